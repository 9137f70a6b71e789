#ifndef sl_log_severity_hpp
#define sl_log_severity_hpp
/**
 * @file
 *
 * Define the log severity values and the macro controlling compile-time filtering.
 */

#include <iosfwd>
#include <string>

#ifndef SL_MIN_SEVERITY
/**
 * All log messages below this level are disabled at compile time.
 *
 * Disabled messages reduce to no-op's that the optimizer eliminates, so the reconciliation loop can trace every pass
 * without any cost in production builds.
 */
#define SL_MIN_SEVERITY info
#endif // SL_MIN_SEVERITY

namespace sl {
/**
 * Define the severity levels for Solo-Lease logging.
 *
 * These are modelled after the severity level in syslog(1) and many derived tools.
 */
enum class severity {
  /// Per-pass reconciliation details, timer arming and cancellation.
  trace,
  /// Debug messages that should not be present in production.
  debug,
  /// Normal progress, such as leadership transitions.
  info,
  /// Unusual, but expected conditions, such as running without a broadcast bus.
  notice,
  /// Problems the application may want to look at, such as malformed lease records.
  warning,
  /// An error has been detected, such as a failed store operation.
  error,
  /// The system is in a critical state.
  critical,
  /// The system is at risk of immediate failure.
  alert,
  /// The system is about to crash or terminate.
  fatal,
  /// The highest possible severity level.
  HIGHEST = int(fatal),
  /// The lowest possible severity level.
  LOWEST = int(trace),
  /// The lowest level that is enabled at compile-time.
  LOWEST_ENABLED = int(SL_MIN_SEVERITY),
};

/// Streaming operator, writes a human readable representation.
std::ostream& operator<<(std::ostream& os, severity x);

/**
 * Convert a severity name, as printed by operator<<, back to a severity.
 *
 * Matching is case insensitive, so "WARNING" and "warning" are the same level.
 *
 * @throws std::invalid_argument if @a name is not a severity level.
 */
severity parse_severity(std::string const& name);

} // namespace sl

#endif // sl_log_severity_hpp
