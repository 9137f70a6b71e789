#ifndef sl_log_hpp
#define sl_log_hpp
/**
 * @file
 *
 * Define macros, types, and functions for logging in Solo-Lease.
 */
#include <sl/detail/null_stream.hpp>
#include <sl/log_severity.hpp>
#include <sl/log_sink.hpp>

#include <memory>
#include <mutex>
#include <sstream>
#include <vector>

/// Concatenate two pre-processor tokens.
#define SL_PP_CAT(a, b) a##b

/**
 * Create a (most likely) unique identifier for the logger object declared by SL_LOG_I().
 *
 * Using the line number makes it unlikely that the identifier collides with any variable used in the logging
 * expression.
 */
#define SL_LOGGER_IDENTIFIER SL_PP_CAT(sl_log_, __LINE__)

/**
 * Log to an explicit sl::log object.
 *
 * Applications should use SL_LOG(), this variant exists so the tests can use a private sl::log.
 */
#define SL_LOG_I(level, sink)                                                                                          \
  for (auto SL_LOGGER_IDENTIFIER = sl::logger<level_compile_time_disabled(sl::severity::level)>(                       \
           sl::severity::level, __func__, __FILE__, __LINE__, sink);                                                   \
       (bool)SL_LOGGER_IDENTIFIER; SL_LOGGER_IDENTIFIER.write_to(sink))                                                \
  SL_LOGGER_IDENTIFIER.get()

#ifndef SL_LOG
#define SL_LOG(level) SL_LOG_I(level, sl::log::instance())
#endif // SL_LOG

/**
 * The main namespace for the Solo-Lease library.
 */
namespace sl {
/**
 * The logging framework core.
 *
 * Participants log from timer callbacks, store notifications and application threads, the sinks are configured once
 * by the application.  A process-wide instance keeps the logging calls out of every interface, the tests create
 * private instances and use SL_LOG_I().
 */
class log {
public:
  /// Normally use @c sl::log::instance(), this is useful in testing.
  log()
      : mu_()
      , min_severity_(severity::LOWEST)
      , sinks_() {
  }

  /// The process-wide instance used by SL_LOG().
  static log& instance();

  void add_sink(std::shared_ptr<log_sink> sink);

  /// Remove @a sink, ignored if it is not registered.
  void remove_sink(std::shared_ptr<log_sink> const& sink);

  void clear_sinks();

  /// Deliver a formatted message to every sink.
  void write(severity sev, std::string&& msg);

  /// Drop messages below @a sev, sinks may filter further.
  void min_severity(severity sev) {
    std::lock_guard<std::mutex> guard(mu_);
    min_severity_ = sev;
  }

  severity min_severity() const {
    std::lock_guard<std::mutex> guard(mu_);
    return min_severity_;
  }

private:
  mutable std::mutex mu_;
  severity min_severity_;
  std::vector<std::shared_ptr<log_sink>> sinks_;
};

/**
 * A log message for a level disabled at compile-time.
 *
 * Streaming into it compiles to nothing, see @c detail::null_stream.
 */
template <bool disabled>
class logger {
public:
  logger(severity, char const*, char const*, int, log&) {
  }

  explicit operator bool() const {
    return false;
  }

  detail::null_stream& get() {
    return stream_;
  }

  void write_to(log&) {
  }

private:
  detail::null_stream stream_;
};

/**
 * A log message for an enabled level.
 *
 * The message is formatted as `[severity] text (function file:line)` and delivered when the SL_LOG_I() loop ends.
 * Messages below the run-time minimum severity are never formatted.
 */
template <>
class logger<false> {
public:
  logger(severity sev, char const* function, char const* file, int line, log& sink);

  explicit operator bool() const {
    return pending_;
  }

  std::ostream& get() {
    return stream_;
  }

  void write_to(sl::log& sink);

private:
  std::ostringstream stream_;
  severity sev_;
  char const* function_;
  char const* file_;
  int line_;
  bool pending_;
};

/**
 * Determine if a given severity level is disabled at compile-time.
 */
bool constexpr level_compile_time_disabled(severity lvl) {
  return lvl < sl::severity::SL_MIN_SEVERITY;
}
} // namespace sl

#endif // sl_log_hpp
