#ifndef sl_participant_options_hpp
#define sl_participant_options_hpp

#include <chrono>
#include <functional>
#include <string>

namespace sl {
/**
 * Configure a participant in a single owner election.
 *
 * All the fields have defaults, applications typically only change the namespace and the callbacks.  The values are
 * validated when the participant is created.
 */
struct participant_options {
  /// The name of the resource, participants with the same namespace and prefix compete for the same lease.
  std::string name_space = "my-app";

  /// The prefix of the storage key, the key is `key_prefix + "-" + name_space`.
  std::string key_prefix = "single-owner";

  /// A record older than this is considered abandoned.
  std::chrono::milliseconds timeout = std::chrono::milliseconds(15000);

  /// How often the participant reconciles (and renews the lease while leading).
  std::chrono::milliseconds interval = std::chrono::milliseconds(10000);

  /// Delay between a change notification and the reconciliation it triggers.
  std::chrono::milliseconds debounce = std::chrono::milliseconds(100);

  /// If false the broadcast bus is ignored even if one is provided.
  bool use_broadcast_bus = true;

  /// Log each reconciliation at info level instead of trace.
  bool debug = false;

  //@{
  /// @name Callbacks, invoked without any locks held.
  std::function<void()> on_become_leader;
  std::function<void()> on_lose_leadership;
  std::function<void(std::string const& owner_id)> on_other_detected;
  //@}

  /// The key holding the lease record.
  std::string storage_key() const {
    return key_prefix + "-" + name_space;
  }

  /**
   * Check the values.
   *
   * @throws std::invalid_argument if any value is out of range.
   */
  void validate() const;
};

} // namespace sl

#endif // sl_participant_options_hpp
