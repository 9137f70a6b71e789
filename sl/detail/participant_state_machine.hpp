#ifndef sl_detail_participant_state_machine_hpp
#define sl_detail_participant_state_machine_hpp

#include <iostream>
#include <mutex>

namespace sl {
namespace detail {
/**
 * Represent the state machine for a participant in a single owner election.
 *
 * The leadership status is derived from the lease record on each reconciliation, the state machine makes the
 * transitions explicit.  Its main purpose is to help us debug the transitions through logging, and to ignore
 * triggers (timers, notifications, application calls) that arrive once shutdown has started.
 */
enum class participant_state {
  /// Initial state, before the first reconciliation.
  constructing,
  /// Another participant owns the lease, or nobody does.
  following,
  /// This participant owns the lease.
  leading,
  /// Cleaning up the record and the subscriptions.
  shutting_down,
  /// Final state, shutdown complete.
  shutdown,
};

/**
 * The streaming operator for @c participant_state.
 *
 * Mostly used for unit testing and debugging / logging messages.
 */
std::ostream& operator<<(std::ostream& os, participant_state x);

/**
 * Implement the state machine for a participant.
 *
 * The idea is to have a small place to look at valid vs. invalid transitions and to centralize debug logging.
 */
class participant_state_machine {
public:
  participant_state_machine();

  /// Return the current state.
  participant_state current() const;

  /// Return true if the state is shutting_down or shutdown.
  bool in_shutdown() const;

  /// Propose a state change, returns true if accepted.
  bool change_state(char const* where, participant_state nstate);

private:
  /// Checks if a state transition is acceptable.
  bool check_change_state(char const* where, participant_state nstate) const;

private:
  mutable std::mutex mu_;
  participant_state state_;
};

} // namespace detail
} // namespace sl

#endif // sl_detail_participant_state_machine_hpp
