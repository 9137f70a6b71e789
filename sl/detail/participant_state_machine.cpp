#include "sl/detail/participant_state_machine.hpp"
#include <sl/log.hpp>

namespace sl {
namespace detail {

std::ostream& operator<<(std::ostream& os, participant_state x) {
  char const* values[] = {
      "constructing", "following", "leading", "shutting_down", "shutdown",
  };
  return os << values[int(x)];
}

participant_state_machine::participant_state_machine()
    : mu_()
    , state_(participant_state::constructing) {
}

participant_state participant_state_machine::current() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

bool participant_state_machine::in_shutdown() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_ == participant_state::shutting_down or state_ == participant_state::shutdown;
}

bool participant_state_machine::change_state(char const* where, participant_state nstate) {
  std::lock_guard<std::mutex> lock(mu_);
  if (not check_change_state(where, nstate)) {
    return false;
  }
  if (state_ != nstate) {
    SL_LOG(trace) << where << ": participant state " << state_ << " -> " << nstate;
  }
  state_ = nstate;
  return true;
}

bool participant_state_machine::check_change_state(char const* where, participant_state nstate) const {
  using s = participant_state;
  switch (state_) {
  case s::shutdown:
    break;
  case s::shutting_down:
    return nstate == s::shutdown;
  case s::leading:
  case s::following:
  case s::constructing:
    return nstate == s::following or nstate == s::leading or nstate == s::shutting_down;
  }
  SL_LOG(trace) << where << ": rejected participant state change " << state_ << " -> " << nstate;
  return false;
}

} // namespace detail
} // namespace sl
