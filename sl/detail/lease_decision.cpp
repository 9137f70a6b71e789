#include "sl/detail/lease_decision.hpp"

namespace sl {
namespace detail {

std::ostream& operator<<(std::ostream& os, lease_action x) {
  char const* values[] = {
      "claim_absent",
      "claim_expired",
      "renew",
      "follow",
  };
  return os << values[int(x)];
}

lease_action decide_lease_action(
    slpb::LeaseRecord const* record, std::string const& caller_id, std::int64_t now_ms,
    std::chrono::milliseconds timeout) {
  if (record == nullptr) {
    return lease_action::claim_absent;
  }
  // ... same as `now_ms - acquired_at > timeout`, without overflowing on extreme timestamps ...
  if (record->acquired_at() < now_ms - timeout.count()) {
    return lease_action::claim_expired;
  }
  if (record->owner_id() == caller_id) {
    return lease_action::renew;
  }
  return lease_action::follow;
}

} // namespace detail
} // namespace sl
