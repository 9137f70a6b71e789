#ifndef sl_detail_lease_decision_hpp
#define sl_detail_lease_decision_hpp

#include <sl/lease_protocol.pb.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>

namespace sl {
namespace detail {
/**
 * The possible outcomes of examining the lease record.
 */
enum class lease_action {
  /// There is no (valid) record, write a new one.
  claim_absent,
  /// The record is older than the timeout, its owner is presumed dead, overwrite it.
  claim_expired,
  /// The caller owns the record, refresh its timestamp.
  renew,
  /// Somebody else owns a live record.
  follow,
};

/// Streaming operator for lease_action, used in logging and testing.
std::ostream& operator<<(std::ostream& os, lease_action x);

/// Return true if @a action results in a write of the caller's record.
inline bool writes_record(lease_action action) {
  return action != lease_action::follow;
}

/**
 * Decide what a participant should do with the current lease record.
 *
 * The rules are evaluated in order: a missing record is claimed, a record whose age is strictly larger than
 * @a timeout is claimed, a record owned by @a caller_id is renewed, otherwise the caller follows.
 *
 * @param record the current record, nullptr if it is absent or could not be parsed.
 * @param caller_id the id of the participant making the decision.
 * @param now_ms the current time, in milliseconds since the epoch.
 * @param timeout how long a record stays live without renewal.
 */
lease_action decide_lease_action(
    slpb::LeaseRecord const* record, std::string const& caller_id, std::int64_t now_ms,
    std::chrono::milliseconds timeout);

} // namespace detail
} // namespace sl

#endif // sl_detail_lease_decision_hpp
