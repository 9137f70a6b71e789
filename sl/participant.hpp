#ifndef sl_participant_hpp
#define sl_participant_hpp

#include <sl/lease_protocol.pb.h>

#include <memory>
#include <string>

namespace sl {
/**
 * Define the interface of a participant in a single owner election.
 *
 * Participants share a lease record in a sl::lease_store, the participant named in a live record is the leader.  The
 * leadership status is recomputed on a periodic tick, when the store reports a change, and when a message arrives on
 * the broadcast bus.  The store is not atomic, two participants may briefly both believe they are the leader, they
 * converge within one interval.
 */
class participant {
public:
  virtual ~participant();

  /// Return true if this participant believes it is the leader.
  virtual bool is_leader() const = 0;

  /// Return the id of this participant, generated on construction.
  virtual std::string const& id() const = 0;

  /// Return the key holding the lease record.
  virtual std::string const& storage_key() const = 0;

  /**
   * A rough estimate of the number of participants.
   *
   * Returns 1 when leading and 2 when following, nothing tracks the actual number of participants.
   */
  virtual int participant_count_estimate() const = 0;

  /// Return true while a reconciliation is running.
  virtual bool is_reconciling() const = 0;

  /// The record seen by the last reconciliation, nullptr if there was none.
  virtual std::unique_ptr<slpb::LeaseRecord> last_known_record() const = 0;

  /**
   * Take the lease unconditionally.
   *
   * Overwrites the record even if another participant holds a live lease, that participant steps down on its next
   * reconciliation.
   *
   * @throws std::runtime_error if called after shutdown().
   */
  virtual void force_acquire() = 0;

  /**
   * Reconcile immediately.
   *
   * If a reconciliation is already running it reruns once it completes, and this function returns without waiting.
   */
  virtual void reconcile_now() = 0;

  /**
   * Read the record from the store.
   *
   * @return nullptr if there is no record, the record is malformed, or the store failed.
   */
  virtual std::unique_ptr<slpb::LeaseRecord> read_current_record() = 0;

  /**
   * Report that the application became hidden (or visible again).
   *
   * A hidden leader renews its lease immediately and keeps it, becoming visible triggers a reconciliation.
   */
  virtual void visibility_changed(bool hidden) = 0;

  /**
   * Stop participating.
   *
   * Cancels the timers and the subscriptions, and deletes the lease record if this participant owns it.  Calling it
   * more than once has no effect.  Do not call it from the participant callbacks.
   */
  virtual void shutdown() = 0;
};
} // namespace sl

#endif // sl_participant_hpp
