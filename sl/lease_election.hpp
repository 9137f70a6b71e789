#ifndef sl_lease_election_hpp
#define sl_lease_election_hpp

#include <sl/active_completion_queue.hpp>
#include <sl/broadcast_bus.hpp>
#include <sl/change_listener.hpp>
#include <sl/lease_store.hpp>
#include <sl/participant.hpp>
#include <sl/participant_options.hpp>

#include <memory>

namespace sl {

/**
 * Participate in a single owner election.
 *
 * The participant joins the election on construction: it reconciles with the store immediately (the callbacks may run
 * before the constructor returns) and then on each tick of @a queue.
 *
 * @code
 * auto queue = std::make_shared<sl::active_completion_queue>();
 * auto store = std::make_shared<sl::file_lease_store>("/var/run/my-app");
 * sl::participant_options options;
 * options.on_become_leader = []() { start_serving(); };
 * sl::lease_election election(queue, options, store);
 * @endcode
 */
class lease_election : public participant {
public:
  /**
   * Constructor.
   *
   * @param queue runs the timers, it can be shared by many participants.
   * @param options the configuration, validated here.
   * @param store holds the lease record, must not be null.
   * @param listener reports changes made by other participants, can be null.
   * @param bus the broadcast bus, can be null.
   * @throws std::invalid_argument if the options are invalid or @a store is null.
   */
  lease_election(
      std::shared_ptr<active_completion_queue> queue, participant_options options, std::shared_ptr<lease_store> store,
      std::shared_ptr<change_listener> listener = std::shared_ptr<change_listener>(),
      std::shared_ptr<broadcast_bus> bus = std::shared_ptr<broadcast_bus>());

  /**
   * Leave the election.
   *
   * Releases the lease if this participant holds it, as in shutdown().  Do not destroy the object from one of its
   * callbacks.
   */
  ~lease_election() override;

  //@{
  /// @name implement participant interface using pimpl idiom.
  bool is_leader() const override {
    return impl_->is_leader();
  }
  std::string const& id() const override {
    return impl_->id();
  }
  std::string const& storage_key() const override {
    return impl_->storage_key();
  }
  int participant_count_estimate() const override {
    return impl_->participant_count_estimate();
  }
  bool is_reconciling() const override {
    return impl_->is_reconciling();
  }
  std::unique_ptr<slpb::LeaseRecord> last_known_record() const override {
    return impl_->last_known_record();
  }
  void force_acquire() override {
    impl_->force_acquire();
  }
  void reconcile_now() override {
    impl_->reconcile_now();
  }
  std::unique_ptr<slpb::LeaseRecord> read_current_record() override {
    return impl_->read_current_record();
  }
  void visibility_changed(bool hidden) override {
    impl_->visibility_changed(hidden);
  }
  void shutdown() override {
    impl_->shutdown();
  }
  //@}

private:
  std::shared_ptr<active_completion_queue> queue_;
  std::unique_ptr<participant> impl_;
};

} // namespace sl

#endif // sl_lease_election_hpp
