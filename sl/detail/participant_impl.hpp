#ifndef sl_detail_participant_impl_hpp
#define sl_detail_participant_impl_hpp

#include <sl/assert_throw.hpp>
#include <sl/broadcast_bus.hpp>
#include <sl/change_listener.hpp>
#include <sl/completion_queue.hpp>
#include <sl/detail/async_op_counter.hpp>
#include <sl/detail/deadline_timer.hpp>
#include <sl/detail/lease_decision.hpp>
#include <sl/detail/participant_state_machine.hpp>
#include <sl/detail/print_to_stream.hpp>
#include <sl/detail/wall_clock.hpp>
#include <sl/identity.hpp>
#include <sl/lease_record_codec.hpp>
#include <sl/lease_store.hpp>
#include <sl/log.hpp>
#include <sl/participant.hpp>
#include <sl/participant_options.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace sl {
namespace detail {

/**
 * Implement a participant in a single owner election.
 *
 * All the triggers (the periodic tick, change notifications from the store, messages on the broadcast bus, and the
 * application calls) end up in reconcile(), which reads the lease record and decides to claim, renew or follow.  Only
 * one reconciliation runs at a time, a trigger that arrives while one is running makes the running thread do one more
 * pass.  Store failures make the participant assume it is the leader.
 *
 * @tparam completion_queue_type the scheduler, the tests use a completion queue with mocked timers.
 * @tparam clock_type the source of timestamps for the lease records, must provide `std::int64_t now_ms() const`.
 */
template <typename completion_queue_type, typename clock_type = wall_clock>
class participant_impl : public ::sl::participant {
public:
  participant_impl(
      completion_queue_type& queue, participant_options options, std::shared_ptr<lease_store> store,
      std::shared_ptr<change_listener> listener, std::shared_ptr<broadcast_bus> bus, clock_type clock = clock_type())
      : mu_()
      , queue_(queue)
      , options_(std::move(options))
      , store_(std::move(store))
      , listener_(std::move(listener))
      , bus_(std::move(bus))
      , clock_(std::move(clock))
      , id_(generate_participant_id())
      , key_(options_.storage_key())
      , state_()
      , is_leader_(false)
      , last_known_record_()
      , reconciling_(false)
      , rerun_(false)
      , epoch_(0)
      , listener_token_(0)
      , listener_active_(false)
      , bus_token_(0)
      , bus_active_(false)
      , tick_timer_()
      , debounce_timer_()
      , ops_() {
    options_.validate();
    SL_ASSERT_THROW((bool)store_);
    preamble();
  }

  participant_impl(participant_impl const&) = delete;
  participant_impl& operator=(participant_impl const&) = delete;
  participant_impl(participant_impl&&) = delete;
  participant_impl& operator=(participant_impl&&) = delete;

  ~participant_impl() override {
    shutdown();
  }

  bool is_leader() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return is_leader_;
  }

  std::string const& id() const override {
    return id_;
  }

  std::string const& storage_key() const override {
    return key_;
  }

  int participant_count_estimate() const override {
    return is_leader() ? 1 : 2;
  }

  bool is_reconciling() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return reconciling_;
  }

  std::unique_ptr<slpb::LeaseRecord> last_known_record() const override {
    std::lock_guard<std::mutex> lock(mu_);
    if (not last_known_record_) {
      return std::unique_ptr<slpb::LeaseRecord>();
    }
    return std::make_unique<slpb::LeaseRecord>(*last_known_record_);
  }

  void force_acquire() override {
    async_op_tracer tracer(ops_, "participant/force_acquire");
    if (not tracer) {
      throw std::runtime_error(log_header("force_acquire()") + " called after shutdown");
    }
    auto const now = clock_.now_ms();
    auto record = make_lease_record(id_, now);
    try {
      store_->set(key_, encode_lease_record(record));
    } catch (std::exception const& ex) {
      SL_LOG(error) << log_header("force_acquire()") << " store write failed, assuming leadership anyway: "
                    << ex.what();
    }
    bool became_leader = false;
    {
      std::lock_guard<std::mutex> lock(mu_);
      // ... any reconciliation in progress read the store before this write, its result is stale ...
      ++epoch_;
      if (not state_.change_state("force_acquire()", participant_state::leading)) {
        return;
      }
      became_leader = not is_leader_;
      is_leader_ = true;
      last_known_record_ = std::make_unique<slpb::LeaseRecord>(record);
    }
    SL_LOG(info) << log_header("force_acquire()") << " forced leadership at " << now;
    publish(slpb::BusMessage::LEADERSHIP_CHANGED);
    if (became_leader) {
      invoke_callback("on_become_leader", options_.on_become_leader);
    }
  }

  void reconcile_now() override {
    async_op_tracer tracer(ops_, "participant/reconcile_now");
    if (not tracer) {
      return;
    }
    reconcile("reconcile_now");
  }

  std::unique_ptr<slpb::LeaseRecord> read_current_record() override {
    try {
      return fetch_record();
    } catch (std::exception const& ex) {
      SL_LOG(error) << log_header("read_current_record()") << " store read failed: " << ex.what();
    }
    return std::unique_ptr<slpb::LeaseRecord>();
  }

  void visibility_changed(bool hidden) override {
    async_op_tracer tracer(ops_, "participant/visibility_changed");
    if (not tracer) {
      return;
    }
    // ... a hidden leader keeps renewing through the normal pass, it only renews a record that is still its own ...
    reconcile(hidden ? "hidden" : "visible");
  }

  void shutdown() override {
    if (not state_.change_state("shutdown()", participant_state::shutting_down)) {
      // ... already shutdown once, nothing to do ...
      return;
    }
    SL_LOG(trace) << log_header("shutdown()") << " starting";
    ops_.shutdown();

    std::shared_ptr<deadline_timer> tick;
    std::shared_ptr<deadline_timer> debounce;
    {
      std::lock_guard<std::mutex> lock(mu_);
      tick = std::move(tick_timer_);
      debounce = std::move(debounce_timer_);
    }
    if (tick) {
      tick->cancel();
    }
    if (debounce) {
      debounce->cancel();
    }
    // ... the store and the bus may be delivering a notification to us, they block until it completes, so do not hold
    // any locks ...
    if (listener_active_) {
      try {
        listener_->unsubscribe(listener_token_);
      } catch (std::exception const& ex) {
        SL_LOG(error) << log_header("shutdown()") << " error removing change subscription: " << ex.what();
      }
    }
    if (bus_active_) {
      try {
        bus_->unsubscribe(bus_token_);
      } catch (std::exception const& ex) {
        SL_LOG(notice) << log_header("shutdown()") << " error removing bus subscription: " << ex.what();
      }
    }
    ops_.block_until_all_done();

    release_lease();

    bool was_leader = false;
    {
      std::lock_guard<std::mutex> lock(mu_);
      was_leader = is_leader_;
      is_leader_ = false;
    }
    state_.change_state("shutdown()", participant_state::shutdown);
    SL_LOG(info) << log_header("shutdown()") << " completed, was_leader=" << std::boolalpha << was_leader;
    if (was_leader) {
      invoke_callback("on_lose_leadership", options_.on_lose_leadership);
    }
  }

private:
  /// Subscribe to the notifications, run the first reconciliation and start the periodic tick.
  void preamble() {
    if (listener_) {
      try {
        listener_token_ =
            listener_->subscribe(key_, [this](std::string const& key) { this->on_store_change(key); });
        listener_active_ = true;
      } catch (std::exception const& ex) {
        SL_LOG(error) << log_header("preamble()") << " cannot subscribe to store changes, polling only: "
                      << ex.what();
      }
    }
    if (bus_ and options_.use_broadcast_bus) {
      try {
        bus_token_ = bus_->subscribe(key_, [this](std::string const& payload) { this->on_bus_message(payload); });
        bus_active_ = true;
      } catch (std::exception const& ex) {
        SL_LOG(notice) << log_header("preamble()") << " broadcast bus unavailable, polling only: " << ex.what();
      }
    }
    reconcile("initial");
    set_tick();
  }

  /// Arm the periodic tick.
  void set_tick() {
    std::lock_guard<std::mutex> lock(mu_);
    if (not ops_.async_op_start("participant/tick")) {
      return;
    }
    tick_timer_ = queue_.make_relative_timer(
        options_.interval, "participant/tick", [this](auto const& op, bool ok) { this->on_tick(op, ok); });
  }

  /// Reconcile and re-arm the tick.
  void on_tick(deadline_timer const& op, bool ok) {
    if (ok) {
      reconcile("tick");
      set_tick();
    }
    ops_.async_op_done("participant/tick");
  }

  /// Arm the debounce timer, unless it is already armed.
  void schedule_debounce(char const* trigger) {
    std::lock_guard<std::mutex> lock(mu_);
    if (debounce_timer_) {
      SL_LOG(trace) << log_header("schedule_debounce()") << " " << trigger << " coalesced";
      return;
    }
    if (not ops_.async_op_start("participant/debounce")) {
      return;
    }
    debounce_timer_ = queue_.make_relative_timer(
        options_.debounce, "participant/debounce", [this](auto const& op, bool ok) { this->on_debounce(op, ok); });
  }

  void on_debounce(deadline_timer const& op, bool ok) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      debounce_timer_.reset();
    }
    if (ok) {
      reconcile("debounce");
    }
    ops_.async_op_done("participant/debounce");
  }

  void on_store_change(std::string const& key) {
    if (key != key_) {
      return;
    }
    schedule_debounce("store change");
  }

  void on_bus_message(std::string const& payload) {
    slpb::BusMessage msg;
    if (not decode_bus_message(payload, msg)) {
      SL_LOG(trace) << log_header("on_bus_message()") << " ignoring undecodable message";
      return;
    }
    if (msg.sender_id() == id_) {
      return;
    }
    SL_LOG(trace) << log_header("on_bus_message()") << " received " << print_to_stream(msg);
    schedule_debounce("bus message");
  }

  /// Run a reconciliation, or request a follow-up pass if one is running.
  void reconcile(char const* trigger) {
    serialized(trigger, [this](char const* t) { this->reconcile_pass(t); });
  }

  /**
   * Run @a first_pass and then any follow-up passes requested meanwhile.
   *
   * Returns immediately if another thread is reconciling, that thread runs the follow-up pass.
   */
  template <typename Functor>
  void serialized(char const* trigger, Functor&& first_pass) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (state_.in_shutdown()) {
        return;
      }
      if (reconciling_) {
        rerun_ = true;
        return;
      }
      reconciling_ = true;
    }
    first_pass(trigger);
    while (true) {
      {
        std::lock_guard<std::mutex> lock(mu_);
        if (not rerun_ or state_.in_shutdown()) {
          rerun_ = false;
          reconciling_ = false;
          return;
        }
        rerun_ = false;
      }
      reconcile_pass("rerun");
    }
  }

  /// Read the record, decide, write if needed, update the state and fire the callbacks.
  void reconcile_pass(char const* trigger) {
    std::uint64_t epoch = 0;
    {
      std::lock_guard<std::mutex> lock(mu_);
      epoch = epoch_;
    }
    auto const now = clock_.now_ms();
    std::unique_ptr<slpb::LeaseRecord> record;
    lease_action action = lease_action::claim_absent;
    bool leader = true;
    try {
      record = fetch_record();
      action = decide_lease_action(record.get(), id_, now, options_.timeout);
      if (writes_record(action)) {
        record = std::make_unique<slpb::LeaseRecord>(make_lease_record(id_, now));
        store_->set(key_, encode_lease_record(*record));
      }
      leader = writes_record(action);
    } catch (std::exception const& ex) {
      SL_LOG(error) << log_header("reconcile()") << " store failure on " << trigger
                    << ", assuming leadership: " << ex.what();
      leader = true;
    }

    bool became_leader = false;
    bool lost_leadership = false;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (epoch != epoch_) {
        // ... force_acquire() changed the record while we were reading it ...
        rerun_ = true;
        return;
      }
      if (not state_.change_state("reconcile()", leader ? participant_state::leading : participant_state::following)) {
        return;
      }
      became_leader = leader and not is_leader_;
      lost_leadership = is_leader_ and not leader;
      is_leader_ = leader;
      if (record) {
        last_known_record_ = std::make_unique<slpb::LeaseRecord>(*record);
      }
    }

    if (options_.debug) {
      SL_LOG(info) << log_header("reconcile()") << " trigger=" << trigger << " action=" << action
                   << " leader=" << std::boolalpha << leader;
    } else {
      SL_LOG(trace) << log_header("reconcile()") << " trigger=" << trigger << " action=" << action
                    << " leader=" << std::boolalpha << leader;
    }

    if (became_leader) {
      SL_LOG(info) << log_header("reconcile()") << " became leader (" << action << ")";
      publish(slpb::BusMessage::LEADERSHIP_CHANGED);
      invoke_callback("on_become_leader", options_.on_become_leader);
    }
    if (lost_leadership) {
      SL_LOG(info) << log_header("reconcile()") << " lost leadership to " << record->owner_id();
      invoke_callback("on_lose_leadership", options_.on_lose_leadership);
    }
    if (action == lease_action::follow and record) {
      invoke_callback("on_other_detected", options_.on_other_detected, record->owner_id());
    }
  }

  /// Delete the record if this participant owns it, and tell the other participants.
  void release_lease() {
    try {
      auto record = fetch_record();
      if (not record or record->owner_id() != id_) {
        SL_LOG(trace) << log_header("shutdown()") << " record not owned by this participant, leaving it";
        return;
      }
      store_->del(key_);
    } catch (std::exception const& ex) {
      SL_LOG(error) << log_header("shutdown()") << " error releasing the lease: " << ex.what();
      return;
    }
    SL_LOG(info) << log_header("shutdown()") << " released the lease";
    publish(slpb::BusMessage::CLOSING);
  }

  /**
   * Read and parse the lease record.
   *
   * @return nullptr if the record is absent or malformed.
   * @throws std::exception if the store fails.
   */
  std::unique_ptr<slpb::LeaseRecord> fetch_record() {
    std::string value;
    if (not store_->get(key_, value)) {
      return std::unique_ptr<slpb::LeaseRecord>();
    }
    auto record = std::make_unique<slpb::LeaseRecord>();
    if (not decode_lease_record(value, *record)) {
      SL_LOG(warning) << log_header("fetch_record()") << " ignoring malformed lease record <" << value << ">";
      return std::unique_ptr<slpb::LeaseRecord>();
    }
    return record;
  }

  /// Best effort publication on the bus.
  void publish(slpb::BusMessage::Kind kind) {
    if (not bus_active_) {
      return;
    }
    slpb::BusMessage msg;
    msg.set_kind(kind);
    msg.set_sender_id(id_);
    msg.set_sent_at(clock_.now_ms());
    try {
      bus_->publish(key_, encode_bus_message(msg));
    } catch (std::exception const& ex) {
      SL_LOG(notice) << log_header("publish()") << " ignoring bus error: " << ex.what();
    }
  }

  /// Call an application callback, exceptions are logged and discarded.
  template <typename Callback, typename... Args>
  void invoke_callback(char const* name, Callback const& callback, Args&&... args) {
    if (not callback) {
      return;
    }
    try {
      callback(std::forward<Args>(args)...);
    } catch (std::exception const& ex) {
      SL_LOG(error) << log_header(name) << " callback raised an exception: " << ex.what();
    }
  }

  std::string log_header(char const* log) const {
    std::ostringstream os;
    os << key_ << "/" << id_ << " " << log;
    return os.str();
  }

private:
  mutable std::mutex mu_;

  completion_queue_type& queue_;
  participant_options options_;
  std::shared_ptr<lease_store> store_;
  std::shared_ptr<change_listener> listener_;
  std::shared_ptr<broadcast_bus> bus_;
  clock_type clock_;

  std::string const id_;
  std::string const key_;

  participant_state_machine state_;
  bool is_leader_;
  std::unique_ptr<slpb::LeaseRecord> last_known_record_;

  /// A reconciliation is running.
  bool reconciling_;
  /// Another reconciliation was requested while one was running.
  bool rerun_;
  /// Incremented by writes made outside the reconciliation loop.
  std::uint64_t epoch_;

  long listener_token_;
  bool listener_active_;
  long bus_token_;
  bool bus_active_;

  std::shared_ptr<deadline_timer> tick_timer_;
  std::shared_ptr<deadline_timer> debounce_timer_;

  /// Track pending timers and application calls.
  async_op_counter ops_;
};

} // namespace detail
} // namespace sl

#endif // sl_detail_participant_impl_hpp
