#include "sl/detail/participant_impl.hpp"
#include <sl/detail/mock_lease_store.hpp>
#include <sl/detail/mocked_grpc_interceptor.hpp>
#include <sl/memory_bus.hpp>
#include <sl/memory_store.hpp>

#include <gmock/gmock.h>

#include <algorithm>
#include <atomic>
#include <future>
#include <vector>

/// Define helper types and functions used in these tests
namespace {
using completion_queue_type = sl::completion_queue<sl::detail::mocked_grpc_interceptor>;

/// A clock controlled by the test, copies share the same time.
struct fake_clock {
  fake_clock()
      : now(std::make_shared<std::atomic<std::int64_t>>(0)) {
  }

  std::int64_t now_ms() const {
    return now->load();
  }

  void set(std::int64_t value) {
    now->store(value);
  }

  std::shared_ptr<std::atomic<std::int64_t>> now;
};

using participant_type = sl::detail::participant_impl<completion_queue_type, fake_clock>;

/// Capture the timers created through the mocked interceptor, the test decides when they fire.
class captured_timers {
public:
  explicit captured_timers(completion_queue_type& queue);

  /// The number of pending timers called @a name.
  std::size_t count(std::string const& name) const;

  /// Fire the oldest timer called @a name, returns false if there is none.
  bool fire(std::string const& name, bool ok = true);

  /// Fire all the pending timers as canceled.
  void cancel_all();

private:
  mutable std::mutex mu_;
  std::vector<std::shared_ptr<sl::detail::deadline_timer>> timers_;
};

/// Count the callbacks received by a participant.
struct callback_counters {
  void attach(sl::participant_options& options);

  std::atomic<int> became{0};
  std::atomic<int> lost{0};
  std::vector<std::string> others;
};

/// Options with short timeouts, the callbacks update @a counters.
sl::participant_options test_options(callback_counters& counters);

/// Run shutdown() in a separate thread, canceling the captured timers until it completes.
void shutdown_and_drain(participant_type& participant, captured_timers& timers);

/// Read and parse the record in @a store.
slpb::LeaseRecord stored_record(sl::memory_store const& store, std::string const& key = "single-owner-my-app");

/// Format a record the way the participants store them.
std::string record_value(std::string const& owner_id, std::int64_t acquired_at) {
  return sl::encode_lease_record(sl::make_lease_record(owner_id, acquired_at));
}

/// Collect the messages received by a bus endpoint.
struct bus_observer {
  explicit bus_observer(std::shared_ptr<sl::memory_bus> const& bus);

  /// The number of messages of kind @a kind received.
  int count(slpb::BusMessage::Kind kind) const;

  std::shared_ptr<sl::memory_bus_endpoint> endpoint;
  mutable std::mutex mu;
  std::vector<slpb::BusMessage> received;
};
} // anonymous namespace

/**
 * @test Verify that a participant claims an absent record.
 */
TEST(participant_impl, claim_absent) {
  completion_queue_type queue;
  captured_timers timers(queue);
  fake_clock clock;
  clock.set(1000);
  callback_counters counters;
  auto store = std::make_shared<sl::memory_store>();

  participant_type participant(queue, test_options(counters), store->connect(), nullptr, nullptr, clock);
  EXPECT_TRUE(participant.is_leader());
  EXPECT_EQ(participant.storage_key(), "single-owner-my-app");
  EXPECT_EQ(participant.participant_count_estimate(), 1);
  EXPECT_FALSE(participant.is_reconciling());
  EXPECT_EQ(counters.became.load(), 1);
  EXPECT_EQ(counters.lost.load(), 0);
  EXPECT_TRUE(counters.others.empty());
  EXPECT_EQ(timers.count("participant/tick"), 1U);

  auto record = stored_record(*store);
  EXPECT_EQ(record.owner_id(), participant.id());
  EXPECT_EQ(record.acquired_at(), 1000);

  auto last = participant.last_known_record();
  ASSERT_TRUE((bool)last);
  EXPECT_EQ(last->owner_id(), participant.id());

  shutdown_and_drain(participant, timers);
  EXPECT_FALSE(participant.is_leader());
  EXPECT_EQ(store->size(), 0U);
  EXPECT_EQ(counters.lost.load(), 1);
  EXPECT_EQ(timers.count("participant/tick"), 0U);
}

/**
 * @test Verify that a participant follows a live record owned by somebody else.
 */
TEST(participant_impl, follow_live_owner) {
  completion_queue_type queue;
  captured_timers timers(queue);
  fake_clock clock;
  clock.set(3000);
  callback_counters counters;
  auto store = std::make_shared<sl::memory_store>();
  store->inject("single-owner-my-app", record_value("A", 0));

  participant_type participant(queue, test_options(counters), store->connect(), nullptr, nullptr, clock);
  EXPECT_FALSE(participant.is_leader());
  EXPECT_EQ(participant.participant_count_estimate(), 2);
  EXPECT_EQ(counters.became.load(), 0);
  ASSERT_EQ(counters.others.size(), 1U);
  EXPECT_EQ(counters.others[0], "A");

  // ... the record is exactly as old as the timeout, still live ...
  clock.set(5000);
  ASSERT_TRUE(timers.fire("participant/tick"));
  EXPECT_FALSE(participant.is_leader());
  // ... other_detected is reported on every pass ...
  EXPECT_EQ(counters.others.size(), 2U);
  EXPECT_EQ(timers.count("participant/tick"), 1U);

  auto record = stored_record(*store);
  EXPECT_EQ(record.owner_id(), "A");
  EXPECT_EQ(record.acquired_at(), 0);

  shutdown_and_drain(participant, timers);
  // ... the record belongs to somebody else, it must survive ...
  record = stored_record(*store);
  EXPECT_EQ(record.owner_id(), "A");
  EXPECT_EQ(counters.lost.load(), 0);
}

/**
 * @test Verify the takeover of an abandoned record.
 */
TEST(participant_impl, takeover_expired_record) {
  completion_queue_type queue;
  captured_timers timers(queue);
  fake_clock clock;
  clock.set(3000);
  callback_counters counters;
  auto store = std::make_shared<sl::memory_store>();
  store->inject("single-owner-my-app", record_value("A", 0));

  participant_type participant(queue, test_options(counters), store->connect(), nullptr, nullptr, clock);
  EXPECT_FALSE(participant.is_leader());

  clock.set(6000);
  ASSERT_TRUE(timers.fire("participant/tick"));
  EXPECT_TRUE(participant.is_leader());
  EXPECT_EQ(counters.became.load(), 1);
  EXPECT_EQ(counters.others.size(), 1U);

  auto record = stored_record(*store);
  EXPECT_EQ(record.owner_id(), participant.id());
  EXPECT_EQ(record.acquired_at(), 6000);

  clock.set(7000);
  ASSERT_TRUE(timers.fire("participant/tick"));
  EXPECT_EQ(counters.became.load(), 1);

  shutdown_and_drain(participant, timers);
}

/**
 * @test Verify that repeated reconciliations of a leader only refresh the record.
 */
TEST(participant_impl, idempotent_renewal) {
  completion_queue_type queue;
  captured_timers timers(queue);
  fake_clock clock;
  clock.set(1000);
  callback_counters counters;
  auto store = std::make_shared<sl::memory_store>();

  participant_type participant(queue, test_options(counters), store->connect(), nullptr, nullptr, clock);
  ASSERT_TRUE(participant.is_leader());

  std::int64_t previous = stored_record(*store).acquired_at();
  for (std::int64_t now : {1000, 2000, 2000, 4000, 9000}) {
    clock.set(now);
    if (now % 2000 == 0) {
      participant.reconcile_now();
    } else {
      ASSERT_TRUE(timers.fire("participant/tick"));
    }
    EXPECT_TRUE(participant.is_leader());
    auto record = stored_record(*store);
    EXPECT_EQ(record.owner_id(), participant.id());
    EXPECT_GE(record.acquired_at(), previous);
    EXPECT_EQ(record.acquired_at(), now);
    previous = record.acquired_at();
  }
  EXPECT_EQ(counters.became.load(), 1);
  EXPECT_EQ(counters.lost.load(), 0);
  EXPECT_TRUE(counters.others.empty());

  shutdown_and_drain(participant, timers);
}

/**
 * @test Verify that force_acquire() takes over a live lease.
 */
TEST(participant_impl, force_acquire) {
  completion_queue_type queue;
  captured_timers timers(queue);
  fake_clock clock;
  clock.set(1000);
  callback_counters counters;
  auto store = std::make_shared<sl::memory_store>();
  auto bus = std::make_shared<sl::memory_bus>();
  bus_observer observer(bus);
  store->inject("single-owner-my-app", record_value("A", 1000));

  participant_type participant(queue, test_options(counters), store->connect(), nullptr, bus->connect(), clock);
  EXPECT_FALSE(participant.is_leader());
  EXPECT_EQ(observer.count(slpb::BusMessage::LEADERSHIP_CHANGED), 0);

  clock.set(1500);
  participant.force_acquire();
  EXPECT_TRUE(participant.is_leader());
  EXPECT_EQ(counters.became.load(), 1);
  auto record = stored_record(*store);
  EXPECT_EQ(record.owner_id(), participant.id());
  EXPECT_EQ(record.acquired_at(), 1500);
  EXPECT_EQ(observer.count(slpb::BusMessage::LEADERSHIP_CHANGED), 1);

  // ... forcing again keeps the leadership, no new transition ...
  participant.force_acquire();
  EXPECT_TRUE(participant.is_leader());
  EXPECT_EQ(counters.became.load(), 1);

  shutdown_and_drain(participant, timers);
  EXPECT_THROW(participant.force_acquire(), std::runtime_error);
  EXPECT_FALSE(participant.is_leader());
}

/**
 * @test Verify that shutdown() deletes the record owned by the participant and notifies the bus.
 */
TEST(participant_impl, shutdown_releases_lease) {
  completion_queue_type queue;
  captured_timers timers(queue);
  fake_clock clock;
  clock.set(1000);
  callback_counters counters;
  auto store = std::make_shared<sl::memory_store>();
  auto bus = std::make_shared<sl::memory_bus>();
  bus_observer observer(bus);

  participant_type participant(queue, test_options(counters), store->connect(), nullptr, bus->connect(), clock);
  ASSERT_TRUE(participant.is_leader());
  EXPECT_EQ(bus->subscription_count(), 2U);

  shutdown_and_drain(participant, timers);
  EXPECT_EQ(store->size(), 0U);
  EXPECT_EQ(observer.count(slpb::BusMessage::CLOSING), 1);
  EXPECT_EQ(bus->subscription_count(), 1U);
  EXPECT_EQ(counters.lost.load(), 1);

  // ... a second shutdown has no effect ...
  participant.shutdown();
  EXPECT_EQ(observer.count(slpb::BusMessage::CLOSING), 1);
  EXPECT_EQ(counters.lost.load(), 1);
}

/**
 * @test Verify that shutdown() leaves alone a record owned by somebody else.
 */
TEST(participant_impl, shutdown_keeps_foreign_record) {
  completion_queue_type queue;
  captured_timers timers(queue);
  fake_clock clock;
  clock.set(1000);
  callback_counters counters;
  auto store = std::make_shared<sl::memory_store>();
  auto bus = std::make_shared<sl::memory_bus>();
  bus_observer observer(bus);
  auto context = store->connect();

  participant_type participant(queue, test_options(counters), context, context, bus->connect(), clock);
  ASSERT_TRUE(participant.is_leader());
  EXPECT_EQ(store->subscription_count(), 1U);

  // ... somebody else takes over, the participant has not noticed yet ...
  store->inject("single-owner-my-app", record_value("X", 1200));
  EXPECT_EQ(timers.count("participant/debounce"), 1U);
  EXPECT_TRUE(participant.is_leader());

  shutdown_and_drain(participant, timers);
  auto record = stored_record(*store);
  EXPECT_EQ(record.owner_id(), "X");
  EXPECT_EQ(observer.count(slpb::BusMessage::CLOSING), 0);
  EXPECT_EQ(store->subscription_count(), 0U);
  EXPECT_EQ(counters.lost.load(), 1);
}

/**
 * @test Verify that a hidden leader renews its lease and a visible participant reconciles.
 */
TEST(participant_impl, visibility_changes) {
  completion_queue_type queue;
  captured_timers timers(queue);
  fake_clock clock;
  clock.set(1000);
  callback_counters counters;
  auto store = std::make_shared<sl::memory_store>();

  participant_type participant(queue, test_options(counters), store->connect(), nullptr, nullptr, clock);
  ASSERT_TRUE(participant.is_leader());

  clock.set(2000);
  participant.visibility_changed(true);
  EXPECT_TRUE(participant.is_leader());
  auto record = stored_record(*store);
  EXPECT_EQ(record.owner_id(), participant.id());
  EXPECT_EQ(record.acquired_at(), 2000);
  EXPECT_EQ(counters.became.load(), 1);
  EXPECT_EQ(counters.lost.load(), 0);

  // ... another participant forces the lease, becoming visible again reconciles ...
  store->inject("single-owner-my-app", record_value("X", 2500));
  clock.set(3000);
  participant.visibility_changed(false);
  EXPECT_FALSE(participant.is_leader());
  EXPECT_EQ(counters.lost.load(), 1);
  ASSERT_EQ(counters.others.size(), 1U);
  EXPECT_EQ(counters.others[0], "X");

  // ... a hidden follower does not write ...
  participant.visibility_changed(true);
  EXPECT_FALSE(participant.is_leader());
  EXPECT_EQ(stored_record(*store).owner_id(), "X");

  // ... once the record expires becoming visible claims it ...
  clock.set(9000);
  participant.visibility_changed(false);
  EXPECT_TRUE(participant.is_leader());
  EXPECT_EQ(stored_record(*store).owner_id(), participant.id());
  EXPECT_EQ(counters.became.load(), 2);

  shutdown_and_drain(participant, timers);
}

/**
 * @test Verify that a hidden leader does not take back a lease forced by another participant.
 */
TEST(participant_impl, hidden_leader_respects_forced_lease) {
  completion_queue_type queue;
  captured_timers timers(queue);
  fake_clock clock;
  clock.set(1000);
  callback_counters counters_a;
  callback_counters counters_b;
  auto store = std::make_shared<sl::memory_store>();

  participant_type a(queue, test_options(counters_a), store->connect(), nullptr, nullptr, clock);
  participant_type b(queue, test_options(counters_b), store->connect(), nullptr, nullptr, clock);
  ASSERT_TRUE(a.is_leader());
  ASSERT_FALSE(b.is_leader());

  clock.set(1500);
  b.force_acquire();
  EXPECT_TRUE(b.is_leader());
  // ... without a change listener a has not noticed yet ...
  EXPECT_TRUE(a.is_leader());

  clock.set(2000);
  a.visibility_changed(true);
  EXPECT_FALSE(a.is_leader());
  EXPECT_TRUE(b.is_leader());
  EXPECT_EQ(counters_a.lost.load(), 1);
  ASSERT_FALSE(counters_a.others.empty());
  EXPECT_EQ(counters_a.others.back(), b.id());

  auto record = stored_record(*store);
  EXPECT_EQ(record.owner_id(), b.id());
  EXPECT_EQ(record.acquired_at(), 1500);

  shutdown_and_drain(a, timers);
  EXPECT_EQ(stored_record(*store).owner_id(), b.id());
  shutdown_and_drain(b, timers);
  EXPECT_EQ(store->size(), 0U);
}

/**
 * @test Verify that change notifications are debounced and coalesced.
 */
TEST(participant_impl, debounce_coalesces) {
  completion_queue_type queue;
  captured_timers timers(queue);
  fake_clock clock;
  clock.set(1000);
  callback_counters counters;
  auto store = std::make_shared<sl::memory_store>();
  auto writer = store->connect();
  writer->set("single-owner-my-app", record_value("A", 1000));
  auto context = store->connect();

  participant_type participant(queue, test_options(counters), context, context, nullptr, clock);
  ASSERT_FALSE(participant.is_leader());
  EXPECT_EQ(counters.others.size(), 1U);
  EXPECT_EQ(timers.count("participant/debounce"), 0U);

  // ... two changes in a row result in a single timer ...
  writer->set("single-owner-my-app", record_value("A", 1100));
  writer->set("single-owner-my-app", record_value("A", 1200));
  EXPECT_EQ(timers.count("participant/debounce"), 1U);
  // ... changes to other keys are not interesting ...
  writer->set("unrelated", "value");
  EXPECT_EQ(timers.count("participant/debounce"), 1U);
  // ... nothing happens until the timer fires ...
  EXPECT_EQ(counters.others.size(), 1U);

  ASSERT_TRUE(timers.fire("participant/debounce"));
  EXPECT_EQ(counters.others.size(), 2U);
  EXPECT_EQ(timers.count("participant/debounce"), 0U);
  auto last = participant.last_known_record();
  ASSERT_TRUE((bool)last);
  EXPECT_EQ(last->acquired_at(), 1200);

  // ... the owner leaves, the next notification makes the participant claim the lease ...
  writer->del("single-owner-my-app");
  EXPECT_EQ(timers.count("participant/debounce"), 1U);
  ASSERT_TRUE(timers.fire("participant/debounce"));
  EXPECT_TRUE(participant.is_leader());
  EXPECT_EQ(counters.became.load(), 1);

  // ... a canceled debounce timer does not reconcile ...
  writer->set("single-owner-my-app", record_value("A", 1300));
  ASSERT_TRUE(timers.fire("participant/debounce", false));
  EXPECT_TRUE(participant.is_leader());

  shutdown_and_drain(participant, timers);
}

/**
 * @test Verify that two participants claiming at the same time converge on one owner.
 */
TEST(participant_impl, race_converges) {
  using namespace ::testing;
  completion_queue_type queue;
  captured_timers timers(queue);
  fake_clock clock;
  clock.set(1000);
  callback_counters counters_a;
  callback_counters counters_b;
  auto store = std::make_shared<sl::memory_store>();
  auto context_a = store->connect();

  // ... participant A reads the store before B writes, simulate that with a stale read ...
  auto stale = std::make_shared<sl::detail::mock_lease_store>();
  EXPECT_CALL(*stale, get(_, _))
      .WillOnce(Return(false))
      .WillRepeatedly(Invoke([context_a](std::string const& k, std::string& v) { return context_a->get(k, v); }));
  EXPECT_CALL(*stale, set(_, _)).WillRepeatedly(Invoke([context_a](std::string const& k, std::string const& v) {
    context_a->set(k, v);
  }));
  EXPECT_CALL(*stale, del(_)).WillRepeatedly(Invoke([context_a](std::string const& k) { context_a->del(k); }));

  participant_type b(queue, test_options(counters_b), store->connect(), nullptr, nullptr, clock);
  participant_type a(queue, test_options(counters_a), stale, nullptr, nullptr, clock);

  // ... both wrote the record, both believe they lead, the last writer owns the record ...
  EXPECT_TRUE(a.is_leader());
  EXPECT_TRUE(b.is_leader());
  EXPECT_EQ(stored_record(*store).owner_id(), a.id());
  EXPECT_EQ(timers.count("participant/tick"), 2U);

  // ... the next tick of each resolves the conflict, the oldest timer belongs to b ...
  clock.set(2000);
  ASSERT_TRUE(timers.fire("participant/tick"));
  ASSERT_TRUE(timers.fire("participant/tick"));
  EXPECT_TRUE(a.is_leader());
  EXPECT_FALSE(b.is_leader());
  EXPECT_EQ(counters_b.lost.load(), 1);
  ASSERT_EQ(counters_b.others.size(), 1U);
  EXPECT_EQ(counters_b.others[0], a.id());
  EXPECT_EQ(counters_a.lost.load(), 0);

  auto record = stored_record(*store);
  EXPECT_EQ(record.owner_id(), a.id());
  EXPECT_EQ(record.acquired_at(), 2000);

  shutdown_and_drain(b, timers);
  EXPECT_EQ(stored_record(*store).owner_id(), a.id());
  shutdown_and_drain(a, timers);
  EXPECT_EQ(store->size(), 0U);
}

/**
 * @test Verify that store failures make the participant assume leadership.
 */
TEST(participant_impl, store_failure_fails_safe) {
  using namespace ::testing;
  completion_queue_type queue;
  captured_timers timers(queue);
  fake_clock clock;
  clock.set(1000);
  callback_counters counters;
  auto store = std::make_shared<sl::detail::mock_lease_store>();
  EXPECT_CALL(*store, get(_, _)).WillRepeatedly(Throw(std::runtime_error("quota exceeded")));
  EXPECT_CALL(*store, set(_, _)).Times(0);
  EXPECT_CALL(*store, del(_)).Times(0);

  participant_type participant(queue, test_options(counters), store, nullptr, nullptr, clock);
  EXPECT_TRUE(participant.is_leader());
  EXPECT_EQ(counters.became.load(), 1);
  EXPECT_FALSE((bool)participant.read_current_record());

  // ... the tick keeps running ...
  ASSERT_TRUE(timers.fire("participant/tick"));
  EXPECT_TRUE(participant.is_leader());
  EXPECT_EQ(counters.became.load(), 1);
  EXPECT_EQ(timers.count("participant/tick"), 1U);

  shutdown_and_drain(participant, timers);
}

/**
 * @test Verify that a failed write also makes the participant assume leadership.
 */
TEST(participant_impl, write_failure_fails_safe) {
  completion_queue_type queue;
  captured_timers timers(queue);
  fake_clock clock;
  clock.set(3000);
  callback_counters counters;
  auto store = std::make_shared<sl::memory_store>();
  store->inject("single-owner-my-app", record_value("A", 2000));

  participant_type participant(queue, test_options(counters), store->connect(), nullptr, nullptr, clock);
  EXPECT_FALSE(participant.is_leader());

  store->available(false);
  ASSERT_TRUE(timers.fire("participant/tick"));
  EXPECT_TRUE(participant.is_leader());
  EXPECT_EQ(counters.became.load(), 1);

  // ... once the store recovers the participant follows the live owner again ...
  store->available(true);
  ASSERT_TRUE(timers.fire("participant/tick"));
  EXPECT_FALSE(participant.is_leader());
  EXPECT_EQ(counters.lost.load(), 1);

  shutdown_and_drain(participant, timers);
  EXPECT_EQ(stored_record(*store).owner_id(), "A");
}

/**
 * @test Verify that a participant works without a usable broadcast bus.
 */
TEST(participant_impl, bus_degrades_to_polling) {
  completion_queue_type queue;
  captured_timers timers(queue);
  fake_clock clock;
  clock.set(1000);
  callback_counters counters;
  auto store = std::make_shared<sl::memory_store>();
  auto bus = std::make_shared<sl::memory_bus>();
  bus->available(false);

  participant_type participant(queue, test_options(counters), store->connect(), nullptr, bus->connect(), clock);
  EXPECT_TRUE(participant.is_leader());
  EXPECT_EQ(bus->subscription_count(), 0U);
  EXPECT_EQ(bus->published_count(), 0U);
  EXPECT_EQ(timers.count("participant/tick"), 1U);

  shutdown_and_drain(participant, timers);
  EXPECT_EQ(store->size(), 0U);
  EXPECT_EQ(bus->published_count(), 0U);
}

/**
 * @test Verify that the broadcast bus can be disabled in the options.
 */
TEST(participant_impl, bus_disabled) {
  completion_queue_type queue;
  captured_timers timers(queue);
  fake_clock clock;
  callback_counters counters;
  auto options = test_options(counters);
  options.use_broadcast_bus = false;
  auto store = std::make_shared<sl::memory_store>();
  auto bus = std::make_shared<sl::memory_bus>();

  participant_type participant(queue, std::move(options), store->connect(), nullptr, bus->connect(), clock);
  EXPECT_TRUE(participant.is_leader());
  EXPECT_EQ(bus->subscription_count(), 0U);
  EXPECT_EQ(bus->published_count(), 0U);

  shutdown_and_drain(participant, timers);
}

/**
 * @test Verify that bus messages from other participants trigger a reconciliation.
 */
TEST(participant_impl, bus_messages_trigger_reconciliation) {
  completion_queue_type queue;
  captured_timers timers(queue);
  fake_clock clock;
  clock.set(1000);
  callback_counters counters;
  auto store = std::make_shared<sl::memory_store>();
  auto bus = std::make_shared<sl::memory_bus>();
  auto sender = bus->connect();

  participant_type participant(queue, test_options(counters), store->connect(), nullptr, bus->connect(), clock);
  ASSERT_TRUE(participant.is_leader());

  // ... garbage and unknown kinds are ignored ...
  sender->publish("single-owner-my-app", "not a protobuf");
  slpb::BusMessage msg;
  msg.set_sender_id("X");
  sender->publish("single-owner-my-app", sl::encode_bus_message(msg));
  // ... messages with our own id are ignored ...
  msg.set_kind(slpb::BusMessage::LEADERSHIP_CHANGED);
  msg.set_sender_id(participant.id());
  sender->publish("single-owner-my-app", sl::encode_bus_message(msg));
  // ... so are messages about other namespaces ...
  msg.set_sender_id("X");
  sender->publish("single-owner-other-app", sl::encode_bus_message(msg));
  EXPECT_EQ(timers.count("participant/debounce"), 0U);

  // ... X took over with force_acquire() and announced it ...
  store->inject("single-owner-my-app", record_value("X", 1100));
  sender->publish("single-owner-my-app", sl::encode_bus_message(msg));
  EXPECT_EQ(timers.count("participant/debounce"), 1U);
  msg.set_kind(slpb::BusMessage::CLOSING);
  sender->publish("single-owner-my-app", sl::encode_bus_message(msg));
  EXPECT_EQ(timers.count("participant/debounce"), 1U);

  clock.set(1200);
  ASSERT_TRUE(timers.fire("participant/debounce"));
  EXPECT_FALSE(participant.is_leader());
  EXPECT_EQ(counters.lost.load(), 1);

  shutdown_and_drain(participant, timers);
}

/**
 * @test Verify that malformed records are treated as absent.
 */
TEST(participant_impl, malformed_record_is_claimed) {
  completion_queue_type queue;
  captured_timers timers(queue);
  fake_clock clock;
  clock.set(1000);
  callback_counters counters;
  auto store = std::make_shared<sl::memory_store>();
  store->inject("single-owner-my-app", "this is not a lease record");

  participant_type participant(queue, test_options(counters), store->connect(), nullptr, nullptr, clock);
  EXPECT_TRUE(participant.is_leader());
  EXPECT_EQ(stored_record(*store).owner_id(), participant.id());

  // ... a record without an owner is also malformed ...
  store->inject("single-owner-my-app", R"""({"acquiredAt": 1000})""");
  EXPECT_FALSE((bool)participant.read_current_record());
  ASSERT_TRUE(timers.fire("participant/tick"));
  EXPECT_TRUE(participant.is_leader());
  EXPECT_EQ(stored_record(*store).owner_id(), participant.id());
  EXPECT_EQ(counters.became.load(), 1);
  EXPECT_TRUE(counters.others.empty());

  auto current = participant.read_current_record();
  ASSERT_TRUE((bool)current);
  EXPECT_EQ(current->owner_id(), participant.id());

  shutdown_and_drain(participant, timers);
}

/**
 * @test Verify that a reconciliation requested during a reconciliation runs after it.
 */
TEST(participant_impl, reconciliation_is_not_reentrant) {
  completion_queue_type queue;
  captured_timers timers(queue);
  fake_clock clock;
  clock.set(1000);
  callback_counters counters;
  auto store = std::make_shared<sl::memory_store>();
  store->inject("single-owner-my-app", record_value("A", 1000));

  participant_type* self = nullptr;
  bool reenter = false;
  bool was_reconciling = false;
  auto options = test_options(counters);
  options.on_other_detected = [&](std::string const& owner_id) {
    counters.others.push_back(owner_id);
    if (self != nullptr and reenter) {
      reenter = false;
      was_reconciling = self->is_reconciling();
      // ... this returns immediately, the pass runs once the current one completes ...
      self->reconcile_now();
      EXPECT_EQ(counters.others.size(), 2U);
    }
  };

  participant_type participant(queue, std::move(options), store->connect(), nullptr, nullptr, clock);
  self = &participant;
  EXPECT_EQ(counters.others.size(), 1U);

  reenter = true;
  ASSERT_TRUE(timers.fire("participant/tick"));
  EXPECT_TRUE(was_reconciling);
  EXPECT_EQ(counters.others.size(), 3U);
  EXPECT_FALSE(participant.is_reconciling());

  shutdown_and_drain(participant, timers);
}

/**
 * @test Verify that force_acquire() during a reconciliation invalidates its result.
 */
TEST(participant_impl, force_acquire_during_reconciliation) {
  using namespace ::testing;
  completion_queue_type queue;
  captured_timers timers(queue);
  fake_clock clock;
  clock.set(1000);
  callback_counters counters;
  auto backing = std::make_shared<sl::memory_store>();
  backing->inject("single-owner-my-app", record_value("A", 1000));
  auto context = backing->connect();

  auto store = std::make_shared<sl::detail::mock_lease_store>();
  EXPECT_CALL(*store, get(_, _)).WillRepeatedly(Invoke([context](std::string const& k, std::string& v) {
    return context->get(k, v);
  }));
  EXPECT_CALL(*store, set(_, _)).WillRepeatedly(Invoke([context](std::string const& k, std::string const& v) {
    context->set(k, v);
  }));
  EXPECT_CALL(*store, del(_)).WillRepeatedly(Invoke([context](std::string const& k) { context->del(k); }));

  participant_type participant(queue, test_options(counters), store, nullptr, nullptr, clock);
  ASSERT_FALSE(participant.is_leader());
  EXPECT_EQ(counters.others.size(), 1U);

  // ... the application forces the lease while the tick is reading the record ...
  EXPECT_CALL(*store, get(_, _))
      .WillOnce(Invoke([context, &participant](std::string const& k, std::string& v) {
        bool found = context->get(k, v);
        participant.force_acquire();
        return found;
      }))
      .RetiresOnSaturation();
  ASSERT_TRUE(timers.fire("participant/tick"));
  EXPECT_TRUE(participant.is_leader());
  EXPECT_EQ(counters.became.load(), 1);
  EXPECT_EQ(counters.lost.load(), 0);
  EXPECT_EQ(counters.others.size(), 1U);
  EXPECT_EQ(stored_record(*backing).owner_id(), participant.id());

  shutdown_and_drain(participant, timers);
  EXPECT_EQ(backing->size(), 0U);
}

/**
 * @test Verify that exceptions raised by the callbacks are contained.
 */
TEST(participant_impl, callback_exceptions) {
  completion_queue_type queue;
  captured_timers timers(queue);
  fake_clock clock;
  clock.set(1000);
  callback_counters counters;
  auto options = test_options(counters);
  options.on_become_leader = []() { throw std::runtime_error("application bug"); };
  auto store = std::make_shared<sl::memory_store>();

  std::unique_ptr<participant_type> participant;
  ASSERT_NO_THROW(
      participant = std::make_unique<participant_type>(queue, options, store->connect(), nullptr, nullptr, clock));
  EXPECT_TRUE(participant->is_leader());
  ASSERT_TRUE(timers.fire("participant/tick"));
  EXPECT_EQ(timers.count("participant/tick"), 1U);

  shutdown_and_drain(*participant, timers);
  EXPECT_NO_THROW(participant.reset());
}

/**
 * @test Verify that invalid configurations are rejected.
 */
TEST(participant_impl, invalid_options) {
  using namespace std::chrono_literals;
  completion_queue_type queue;
  captured_timers timers(queue);
  fake_clock clock;
  callback_counters counters;
  auto store = std::make_shared<sl::memory_store>();

  auto options = test_options(counters);
  options.timeout = 0ms;
  EXPECT_THROW(participant_type(queue, options, store->connect(), nullptr, nullptr, clock), std::invalid_argument);

  options = test_options(counters);
  options.name_space = "";
  EXPECT_THROW(participant_type(queue, options, store->connect(), nullptr, nullptr, clock), std::invalid_argument);

  EXPECT_THROW(
      participant_type(queue, test_options(counters), std::shared_ptr<sl::lease_store>(), nullptr, nullptr, clock),
      std::invalid_argument);

  EXPECT_EQ(timers.count("participant/tick"), 0U);
  EXPECT_EQ(store->size(), 0U);
}

namespace {
captured_timers::captured_timers(completion_queue_type& queue)
    : mu_()
    , timers_() {
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, arm_timer(_)).WillRepeatedly(Invoke([this](auto timer) {
    std::lock_guard<std::mutex> lock(mu_);
    timers_.push_back(timer);
  }));
}

std::size_t captured_timers::count(std::string const& name) const {
  std::lock_guard<std::mutex> lock(mu_);
  return std::count_if(timers_.begin(), timers_.end(), [&name](auto const& op) { return op->name() == name; });
}

bool captured_timers::fire(std::string const& name, bool ok) {
  std::shared_ptr<sl::detail::deadline_timer> op;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto i = std::find_if(timers_.begin(), timers_.end(), [&name](auto const& op) { return op->name() == name; });
    if (i == timers_.end()) {
      return false;
    }
    op = *i;
    timers_.erase(i);
  }
  // ... the callback may create new timers, do not hold the lock ...
  op->fire(ok);
  return true;
}

void captured_timers::cancel_all() {
  std::vector<std::shared_ptr<sl::detail::deadline_timer>> pending;
  {
    std::lock_guard<std::mutex> lock(mu_);
    pending.swap(timers_);
  }
  for (auto const& op : pending) {
    op->fire(false);
  }
}

void callback_counters::attach(sl::participant_options& options) {
  options.on_become_leader = [this]() { ++became; };
  options.on_lose_leadership = [this]() { ++lost; };
  options.on_other_detected = [this](std::string const& owner_id) { others.push_back(owner_id); };
}

sl::participant_options test_options(callback_counters& counters) {
  using namespace std::chrono_literals;
  sl::participant_options options;
  options.timeout = 5000ms;
  options.interval = 2000ms;
  counters.attach(options);
  return options;
}

void shutdown_and_drain(participant_type& participant, captured_timers& timers) {
  using namespace std::chrono_literals;
  auto done = std::async(std::launch::async, [&participant]() { participant.shutdown(); });
  // ... shutdown() blocks until the canceled timers run their callbacks, the mocked timers never fire on their own ...
  while (done.wait_for(5ms) != std::future_status::ready) {
    timers.cancel_all();
  }
  done.get();
}

slpb::LeaseRecord stored_record(sl::memory_store const& store, std::string const& key) {
  slpb::LeaseRecord record;
  std::string value;
  EXPECT_TRUE(store.peek(key, value));
  EXPECT_TRUE(sl::decode_lease_record(value, record)) << "value=" << value;
  return record;
}

bus_observer::bus_observer(std::shared_ptr<sl::memory_bus> const& bus)
    : endpoint(bus->connect())
    , mu()
    , received() {
  endpoint->subscribe("single-owner-my-app", [this](std::string const& payload) {
    slpb::BusMessage msg;
    if (sl::decode_bus_message(payload, msg)) {
      std::lock_guard<std::mutex> lock(mu);
      received.push_back(msg);
    }
  });
}

int bus_observer::count(slpb::BusMessage::Kind kind) const {
  std::lock_guard<std::mutex> lock(mu);
  return static_cast<int>(
      std::count_if(received.begin(), received.end(), [kind](auto const& msg) { return msg.kind() == kind; }));
}
} // anonymous namespace
