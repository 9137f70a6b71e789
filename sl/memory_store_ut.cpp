#include "sl/memory_store.hpp"

#include <gtest/gtest.h>

#include <vector>

/**
 * @test Verify the basic get/set/del operations.
 */
TEST(memory_store, basic) {
  auto store = std::make_shared<sl::memory_store>();
  auto context = store->connect();

  std::string value;
  EXPECT_FALSE(context->get("single-owner-my-app", value));
  context->set("single-owner-my-app", "v1");
  ASSERT_TRUE(context->get("single-owner-my-app", value));
  EXPECT_EQ(value, "v1");
  EXPECT_EQ(store->size(), 1U);

  context->set("single-owner-my-app", "v2");
  ASSERT_TRUE(store->peek("single-owner-my-app", value));
  EXPECT_EQ(value, "v2");

  context->del("single-owner-my-app");
  EXPECT_FALSE(context->get("single-owner-my-app", value));
  EXPECT_NO_THROW(context->del("single-owner-my-app"));
  EXPECT_EQ(store->size(), 0U);
}

/**
 * @test Verify that writes only notify the subscribers of other contexts.
 */
TEST(memory_store, notifications_skip_origin) {
  auto store = std::make_shared<sl::memory_store>();
  auto a = store->connect();
  auto b = store->connect();
  EXPECT_NE(a->origin(), b->origin());

  std::vector<std::string> seen_by_a;
  std::vector<std::string> seen_by_b;
  auto ta = a->subscribe("k", [&seen_by_a](std::string const& key) { seen_by_a.push_back(key); });
  auto tb = b->subscribe("k", [&seen_by_b](std::string const& key) { seen_by_b.push_back(key); });
  b->subscribe("other", [&seen_by_b](std::string const& key) { seen_by_b.push_back(key); });
  EXPECT_EQ(store->subscription_count(), 3U);

  a->set("k", "from-a");
  EXPECT_TRUE(seen_by_a.empty());
  ASSERT_EQ(seen_by_b.size(), 1U);
  EXPECT_EQ(seen_by_b[0], "k");

  b->del("k");
  EXPECT_EQ(seen_by_a.size(), 1U);
  EXPECT_EQ(seen_by_b.size(), 1U);

  // ... deleting a missing key is not a change ...
  b->del("k");
  EXPECT_EQ(seen_by_a.size(), 1U);

  // ... external writes notify everybody ...
  store->inject("k", "external");
  EXPECT_EQ(seen_by_a.size(), 2U);
  EXPECT_EQ(seen_by_b.size(), 2U);

  a->unsubscribe(ta);
  b->unsubscribe(tb);
  store->erase("k");
  EXPECT_EQ(seen_by_a.size(), 2U);
  EXPECT_EQ(seen_by_b.size(), 2U);
}

/**
 * @test Verify that callbacks can read the store while being notified.
 */
TEST(memory_store, callback_reads_store) {
  auto store = std::make_shared<sl::memory_store>();
  auto a = store->connect();
  auto b = store->connect();

  std::string observed;
  b->subscribe("k", [&b, &observed](std::string const& key) { b->get(key, observed); });
  a->set("k", "hello");
  EXPECT_EQ(observed, "hello");
}

/**
 * @test Verify that destroying a context removes its subscriptions.
 */
TEST(memory_store, context_cleanup) {
  auto store = std::make_shared<sl::memory_store>();
  {
    auto a = store->connect();
    a->subscribe("k", [](std::string const&) {});
    a->subscribe("j", [](std::string const&) {});
    EXPECT_EQ(store->subscription_count(), 2U);
  }
  EXPECT_EQ(store->subscription_count(), 0U);
}

/**
 * @test Verify that an unavailable store raises from every context operation.
 */
TEST(memory_store, unavailable) {
  auto store = std::make_shared<sl::memory_store>();
  auto a = store->connect();
  a->set("k", "v");

  store->available(false);
  std::string value;
  EXPECT_THROW(a->get("k", value), std::runtime_error);
  EXPECT_THROW(a->set("k", "w"), std::runtime_error);
  EXPECT_THROW(a->del("k"), std::runtime_error);
  EXPECT_FALSE(sl::lease_store_available(*a));

  store->available(true);
  ASSERT_TRUE(a->get("k", value));
  EXPECT_EQ(value, "v");
  EXPECT_TRUE(sl::lease_store_available(*a));
  // ... the probe leaves nothing behind ...
  EXPECT_EQ(store->size(), 1U);
}
