#include "sl/memory_bus.hpp"

#include <gtest/gtest.h>

#include <vector>

/**
 * @test Verify that messages reach the other endpoints, and not the publisher.
 */
TEST(memory_bus, basic) {
  auto bus = std::make_shared<sl::memory_bus>();
  auto a = bus->connect();
  auto b = bus->connect();
  auto c = bus->connect();

  std::vector<std::string> at_a, at_b, at_c;
  a->subscribe("topic", [&at_a](std::string const& p) { at_a.push_back(p); });
  auto tb = b->subscribe("topic", [&at_b](std::string const& p) { at_b.push_back(p); });
  c->subscribe("elsewhere", [&at_c](std::string const& p) { at_c.push_back(p); });
  EXPECT_EQ(bus->subscription_count(), 3U);

  a->publish("topic", "hello");
  EXPECT_TRUE(at_a.empty());
  ASSERT_EQ(at_b.size(), 1U);
  EXPECT_EQ(at_b[0], "hello");
  EXPECT_TRUE(at_c.empty());
  EXPECT_EQ(bus->published_count(), 1U);

  b->unsubscribe(tb);
  a->publish("topic", "again");
  EXPECT_EQ(at_b.size(), 1U);
  // ... unknown tokens are ignored ...
  EXPECT_NO_THROW(b->unsubscribe(tb));
}

/**
 * @test Verify that an unavailable bus raises, and that endpoints clean up their subscriptions.
 */
TEST(memory_bus, unavailable_and_cleanup) {
  auto bus = std::make_shared<sl::memory_bus>();
  auto a = bus->connect();
  {
    auto b = bus->connect();
    b->subscribe("topic", [](std::string const&) {});
    EXPECT_EQ(bus->subscription_count(), 1U);
  }
  EXPECT_EQ(bus->subscription_count(), 0U);

  bus->available(false);
  EXPECT_THROW(a->publish("topic", "x"), std::runtime_error);
  EXPECT_THROW(a->subscribe("topic", [](std::string const&) {}), std::runtime_error);
  bus->available(true);
  EXPECT_NO_THROW(a->publish("topic", "x"));
}
