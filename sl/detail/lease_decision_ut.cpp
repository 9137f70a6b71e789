#include "sl/detail/lease_decision.hpp"
#include <sl/lease_record_codec.hpp>

#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include <sstream>

using namespace std::chrono_literals;

/**
 * @test Verify the decisions for each kind of record.
 */
TEST(lease_decision, basic) {
  using a = sl::detail::lease_action;
  using sl::detail::decide_lease_action;

  EXPECT_EQ(decide_lease_action(nullptr, "B", 1000, 5000ms), a::claim_absent);

  auto other = sl::make_lease_record("A", 0);
  EXPECT_EQ(decide_lease_action(&other, "B", 3000, 5000ms), a::follow);
  EXPECT_EQ(decide_lease_action(&other, "B", 6000, 5000ms), a::claim_expired);

  auto mine = sl::make_lease_record("B", 1000);
  EXPECT_EQ(decide_lease_action(&mine, "B", 3000, 5000ms), a::renew);
  // ... an expired record is claimed, even when the caller owns it ...
  EXPECT_EQ(decide_lease_action(&mine, "B", 7000, 5000ms), a::claim_expired);
}

/**
 * @test Verify that a record exactly as old as the timeout is still live.
 */
TEST(lease_decision, boundary) {
  using a = sl::detail::lease_action;
  using sl::detail::decide_lease_action;

  auto other = sl::make_lease_record("A", 1000);
  EXPECT_EQ(decide_lease_action(&other, "B", 6000, 5000ms), a::follow);
  EXPECT_EQ(decide_lease_action(&other, "B", 6001, 5000ms), a::claim_expired);

  // ... records from the future (small clock skew) are live ...
  EXPECT_EQ(decide_lease_action(&other, "B", 500, 5000ms), a::follow);
}

/**
 * @test Verify that records with extreme timestamps are classified without overflow.
 */
TEST(lease_decision, extreme_timestamps) {
  using a = sl::detail::lease_action;
  using sl::detail::decide_lease_action;

  auto ancient = sl::make_lease_record("X", std::numeric_limits<std::int64_t>::min());
  EXPECT_EQ(decide_lease_action(&ancient, "B", 1000, 5000ms), a::claim_expired);
  EXPECT_EQ(decide_lease_action(&ancient, "X", 1000, 5000ms), a::claim_expired);

  // ... a record from the far future is never older than the timeout ...
  auto future = sl::make_lease_record("X", std::numeric_limits<std::int64_t>::max());
  EXPECT_EQ(decide_lease_action(&future, "B", 1000, 5000ms), a::follow);
  EXPECT_EQ(decide_lease_action(&future, "X", 1000, 5000ms), a::renew);
}

/**
 * @test Verify the helpers for sl::detail::lease_action.
 */
TEST(lease_action, streaming) {
  using a = sl::detail::lease_action;
  std::ostringstream os;
  os << a::claim_absent << " " << a::claim_expired << " " << a::renew << " " << a::follow;
  EXPECT_EQ(os.str(), "claim_absent claim_expired renew follow");

  EXPECT_TRUE(sl::detail::writes_record(a::claim_absent));
  EXPECT_TRUE(sl::detail::writes_record(a::claim_expired));
  EXPECT_TRUE(sl::detail::writes_record(a::renew));
  EXPECT_FALSE(sl::detail::writes_record(a::follow));
}
