#include "sl/detail/async_op_counter.hpp"

#include <gtest/gtest.h>

#include <thread>

/**
 * @test Verify that sl::detail::async_op_counter counts operations and blocks until they complete.
 */
TEST(async_op_counter, basic) {
  sl::detail::async_op_counter counter;

  EXPECT_TRUE(counter.async_op_start("participant/tick"));
  EXPECT_TRUE(counter.async_op_start("participant/debounce"));
  EXPECT_EQ(counter.pending(), 2);

  counter.async_op_done("participant/tick");
  counter.async_op_done("participant/debounce");
  EXPECT_EQ(counter.pending(), 0);

  EXPECT_TRUE(counter.async_op_start("participant/tick"));
  EXPECT_TRUE(counter.async_op_start("participant/debounce"));

  counter.shutdown();
  EXPECT_TRUE(counter.in_shutdown());
  EXPECT_FALSE(counter.async_op_start("participant/tick"));
  EXPECT_EQ(counter.pending(), 2);

  std::thread t([&counter]() {
    counter.async_op_done("participant/tick");
    counter.async_op_done("participant/debounce");
  });

  counter.block_until_all_done();
  EXPECT_FALSE(counter.async_op_start("participant/tick"));
  EXPECT_EQ(counter.pending(), 0);
  t.join();
}

/**
 * @test Verify that block_until_all_done() returns immediately when nothing is pending.
 */
TEST(async_op_counter, nothing_pending) {
  sl::detail::async_op_counter counter;
  counter.block_until_all_done();
  EXPECT_TRUE(counter.in_shutdown());
  EXPECT_FALSE(counter.async_op_start("participant/reconcile_now"));
}

/**
 * @test Verify that sl::detail::async_op_tracer only counts operations that started.
 */
TEST(async_op_tracer, basic) {
  sl::detail::async_op_counter counter;
  {
    sl::detail::async_op_tracer tracer(counter, "participant/reconcile_now");
    EXPECT_TRUE((bool)tracer);
    EXPECT_EQ(counter.pending(), 1);
  }
  EXPECT_EQ(counter.pending(), 0);

  counter.shutdown();
  {
    sl::detail::async_op_tracer tracer(counter, "participant/force_acquire");
    EXPECT_FALSE((bool)tracer);
    EXPECT_EQ(counter.pending(), 0);
  }
  EXPECT_EQ(counter.pending(), 0);
}
