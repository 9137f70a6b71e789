#include "sl/active_completion_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>

/**
 * @test Verify that sl::active_completion_queue starts and stops its thread.
 */
TEST(active_completion_queue, basic) {
  auto shq = std::make_shared<sl::active_completion_queue>();
  EXPECT_NO_THROW(shq.reset());

  EXPECT_NO_THROW(sl::active_completion_queue());

  sl::active_completion_queue queue;
  EXPECT_NO_THROW(queue.shutdown());
  // ... the destructor shuts down again, harmless ...
}

/**
 * @test Verify that timer callbacks run in the loop thread.
 */
TEST(active_completion_queue, loop_thread) {
  using namespace std::chrono_literals;
  sl::active_completion_queue queue;
  EXPECT_FALSE(queue.in_loop_thread());

  std::promise<bool> in_loop;
  auto timer = queue.cq().make_relative_timer(
      1ms, "check-thread", [&queue, &in_loop](auto const&, bool ok) { in_loop.set_value(queue.in_loop_thread()); });
  auto fut = in_loop.get_future();
  ASSERT_EQ(std::future_status::ready, fut.wait_for(2s));
  EXPECT_TRUE(fut.get());
}

/**
 * @test Verify that shutdown() delivers canceled timers before the thread exits.
 */
TEST(active_completion_queue, shutdown_drains_canceled_timers) {
  using namespace std::chrono_literals;
  sl::active_completion_queue queue;

  std::atomic<int> canceled(0);
  auto timer = queue.cq().make_relative_timer(
      10000ms, "participant/tick", [&canceled](auto const&, bool ok) {
        if (not ok) {
          ++canceled;
        }
      });
  timer->cancel();
  queue.shutdown();
  EXPECT_EQ(canceled.load(), 1);
  EXPECT_EQ(queue.cq().pending_count(), 0U);
}
