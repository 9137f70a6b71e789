#include "sl/completion_queue.hpp"
#include <sl/detail/mocked_grpc_interceptor.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>

namespace sl {
namespace detail {
struct base_completion_queue_test_only {
  static grpc::CompletionQueue* get_raw_queue(base_completion_queue& q) {
    return q.cq();
  }
};
} // namespace detail
} // namespace sl

/**
 * @test Verify that timers fire, and canceled timers report ok == false.
 */
TEST(completion_queue, basic) {
  sl::completion_queue<> queue;

  std::atomic<int> cnt(0);
  std::atomic<int> cxl(0);
  auto functor = [&cnt, &cxl](auto const& op, bool ok) {
    if (not ok) {
      ++cxl;
    } else {
      ++cnt;
    }
  };

  using namespace std::chrono_literals;

  auto canceled = queue.make_relative_timer(5ms, "test-canceled", functor);
  canceled->cancel();
  auto timer = queue.make_relative_timer(5ms, "test-timer", functor);
  EXPECT_EQ(timer->name(), "test-timer");
  std::thread t([&queue]() { queue.run(); });

  for (int i = 0; i != 100 and (cnt.load() == 0 or cxl.load() == 0); ++i) {
    std::this_thread::sleep_for(10ms);
  }
  ASSERT_EQ(cnt.load(), 1);
  ASSERT_EQ(cxl.load(), 1);
  EXPECT_EQ(queue.pending_count(), 0U);

  queue.shutdown();
  t.join();
}

/**
 * @test Make sure sl::completion_queue handles unknown tags and failing callbacks gracefully.
 */
TEST(completion_queue, error) {
  using namespace std::chrono_literals;

  sl::completion_queue<> queue;
  std::thread t([&queue]() { queue.run(); });

  grpc::CompletionQueue* cq = sl::detail::base_completion_queue_test_only::get_raw_queue(queue);

  std::atomic<int> cnt(0);
  auto thrower = queue.make_relative_timer(
      5ms, "throws", [](auto const& op, bool ok) { throw std::runtime_error("callback failure"); });
  auto op = queue.make_relative_timer(30ms, "alarm-after", [&cnt](auto const& op, bool ok) { ++cnt; });
  // ... an alarm with a null tag and an alarm with a tag the queue does not know about ...
  grpc::Alarm al1;
  al1.Set(cq, std::chrono::system_clock::now() + 10ms, nullptr);
  grpc::Alarm al2;
  al2.Set(cq, std::chrono::system_clock::now() + 20ms, (void*)&cnt);

  for (int i = 0; i != 100 and cnt.load() == 0; ++i) {
    std::this_thread::sleep_for(40ms);
  }
  ASSERT_EQ(cnt.load(), 1);

  queue.shutdown();
  t.join();
}

/**
 * @test Verify that the mocked interceptor receives the timers instead of gRPC.
 */
TEST(completion_queue, mocked_timer) {
  using namespace std::chrono_literals;
  using namespace ::testing;
  sl::completion_queue<sl::detail::mocked_grpc_interceptor> queue;

  std::shared_ptr<sl::detail::deadline_timer> captured;
  EXPECT_CALL(*queue.interceptor().shared_mock, arm_timer(_))
      .WillOnce(Invoke([&captured](auto timer) { captured = timer; }));

  int calls = 0;
  auto timer = queue.make_relative_timer(10s, "mocked", [&calls](auto const& op, bool ok) {
    EXPECT_TRUE(ok);
    ++calls;
  });
  ASSERT_TRUE((bool)captured);
  EXPECT_EQ(captured->name(), "mocked");
  EXPECT_EQ(calls, 0);
  captured->fire(true);
  EXPECT_EQ(calls, 1);
  // ... the timer was never delivered by gRPC, it remains registered ...
  EXPECT_EQ(queue.pending_count(), 1U);
}
