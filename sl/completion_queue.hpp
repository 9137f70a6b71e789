#ifndef sl_completion_queue_hpp
#define sl_completion_queue_hpp

#include <sl/detail/base_completion_queue.hpp>
#include <sl/detail/deadline_timer.hpp>
#include <sl/detail/default_grpc_interceptor.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace sl {

/**
 * Wrap a gRPC completion queue as the scheduler for lease participants.
 *
 * The grpc::CompletionQueue is a small, robust event loop with timers (grpc::Alarm) that can be armed and canceled
 * from any thread.  This wrapper calls functors (lambdas, std::function<>, etc) when the timers expire or are
 * canceled, all the functors run in the thread that calls run().
 *
 * @tparam grpc_interceptor_t mediate all calls to the gRPC library.  The default inlines all the calls, the tests
 * replace it to decide when timers fire.
 */
template <typename grpc_interceptor_t = detail::default_grpc_interceptor>
class completion_queue : public detail::base_completion_queue {
public:
  using grpc_interceptor_type = grpc_interceptor_t;

  explicit completion_queue(grpc_interceptor_type interceptor = grpc_interceptor_type())
      : detail::base_completion_queue()
      , interceptor_(std::move(interceptor)) {
  }

  /**
   * Call the functor when the deadline expires.
   *
   * The functor is called as `f(detail::deadline_timer const&, bool ok)`, where @a ok is false if the timer was
   * canceled.  system_clock is not guaranteed to be monotonic, the lease protocol compares wall clock timestamps
   * anyway, so a clock step affects both equally.
   */
  template <typename Functor>
  std::shared_ptr<detail::deadline_timer> make_deadline_timer(
      std::chrono::system_clock::time_point deadline, std::string name, Functor&& f) {
    auto timer = std::make_shared<detail::deadline_timer>(
        std::move(name), deadline, detail::deadline_timer::callback_type(std::forward<Functor>(f)));
    void* tag = register_timer(timer);
    interceptor_.arm_timer(timer, cq(), tag);
    return timer;
  }

  /// Call the functor after @a duration.
  template <typename duration_type, typename Functor>
  std::shared_ptr<detail::deadline_timer> make_relative_timer(
      duration_type duration, std::string name, Functor&& functor) {
    auto deadline = std::chrono::system_clock::now() + duration;
    return make_deadline_timer(deadline, std::move(name), std::forward<Functor>(functor));
  }

  /// The interceptor, the tests use it to reach the mocks.
  grpc_interceptor_type& interceptor() {
    return interceptor_;
  }

private:
  grpc_interceptor_type interceptor_;
};

} // namespace sl

#endif // sl_completion_queue_hpp
