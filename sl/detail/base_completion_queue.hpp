#ifndef sl_detail_base_completion_queue_hpp
#define sl_detail_base_completion_queue_hpp

#include <sl/detail/deadline_timer.hpp>

#include <grpc++/grpc++.h>

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>

namespace sl {
namespace detail {
/// Give the tests access to the raw grpc::CompletionQueue.
struct base_completion_queue_test_only;

/**
 * The part of sl::completion_queue<> that does not depend on the interceptor.
 *
 * Owns the grpc::CompletionQueue and the timers posted to it.  Each timer is registered under its own address, which
 * is the tag gRPC reports back when the timer expires or is canceled.
 */
class base_completion_queue {
public:
  base_completion_queue();
  virtual ~base_completion_queue();

  /**
   * Run the event loop in the calling thread.
   *
   * Returns once shutdown() was called and every timer still in the queue has been delivered.
   */
  void run();

  /// Stop accepting timers and let run() return, safe to call more than once.
  void shutdown();

  /// The number of timers posted and not yet delivered.
  std::size_t pending_count() const;

protected:
  friend struct ::sl::detail::base_completion_queue_test_only;
  grpc::CompletionQueue* cq() {
    return &queue_;
  }

  /// Keep @a timer alive until it is delivered, returns the tag for gRPC.
  void* register_timer(std::shared_ptr<deadline_timer> timer);

  /// Remove the timer registered under @a tag, returns null if there is none.
  std::shared_ptr<deadline_timer> take_timer(void* tag);

private:
  mutable std::mutex mu_;
  std::map<void*, std::shared_ptr<deadline_timer>> timers_;
  grpc::CompletionQueue queue_;
  std::atomic<bool> shutdown_;
};
} // namespace detail
} // namespace sl

#endif // sl_detail_base_completion_queue_hpp
