#ifndef sl_active_completion_queue_hpp
#define sl_active_completion_queue_hpp

#include <sl/completion_queue.hpp>

#include <memory>
#include <thread>

namespace sl {

/**
 * Run a sl::completion_queue in its own thread.
 *
 * The timers of every participant sharing this object fire in that thread.  Participants keep a shared_ptr to the
 * queue, so it outlives them, and the destructor stops the loop and joins the thread.
 */
class active_completion_queue {
public:
  /// Create the queue and start the thread running its loop.
  active_completion_queue();

  active_completion_queue(active_completion_queue const&) = delete;
  active_completion_queue& operator=(active_completion_queue const&) = delete;
  active_completion_queue(active_completion_queue&&) = delete;
  active_completion_queue& operator=(active_completion_queue&&) = delete;

  ~active_completion_queue();

  completion_queue<>& cq() {
    return *queue_;
  }

  /// True when called from the thread running the loop, where blocking on a participant would deadlock.
  bool in_loop_thread() const {
    return std::this_thread::get_id() == thread_.get_id();
  }

  /**
   * Stop the loop and join the thread.
   *
   * The loop first runs the callbacks of any canceled timers.  Calling it more than once has no effect.
   */
  void shutdown();

private:
  std::shared_ptr<completion_queue<>> queue_;
  std::thread thread_;
};

} // namespace sl

#endif // sl_active_completion_queue_hpp
