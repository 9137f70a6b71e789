#ifndef sl_detail_async_op_counter_hpp
#define sl_detail_async_op_counter_hpp

#include <condition_variable>
#include <mutex>

namespace sl {
namespace detail {

/**
 * Track the pending timers of a participant.
 *
 * A participant must not be destroyed while the completion queue still holds a timer whose callback points to it.
 * shutdown() cancels the timers and then blocks until their (canceled) callbacks have run.
 */
class async_op_counter {
public:
  async_op_counter()
      : mu_()
      , cv_()
      , pending_(0)
      , shutdown_(false) {
  }

  /**
   * Reject new operations and block until the pending ones complete.
   *
   * Do not call this operation from the thread running the completion queue event loop.
   */
  void block_until_all_done();

  /// Reject all future operations, async_op_start() returns false.
  void shutdown();

  bool in_shutdown() const {
    std::lock_guard<std::mutex> lock(mu_);
    return shutdown_;
  }

  /// The number of operations started and not yet done.
  int pending() const {
    std::lock_guard<std::mutex> lock(mu_);
    return pending_;
  }

  /**
   * Count a new operation called @a name.
   *
   * Call just before arming the timer, otherwise its callback may run before the count is incremented.
   *
   * @return true if the operation should be started, false if shutting down.
   */
  bool async_op_start(char const* name);

  /**
   * Mark the operation called @a name as completed.
   *
   * Call at the end of the callback, successful or canceled.
   */
  void async_op_done(char const* name);

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  int pending_;
  bool shutdown_;
};

/**
 * Count an operation that runs synchronously in the calling thread.
 *
 * Application calls (reconcile_now(), force_acquire(), ...) hold one of these so shutdown() waits for them.
 */
class async_op_tracer {
public:
  async_op_tracer(async_op_counter& counter, char const* name)
      : counter_(counter)
      , name_(name)
      , status_(false) {
    status_ = counter_.async_op_start(name_);
  }
  ~async_op_tracer() {
    if (status_) {
      counter_.async_op_done(name_);
    }
  }

  /// Return false if the counter was already shutdown, the operation should not run.
  explicit operator bool() const {
    return status_;
  }

  async_op_tracer(async_op_tracer&&) = delete;
  async_op_tracer& operator=(async_op_tracer&&) = delete;
  async_op_tracer(async_op_tracer const&) = delete;
  async_op_tracer& operator=(async_op_tracer const&) = delete;

private:
  async_op_counter& counter_;
  char const* name_;
  bool status_;
};

} // namespace detail
} // namespace sl

#endif // sl_detail_async_op_counter_hpp
