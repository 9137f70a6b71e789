#ifndef sl_detail_deadline_timer_hpp
#define sl_detail_deadline_timer_hpp

#include <grpc++/alarm.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace sl {
namespace detail {
/**
 * A timer posted to a sl::completion_queue.
 *
 * Participants use two of them: the periodic reconciliation tick and the debounce timer.  The queue keeps the timer
 * alive until its callback runs, with @a ok == true when the deadline expires, or with @a ok == false after cancel().
 */
class deadline_timer {
public:
  using callback_type = std::function<void(deadline_timer const&, bool)>;

  deadline_timer(std::string name, std::chrono::system_clock::time_point deadline, callback_type callback)
      : name_(std::move(name))
      , deadline_(deadline)
      , callback_(std::move(callback))
      , alarm_() {
  }

  std::string const& name() const {
    return name_;
  }
  std::chrono::system_clock::time_point deadline() const {
    return deadline_;
  }

  /// Cancel from any thread, the callback still runs in the completion queue loop.
  void cancel() {
    if (alarm_) {
      alarm_->Cancel();
    }
  }

  /// Run the callback, called by the completion queue loop (and the tests).
  void fire(bool ok) const {
    callback_(*this, ok);
  }

private:
  friend struct default_grpc_interceptor;
  std::string name_;
  std::chrono::system_clock::time_point deadline_;
  callback_type callback_;
  std::unique_ptr<grpc::Alarm> alarm_;
};
} // namespace detail
} // namespace sl

#endif // sl_detail_deadline_timer_hpp
