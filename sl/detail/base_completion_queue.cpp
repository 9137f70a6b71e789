#include "sl/detail/base_completion_queue.hpp"
#include <sl/assert_throw.hpp>
#include <sl/log.hpp>

#include <exception>

namespace sl {
namespace detail {

base_completion_queue::base_completion_queue()
    : mu_()
    , timers_()
    , queue_()
    , shutdown_(false) {
}

base_completion_queue::~base_completion_queue() {
  // ... the callbacks may refer to participants already deleted, all we can do is report them ...
  for (auto const& t : timers_) {
    SL_LOG(error) << "completion queue deleted with pending timer " << t.second->name();
  }
}

void base_completion_queue::run() {
  void* tag = nullptr;
  bool ok = false;
  // ... Next() keeps returning the canceled timers after Shutdown(), and returns false once the queue is empty ...
  while (queue_.Next(&tag, &ok)) {
    auto timer = take_timer(tag);
    if (not timer) {
      SL_LOG(error) << "completion queue returned unknown tag " << tag;
      continue;
    }
    // ... one participant failing must not stop the loop for the others sharing it ...
    try {
      timer->fire(ok);
    } catch (std::exception const& ex) {
      SL_LOG(error) << "exception raised by " << timer->name() << " callback: " << ex.what();
    }
  }
  SL_LOG(trace) << "completion queue drained";
}

void base_completion_queue::shutdown() {
  if (shutdown_.exchange(true)) {
    return;
  }
  SL_LOG(trace) << "completion queue shutdown with " << pending_count() << " pending timers";
  queue_.Shutdown();
}

std::size_t base_completion_queue::pending_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return timers_.size();
}

void* base_completion_queue::register_timer(std::shared_ptr<deadline_timer> timer) {
  void* tag = timer.get();
  std::lock_guard<std::mutex> lock(mu_);
  bool inserted = timers_.emplace(tag, std::move(timer)).second;
  SL_ASSERT_THROW(inserted);
  return tag;
}

std::shared_ptr<deadline_timer> base_completion_queue::take_timer(void* tag) {
  std::lock_guard<std::mutex> lock(mu_);
  auto i = timers_.find(tag);
  if (i == timers_.end()) {
    return std::shared_ptr<deadline_timer>();
  }
  auto timer = std::move(i->second);
  timers_.erase(i);
  return timer;
}

} // namespace detail
} // namespace sl
