#include "sl/active_completion_queue.hpp"
#include <sl/log.hpp>

namespace sl {

active_completion_queue::active_completion_queue()
    : queue_(std::make_shared<completion_queue<>>())
    , thread_() {
  thread_ = std::thread([q = queue_]() { q->run(); });
}

active_completion_queue::~active_completion_queue() {
  shutdown();
}

void active_completion_queue::shutdown() {
  queue_->shutdown();
  if (not thread_.joinable()) {
    return;
  }
  if (in_loop_thread()) {
    // ... the loop exits once this callback returns, nobody can join it ...
    SL_LOG(error) << "active_completion_queue shutdown from its own thread, detaching";
    thread_.detach();
    return;
  }
  SL_LOG(trace) << "joining active completion queue thread";
  thread_.join();
}

} // namespace sl
