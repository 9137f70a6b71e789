#include "sl/detail/async_op_counter.hpp"
#include <sl/log.hpp>

namespace sl {
namespace detail {

void async_op_counter::block_until_all_done() {
  std::unique_lock<std::mutex> lock(mu_);
  shutdown_ = true;
  if (pending_ != 0) {
    SL_LOG(trace) << "waiting for " << pending_ << " pending operations";
  }
  cv_.wait(lock, [this]() { return pending_ == 0; });
}

void async_op_counter::shutdown() {
  std::lock_guard<std::mutex> lock(mu_);
  shutdown_ = true;
}

bool async_op_counter::async_op_start(char const* name) {
  std::lock_guard<std::mutex> lock(mu_);
  if (shutdown_) {
    SL_LOG(trace) << "async_op_start(" << name << ") rejected, shutting down";
    return false;
  }
  ++pending_;
  SL_LOG(trace) << "async_op_start(" << name << ") pending=" << pending_;
  return true;
}

void async_op_counter::async_op_done(char const* name) {
  std::unique_lock<std::mutex> lock(mu_);
  --pending_;
  SL_LOG(trace) << "async_op_done(" << name << ") pending=" << pending_;
  if (pending_ == 0) {
    lock.unlock();
    cv_.notify_all();
  }
}

} // namespace detail
} // namespace sl
