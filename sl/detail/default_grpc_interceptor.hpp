#ifndef sl_detail_default_grpc_interceptor_hpp
#define sl_detail_default_grpc_interceptor_hpp

#include <sl/detail/deadline_timer.hpp>

#include <grpc++/grpc++.h>
#include <memory>

namespace sl {
namespace detail {

/**
 * The only point where sl::completion_queue calls into gRPC++.
 *
 * The participant tests replace it with sl::detail::mocked_grpc_interceptor to decide exactly when timers fire.
 */
struct default_grpc_interceptor {
  /// Arm a grpc::Alarm that delivers @a tag to @a cq at the timer deadline.
  void arm_timer(std::shared_ptr<deadline_timer> const& timer, grpc::CompletionQueue* cq, void* tag) {
    timer->alarm_.reset(new grpc::Alarm);
    timer->alarm_->Set(cq, timer->deadline(), tag);
  }
};

} // namespace detail
} // namespace sl

#endif // sl_detail_default_grpc_interceptor_hpp
