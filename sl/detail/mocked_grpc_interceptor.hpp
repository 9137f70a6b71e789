#ifndef sl_detail_mocked_grpc_interceptor_hpp
#define sl_detail_mocked_grpc_interceptor_hpp

#include <sl/detail/deadline_timer.hpp>

#include <gmock/gmock.h>
#include <grpc++/grpc++.h>
#include <memory>

namespace sl {
namespace detail {

/**
 * Replace sl::detail::default_grpc_interceptor in the tests.
 *
 * The timers never reach gRPC, the test captures them through the mock and calls deadline_timer::fire() itself.
 */
struct mocked_grpc_interceptor {
  mocked_grpc_interceptor()
      : shared_mock(std::make_shared<mocked>()) {
  }

  void arm_timer(std::shared_ptr<deadline_timer> const& timer, grpc::CompletionQueue*, void*) {
    shared_mock->arm_timer(timer);
  }

  struct mocked {
    MOCK_CONST_METHOD1(arm_timer, void(std::shared_ptr<deadline_timer> timer));
  };

  /// Shared so the copies made by sl::completion_queue report to the same mock.
  std::shared_ptr<mocked> shared_mock;
};

} // namespace detail
} // namespace sl

#endif // sl_detail_mocked_grpc_interceptor_hpp
