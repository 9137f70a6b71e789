#include "sl/lease_election.hpp"
#include <sl/assert_throw.hpp>
#include <sl/detail/participant_impl.hpp>
#include <sl/log.hpp>

namespace sl {
participant::~participant() {
}

lease_election::lease_election(
    std::shared_ptr<active_completion_queue> queue, participant_options options, std::shared_ptr<lease_store> store,
    std::shared_ptr<change_listener> listener, std::shared_ptr<broadcast_bus> bus)
    : queue_(std::move(queue))
    , impl_() {
  SL_ASSERT_THROW((bool)queue_);
  impl_ = std::make_unique<detail::participant_impl<completion_queue<>>>(
      queue_->cq(), std::move(options), std::move(store), std::move(listener), std::move(bus));
}

lease_election::~lease_election() {
  if (queue_->in_loop_thread()) {
    SL_LOG(error) << impl_->storage_key() << "/" << impl_->id()
                  << " lease_election deleted from the completion queue thread, this will deadlock";
  }
  try {
    impl_->shutdown();
  } catch (std::exception const& ex) {
    SL_LOG(error) << impl_->storage_key() << "/" << impl_->id() << " error during shutdown: " << ex.what();
  }
}

} // namespace sl
