#include "sl/memory_bus.hpp"
#include <sl/log.hpp>

#include <stdexcept>
#include <vector>

namespace sl {

memory_bus::memory_bus()
    : mu_()
    , delivery_mu_()
    , subscriptions_()
    , next_token_(0)
    , next_endpoint_(0)
    , published_(0)
    , available_(true) {
}

std::shared_ptr<memory_bus_endpoint> memory_bus::connect() {
  long origin = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    origin = ++next_endpoint_;
  }
  return std::make_shared<memory_bus_endpoint>(shared_from_this(), origin);
}

std::size_t memory_bus::subscription_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return subscriptions_.size();
}

std::size_t memory_bus::published_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return published_;
}

void memory_bus::available(bool value) {
  std::lock_guard<std::mutex> lock(mu_);
  available_ = value;
}

void memory_bus::publish(long origin, std::string const& topic, std::string const& payload) {
  std::lock_guard<std::recursive_mutex> delivery(delivery_mu_);
  std::vector<broadcast_bus::callback_type> callbacks;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (not available_) {
      throw std::runtime_error("memory_bus::publish() - bus is unavailable");
    }
    ++published_;
    for (auto const& s : subscriptions_) {
      if (s.second.topic == topic and s.second.origin != origin) {
        callbacks.push_back(s.second.callback);
      }
    }
  }
  SL_LOG(trace) << "memory_bus publish topic=" << topic << ", origin=" << origin << ", subscribers=" << callbacks.size();
  for (auto const& cb : callbacks) {
    cb(payload);
  }
}

long memory_bus::subscribe(long origin, std::string const& topic, broadcast_bus::callback_type&& callback) {
  std::lock_guard<std::mutex> lock(mu_);
  if (not available_) {
    throw std::runtime_error("memory_bus::subscribe() - bus is unavailable");
  }
  long token = ++next_token_;
  subscriptions_.emplace(token, subscription{origin, topic, std::move(callback)});
  return token;
}

void memory_bus::unsubscribe(long token) {
  std::lock_guard<std::recursive_mutex> delivery(delivery_mu_);
  std::lock_guard<std::mutex> lock(mu_);
  subscriptions_.erase(token);
}

void memory_bus::unsubscribe_all(long origin) {
  std::lock_guard<std::recursive_mutex> delivery(delivery_mu_);
  std::lock_guard<std::mutex> lock(mu_);
  for (auto i = subscriptions_.begin(); i != subscriptions_.end();) {
    if (i->second.origin == origin) {
      i = subscriptions_.erase(i);
    } else {
      ++i;
    }
  }
}

memory_bus_endpoint::memory_bus_endpoint(std::shared_ptr<memory_bus> bus, long origin)
    : bus_(std::move(bus))
    , origin_(origin) {
}

memory_bus_endpoint::~memory_bus_endpoint() {
  bus_->unsubscribe_all(origin_);
}

void memory_bus_endpoint::publish(std::string const& topic, std::string const& payload) {
  bus_->publish(origin_, topic, payload);
}

long memory_bus_endpoint::subscribe(std::string const& topic, callback_type&& callback) {
  return bus_->subscribe(origin_, topic, std::move(callback));
}

void memory_bus_endpoint::unsubscribe(long token) {
  bus_->unsubscribe(token);
}

} // namespace sl
