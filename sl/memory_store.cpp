#include "sl/memory_store.hpp"
#include <sl/log.hpp>

#include <stdexcept>
#include <vector>

namespace sl {

long constexpr memory_store::no_context;

memory_store::memory_store()
    : mu_()
    , delivery_mu_()
    , values_()
    , subscriptions_()
    , next_token_(0)
    , next_context_(no_context)
    , available_(true) {
}

std::shared_ptr<memory_store_context> memory_store::connect() {
  long origin = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    origin = ++next_context_;
  }
  return std::make_shared<memory_store_context>(shared_from_this(), origin);
}

void memory_store::inject(std::string const& key, std::string const& value) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    values_[key] = value;
  }
  notify(no_context, key);
}

void memory_store::erase(std::string const& key) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    values_.erase(key);
  }
  notify(no_context, key);
}

bool memory_store::peek(std::string const& key, std::string& value) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto i = values_.find(key);
  if (i == values_.end()) {
    return false;
  }
  value = i->second;
  return true;
}

std::size_t memory_store::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return values_.size();
}

std::size_t memory_store::subscription_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return subscriptions_.size();
}

void memory_store::available(bool value) {
  std::lock_guard<std::mutex> lock(mu_);
  available_ = value;
}

bool memory_store::get(std::string const& key, std::string& value) {
  std::lock_guard<std::mutex> lock(mu_);
  check_available("get");
  auto i = values_.find(key);
  if (i == values_.end()) {
    return false;
  }
  value = i->second;
  return true;
}

void memory_store::set(long origin, std::string const& key, std::string const& value) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    check_available("set");
    values_[key] = value;
  }
  notify(origin, key);
}

void memory_store::del(long origin, std::string const& key) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    check_available("del");
    if (values_.erase(key) == 0U) {
      return;
    }
  }
  notify(origin, key);
}

long memory_store::subscribe(long origin, std::string const& key, change_listener::callback_type&& callback) {
  std::lock_guard<std::mutex> lock(mu_);
  long token = ++next_token_;
  subscriptions_.emplace(token, subscription{origin, key, std::move(callback)});
  return token;
}

void memory_store::unsubscribe(long token) {
  // ... wait for any delivery in progress, after this function returns the callback is never called ...
  std::lock_guard<std::recursive_mutex> delivery(delivery_mu_);
  std::lock_guard<std::mutex> lock(mu_);
  subscriptions_.erase(token);
}

void memory_store::unsubscribe_all(long origin) {
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

void memory_store::check_available(char const* where) const {
  if (not available_) {
    throw std::runtime_error(std::string("memory_store::") + where + "() - store is unavailable");
  }
}

void memory_store::notify(long origin, std::string const& key) {
  std::lock_guard<std::recursive_mutex> delivery(delivery_mu_);
  // ... the callbacks are called without holding mu_, they may read the store ...
  std::vector<change_listener::callback_type> callbacks;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto const& s : subscriptions_) {
      if (s.second.key == key and (origin == no_context or s.second.origin != origin)) {
        callbacks.push_back(s.second.callback);
      }
    }
  }
  SL_LOG(trace) << "memory_store notify key=" << key << ", origin=" << origin << ", subscribers=" << callbacks.size();
  for (auto const& cb : callbacks) {
    cb(key);
  }
}

memory_store_context::memory_store_context(std::shared_ptr<memory_store> store, long origin)
    : store_(std::move(store))
    , origin_(origin) {
}

memory_store_context::~memory_store_context() {
  store_->unsubscribe_all(origin_);
}

bool memory_store_context::get(std::string const& key, std::string& value) {
  return store_->get(key, value);
}

void memory_store_context::set(std::string const& key, std::string const& value) {
  store_->set(origin_, key, value);
}

void memory_store_context::del(std::string const& key) {
  store_->del(origin_, key);
}

long memory_store_context::subscribe(std::string const& key, callback_type&& callback) {
  return store_->subscribe(origin_, key, std::move(callback));
}

void memory_store_context::unsubscribe(long token) {
  store_->unsubscribe(token);
}

} // namespace sl
