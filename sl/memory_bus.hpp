#ifndef sl_memory_bus_hpp
#define sl_memory_bus_hpp

#include <sl/broadcast_bus.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace sl {
class memory_bus_endpoint;

/**
 * An in-process sl::broadcast_bus shared by several participants.
 *
 * Each participant connects through its own endpoint.  A message published through one endpoint is delivered,
 * synchronously and in the publisher's thread, to the subscribers of the same topic in every other endpoint.
 */
class memory_bus : public std::enable_shared_from_this<memory_bus> {
public:
  memory_bus();
  memory_bus(memory_bus const&) = delete;
  memory_bus& operator=(memory_bus const&) = delete;

  /// Create a new endpoint, the bus must be owned by a std::shared_ptr.
  std::shared_ptr<memory_bus_endpoint> connect();

  /// The number of active subscriptions, across all endpoints.
  std::size_t subscription_count() const;

  /// The number of messages published so far.
  std::size_t published_count() const;

  /// Simulate a broken bus, publish() and subscribe() raise while unavailable.
  void available(bool value);

private:
  friend class memory_bus_endpoint;

  void publish(long origin, std::string const& topic, std::string const& payload);
  long subscribe(long origin, std::string const& topic, broadcast_bus::callback_type&& callback);
  void unsubscribe(long token);
  void unsubscribe_all(long origin);

private:
  mutable std::mutex mu_;
  std::recursive_mutex delivery_mu_;

  struct subscription {
    long origin;
    std::string topic;
    broadcast_bus::callback_type callback;
  };
  std::map<long, subscription> subscriptions_;
  long next_token_;
  long next_endpoint_;
  std::size_t published_;
  bool available_;
};

/**
 * One endpoint connected to a sl::memory_bus.
 */
class memory_bus_endpoint : public broadcast_bus {
public:
  memory_bus_endpoint(std::shared_ptr<memory_bus> bus, long origin);
  ~memory_bus_endpoint();

  //@{
  /// @name implement the broadcast_bus interface.
  void publish(std::string const& topic, std::string const& payload) override;
  long subscribe(std::string const& topic, callback_type&& callback) override;
  void unsubscribe(long token) override;
  //@}

private:
  std::shared_ptr<memory_bus> bus_;
  long origin_;
};

} // namespace sl

#endif // sl_memory_bus_hpp
