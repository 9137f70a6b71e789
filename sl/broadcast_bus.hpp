#ifndef sl_broadcast_bus_hpp
#define sl_broadcast_bus_hpp

#include <functional>
#include <string>

namespace sl {

/**
 * Define the interface for a best-effort publish/subscribe channel between participants.
 *
 * There are no guarantees: messages can be lost, reordered, or delivered to nobody, and nothing is persisted.  A
 * publisher does not receive its own messages.  Implementations may raise from any function, the participants treat
 * such failures as if the bus did not exist.
 */
class broadcast_bus {
public:
  //@{
  /// @name type traits
  using callback_type = std::function<void(std::string const& payload)>;
  //@}

  virtual ~broadcast_bus() {}

  /// Send @a payload to the subscribers of @a topic.
  virtual void publish(std::string const& topic, std::string const& payload) = 0;

  /**
   * Receive the messages published on @a topic.
   *
   * @returns a token to later remove the subscription.
   */
  virtual long subscribe(std::string const& topic, callback_type&& callback) = 0;

  /// Remove a subscription, unknown tokens are ignored.
  virtual void unsubscribe(long token) = 0;
};

} // namespace sl

#endif // sl_broadcast_bus_hpp
