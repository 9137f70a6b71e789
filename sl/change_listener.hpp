#ifndef sl_change_listener_hpp
#define sl_change_listener_hpp

#include <functional>
#include <string>

namespace sl {

/**
 * Define the interface to receive notifications when a key in the lease store changes.
 *
 * A change listener is bound to one execution context, only writes made by *other* contexts are reported.  The
 * callback may run in any thread, including the thread that made the write, it should return quickly and must not
 * call back into the store.
 */
class change_listener {
public:
  //@{
  /// @name type traits
  /// The callback receives the key that changed.
  using callback_type = std::function<void(std::string const& key)>;
  //@}

  virtual ~change_listener() {}

  /**
   * Start receiving notifications about @a key.
   *
   * @returns a token to later remove the subscription.
   */
  virtual long subscribe(std::string const& key, callback_type&& callback) = 0;

  /**
   * Remove a subscription.
   *
   * Once this function returns the callback is not called again.  Unknown tokens are ignored.
   */
  virtual void unsubscribe(long token) = 0;
};

} // namespace sl

#endif // sl_change_listener_hpp
