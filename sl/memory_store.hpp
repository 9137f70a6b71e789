#ifndef sl_memory_store_hpp
#define sl_memory_store_hpp

#include <sl/change_listener.hpp>
#include <sl/lease_store.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace sl {
class memory_store_context;

/**
 * A thread-safe, in-process lease store shared by several execution contexts.
 *
 * Each participant connects through its own sl::memory_store_context, the contexts implement sl::lease_store and
 * sl::change_listener.  Writes made through one context notify the subscribers of all the *other* contexts, writes
 * made directly on the store (inject(), erase()) notify every subscriber, as a write from a foreign process would.
 *
 * Like the stores it stands in for, it offers no compare-and-set.
 *
 * @code
 * auto store = std::make_shared<sl::memory_store>();
 * auto context = store->connect();
 * @endcode
 */
class memory_store : public std::enable_shared_from_this<memory_store> {
public:
  memory_store();
  memory_store(memory_store const&) = delete;
  memory_store& operator=(memory_store const&) = delete;

  /// Create a new execution context for this store, the store must be owned by a std::shared_ptr.
  std::shared_ptr<memory_store_context> connect();

  /// Write a value without an originating context.
  void inject(std::string const& key, std::string const& value);

  /// Delete a value without an originating context.
  void erase(std::string const& key);

  /// Read a value, ignores the availability flag.
  bool peek(std::string const& key, std::string& value) const;

  /// The number of keys in the store.
  std::size_t size() const;

  /// The number of active subscriptions, across all contexts.
  std::size_t subscription_count() const;

  /// Simulate an unavailable (or full) store, all context operations raise while unavailable.
  void available(bool value);

private:
  friend class memory_store_context;

  /// The origin used by inject() and erase().
  static long constexpr no_context = 0;

  bool get(std::string const& key, std::string& value);
  void set(long origin, std::string const& key, std::string const& value);
  void del(long origin, std::string const& key);
  long subscribe(long origin, std::string const& key, change_listener::callback_type&& callback);
  void unsubscribe(long token);
  void unsubscribe_all(long origin);

  /// Raise if the store is marked unavailable, must be called with the mutex held.
  void check_available(char const* where) const;

  /// Call the subscribers of @a key not owned by @a origin.
  void notify(long origin, std::string const& key);

private:
  mutable std::mutex mu_;
  /// Held while delivering notifications, unsubscribe() waits on it.
  std::recursive_mutex delivery_mu_;
  std::map<std::string, std::string> values_;

  struct subscription {
    long origin;
    std::string key;
    change_listener::callback_type callback;
  };
  std::map<long, subscription> subscriptions_;
  long next_token_;
  long next_context_;
  bool available_;
};

/**
 * One execution context connected to a sl::memory_store.
 */
class memory_store_context : public lease_store, public change_listener {
public:
  memory_store_context(std::shared_ptr<memory_store> store, long origin);
  ~memory_store_context();

  //@{
  /// @name implement the lease_store interface.
  bool get(std::string const& key, std::string& value) override;
  void set(std::string const& key, std::string const& value) override;
  void del(std::string const& key) override;
  //@}

  //@{
  /// @name implement the change_listener interface.
  long subscribe(std::string const& key, callback_type&& callback) override;
  void unsubscribe(long token) override;
  //@}

  long origin() const {
    return origin_;
  }

private:
  std::shared_ptr<memory_store> store_;
  long origin_;
};

} // namespace sl

#endif // sl_memory_store_hpp
