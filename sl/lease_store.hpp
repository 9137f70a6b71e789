#ifndef sl_lease_store_hpp
#define sl_lease_store_hpp

#include <string>

namespace sl {

/**
 * Define the interface to the shared key-value store holding the lease records.
 *
 * The store is durable and shared by all the participants, but it is not atomic: nothing prevents two participants
 * from reading the same value and then both writing.  The participants only need the three operations below.
 *
 * All the operations are synchronous and raise a std::exception if the store is unavailable or full.
 */
class lease_store {
public:
  virtual ~lease_store() {}

  /**
   * Read the value stored under @a key.
   *
   * @return false if there is no value under @a key.
   */
  virtual bool get(std::string const& key, std::string& value) = 0;

  /// Store @a value under @a key, replacing any previous value.
  virtual void set(std::string const& key, std::string const& value) = 0;

  /// Remove the value stored under @a key, if any.
  virtual void del(std::string const& key) = 0;
};

/**
 * Probe a store by writing, reading back and deleting a sentinel key.
 *
 * @return false if any of the operations fails or the value read back does not match, never throws.
 */
bool lease_store_available(lease_store& store);

} // namespace sl

#endif // sl_lease_store_hpp
