#include "sl/lease_store.hpp"
#include <sl/log.hpp>

#include <exception>

namespace sl {

bool lease_store_available(lease_store& store) {
  char const* key = "__solo_lease_probe__";
  try {
    store.set(key, key);
    std::string value;
    bool found = store.get(key, value);
    store.del(key);
    return found and value == key;
  } catch (std::exception const& ex) {
    SL_LOG(notice) << "lease store is not available: " << ex.what();
  }
  return false;
}

} // namespace sl
