#ifndef sl_detail_mock_lease_store_hpp
#define sl_detail_mock_lease_store_hpp

#include <sl/lease_store.hpp>

#include <gmock/gmock.h>

namespace sl {
namespace detail {
/**
 * A sl::lease_store for the tests, used to inject failures and stale reads.
 */
class mock_lease_store : public lease_store {
public:
  MOCK_METHOD2(get, bool(std::string const&, std::string&));
  MOCK_METHOD2(set, void(std::string const&, std::string const&));
  MOCK_METHOD1(del, void(std::string const&));
};
} // namespace detail
} // namespace sl

#endif // sl_detail_mock_lease_store_hpp
