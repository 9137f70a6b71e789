#include "sl/lease_store.hpp"
#include <sl/detail/mock_lease_store.hpp>
#include <sl/memory_store.hpp>

#include <gmock/gmock.h>

/**
 * @test Verify that sl::lease_store_available() probes a working store.
 */
TEST(lease_store_available, basic) {
  auto store = std::make_shared<sl::memory_store>();
  auto context = store->connect();
  EXPECT_TRUE(sl::lease_store_available(*context));
  // ... the probe does not leave anything behind ...
  EXPECT_EQ(store->size(), 0U);

  store->available(false);
  EXPECT_FALSE(sl::lease_store_available(*context));
}

/**
 * @test Verify that sl::lease_store_available() detects stores that lose or corrupt writes.
 */
TEST(lease_store_available, failures) {
  using namespace ::testing;
  sl::detail::mock_lease_store lossy;
  EXPECT_CALL(lossy, set(_, _)).Times(1);
  EXPECT_CALL(lossy, get(_, _)).WillOnce(Return(false));
  EXPECT_CALL(lossy, del(_)).Times(1);
  EXPECT_FALSE(sl::lease_store_available(lossy));

  sl::detail::mock_lease_store full;
  EXPECT_CALL(full, set(_, _)).WillOnce(Throw(std::runtime_error("quota exceeded")));
  EXPECT_CALL(full, get(_, _)).Times(0);
  EXPECT_FALSE(sl::lease_store_available(full));
}
