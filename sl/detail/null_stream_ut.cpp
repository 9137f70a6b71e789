#include "sl/detail/null_stream.hpp"

#include <gtest/gtest.h>
#include <string>

TEST(null_stream, base) {
  sl::detail::null_stream n;

  EXPECT_NO_THROW(n << "lease");
  EXPECT_NO_THROW(n << "owner=" << 42 << std::string(" acquired_at=") << 6000L);
}
