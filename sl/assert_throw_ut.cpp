#include "sl/assert_throw.hpp"

#include <gmock/gmock.h>

#include <stdexcept>

/**
 * @test Verify that SL_ASSERT_THROW() works as expected.
 */
TEST(assert_throw, basic) {
  ASSERT_THROW(sl::assert_throw_impl("timeout > 0", "validate()", "options.cpp", 20), std::invalid_argument);

  ASSERT_THROW(SL_ASSERT_THROW(false), std::invalid_argument);
  ASSERT_NO_THROW(SL_ASSERT_THROW(true));
}

/**
 * @test Verify that the exception message names the predicate and the location.
 */
TEST(assert_throw, message) {
  try {
    int interval = 0;
    SL_ASSERT_THROW(interval > 0);
    FAIL() << "SL_ASSERT_THROW() should have raised";
  } catch (std::invalid_argument const& ex) {
    using namespace ::testing;
    EXPECT_THAT(ex.what(), HasSubstr("interval > 0"));
    EXPECT_THAT(ex.what(), HasSubstr("assert_throw_ut.cpp"));
  }
}
