#include "sl/participant_options.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;

/**
 * @test Verify the default values.
 */
TEST(participant_options, defaults) {
  sl::participant_options options;
  EXPECT_EQ(options.name_space, "my-app");
  EXPECT_EQ(options.storage_key(), "single-owner-my-app");
  EXPECT_EQ(options.timeout, 15000ms);
  EXPECT_EQ(options.interval, 10000ms);
  EXPECT_EQ(options.debounce, 100ms);
  EXPECT_TRUE(options.use_broadcast_bus);
  EXPECT_FALSE(options.debug);
  EXPECT_NO_THROW(options.validate());

  options.key_prefix = "reports";
  options.name_space = "nightly";
  EXPECT_EQ(options.storage_key(), "reports-nightly");
}

/**
 * @test Verify that invalid values are rejected.
 */
TEST(participant_options, validate) {
  sl::participant_options options;
  options.name_space = "";
  EXPECT_THROW(options.validate(), std::invalid_argument);

  options = sl::participant_options();
  options.key_prefix = "";
  EXPECT_THROW(options.validate(), std::invalid_argument);

  options = sl::participant_options();
  options.timeout = 0ms;
  EXPECT_THROW(options.validate(), std::invalid_argument);

  options = sl::participant_options();
  options.interval = -1ms;
  EXPECT_THROW(options.validate(), std::invalid_argument);

  options = sl::participant_options();
  options.debounce = -1ms;
  EXPECT_THROW(options.validate(), std::invalid_argument);

  options = sl::participant_options();
  options.debounce = 0ms;
  EXPECT_NO_THROW(options.validate());
}
