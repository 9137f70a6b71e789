#include "sl/identity.hpp"

#include <gtest/gtest.h>
#include <regex>
#include <set>

/**
 * @test Verify that participant ids have the expected format.
 */
TEST(identity, format) {
  std::regex re("participant-[0-9]+-[0-9a-z]{9}");
  for (int i = 0; i != 10; ++i) {
    auto id = sl::generate_participant_id();
    EXPECT_TRUE(std::regex_match(id, re)) << "id=" << id;
  }
}

/**
 * @test Verify that generated ids do not repeat.
 */
TEST(identity, unique) {
  std::set<std::string> ids;
  for (int i = 0; i != 1000; ++i) {
    ids.insert(sl::generate_participant_id());
  }
  EXPECT_EQ(ids.size(), 1000UL);
}
