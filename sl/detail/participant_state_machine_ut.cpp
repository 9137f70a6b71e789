#include "sl/detail/participant_state_machine.hpp"

#include <gtest/gtest.h>
#include <sstream>

/**
 * @test Verify the valid and invalid transitions of sl::detail::participant_state_machine.
 */
TEST(participant_state_machine, basic) {
  using s = sl::detail::participant_state;
  sl::detail::participant_state_machine machine;

  ASSERT_EQ(machine.current(), s::constructing);
  EXPECT_FALSE(machine.in_shutdown());
  EXPECT_FALSE(machine.change_state("test-1", s::shutdown));
  EXPECT_TRUE(machine.change_state("test-2", s::following));
  EXPECT_FALSE(machine.change_state("test-3", s::constructing));

  EXPECT_TRUE(machine.change_state("test-4", s::leading));
  EXPECT_EQ(machine.current(), s::leading);
  EXPECT_FALSE(machine.change_state("test-5", s::shutdown));
  EXPECT_EQ(machine.current(), s::leading);

  // ... renewals and repeated follows are accepted ...
  EXPECT_TRUE(machine.change_state("test", s::leading));
  EXPECT_TRUE(machine.change_state("test", s::following));
  EXPECT_TRUE(machine.change_state("test", s::following));

  ASSERT_TRUE(machine.change_state("test", s::shutting_down));
  EXPECT_TRUE(machine.in_shutdown());
  EXPECT_FALSE(machine.change_state("test", s::leading));
  EXPECT_FALSE(machine.change_state("test", s::following));
  EXPECT_FALSE(machine.change_state("test", s::shutting_down));
  ASSERT_TRUE(machine.change_state("test", s::shutdown));
  EXPECT_TRUE(machine.in_shutdown());
  EXPECT_FALSE(machine.change_state("test", s::shutting_down));
  EXPECT_FALSE(machine.change_state("test", s::following));
}

/**
 * @test Verify that the iostream operator for sl::detail::participant_state works as expected.
 */
TEST(participant_state, streaming) {
  using s = sl::detail::participant_state;
  std::ostringstream os;
  os << s::constructing << " " << s::following << " " << s::leading << " " << s::shutting_down << " " << s::shutdown;
  EXPECT_EQ(os.str(), "constructing following leading shutting_down shutdown");
}
