#include "sl/detail/print_to_stream.hpp"
#include <sl/lease_protocol.pb.h>

#include <gmock/gmock.h>

#include <sstream>

/**
 * @test Verify that protobufs are printed in a single line.
 */
TEST(print_to_stream, single_line) {
  slpb::LeaseRecord record;
  record.set_owner_id("participant-a");
  record.set_acquired_at(6000);

  std::ostringstream os;
  os << sl::detail::print_to_stream(record);
  using namespace ::testing;
  EXPECT_THAT(os.str(), HasSubstr("owner_id: \"participant-a\""));
  EXPECT_THAT(os.str(), HasSubstr("acquired_at: 6000"));
  EXPECT_THAT(os.str(), Not(HasSubstr("\n")));
  EXPECT_THAT(os.str(), StartsWith("{"));
  EXPECT_THAT(os.str(), EndsWith("}"));
}

/**
 * @test Verify that empty protobufs print as an empty object.
 */
TEST(print_to_stream, empty) {
  std::ostringstream os;
  os << sl::detail::print_to_stream(slpb::BusMessage());
  EXPECT_EQ(os.str(), "{}");
}
