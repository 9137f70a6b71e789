#include "sl/lease_record_codec.hpp"

#include <gmock/gmock.h>

#include <stdexcept>

/**
 * @test Verify that records are stored with the documented JSON field names.
 */
TEST(lease_record_codec, encode) {
  auto json = sl::encode_lease_record(sl::make_lease_record("participant-a", 6000));
  using namespace ::testing;
  EXPECT_THAT(json, HasSubstr("\"ownerId\":\"participant-a\""));
  EXPECT_THAT(json, HasSubstr("\"acquiredAt\":6000"));

  slpb::LeaseRecord decoded;
  ASSERT_TRUE(sl::decode_lease_record(json, decoded));
  EXPECT_EQ(decoded.owner_id(), "participant-a");
  EXPECT_EQ(decoded.acquired_at(), 6000);
}

/**
 * @test Verify that realistic timestamps are written as exact JSON numbers.
 */
TEST(lease_record_codec, encode_timestamps) {
  using namespace ::testing;
  auto json = sl::encode_lease_record(sl::make_lease_record("participant-b", 1700000000123LL));
  EXPECT_THAT(json, HasSubstr("\"acquiredAt\":1700000000123"));
  EXPECT_THAT(json, Not(HasSubstr("\"1700000000123\"")));

  slpb::LeaseRecord decoded;
  ASSERT_TRUE(sl::decode_lease_record(json, decoded));
  EXPECT_EQ(decoded.acquired_at(), 1700000000123LL);

  // ... older records with the timestamp as a string are still accepted ...
  ASSERT_TRUE(sl::decode_lease_record(R"""({"ownerId":"participant-b","acquiredAt":"6000"})""", decoded));
  EXPECT_EQ(decoded.acquired_at(), 6000);

  EXPECT_THROW(sl::encode_lease_record(sl::make_lease_record("participant-b", (1LL << 53) + 1)), std::runtime_error);
}

/**
 * @test Verify that records written with integer timestamps, or extra fields, are accepted.
 */
TEST(lease_record_codec, decode_variants) {
  slpb::LeaseRecord record;
  ASSERT_TRUE(sl::decode_lease_record(R"""({"ownerId": "A", "acquiredAt": 0})""", record));
  EXPECT_EQ(record.owner_id(), "A");
  EXPECT_EQ(record.acquired_at(), 0);

  ASSERT_TRUE(sl::decode_lease_record(R"""({"ownerId": "B", "acquiredAt": 1700000000123, "tabs": 3})""", record));
  EXPECT_EQ(record.owner_id(), "B");
  EXPECT_EQ(record.acquired_at(), 1700000000123LL);

  // ... a missing timestamp means the epoch, such a record is always expired ...
  ASSERT_TRUE(sl::decode_lease_record(R"""({"ownerId": "C"})""", record));
  EXPECT_EQ(record.acquired_at(), 0);
}

/**
 * @test Verify that malformed records are rejected.
 */
TEST(lease_record_codec, decode_malformed) {
  slpb::LeaseRecord record;
  EXPECT_FALSE(sl::decode_lease_record("", record));
  EXPECT_FALSE(sl::decode_lease_record("not json at all", record));
  EXPECT_FALSE(sl::decode_lease_record("{\"ownerId\": \"A\", \"acquiredAt\": ", record));
  EXPECT_FALSE(sl::decode_lease_record(R"""({"acquiredAt": 100})""", record));
  EXPECT_FALSE(sl::decode_lease_record(R"""({"ownerId": "", "acquiredAt": 100})""", record));
  EXPECT_FALSE(sl::decode_lease_record(R"""({"ownerId": "A", "acquiredAt": "yesterday"})""", record));
  EXPECT_FALSE(sl::decode_lease_record("[1, 2, 3]", record));
}

/**
 * @test Verify that bus messages with unknown kinds or garbage payloads are rejected.
 */
TEST(lease_record_codec, bus_message) {
  slpb::BusMessage msg;
  msg.set_kind(slpb::BusMessage::CLOSING);
  msg.set_sender_id("participant-a");
  msg.set_sent_at(42);

  slpb::BusMessage decoded;
  ASSERT_TRUE(sl::decode_bus_message(sl::encode_bus_message(msg), decoded));
  EXPECT_EQ(decoded.kind(), slpb::BusMessage::CLOSING);
  EXPECT_EQ(decoded.sender_id(), "participant-a");

  EXPECT_FALSE(sl::decode_bus_message(sl::encode_bus_message(slpb::BusMessage()), decoded));
  EXPECT_FALSE(sl::decode_bus_message(std::string("\xff\xff\xff\xff", 4), decoded));
}
