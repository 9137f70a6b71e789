/**
 * @file
 *
 * Convert lease records and bus messages to and from the strings kept in stores and sent over buses.
 */
#ifndef sl_lease_record_codec_hpp
#define sl_lease_record_codec_hpp

#include <sl/lease_protocol.pb.h>

#include <cstdint>
#include <string>

namespace sl {

/// Create a lease record.
slpb::LeaseRecord make_lease_record(std::string const& owner_id, std::int64_t acquired_at);

/**
 * Format a lease record as JSON.
 *
 * The result looks like `{"ownerId":"participant-a","acquiredAt":6000}`, the field order is not specified.
 *
 * @throws std::runtime_error if the record cannot be formatted, or if `acquired_at` is beyond +/- 2^53.
 */
std::string encode_lease_record(slpb::LeaseRecord const& record);

/**
 * Parse a lease record stored by any participant.
 *
 * `acquiredAt` can be a JSON number or a decimal string, unknown fields are ignored.  A record without an `ownerId`
 * cannot be attributed to anybody and is rejected.
 *
 * @return false if @a value is not a valid lease record, @a record is unspecified in that case.
 */
bool decode_lease_record(std::string const& value, slpb::LeaseRecord& record);

/// Serialize a bus message.
std::string encode_bus_message(slpb::BusMessage const& msg);

/**
 * Parse a bus message.
 *
 * @return false if @a payload is not a valid bus message, or if its kind is unknown.
 */
bool decode_bus_message(std::string const& payload, slpb::BusMessage& msg);

} // namespace sl

#endif // sl_lease_record_codec_hpp
