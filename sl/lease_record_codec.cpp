#include "sl/lease_record_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cstdint>
#include <sstream>
#include <stdexcept>

namespace sl {

slpb::LeaseRecord make_lease_record(std::string const& owner_id, std::int64_t acquired_at) {
  slpb::LeaseRecord record;
  record.set_owner_id(owner_id);
  record.set_acquired_at(acquired_at);
  return record;
}

std::string encode_lease_record(slpb::LeaseRecord const& record) {
  // ... a double holds every integer up to 2^53 exactly, which covers epoch milliseconds for a long time ...
  std::int64_t const max_exact = std::int64_t(1) << 53;
  if (record.acquired_at() > max_exact or record.acquired_at() < -max_exact) {
    std::ostringstream os;
    os << "cannot format lease record for owner=" << record.owner_id() << ": acquired_at=" << record.acquired_at()
       << " is not representable as a JSON number";
    throw std::runtime_error(os.str());
  }
  // ... the proto3 mapping of int64 is a JSON string, build the object by hand to print acquiredAt as a number ...
  google::protobuf::Struct json;
  auto& fields = *json.mutable_fields();
  fields["ownerId"].set_string_value(record.owner_id());
  fields["acquiredAt"].set_number_value(static_cast<double>(record.acquired_at()));
  std::string value;
  auto status = google::protobuf::util::MessageToJsonString(json, &value);
  if (not status.ok()) {
    std::ostringstream os;
    os << "cannot format lease record for owner=" << record.owner_id() << ": " << status.ToString();
    throw std::runtime_error(os.str());
  }
  return value;
}

bool decode_lease_record(std::string const& value, slpb::LeaseRecord& record) {
  if (value.empty()) {
    return false;
  }
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  record.Clear();
  auto status = google::protobuf::util::JsonStringToMessage(value, &record, options);
  if (not status.ok()) {
    return false;
  }
  return not record.owner_id().empty();
}

std::string encode_bus_message(slpb::BusMessage const& msg) {
  return msg.SerializeAsString();
}

bool decode_bus_message(std::string const& payload, slpb::BusMessage& msg) {
  if (not msg.ParseFromString(payload)) {
    return false;
  }
  return msg.kind() != slpb::BusMessage::UNKNOWN and slpb::BusMessage::Kind_IsValid(msg.kind());
}

} // namespace sl
