/**
 * @file
 *
 * Helper to print protobufs in log messages and exceptions.
 */
#ifndef sl_detail_print_to_stream_hpp
#define sl_detail_print_to_stream_hpp

#include <google/protobuf/message.h>

#include <iosfwd>

namespace sl {
namespace detail {

/**
 * Print a protobuf on a std::ostream, in a single line.
 *
 * @code
 * slpb::LeaseRecord const& record = ...;
 * SL_LOG(info) << "current record " << print_to_stream(record);
 * @endcode
 */
struct print_to_stream {
  explicit print_to_stream(google::protobuf::Message const& m)
      : msg(m) {
  }

  google::protobuf::Message const& msg;
};

/// Streaming operator
std::ostream& operator<<(std::ostream& os, print_to_stream const& x);

} // namespace detail
} // namespace sl

#endif // sl_detail_print_to_stream_hpp
