#include "sl/detail/print_to_stream.hpp"

#include <google/protobuf/text_format.h>

#include <ostream>
#include <string>

namespace sl {
namespace detail {

std::ostream& operator<<(std::ostream& os, print_to_stream const& x) {
  // ... on failure we just get an empty string, this is only used for logging ...
  google::protobuf::TextFormat::Printer printer;
  printer.SetSingleLineMode(true);
  std::string formatted;
  (void)printer.PrintToString(x.msg, &formatted);
  // ... single line mode leaves a trailing space ...
  if (not formatted.empty() and formatted.back() == ' ') {
    formatted.pop_back();
  }
  return os << "{" << formatted << "}";
}

} // namespace detail
} // namespace sl
