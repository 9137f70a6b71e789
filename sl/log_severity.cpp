#include "sl/log_severity.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace {
char const* const severity_names[] = {
    "trace", "debug", "info", "notice", "warning", "error", "critical", "alert", "fatal",
};
} // anonymous namespace

namespace sl {

std::ostream& operator<<(std::ostream& os, severity x) {
  if (x < severity::LOWEST or x > severity::HIGHEST) {
    return os << "severity(" << int(x) << ")";
  }
  return os << severity_names[int(x)];
}

severity parse_severity(std::string const& name) {
  std::string lower;
  std::transform(name.begin(), name.end(), std::back_inserter(lower), [](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  for (int i = int(severity::LOWEST); i <= int(severity::HIGHEST); ++i) {
    if (lower == severity_names[i]) {
      return severity(i);
    }
  }
  throw std::invalid_argument("unknown log severity <" + name + ">");
}

} // namespace sl
