#include "sl/log_severity.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

TEST(log_severity, base) {
  ASSERT_LT(sl::severity::LOWEST, sl::severity::HIGHEST);
  ASSERT_LE(sl::severity::LOWEST, sl::severity::LOWEST_ENABLED);

  using s = sl::severity;
  std::ostringstream os;
  os << s::trace << " " << s::debug << " " << s::info << " " << s::notice << " " << s::warning << " " << s::error << " "
     << s::critical << " " << s::alert << " " << s::fatal;
  ASSERT_EQ(os.str(), "trace debug info notice warning error critical alert fatal");
}

TEST(log_severity, parse) {
  EXPECT_EQ(sl::parse_severity("trace"), sl::severity::trace);
  EXPECT_EQ(sl::parse_severity("Notice"), sl::severity::notice);
  EXPECT_EQ(sl::parse_severity("WARNING"), sl::severity::warning);
  EXPECT_EQ(sl::parse_severity("fatal"), sl::severity::fatal);
  EXPECT_THROW(sl::parse_severity(""), std::invalid_argument);
  EXPECT_THROW(sl::parse_severity("verbose"), std::invalid_argument);

  std::ostringstream os;
  os << sl::severity(42);
  EXPECT_EQ(os.str(), "severity(42)");
}
