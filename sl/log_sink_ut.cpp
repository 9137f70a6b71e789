#include "sl/log_sink.hpp"

#include <gtest/gtest.h>

/**
 * @test Verify that sl::make_log_sink forwards messages to the functor.
 */
TEST(log_sink, basic) {
  std::string value;
  sl::severity sev = sl::severity::trace;
  auto ls = sl::make_log_sink([&value, &sev](sl::severity s, std::string&& m) {
    value = std::move(m);
    sev = s;
  });

  ls->log(sl::severity::warning, std::string("record is malformed"));
  ASSERT_EQ(sev, sl::severity::warning);
  ASSERT_EQ(value, "record is malformed");
}

/**
 * @test Verify that sl::make_log_sink accepts a named (lvalue) functor.
 */
TEST(log_sink, lvalue_functor) {
  int count = 0;
  auto counter = [&count](sl::severity, std::string&&) { ++count; };
  auto ls = sl::make_log_sink(counter);
  ls->log(sl::severity::info, std::string("a"));
  ls->log(sl::severity::info, std::string("b"));
  ASSERT_EQ(count, 2);
}
