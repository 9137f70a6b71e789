#include "sl/log.hpp"

#include <gmock/gmock.h>

namespace {
using captured_logs = std::vector<std::pair<sl::severity, std::string>>;

std::shared_ptr<sl::log_sink> capture_to(captured_logs& logs) {
  return sl::make_log_sink([&logs](sl::severity sev, std::string&& msg) { logs.emplace_back(sev, std::move(msg)); });
}
} // anonymous namespace

/**
 * @test Verify that SL_LOG_I() and the supporting classes work in the normal case.
 */
TEST(log, basic) {
  sl::log lg;
  // ... without sinks this is basically a compilation test ...
  ASSERT_NO_THROW(SL_LOG_I(error, lg) << "store unavailable " << 4 << 2);
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  using namespace ::testing;
  ASSERT_NO_THROW(SL_LOG_I(error, lg) << "store unavailable"
                                      << " " << 42);
  ASSERT_EQ(logs.size(), 1UL);
  ASSERT_EQ(logs[0].first, sl::severity::error);
  ASSERT_THAT(logs[0].second, StartsWith("[error] store unavailable 42"));
  ASSERT_THAT(logs[0].second, HasSubstr("log_ut.cpp"));
}

/**
 * @test Verify that messages below the run-time minimum severity are not even evaluated.
 */
TEST(log, run_time_disable) {
  sl::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  using namespace ::testing;
  ASSERT_NO_THROW(SL_LOG_I(info, lg) << "became leader"
                                     << " " << 42);
  ASSERT_EQ(logs.size(), 1UL);
  ASSERT_EQ(logs[0].first, sl::severity::info);
  ASSERT_THAT(logs[0].second, StartsWith("[info] became leader 42"));

  logs.clear();
  int cnt = 0;
  auto f = [&cnt]() {
    ++cnt;
    return 42;
  };
  lg.min_severity(sl::severity::warning);
  ASSERT_NO_THROW(SL_LOG_I(info, lg) << "became leader"
                                     << " " << f());
  ASSERT_EQ(logs.size(), 0UL);
  ASSERT_EQ(cnt, 0);
  ASSERT_EQ(f(), 42);
  ASSERT_EQ(cnt, 1);
}

/**
 * @test Verify that levels disabled at compile-time produce nothing, even if enabled at run-time.
 */
TEST(log, compile_time_disable) {
  sl::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  int cnt = 0;
  auto f = [&cnt]() {
    ++cnt;
    return 42;
  };
  lg.min_severity(sl::severity::trace);
  ASSERT_NO_THROW(SL_LOG_I(debug, lg) << "reconcile pass " << f());
  ASSERT_EQ(logs.size(), 0UL);
  ASSERT_EQ(cnt, 0);
}

/**
 * @test Verify that the SL_LOG() macro and the singleton work as expected.
 */
TEST(log, instance_basic) {
  sl::log& lg = sl::log::instance();
  captured_logs logs;
  auto sink = capture_to(logs);
  lg.add_sink(sink);

  using namespace ::testing;
  ASSERT_NO_THROW(SL_LOG(info) << "lost leadership " << 42);
  ASSERT_EQ(logs.size(), 1UL);
  ASSERT_EQ(logs[0].first, sl::severity::info);
  ASSERT_THAT(logs[0].second, StartsWith("[info] lost leadership 42"));

  lg.remove_sink(sink);
  ASSERT_NO_THROW(SL_LOG(info) << "not captured");
  ASSERT_EQ(logs.size(), 1UL);
}

/**
 * @test Verify that every sink receives a copy of the message.
 */
TEST(log, multiple_sinks) {
  sl::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));
  lg.add_sink(sl::make_log_sink([&logs](sl::severity sev, std::string&& msg) {
    auto s = std::string("(2) ") + msg;
    logs.emplace_back(sev, std::move(s));
  }));

  using namespace ::testing;
  ASSERT_NO_THROW(SL_LOG_I(error, lg) << "delete failed"
                                      << " " << 42);
  ASSERT_EQ(logs.size(), 2UL);
  ASSERT_THAT(logs[0].second, StartsWith("[error] delete failed 42"));
  ASSERT_THAT(logs[1].second, StartsWith("(2) [error] delete failed 42"));

  lg.clear_sinks();
  ASSERT_NO_THROW(SL_LOG_I(error, lg) << "dropped");
  ASSERT_EQ(logs.size(), 2UL);
}

/**
 * @test Complete code coverage for the sl::logger<true> class.
 */
TEST(log, logger_disabled) {
  sl::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));
  sl::logger<true> logger(sl::severity::error, __func__, __FILE__, __LINE__, lg);

  ASSERT_EQ((bool)logger, false);
  ASSERT_NO_THROW(logger.get() << "testing " << 123 << std::string(" ") << 42);
  ASSERT_TRUE((std::is_same<decltype(logger.get()), sl::detail::null_stream&>::value));
  ASSERT_NO_THROW(logger.write_to(lg));
  ASSERT_EQ(logs.size(), 0U);
}
