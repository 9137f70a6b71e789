#include "sl/file_lease_store.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>

#include <sys/stat.h>
#include <unistd.h>

namespace {
/// Create (and remove) a scratch directory for each test.
class file_lease_store_test : public ::testing::Test {
protected:
  void SetUp() override {
    char tmpl[] = "/tmp/sl-file-lease-store-XXXXXX";
    char* dir = ::mkdtemp(tmpl);
    ASSERT_TRUE(dir != nullptr);
    directory = dir;
  }

  void TearDown() override {
    for (auto const& name : {"single-owner-my-app", "other"}) {
      (void)std::remove((directory + "/" + name).c_str());
    }
    (void)::rmdir(directory.c_str());
  }

  std::string directory;
};
} // anonymous namespace

/**
 * @test Verify the basic get/set/del operations.
 */
TEST_F(file_lease_store_test, basic) {
  sl::file_lease_store store(directory);
  EXPECT_EQ(store.directory(), directory);

  std::string value;
  EXPECT_FALSE(store.get("single-owner-my-app", value));
  store.set("single-owner-my-app", R"""({"ownerId":"a","acquiredAt":1})""");
  ASSERT_TRUE(store.get("single-owner-my-app", value));
  EXPECT_EQ(value, R"""({"ownerId":"a","acquiredAt":1})""");

  store.set("single-owner-my-app", "shorter");
  ASSERT_TRUE(store.get("single-owner-my-app", value));
  EXPECT_EQ(value, "shorter");

  store.del("single-owner-my-app");
  EXPECT_FALSE(store.get("single-owner-my-app", value));
  EXPECT_NO_THROW(store.del("single-owner-my-app"));
}

/**
 * @test Verify that two stores on the same directory see each other's writes.
 */
TEST_F(file_lease_store_test, shared_directory) {
  sl::file_lease_store a(directory);
  sl::file_lease_store b(directory);

  a.set("other", "written by a");
  std::string value;
  ASSERT_TRUE(b.get("other", value));
  EXPECT_EQ(value, "written by a");

  std::ifstream is(a.path("other"));
  std::string contents;
  std::getline(is, contents);
  EXPECT_EQ(contents, "written by a");
}

/**
 * @test Verify that invalid keys and directories are rejected.
 */
TEST_F(file_lease_store_test, errors) {
  EXPECT_THROW(sl::file_lease_store(directory + "/does-not-exist"), std::runtime_error);

  sl::file_lease_store store(directory);
  std::string value;
  EXPECT_THROW(store.get("a/b", value), std::invalid_argument);
  EXPECT_THROW(store.set("", "x"), std::invalid_argument);
  EXPECT_THROW(store.del(".."), std::invalid_argument);

  EXPECT_TRUE(sl::lease_store_available(store));
}
