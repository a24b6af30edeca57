#include "supervisor/runtime.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Not;

using namespace supervisor;  // NOLINT

// NOLINTNEXTLINE
TEST(RuntimeTableTest, Builtin) {
  RuntimeTable table = RuntimeTable::Builtin();
  EXPECT_THAT(table.Ids(), ElementsAre("python3", "sh"));
  const Runtime& sh = KJ_ASSERT_NONNULL(table.Find("sh"));
  EXPECT_EQ(sh.source_file, "main.sh");
  const Runtime& python = KJ_ASSERT_NONNULL(table.Find("python3"));
  EXPECT_THAT(python.command, ElementsAre("python3", "-Iqu", "-c", "{source}"));
  EXPECT_EQ(table.Find("ruby"), nullptr);
}

// NOLINTNEXTLINE
TEST(RuntimeTableTest, FromJson) {
  RuntimeTable table;
  std::string error_msg;
  ASSERT_TRUE(RuntimeTable::FromJson(R"({"runtimes": [
      {"id": "node", "command": ["node", "{source}"], "sourceFile": "main.js"},
      {"id": "bash", "command": ["bash", "-c", "{source}"]}
  ]})",
                                     &table, &error_msg))
      << error_msg;
  EXPECT_THAT(table.Ids(), ElementsAre("bash", "node"));
  const Runtime& node = KJ_ASSERT_NONNULL(table.Find("node"));
  EXPECT_THAT(node.command, ElementsAre("node", "{source}"));
  EXPECT_EQ(node.source_file, "main.js");
  EXPECT_EQ(KJ_ASSERT_NONNULL(table.Find("bash")).source_file, "");
}

// NOLINTNEXTLINE
TEST(RuntimeTableTest, FromJsonMalformed) {
  RuntimeTable table = RuntimeTable::Builtin();
  std::string error_msg;
  EXPECT_FALSE(RuntimeTable::FromJson("{\"runtimes\": [", &table, &error_msg));
  EXPECT_THAT(error_msg, Not(IsEmpty()));
  // Left untouched on failure.
  EXPECT_NE(table.Find("sh"), nullptr);
}

// NOLINTNEXTLINE
TEST(RuntimeTableTest, FromJsonInvalidRuntimes) {
  RuntimeTable table;
  std::string error_msg;
  EXPECT_FALSE(RuntimeTable::FromJson(
      R"({"runtimes": [{"id": "x", "command": []}]})", &table, &error_msg));
  EXPECT_THAT(error_msg, HasSubstr("empty command"));
  EXPECT_FALSE(RuntimeTable::FromJson(
      R"({"runtimes": [{"command": ["sh"]}]})", &table, &error_msg));
  EXPECT_EQ(error_msg, "runtime without an id");
  EXPECT_FALSE(RuntimeTable::FromJson(
      R"({"runtimes": [{"id": "x", "command": ["sh"], "sourceFile": "../a"}]})",
      &table, &error_msg));
  EXPECT_THAT(error_msg, HasSubstr("invalid source file"));
}

// NOLINTNEXTLINE
TEST(RuntimeTableTest, LoadMissingFile) {
  RuntimeTable table;
  std::string error_msg;
  EXPECT_FALSE(RuntimeTable::Load("/nonexistent/snekbox/runtimes.json", &table,
                                  &error_msg));
  EXPECT_THAT(error_msg, Not(IsEmpty()));
}

// NOLINTNEXTLINE
TEST(RuntimeTableTest, Load) {
  util::TempDir dir("/tmp/snekbox_testdir");
  std::string path = util::File::JoinPath(dir.Path(), "runtimes.json");
  util::File::WriteString(
      path, R"({"runtimes": [{"id": "sh", "command": ["dash", "{source}"]}]})");
  RuntimeTable table;
  std::string error_msg;
  ASSERT_TRUE(RuntimeTable::Load(path, &table, &error_msg)) << error_msg;
  EXPECT_THAT(KJ_ASSERT_NONNULL(table.Find("sh")).command,
              ElementsAre("dash", "{source}"));
}

}  // namespace
