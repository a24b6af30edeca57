#include "util/misc.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAreArray;
using ::testing::IsEmpty;
using ::testing::MatchesRegex;

/*
 * Split
 */

// NOLINTNEXTLINE
TEST(Misc, Split) {
  std::string str = "python3 -Iqu -c";
  auto pieces = util::split(str, ' ');
  EXPECT_THAT(pieces, ElementsAreArray({"python3", "-Iqu", "-c"}));
}

// NOLINTNEXTLINE
TEST(Misc, SplitEmpty) {
  std::string str;
  auto pieces = util::split(str, ' ');
  EXPECT_THAT(pieces, IsEmpty());
}

// NOLINTNEXTLINE
TEST(Misc, SplitSkipEmpty) {
  std::string str = "/usr/bin::/bin:";
  auto pieces = util::split(str, ':');
  EXPECT_THAT(pieces, ElementsAreArray({"/usr/bin", "/bin"}));
}

/*
 * Strings
 */

// NOLINTNEXTLINE
TEST(Misc, ReplaceAll) {
  EXPECT_EQ(util::replaceAll("{source} and {source}", "{source}", "x"),
            "x and x");
  EXPECT_EQ(util::replaceAll("{source}", "{source}", "{source}{source}"),
            "{source}{source}");
  EXPECT_EQ(util::replaceAll("nothing", "{source}", "x"), "nothing");
}

// NOLINTNEXTLINE
TEST(Misc, RandomHex) {
  std::string a = util::randomHex(8);
  std::string b = util::randomHex(8);
  EXPECT_THAT(a, MatchesRegex("[0-9a-f]{16}"));
  EXPECT_NE(a, b);
}

/*
 * Setters
 */

// NOLINTNEXTLINE
TEST(Misc, SetBool) {
  bool x = false;
  util::setBool(x)();
  EXPECT_TRUE(x);
}

// NOLINTNEXTLINE
TEST(Misc, SetString) {
  std::string x;
  util::setString(x)("wow");
  EXPECT_EQ(x, "wow");
}

// NOLINTNEXTLINE
TEST(Misc, SetInt) {
  int x = 0;
  EXPECT_TRUE(util::setInt(x)("42"));
  EXPECT_EQ(x, 42);
  EXPECT_FALSE(util::setInt(x)("lol"));
}

// NOLINTNEXTLINE
TEST(Misc, SetInt64) {
  int64_t x = 0;
  EXPECT_TRUE(util::setInt64(x)("52428800000"));
  EXPECT_EQ(x, 52428800000LL);
  EXPECT_FALSE(util::setInt64(x)("-1"));
  EXPECT_FALSE(util::setInt64(x)(""));
}

}  // namespace
