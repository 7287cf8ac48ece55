#include "util/misc.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::EndsWith;
using ::testing::MatchesRegex;

TEST(MiscTest, TruncateShortString) {
  EXPECT_EQ(util::Truncate("abc", 10), "abc");
  EXPECT_EQ(util::Truncate("", 0), "");
}

TEST(MiscTest, TruncateLongString) {
  std::string truncated = util::Truncate(std::string(2000, 'x'), 1000);
  EXPECT_EQ(truncated.size(), 1000);
  EXPECT_THAT(truncated, EndsWith("..."));
}

TEST(MiscTest, TruncateKeepsUtf8Sequences) {
  // Each "\xc3\xa9" is one character; a cut at an odd byte backs off.
  std::string truncated = util::Truncate("\xc3\xa9\xc3\xa9\xc3\xa9xx", 6);
  EXPECT_EQ(truncated, "\xc3\xa9...");
}

TEST(MiscTest, TruncateTinyLimit) {
  EXPECT_EQ(util::Truncate("abcdef", 2), "ab");
}

TEST(MiscTest, RandomIdIsHex) {
  std::string a = util::RandomId();
  std::string b = util::RandomId();
  EXPECT_THAT(a, MatchesRegex("[0-9a-f]{32}"));
  EXPECT_NE(a, b);
}

}  // namespace
