#include "util/misc.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAreArray;
using ::testing::IsEmpty;

/*
 * Split
 */

// NOLINTNEXTLINE
TEST(Misc, Split) {
  std::string str = "this is some text";
  auto pieces = util::split(str, ' ');
  EXPECT_THAT(pieces, ElementsAreArray({"this", "is", "some", "text"}));
}

// NOLINTNEXTLINE
TEST(Misc, SplitEmpty) {
  std::string str;
  auto pieces = util::split(str, ' ');
  EXPECT_THAT(pieces, IsEmpty());
}

// NOLINTNEXTLINE
TEST(Misc, SplitSkipEmpty) {
  std::string str = "::/usr/bin::/bin:";
  auto pieces = util::split(str, ':');
  EXPECT_THAT(pieces, ElementsAreArray({"/usr/bin", "/bin"}));
}

/*
 * Setters
 */

// NOLINTNEXTLINE
TEST(Misc, SetBool) {
  bool x = false;
  EXPECT_TRUE(util::setBool(x)().getError() == nullptr);
  EXPECT_TRUE(x);
}

// NOLINTNEXTLINE
TEST(Misc, SetString) {
  std::string x;
  EXPECT_TRUE(util::setString(x)("wow").getError() == nullptr);
  EXPECT_EQ(x, "wow");
}

// NOLINTNEXTLINE
TEST(Misc, SetUint64) {
  uint64_t x = 0;
  EXPECT_TRUE(util::setUint64(x)("268435456").getError() == nullptr);
  EXPECT_EQ(x, 268435456u);
  EXPECT_TRUE(util::setUint64(x)("18446744073709551615").getError() ==
              nullptr);
  EXPECT_EQ(x, UINT64_MAX);
}

// NOLINTNEXTLINE
TEST(Misc, SetUint64Invalid) {
  uint64_t x = 42;
  EXPECT_FALSE(util::setUint64(x)("").getError() == nullptr);
  EXPECT_FALSE(util::setUint64(x)("-1").getError() == nullptr);
  EXPECT_FALSE(util::setUint64(x)("12abc").getError() == nullptr);
  EXPECT_FALSE(util::setUint64(x)("18446744073709551616").getError() ==
               nullptr);
  EXPECT_EQ(x, 42u);
}

// NOLINTNEXTLINE
TEST(Misc, SetUint64Max) {
  uint64_t x = 42;
  EXPECT_TRUE(util::setUint64(x, 1000)("1000").getError() == nullptr);
  EXPECT_EQ(x, 1000u);
  EXPECT_FALSE(util::setUint64(x, 1000)("1001").getError() == nullptr);
  EXPECT_FALSE(util::setUint64(x, 1000)("18446744073709551615").getError() ==
               nullptr);
  EXPECT_EQ(x, 1000u);
}

}  // namespace
