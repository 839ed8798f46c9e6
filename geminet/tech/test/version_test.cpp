#include "geminet/version.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string_view>

namespace geminet {

TEST(Version, IsSemver) {
  constexpr std::string_view kVersion = version();
  ASSERT_FALSE(kVersion.empty());
  EXPECT_EQ(std::ranges::count(kVersion, '.'), 2);
  EXPECT_TRUE(kVersion.front() >= '0' && kVersion.front() <= '9');
}

}  // namespace geminet
