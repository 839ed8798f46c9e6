#include "geminet/internal/lifecycle.hpp"

#include <gtest/gtest.h>

namespace geminet::internal {

TEST(LifecycleTest, StartsIdle) {
  Lifecycle lifecycle;
  EXPECT_TRUE(lifecycle.isIdle());
  EXPECT_FALSE(lifecycle.isActive());
}

TEST(LifecycleTest, FullCycle) {
  Lifecycle lifecycle;
  ASSERT_TRUE(lifecycle.tryEnterRunning());
  EXPECT_TRUE(lifecycle.isRunning());
  EXPECT_TRUE(lifecycle.isActive());

  ASSERT_TRUE(lifecycle.tryEnterDraining());
  EXPECT_TRUE(lifecycle.isDraining());
  EXPECT_TRUE(lifecycle.isActive());

  lifecycle.reset();
  EXPECT_EQ(lifecycle.state.load(), Lifecycle::State::Idle);
}

TEST(LifecycleTest, CannotRunTwice) {
  Lifecycle lifecycle;
  ASSERT_TRUE(lifecycle.tryEnterRunning());
  EXPECT_FALSE(lifecycle.tryEnterRunning());
  ASSERT_TRUE(lifecycle.tryEnterDraining());
  EXPECT_FALSE(lifecycle.tryEnterRunning());
}

TEST(LifecycleTest, DrainingRequestIsIdempotentAndIgnoredWhenIdle) {
  Lifecycle lifecycle;
  EXPECT_FALSE(lifecycle.tryEnterDraining());
  EXPECT_TRUE(lifecycle.isIdle());

  ASSERT_TRUE(lifecycle.tryEnterRunning());
  EXPECT_TRUE(lifecycle.tryEnterDraining());
  EXPECT_FALSE(lifecycle.tryEnterDraining());
  EXPECT_TRUE(lifecycle.isDraining());
}

}  // namespace geminet::internal
