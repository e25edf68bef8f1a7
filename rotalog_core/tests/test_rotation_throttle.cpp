#include <gtest/gtest.h>

#include <chrono>

#include "../include/rotalog/rotation_config.hpp"
#include "../include/rotalog/rotation_throttle.hpp"

using namespace std::chrono_literals;
using Clock = rotalog::RotationThrottle::Clock;

TEST(RotationThrottle, NoCheckBelowBothThresholds)
{
  rotalog::RotationThrottle throttle(100, 1h);
  for (uint64_t count = 1; count < 100; ++count)
  {
    EXPECT_FALSE(throttle.ShouldCheck(count, 0s));
    EXPECT_FALSE(throttle.ShouldCheck(count, 59min));
  }
}

TEST(RotationThrottle, ZeroCallCountIsDue)
{
  rotalog::RotationThrottle throttle(100, 1h);
  EXPECT_TRUE(throttle.ShouldCheck(0, 0s));
}

TEST(RotationThrottle, CountThresholdFires)
{
  rotalog::RotationThrottle throttle(100, 1h);
  EXPECT_TRUE(throttle.ShouldCheck(100, 0s));
  EXPECT_TRUE(throttle.ShouldCheck(101, 0s));
}

TEST(RotationThrottle, IntervalFires)
{
  rotalog::RotationThrottle throttle(100, 1h);
  EXPECT_TRUE(throttle.ShouldCheck(1, 1h));
  EXPECT_TRUE(throttle.ShouldCheck(1, 2h));
}

TEST(RotationThrottle, FirstCallChecks)
{
  rotalog::RotationThrottle throttle(100, 1h);
  EXPECT_FALSE(throttle.HasChecked());
  EXPECT_TRUE(throttle.OnCall(Clock::now()));
  EXPECT_TRUE(throttle.HasChecked());
}

TEST(RotationThrottle, FiresEveryFrequencyCalls)
{
  rotalog::RotationThrottle throttle(10, 1h);
  auto t0 = Clock::now();
  ASSERT_TRUE(throttle.OnCall(t0));

  for (int round = 0; round < 3; ++round)
  {
    for (int i = 1; i < 10; ++i)
    {
      EXPECT_FALSE(throttle.OnCall(t0 + 1s)) << "round " << round << " call " << i;
    }
    EXPECT_TRUE(throttle.OnCall(t0 + 1s));
  }
  EXPECT_EQ(throttle.FireCount(), 4u);
}

TEST(RotationThrottle, FiresOnElapsedTime)
{
  rotalog::RotationThrottle throttle(1000, 10min);
  auto t0 = Clock::now();
  ASSERT_TRUE(throttle.OnCall(t0));

  EXPECT_FALSE(throttle.OnCall(t0 + 5min));
  EXPECT_FALSE(throttle.OnCall(t0 + 9min));
  EXPECT_TRUE(throttle.OnCall(t0 + 10min));
  EXPECT_FALSE(throttle.OnCall(t0 + 11min));
}

TEST(RotationThrottle, FireResetsCounterAndTimestamp)
{
  rotalog::RotationThrottle throttle(1000, 10min);
  auto t0 = Clock::now();
  ASSERT_TRUE(throttle.OnCall(t0));
  EXPECT_EQ(throttle.CallCount(), 0u);
  EXPECT_EQ(throttle.LastCheck(), t0);

  throttle.OnCall(t0 + 1min);
  throttle.OnCall(t0 + 2min);
  EXPECT_EQ(throttle.CallCount(), 2u);
  EXPECT_EQ(throttle.LastCheck(), t0);

  auto t1 = t0 + 10min;
  ASSERT_TRUE(throttle.OnCall(t1));
  EXPECT_EQ(throttle.CallCount(), 0u);
  EXPECT_EQ(throttle.LastCheck(), t1);

  // The time bound restarts from the last fire, not from construction.
  EXPECT_FALSE(throttle.OnCall(t1 + 9min));
}

TEST(RotationThrottle, DefaultTuning)
{
  rotalog::RotationTuning tuning;
  EXPECT_EQ(tuning.check_frequency, 50000u);
  EXPECT_EQ(tuning.check_interval, std::chrono::minutes(8));
  EXPECT_EQ(tuning.flush_threshold, 200u);
}
