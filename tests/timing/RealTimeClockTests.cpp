// Repository: Cadence-audio
// Component: RealTimeClock Tests
// Purpose: Speed-scaled position on virtual time.
// Copyright (c) 2025 Cadence

#include <gtest/gtest.h>

#include <memory>

#include "cadence/timing/RealTimeClock.hpp"
#include "support/DeterministicTimeSource.hpp"

namespace cadence::timing::testing {
namespace {

TEST(RealTimeClockTest, StoppedClockDoesNotAdvance) {
  auto time = std::make_shared<DeterministicTimeSource>(1'000'000);
  RealTimeClock clock(time);
  time->AdvanceMs(500);
  EXPECT_EQ(clock.PositionUs(), 0);
  EXPECT_FALSE(clock.IsRunning());
}

TEST(RealTimeClockTest, RunningClockFollowsElapsedTime) {
  auto time = std::make_shared<DeterministicTimeSource>();
  RealTimeClock clock(time);
  clock.Play();
  time->AdvanceMs(250);
  EXPECT_EQ(clock.PositionUs(), 250'000);
}

TEST(RealTimeClockTest, PauseFreezesPosition) {
  auto time = std::make_shared<DeterministicTimeSource>();
  RealTimeClock clock(time);
  clock.Play();
  time->AdvanceMs(100);
  clock.Pause();
  time->AdvanceMs(100);
  EXPECT_EQ(clock.PositionUs(), 100'000);
  clock.Play();
  time->AdvanceMs(50);
  EXPECT_EQ(clock.PositionUs(), 150'000);
}

TEST(RealTimeClockTest, SpeedChangeKeepsPositionContinuous) {
  auto time = std::make_shared<DeterministicTimeSource>();
  RealTimeClock clock(time);
  clock.Play();
  time->AdvanceMs(100);
  clock.SetSpeedRatio(2.0);
  EXPECT_EQ(clock.PositionUs(), 100'000);
  time->AdvanceMs(100);
  EXPECT_EQ(clock.PositionUs(), 300'000);
  clock.SetSpeedRatio(0.5);
  time->AdvanceMs(100);
  EXPECT_EQ(clock.PositionUs(), 350'000);
}

TEST(RealTimeClockTest, SpeedIsClamped) {
  RealTimeClock clock;
  clock.SetSpeedRatio(20.0);
  EXPECT_DOUBLE_EQ(clock.SpeedRatio(), 8.0);
  clock.SetSpeedRatio(-3.0);
  EXPECT_DOUBLE_EQ(clock.SpeedRatio(), 0.0);
}

TEST(RealTimeClockTest, UpdateAndReset) {
  auto time = std::make_shared<DeterministicTimeSource>();
  RealTimeClock clock(time);
  clock.Play();
  clock.Update(5'000'000);
  time->AdvanceMs(10);
  EXPECT_EQ(clock.PositionUs(), 5'010'000);
  EXPECT_TRUE(clock.IsRunning());

  clock.Reset();
  EXPECT_FALSE(clock.IsRunning());
  EXPECT_EQ(clock.PositionUs(), 0);
}

}  // namespace
}  // namespace cadence::timing::testing
