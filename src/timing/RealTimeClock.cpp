// Repository: Cadence-audio
// Component: RealTimeClock
// Purpose: Speed-scaled playback clock.
// Copyright (c) 2025 Cadence

#include "cadence/timing/RealTimeClock.hpp"

#include <algorithm>
#include <cmath>

namespace cadence::timing {

RealTimeClock::RealTimeClock(std::shared_ptr<const ITimeSource> time_source)
    : time_source_(time_source ? std::move(time_source)
                               : std::make_shared<SteadyTimeSource>()) {}

int64_t RealTimeClock::PositionLocked(int64_t now_us) const {
  if (!running_) return offset_us_;
  const double elapsed = static_cast<double>(now_us - anchor_us_);
  return offset_us_ + static_cast<int64_t>(std::llround(elapsed * speed_ratio_));
}

int64_t RealTimeClock::PositionUs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return PositionLocked(time_source_->NowMonotonicUs());
}

double RealTimeClock::SpeedRatio() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return speed_ratio_;
}

void RealTimeClock::SetSpeedRatio(double ratio) {
  ratio = std::clamp(ratio, kMinSpeedRatio, kMaxSpeedRatio);
  std::lock_guard<std::mutex> lock(mutex_);
  const int64_t now = time_source_->NowMonotonicUs();
  offset_us_ = PositionLocked(now);
  anchor_us_ = now;
  speed_ratio_ = ratio;
}

void RealTimeClock::Play() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) return;
  anchor_us_ = time_source_->NowMonotonicUs();
  running_ = true;
}

void RealTimeClock::Pause() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!running_) return;
  offset_us_ = PositionLocked(time_source_->NowMonotonicUs());
  running_ = false;
}

void RealTimeClock::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  offset_us_ = 0;
  anchor_us_ = time_source_->NowMonotonicUs();
  running_ = false;
}

void RealTimeClock::Update(int64_t position_us) {
  std::lock_guard<std::mutex> lock(mutex_);
  offset_us_ = position_us;
  anchor_us_ = time_source_->NowMonotonicUs();
}

bool RealTimeClock::IsRunning() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

}  // namespace cadence::timing
