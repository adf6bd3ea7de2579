// Repository: Cadence-audio
// Component: RealTimeClock
// Purpose: Speed-scaled playback clock. Position advances by elapsed
//          monotonic time multiplied by the speed ratio while running.
// Copyright (c) 2025 Cadence

#ifndef CADENCE_TIMING_REAL_TIME_CLOCK_HPP_
#define CADENCE_TIMING_REAL_TIME_CLOCK_HPP_

#include <cstdint>
#include <memory>
#include <mutex>

#include "cadence/timing/IReferenceClock.hpp"
#include "cadence/timing/ITimeSource.hpp"

namespace cadence::timing {

// Position = offset + (now - anchor) * speed_ratio while running.
// Changing the speed or updating the position re-anchors, so the position
// is continuous across speed changes.
//
// Thread safety: all public methods are mutex-protected.
class RealTimeClock : public IReferenceClock {
 public:
  explicit RealTimeClock(
      std::shared_ptr<const ITimeSource> time_source = nullptr);

  int64_t PositionUs() const override;
  double SpeedRatio() const override;
  // Clamped to [0, 8].
  void SetSpeedRatio(double ratio) override;

  void Play();
  void Pause();
  // Pauses and rewinds to zero.
  void Reset();
  // Jumps to position_us, keeping the running state.
  void Update(int64_t position_us);
  bool IsRunning() const;

 private:
  int64_t PositionLocked(int64_t now_us) const;

  std::shared_ptr<const ITimeSource> time_source_;
  mutable std::mutex mutex_;
  int64_t offset_us_ = 0;
  int64_t anchor_us_ = 0;
  double speed_ratio_ = 1.0;
  bool running_ = false;
};

}  // namespace cadence::timing

#endif  // CADENCE_TIMING_REAL_TIME_CLOCK_HPP_
