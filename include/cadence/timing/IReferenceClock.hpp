// Repository: Cadence-audio
// Component: Reference Clock Interface
// Purpose: Master playback clock the renderer synchronizes against.
// Copyright (c) 2025 Cadence

#ifndef CADENCE_TIMING_IREFERENCE_CLOCK_HPP_
#define CADENCE_TIMING_IREFERENCE_CLOCK_HPP_

#include <cstdint>

namespace cadence::timing {

// Playback speed range shared by every clock and the renderer.
constexpr double kMinSpeedRatio = 0.0;
constexpr double kDefaultSpeedRatio = 1.0;
constexpr double kMaxSpeedRatio = 8.0;

// Read from the device callback on every pull: implementations must not
// block for long.
class IReferenceClock {
 public:
  virtual ~IReferenceClock() = default;

  // Playback position in microseconds since stream start.
  virtual int64_t PositionUs() const = 0;

  virtual double SpeedRatio() const = 0;
  virtual void SetSpeedRatio(double ratio) = 0;
};

}  // namespace cadence::timing

#endif  // CADENCE_TIMING_IREFERENCE_CLOCK_HPP_
