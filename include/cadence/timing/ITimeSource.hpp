// Repository: Cadence-audio
// Component: Time Source Interface
// Purpose: Monotonic time abstraction so clocks can be driven by virtual
//          time in tests.
// Copyright (c) 2025 Cadence

#ifndef CADENCE_TIMING_ITIME_SOURCE_HPP_
#define CADENCE_TIMING_ITIME_SOURCE_HPP_

#include <chrono>
#include <cstdint>

namespace cadence::timing {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowMonotonicUs() const = 0;
};

class SteadyTimeSource : public ITimeSource {
 public:
  int64_t NowMonotonicUs() const override {
    return std::chrono::duration_cast<std::chrono::microseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
  }
};

}  // namespace cadence::timing

#endif  // CADENCE_TIMING_ITIME_SOURCE_HPP_
