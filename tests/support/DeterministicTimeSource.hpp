#pragma once
#include <atomic>
#include <cstdint>

#include "cadence/timing/ITimeSource.hpp"

class DeterministicTimeSource : public cadence::timing::ITimeSource {
public:
  explicit DeterministicTimeSource(int64_t start_us = 0)
      : now_us_(start_us) {}

  int64_t NowMonotonicUs() const override {
    return now_us_.load();
  }

  void AdvanceUs(int64_t delta_us) {
    now_us_ += delta_us;
  }

  void AdvanceMs(int64_t delta_ms) {
    now_us_ += delta_ms * 1000;
  }

private:
  std::atomic<int64_t> now_us_;
};
