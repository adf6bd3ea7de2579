// Repository: Cadence-audio
// Component: Cycle Timers
// Purpose: Interruptible waits between worker cycles. Coarse timer for
//          low-priority work, 1 ms timerfd-driven timer for audio feeding.
// Copyright (c) 2025 Cadence

#ifndef CADENCE_WORKER_CYCLE_TIMER_HPP_
#define CADENCE_WORKER_CYCLE_TIMER_HPP_

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace cadence::worker {

enum class IntervalWorkerMode {
  kSystemDefault,   // ~15 ms granularity
  kHighPrecision,   // ~1 ms granularity
};

// Waits return early on Interrupt(). An Interrupt() that arrives while no
// wait is in progress is kept and ends the next wait immediately.
class ICycleTimer {
 public:
  virtual ~ICycleTimer() = default;

  // True when the full duration elapsed, false when interrupted.
  virtual bool WaitFor(std::chrono::nanoseconds duration) = 0;
  virtual void Interrupt() = 0;

  virtual std::chrono::milliseconds Resolution() const = 0;
  virtual bool IsHighResolution() const = 0;
};

// Condition-variable wait in steps of at most kStep.
class CoarseCycleTimer : public ICycleTimer {
 public:
  static constexpr std::chrono::milliseconds kStep{15};

  bool WaitFor(std::chrono::nanoseconds duration) override;
  void Interrupt() override;
  std::chrono::milliseconds Resolution() const override { return kStep; }
  bool IsHighResolution() const override { return false; }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool interrupted_ = false;
};

// Periodic 1 ms timerfd on CLOCK_MONOTONIC plus an eventfd for interrupts,
// multiplexed with poll().
class HighResolutionCycleTimer : public ICycleTimer {
 public:
  static constexpr std::chrono::milliseconds kTick{1};

  // Null when the kernel objects cannot be created.
  static std::unique_ptr<HighResolutionCycleTimer> TryCreate();
  ~HighResolutionCycleTimer() override;

  HighResolutionCycleTimer(const HighResolutionCycleTimer&) = delete;
  HighResolutionCycleTimer& operator=(const HighResolutionCycleTimer&) = delete;

  bool WaitFor(std::chrono::nanoseconds duration) override;
  void Interrupt() override;
  std::chrono::milliseconds Resolution() const override { return kTick; }
  bool IsHighResolution() const override { return true; }

 private:
  HighResolutionCycleTimer(int timer_fd, int event_fd);

  const int timer_fd_;
  const int event_fd_;
};

// kHighPrecision falls back to the coarse timer (with a warning) when the
// high resolution timer is unavailable.
std::unique_ptr<ICycleTimer> CreateCycleTimer(IntervalWorkerMode mode);

}  // namespace cadence::worker

#endif  // CADENCE_WORKER_CYCLE_TIMER_HPP_
