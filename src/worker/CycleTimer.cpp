// Repository: Cadence-audio
// Component: Cycle Timers
// Purpose: Interruptible waits between worker cycles.
// Copyright (c) 2025 Cadence

#include "cadence/worker/CycleTimer.hpp"

#include <poll.h>
#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>

#include "cadence/util/Logger.hpp"

namespace cadence::worker {

using util::Logger;
using Clock = std::chrono::steady_clock;

// =============================================================================
// CoarseCycleTimer
// =============================================================================

bool CoarseCycleTimer::WaitFor(std::chrono::nanoseconds duration) {
  const auto deadline = Clock::now() + duration;
  std::unique_lock<std::mutex> lock(mutex_);
  while (!interrupted_) {
    const auto now = Clock::now();
    if (now >= deadline) break;
    const auto step = std::min<Clock::duration>(deadline - now, kStep);
    cv_.wait_for(lock, step);
  }
  const bool interrupted = interrupted_;
  interrupted_ = false;
  return !interrupted;
}

void CoarseCycleTimer::Interrupt() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    interrupted_ = true;
  }
  cv_.notify_all();
}

// =============================================================================
// HighResolutionCycleTimer
// =============================================================================

std::unique_ptr<HighResolutionCycleTimer> HighResolutionCycleTimer::TryCreate() {
  const int timer_fd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
  if (timer_fd < 0) {
    Logger::Warn(std::string("[CycleTimer] timerfd_create failed: ") +
                 std::strerror(errno));
    return nullptr;
  }

  itimerspec spec{};
  spec.it_interval.tv_nsec =
      std::chrono::duration_cast<std::chrono::nanoseconds>(kTick).count();
  spec.it_value = spec.it_interval;
  if (::timerfd_settime(timer_fd, 0, &spec, nullptr) < 0) {
    Logger::Warn(std::string("[CycleTimer] timerfd_settime failed: ") +
                 std::strerror(errno));
    ::close(timer_fd);
    return nullptr;
  }

  const int event_fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (event_fd < 0) {
    Logger::Warn(std::string("[CycleTimer] eventfd failed: ") +
                 std::strerror(errno));
    ::close(timer_fd);
    return nullptr;
  }

  return std::unique_ptr<HighResolutionCycleTimer>(
      new HighResolutionCycleTimer(timer_fd, event_fd));
}

HighResolutionCycleTimer::HighResolutionCycleTimer(int timer_fd, int event_fd)
    : timer_fd_(timer_fd), event_fd_(event_fd) {}

HighResolutionCycleTimer::~HighResolutionCycleTimer() {
  ::close(timer_fd_);
  ::close(event_fd_);
}

bool HighResolutionCycleTimer::WaitFor(std::chrono::nanoseconds duration) {
  const auto deadline = Clock::now() + duration;
  for (;;) {
    const auto now = Clock::now();
    const bool expired = now >= deadline;
    int timeout_ms = 0;
    if (!expired) {
      timeout_ms = static_cast<int>(
          std::chrono::ceil<std::chrono::milliseconds>(deadline - now).count());
    }

    pollfd fds[2];
    fds[0].fd = timer_fd_;
    fds[0].events = POLLIN;
    fds[0].revents = 0;
    fds[1].fd = event_fd_;
    fds[1].events = POLLIN;
    fds[1].revents = 0;

    const int rc = ::poll(fds, 2, timeout_ms);
    if (rc < 0) {
      if (errno == EINTR) continue;
      Logger::Warn(std::string("[CycleTimer] poll failed: ") +
                   std::strerror(errno));
      return true;
    }

    uint64_t value = 0;
    if (fds[1].revents & POLLIN) {
      // Drains every pending Interrupt() at once.
      if (::read(event_fd_, &value, sizeof(value)) < 0 && errno != EAGAIN) {
        Logger::Warn(std::string("[CycleTimer] eventfd read failed: ") +
                     std::strerror(errno));
      }
      return false;
    }
    if (fds[0].revents & POLLIN) {
      if (::read(timer_fd_, &value, sizeof(value)) < 0 && errno != EAGAIN) {
        Logger::Warn(std::string("[CycleTimer] timerfd read failed: ") +
                     std::strerror(errno));
      }
    }
    if (expired) return true;
  }
}

void HighResolutionCycleTimer::Interrupt() {
  const uint64_t one = 1;
  if (::write(event_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
    Logger::Warn(std::string("[CycleTimer] eventfd write failed: ") +
                 std::strerror(errno));
  }
}

// =============================================================================
// Factory
// =============================================================================

std::unique_ptr<ICycleTimer> CreateCycleTimer(IntervalWorkerMode mode) {
  if (mode == IntervalWorkerMode::kHighPrecision) {
    auto timer = HighResolutionCycleTimer::TryCreate();
    if (timer) return timer;
    Logger::Warn("[CycleTimer] High resolution timer unavailable, "
                 "falling back to coarse timer");
  }
  return std::make_unique<CoarseCycleTimer>();
}

}  // namespace cadence::worker
