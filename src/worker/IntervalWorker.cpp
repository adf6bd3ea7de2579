// Repository: Cadence-audio
// Component: IntervalWorker
// Purpose: Cancellable, pausable periodic execution on a dedicated thread.
// Copyright (c) 2025 Cadence

#include "cadence/worker/IntervalWorker.hpp"

#include <sstream>
#include <stdexcept>

#include "cadence/util/Logger.hpp"

namespace cadence::worker {

using util::Logger;
using Clock = std::chrono::steady_clock;

namespace {

std::future<WorkerState> ReadyFuture(WorkerState state) {
  std::promise<WorkerState> promise;
  promise.set_value(state);
  return promise.get_future();
}

}  // namespace

const char* WorkerStateName(WorkerState state) {
  switch (state) {
    case WorkerState::kCreated: return "Created";
    case WorkerState::kRunning: return "Running";
    case WorkerState::kPaused:  return "Paused";
    case WorkerState::kStopped: return "Stopped";
  }
  return "Unknown";
}

IntervalWorker::IntervalWorker(std::string name,
                               std::chrono::nanoseconds period,
                               IntervalWorkerMode mode)
    : IntervalWorker(std::move(name), period, CreateCycleTimer(mode)) {}

IntervalWorker::IntervalWorker(std::string name,
                               std::chrono::nanoseconds period,
                               std::unique_ptr<ICycleTimer> timer)
    : name_(std::move(name)),
      timer_(timer ? std::move(timer) : std::make_unique<CoarseCycleTimer>()),
      resolution_(timer_->Resolution()),
      high_resolution_(timer_->IsHighResolution()),
      period_ns_(period.count()) {
  if (period.count() <= 0) {
    throw std::invalid_argument("IntervalWorker period must be positive");
  }
}

IntervalWorker::~IntervalWorker() {
  if (thread_.joinable()) {
    Logger::Error("[IntervalWorker] " + name_ +
                  " destroyed without Dispose(); stopping now");
  }
  Dispose();
}

// =============================================================================
// State requests
// =============================================================================

void IntervalWorker::InterruptLocked() {
  cycle_source_.Cancel();
  if (timer_) {
    timer_->Interrupt();
  }
}

std::future<WorkerState> IntervalWorker::RequestStateLocked(
    WorkerState wanted) {
  wanted_state_ = wanted;
  waiters_.emplace_back();
  auto future = waiters_.back().get_future();
  InterruptLocked();
  return future;
}

void IntervalWorker::CompleteWaitersLocked() {
  for (auto& waiter : waiters_) {
    waiter.set_value(state_);
  }
  waiters_.clear();
}

std::future<WorkerState> IntervalWorker::StartAsync() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (disposing_ || disposed_) return ReadyFuture(state_);

  if (state_ == WorkerState::kCreated) {
    state_ = WorkerState::kRunning;
    wanted_state_ = WorkerState::kRunning;
    thread_ = std::thread(&IntervalWorker::WorkerLoop, this);
    Logger::Debug("[IntervalWorker] " + name_ + " STARTED");
    return ReadyFuture(state_);
  }
  if (state_ != WorkerState::kPaused) return ReadyFuture(state_);
  return RequestStateLocked(WorkerState::kRunning);
}

std::future<WorkerState> IntervalWorker::PauseAsync() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (disposing_ || disposed_ || state_ != WorkerState::kRunning) {
    return ReadyFuture(state_);
  }
  return RequestStateLocked(WorkerState::kPaused);
}

std::future<WorkerState> IntervalWorker::ResumeAsync() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (disposing_ || disposed_ || state_ != WorkerState::kPaused) {
    return ReadyFuture(state_);
  }
  return RequestStateLocked(WorkerState::kRunning);
}

std::future<WorkerState> IntervalWorker::StopAsync() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (disposing_ || disposed_ ||
      (state_ != WorkerState::kRunning && state_ != WorkerState::kPaused)) {
    return ReadyFuture(state_);
  }
  return RequestStateLocked(WorkerState::kStopped);
}

// =============================================================================
// Disposal
// =============================================================================

void IntervalWorker::Dispose() {
  if (OnWorkerThread()) {
    // The loop is still on this stack: ask it to stop and let the owner's
    // Dispose() (or destructor) join and finalize.
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_ || wanted_state_ == WorkerState::kStopped) return;
    Logger::Debug("[IntervalWorker] " + name_ + " SELF_DISPOSE_REQUESTED");
    wanted_state_ = WorkerState::kStopped;
    InterruptLocked();
    return;
  }

  std::lock_guard<std::mutex> dispose_lock(dispose_mutex_);

  std::future<WorkerState> stopped;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_ || disposing_) return;
    disposing_ = true;
    if (state_ == WorkerState::kCreated) {
      state_ = WorkerState::kStopped;
      wanted_state_ = WorkerState::kStopped;
    } else if (state_ != WorkerState::kStopped) {
      stopped = RequestStateLocked(WorkerState::kStopped);
    }
  }

  if (stopped.valid() &&
      stopped.wait_for(kDisposeTimeout) != std::future_status::ready) {
    std::ostringstream oss;
    oss << "[IntervalWorker] " << name_ << " DISPOSE_TIMEOUT after "
        << kDisposeTimeout.count() << "ms; waiting for cycle to return";
    Logger::Warn(oss.str());
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  try {
    OnDisposing();
  } catch (const std::exception& e) {
    Logger::Error("[IntervalWorker] " + name_ +
                  " OnDisposing threw: " + e.what());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  CompleteWaitersLocked();
  timer_.reset();
  disposed_ = true;
  disposing_ = false;
  Logger::Debug("[IntervalWorker] " + name_ + " DISPOSED");
}

bool IntervalWorker::OnWorkerThread() const {
  return worker_thread_id_.load() == std::this_thread::get_id();
}

// =============================================================================
// Accessors
// =============================================================================

WorkerState IntervalWorker::State() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

WorkerState IntervalWorker::WantedState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return wanted_state_;
}

bool IntervalWorker::IsDisposed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return disposed_;
}

bool IntervalWorker::IsDisposing() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return disposing_;
}

std::chrono::nanoseconds IntervalWorker::Period() const {
  return std::chrono::nanoseconds(period_ns_.load());
}

void IntervalWorker::SetPeriod(std::chrono::nanoseconds period) {
  if (period.count() <= 0) {
    throw std::invalid_argument("IntervalWorker period must be positive");
  }
  period_ns_.store(period.count());
}

std::chrono::nanoseconds IntervalWorker::LastCycleElapsed() const {
  return std::chrono::nanoseconds(last_cycle_elapsed_ns_.load());
}

std::chrono::nanoseconds IntervalWorker::RemainingCycleTime() const {
  return std::chrono::nanoseconds(remaining_cycle_ns_.load());
}

// =============================================================================
// Worker thread
// =============================================================================

void IntervalWorker::RunCycle(const util::CancellationToken& token) {
  try {
    ExecuteCycleLogic(token);
    return;
  } catch (const std::exception& e) {
    try {
      OnCycleException(e);
    } catch (const std::exception& handler_error) {
      Logger::Error("[IntervalWorker] " + name_ +
                    " OnCycleException threw: " + handler_error.what());
    }
    return;
  } catch (...) {
    const std::runtime_error error("non-standard exception from cycle logic");
    try {
      OnCycleException(error);
    } catch (const std::exception& handler_error) {
      Logger::Error("[IntervalWorker] " + name_ +
                    " OnCycleException threw: " + handler_error.what());
    }
  }
}

void IntervalWorker::WorkerLoop() {
  worker_thread_id_.store(std::this_thread::get_id());
  auto cycle_start = Clock::now();

  for (;;) {
    util::CancellationToken token;
    WorkerState state;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (state_ != wanted_state_) {
        Logger::Debug(std::string("[IntervalWorker] ") + name_ + " " +
                      WorkerStateName(state_) + " -> " +
                      WorkerStateName(wanted_state_));
        state_ = wanted_state_;
      }
      state = state_;
      CompleteWaitersLocked();
      if (state == WorkerState::kStopped) break;

      cycle_source_ = util::CancellationSource();
      token = cycle_source_.Token();
    }

    if (state == WorkerState::kRunning) {
      RunCycle(token);
      cycle_count_.fetch_add(1);
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      cycle_source_.Cancel();
    }

    const auto logic_elapsed = Clock::now() - cycle_start;
    const auto remaining = std::chrono::nanoseconds(period_ns_.load()) -
                           std::chrono::duration_cast<std::chrono::nanoseconds>(
                               logic_elapsed);
    remaining_cycle_ns_.store(remaining.count());
    if (remaining.count() > 0) {
      timer_->WaitFor(remaining);
    } else {
      // Overrun: only pick up a pending interrupt.
      timer_->WaitFor(std::chrono::nanoseconds::zero());
    }

    const auto now = Clock::now();
    last_cycle_elapsed_ns_.store(
        std::chrono::duration_cast<std::chrono::nanoseconds>(now - cycle_start)
            .count());
    cycle_start = now;
  }
}

}  // namespace cadence::worker
