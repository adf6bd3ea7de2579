// Repository: Cadence-audio
// Component: IntervalWorker
// Purpose: Cancellable, pausable periodic execution on a dedicated thread.
//          Drives the audio feed and any other fixed-rate background work.
// Copyright (c) 2025 Cadence

#ifndef CADENCE_WORKER_INTERVAL_WORKER_HPP_
#define CADENCE_WORKER_INTERVAL_WORKER_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "cadence/util/CancellationToken.hpp"
#include "cadence/worker/CycleTimer.hpp"

namespace cadence::worker {

enum class WorkerState { kCreated, kRunning, kPaused, kStopped };

const char* WorkerStateName(WorkerState state);

// IntervalWorker runs ExecuteCycleLogic() once per period on its own thread.
//
// State machine:
//   Created --Start--> Running --Pause--> Paused --Resume/Start--> Running
//   Running/Paused --Stop--> Stopped (terminal)
//
// Requests return a future completed with the state the worker thread
// applied. Incompatible requests (and any request while disposing or
// disposed) complete immediately with the current state. Each request
// interrupts the current wait and cancels the live cycle token, so it takes
// effect within one period.
//
// Cycle logic is never re-entered. Exceptions thrown by it are passed to
// OnCycleException() and the loop continues.
//
// Derived classes must call Dispose() from their destructor so the thread
// is gone before their members are.
class IntervalWorker {
 public:
  static constexpr std::chrono::milliseconds kDefaultPeriod{15};
  static constexpr std::chrono::milliseconds kDisposeTimeout{2000};

  IntervalWorker(std::string name, std::chrono::nanoseconds period,
                 IntervalWorkerMode mode);
  IntervalWorker(std::string name, std::chrono::nanoseconds period,
                 std::unique_ptr<ICycleTimer> timer);
  virtual ~IntervalWorker();

  IntervalWorker(const IntervalWorker&) = delete;
  IntervalWorker& operator=(const IntervalWorker&) = delete;

  std::future<WorkerState> StartAsync();
  std::future<WorkerState> PauseAsync();
  std::future<WorkerState> ResumeAsync();
  std::future<WorkerState> StopAsync();

  // Idempotent. Drives the worker to Stopped (waiting up to
  // kDisposeTimeout), joins the thread, then calls OnDisposing().
  //
  // Called from cycle logic it only requests Stopped and returns; the
  // worker is not disposed until Dispose() runs again on another thread
  // (the derived destructor does this).
  void Dispose();

  const std::string& Name() const { return name_; }
  WorkerState State() const;
  WorkerState WantedState() const;
  bool IsDisposed() const;
  bool IsDisposing() const;

  std::chrono::nanoseconds Period() const;
  void SetPeriod(std::chrono::nanoseconds period);

  std::chrono::milliseconds TimerResolution() const { return resolution_; }
  bool IsHighResolution() const { return high_resolution_; }

  // Wall time of the last full cycle (logic plus wait).
  std::chrono::nanoseconds LastCycleElapsed() const;
  // Wait budget left after the last cycle's logic; negative when overrun.
  std::chrono::nanoseconds RemainingCycleTime() const;
  int64_t CycleCount() const { return cycle_count_.load(); }

 protected:
  virtual void ExecuteCycleLogic(const util::CancellationToken& token) = 0;
  virtual void OnCycleException(const std::exception& error) = 0;
  virtual void OnDisposing() {}

 private:
  std::future<WorkerState> RequestStateLocked(WorkerState wanted);
  void CompleteWaitersLocked();
  void InterruptLocked();
  void RunCycle(const util::CancellationToken& token);
  void WorkerLoop();
  bool OnWorkerThread() const;

  const std::string name_;
  std::unique_ptr<ICycleTimer> timer_;
  const std::chrono::milliseconds resolution_;
  const bool high_resolution_;
  std::atomic<int64_t> period_ns_;

  mutable std::mutex mutex_;
  WorkerState state_ = WorkerState::kCreated;
  WorkerState wanted_state_ = WorkerState::kCreated;
  std::vector<std::promise<WorkerState>> waiters_;
  util::CancellationSource cycle_source_;
  bool disposing_ = false;
  bool disposed_ = false;

  std::mutex dispose_mutex_;
  std::thread thread_;
  std::atomic<std::thread::id> worker_thread_id_{};

  std::atomic<int64_t> last_cycle_elapsed_ns_{0};
  std::atomic<int64_t> remaining_cycle_ns_{0};
  std::atomic<int64_t> cycle_count_{0};
};

}  // namespace cadence::worker

#endif  // CADENCE_WORKER_INTERVAL_WORKER_HPP_
