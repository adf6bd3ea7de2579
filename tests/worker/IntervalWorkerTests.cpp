// Repository: Cadence-audio
// Component: IntervalWorker Tests
// Purpose: State machine, request interruption, per-cycle cancellation,
//          exception delegation and disposal.
// Copyright (c) 2025 Cadence

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "cadence/worker/IntervalWorker.hpp"

namespace cadence::worker::testing {
namespace {

using namespace std::chrono_literals;

// Helper: polls pred until true or timeout.
static bool WaitUntil(const std::function<bool()>& pred,
                      std::chrono::milliseconds timeout = 2000ms) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(1ms);
  }
  return pred();
}

class CountingWorker : public IntervalWorker {
 public:
  explicit CountingWorker(std::chrono::nanoseconds period = 5ms,
                          IntervalWorkerMode mode = IntervalWorkerMode::kSystemDefault)
      : IntervalWorker("Counting", period, mode) {}
  ~CountingWorker() override { Dispose(); }

  std::atomic<int> cycles{0};
  std::atomic<int> exceptions{0};
  std::atomic<int> disposing_calls{0};
  std::atomic<int> overlaps{0};
  std::atomic<bool> throw_next{false};
  std::function<void(const util::CancellationToken&)> body;
  std::string last_error;

 protected:
  void ExecuteCycleLogic(const util::CancellationToken& token) override {
    if (in_cycle_.exchange(true)) overlaps.fetch_add(1);
    cycles.fetch_add(1);
    if (throw_next.exchange(false)) {
      in_cycle_.store(false);
      throw std::runtime_error("cycle failed");
    }
    if (body) body(token);
    in_cycle_.store(false);
  }

  void OnCycleException(const std::exception& error) override {
    last_error = error.what();
    exceptions.fetch_add(1);
  }

  void OnDisposing() override { disposing_calls.fetch_add(1); }

 private:
  std::atomic<bool> in_cycle_{false};
};

// =============================================================================
// State machine
// =============================================================================
TEST(IntervalWorkerTest, CreatedIgnoresEverythingButStart) {
  CountingWorker worker;
  EXPECT_EQ(worker.State(), WorkerState::kCreated);
  EXPECT_EQ(worker.PauseAsync().get(), WorkerState::kCreated);
  EXPECT_EQ(worker.ResumeAsync().get(), WorkerState::kCreated);
  EXPECT_EQ(worker.StopAsync().get(), WorkerState::kCreated);
  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(worker.cycles.load(), 0);
}

TEST(IntervalWorkerTest, StartFromCreatedIsImmediate) {
  CountingWorker worker;
  auto started = worker.StartAsync();
  ASSERT_EQ(started.wait_for(0s), std::future_status::ready);
  EXPECT_EQ(started.get(), WorkerState::kRunning);
  EXPECT_TRUE(WaitUntil([&] { return worker.cycles.load() >= 3; }));
}

TEST(IntervalWorkerTest, PauseHaltsCyclesAndResumeRestarts) {
  CountingWorker worker;
  worker.StartAsync().get();
  ASSERT_TRUE(WaitUntil([&] { return worker.cycles.load() >= 2; }));

  EXPECT_EQ(worker.PauseAsync().get(), WorkerState::kPaused);
  const int paused_at = worker.cycles.load();
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(worker.cycles.load(), paused_at);
  EXPECT_EQ(worker.PauseAsync().get(), WorkerState::kPaused);

  EXPECT_EQ(worker.ResumeAsync().get(), WorkerState::kRunning);
  EXPECT_TRUE(WaitUntil([&] { return worker.cycles.load() > paused_at; }));
}

TEST(IntervalWorkerTest, StartFromPausedResumes) {
  CountingWorker worker;
  worker.StartAsync().get();
  worker.PauseAsync().get();
  EXPECT_EQ(worker.StartAsync().get(), WorkerState::kRunning);
  EXPECT_EQ(worker.ResumeAsync().get(), WorkerState::kRunning);
}

TEST(IntervalWorkerTest, StoppedIsTerminal) {
  CountingWorker worker;
  worker.StartAsync().get();
  EXPECT_EQ(worker.StopAsync().get(), WorkerState::kStopped);
  EXPECT_EQ(worker.StartAsync().get(), WorkerState::kStopped);
  EXPECT_EQ(worker.PauseAsync().get(), WorkerState::kStopped);
  EXPECT_EQ(worker.ResumeAsync().get(), WorkerState::kStopped);
  EXPECT_EQ(worker.StopAsync().get(), WorkerState::kStopped);
}

TEST(IntervalWorkerTest, StopFromPaused) {
  CountingWorker worker;
  worker.StartAsync().get();
  worker.PauseAsync().get();
  EXPECT_EQ(worker.StopAsync().get(), WorkerState::kStopped);
}

// =============================================================================
// Interruption and cancellation
// =============================================================================
TEST(IntervalWorkerTest, RequestInterruptsLongWait) {
  CountingWorker worker(std::chrono::seconds(10));
  worker.StartAsync().get();
  ASSERT_TRUE(WaitUntil([&] { return worker.cycles.load() >= 1; }));

  auto paused = worker.PauseAsync();
  EXPECT_EQ(paused.wait_for(1s), std::future_status::ready);
  EXPECT_EQ(paused.get(), WorkerState::kPaused);

  auto stopped = worker.StopAsync();
  EXPECT_EQ(stopped.wait_for(1s), std::future_status::ready);
}

TEST(IntervalWorkerTest, RequestCancelsLiveCycleToken) {
  CountingWorker worker;
  std::atomic<bool> entered{false};
  std::atomic<bool> saw_cancel{false};
  worker.body = [&](const util::CancellationToken& token) {
    entered.store(true);
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!token.IsCancellationRequested() &&
           std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(1ms);
    }
    saw_cancel.store(token.IsCancellationRequested());
  };
  worker.StartAsync().get();
  ASSERT_TRUE(WaitUntil([&] { return entered.load(); }));

  auto stopped = worker.StopAsync();
  ASSERT_EQ(stopped.wait_for(2s), std::future_status::ready);
  EXPECT_TRUE(saw_cancel.load());
}

TEST(IntervalWorkerTest, HighPrecisionModeRuns) {
  CountingWorker worker(2ms, IntervalWorkerMode::kHighPrecision);
  worker.StartAsync().get();
  EXPECT_TRUE(WaitUntil([&] { return worker.cycles.load() >= 5; }));
  EXPECT_GT(worker.LastCycleElapsed().count(), 0);
  EXPECT_EQ(worker.StopAsync().get(), WorkerState::kStopped);
}

// =============================================================================
// Exceptions
// =============================================================================
TEST(IntervalWorkerTest, CycleExceptionIsDelegatedAndLoopContinues) {
  CountingWorker worker;
  worker.throw_next.store(true);
  worker.StartAsync().get();
  ASSERT_TRUE(WaitUntil([&] { return worker.exceptions.load() == 1; }));
  const int after_throw = worker.cycles.load();
  EXPECT_TRUE(WaitUntil([&] { return worker.cycles.load() > after_throw + 2; }));
  EXPECT_EQ(worker.StopAsync().get(), WorkerState::kStopped);
  EXPECT_EQ(worker.last_error, "cycle failed");
  EXPECT_EQ(worker.overlaps.load(), 0);
}

// =============================================================================
// Disposal
// =============================================================================
TEST(IntervalWorkerTest, DisposeIsIdempotent) {
  CountingWorker worker;
  worker.StartAsync().get();
  worker.Dispose();
  worker.Dispose();
  EXPECT_TRUE(worker.IsDisposed());
  EXPECT_EQ(worker.State(), WorkerState::kStopped);
  EXPECT_EQ(worker.disposing_calls.load(), 1);

  const int cycles = worker.cycles.load();
  EXPECT_EQ(worker.StartAsync().get(), WorkerState::kStopped);
  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(worker.cycles.load(), cycles);
}

TEST(IntervalWorkerTest, DisposeFromCreated) {
  CountingWorker worker;
  worker.Dispose();
  EXPECT_EQ(worker.State(), WorkerState::kStopped);
  EXPECT_EQ(worker.disposing_calls.load(), 1);
  EXPECT_EQ(worker.cycles.load(), 0);
}

TEST(IntervalWorkerTest, DisposeWhilePaused) {
  CountingWorker worker;
  worker.StartAsync().get();
  worker.PauseAsync().get();
  worker.Dispose();
  EXPECT_EQ(worker.State(), WorkerState::kStopped);
}

TEST(IntervalWorkerTest, DisposeFromCycleLogicStopsWithoutFinalizing) {
  auto worker = std::make_unique<CountingWorker>();
  CountingWorker* self = worker.get();
  worker->body = [self](const util::CancellationToken&) { self->Dispose(); };
  worker->StartAsync().get();

  ASSERT_TRUE(WaitUntil([&] { return worker->State() == WorkerState::kStopped; }));
  EXPECT_EQ(worker->cycles.load(), 1);
  EXPECT_FALSE(worker->IsDisposed());
  EXPECT_EQ(worker->disposing_calls.load(), 0);
  EXPECT_EQ(worker->StopAsync().get(), WorkerState::kStopped);

  // The owner finalizes: joins the exited loop, then runs OnDisposing().
  worker->Dispose();
  EXPECT_TRUE(worker->IsDisposed());
  EXPECT_EQ(worker->disposing_calls.load(), 1);
  EXPECT_EQ(worker->CycleCount(), 1);
  worker.reset();
}

TEST(IntervalWorkerTest, DestroyAfterDisposeFromCycleLogic) {
  auto worker = std::make_unique<CountingWorker>();
  CountingWorker* self = worker.get();
  std::atomic<bool> disposed_in_cycle{false};
  worker->body = [self, &disposed_in_cycle](const util::CancellationToken&) {
    self->Dispose();
    disposed_in_cycle.store(true);
  };
  worker->StartAsync().get();
  ASSERT_TRUE(WaitUntil([&] { return disposed_in_cycle.load(); }));

  // Destruction joins the loop before members go away.
  worker.reset();
  SUCCEED();
}

// =============================================================================
// Period
// =============================================================================
TEST(IntervalWorkerTest, PeriodIsMutable) {
  CountingWorker worker(15ms);
  EXPECT_EQ(worker.Period(), std::chrono::nanoseconds(15ms));
  worker.SetPeriod(3ms);
  EXPECT_EQ(worker.Period(), std::chrono::nanoseconds(3ms));
  EXPECT_THROW(worker.SetPeriod(0ms), std::invalid_argument);
}

TEST(IntervalWorkerTest, NonPositivePeriodRejected) {
  EXPECT_THROW(CountingWorker worker(0ms), std::invalid_argument);
}

}  // namespace
}  // namespace cadence::worker::testing
