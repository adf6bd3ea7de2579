// Repository: Cadence-audio
// Component: AudioFeedWorker Tests
// Purpose: Periodic feeding of the renderer from the block buffer at the
//          reference clock position.
// Copyright (c) 2025 Cadence

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "cadence/audio/AudioRenderer.hpp"
#include "cadence/worker/AudioFeedWorker.hpp"
#include "fixtures/ManualReferenceClock.h"
#include "fixtures/ManualWavePlayer.h"

namespace cadence::worker::testing {
namespace {

using namespace std::chrono_literals;
using tests::fixtures::ManualReferenceClock;
using tests::fixtures::ManualWavePlayer;
using tests::fixtures::ManualWavePlayerProbe;

static bool WaitUntil(const std::function<bool()>& pred,
                      std::chrono::milliseconds timeout = 2000ms) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(1ms);
  }
  return pred();
}

static audio::PcmBlockPtr MakeBlock(int64_t start_ms) {
  return audio::MakePcmBlock(std::vector<uint8_t>(1920, 1), start_ms * 1000,
                             audio::WaveFormat::House());
}

struct FeedRig {
  std::shared_ptr<ManualWavePlayerProbe> probe =
      std::make_shared<ManualWavePlayerProbe>();
  std::shared_ptr<ManualReferenceClock> clock =
      std::make_shared<ManualReferenceClock>();
  std::shared_ptr<audio::AudioBlockBuffer> blocks =
      std::make_shared<audio::AudioBlockBuffer>(16);
  std::shared_ptr<audio::AudioRenderer> renderer;

  FeedRig() {
    audio::AudioRendererConfig config;
    config.ring_buffer_bytes = 65536;
    auto device_probe = probe;
    renderer = std::make_shared<audio::AudioRenderer>(
        config, audio::StreamInfo{}, clock, blocks,
        [device_probe](const audio::AudioRendererConfig&) {
          return std::make_unique<ManualWavePlayer>(device_probe);
        });
  }
};

TEST(AudioFeedWorkerTest, RequiresCollaborators) {
  FeedRig rig;
  EXPECT_THROW(AudioFeedWorker(nullptr, rig.blocks, rig.clock),
               std::invalid_argument);
}

TEST(AudioFeedWorkerTest, FeedsBlocksAtClockPosition) {
  FeedRig rig;
  for (int i = 0; i < 4; ++i) rig.blocks->Add(MakeBlock(i * 10));

  AudioFeedWorker worker(rig.renderer, rig.blocks, rig.clock, 5ms,
                         IntervalWorkerMode::kSystemDefault);
  worker.StartAsync().get();
  EXPECT_TRUE(WaitUntil([&] { return rig.renderer->ReadableBytes() == 4 * 1920; }));
  EXPECT_GT(worker.BlocksRendered(), 0);

  // New audio arriving later is picked up on a following cycle.
  rig.blocks->Add(MakeBlock(40));
  EXPECT_TRUE(WaitUntil([&] { return rig.renderer->ReadableBytes() == 5 * 1920; }));
  EXPECT_EQ(worker.StopAsync().get(), WorkerState::kStopped);
  EXPECT_EQ(worker.CycleExceptions(), 0);
}

TEST(AudioFeedWorkerTest, ClockBeforeRangeStartsWithEarliestBlock) {
  FeedRig rig;
  rig.blocks->Add(MakeBlock(100));
  rig.blocks->Add(MakeBlock(110));
  rig.clock->SetPositionUs(0);

  AudioFeedWorker worker(rig.renderer, rig.blocks, rig.clock, 5ms,
                         IntervalWorkerMode::kHighPrecision);
  worker.StartAsync().get();
  EXPECT_TRUE(WaitUntil([&] { return rig.renderer->ReadableBytes() == 2 * 1920; }));
  // Audio position = last tag (110 ms) minus 20 ms pending.
  EXPECT_EQ(rig.renderer->PositionUs(), 90'000);
}

TEST(AudioFeedWorkerTest, EmptyBufferIsANoOp) {
  FeedRig rig;
  AudioFeedWorker worker(rig.renderer, rig.blocks, rig.clock, 5ms,
                         IntervalWorkerMode::kSystemDefault);
  worker.StartAsync().get();
  EXPECT_TRUE(WaitUntil([&] { return worker.CycleCount() >= 3; }));
  EXPECT_EQ(rig.renderer->ReadableBytes(), 0);
  EXPECT_EQ(worker.BlocksRendered(), 0);
  worker.Dispose();
  EXPECT_TRUE(worker.IsDisposed());
}

}  // namespace
}  // namespace cadence::worker::testing
