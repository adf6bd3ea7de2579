// Repository: Cadence-audio
// Component: AudioFeedWorker
// Purpose: Producer side of the renderer. Each period, hands the block at
//          the reference clock position to AudioRenderer::Render().
// Copyright (c) 2025 Cadence

#ifndef CADENCE_WORKER_AUDIO_FEED_WORKER_HPP_
#define CADENCE_WORKER_AUDIO_FEED_WORKER_HPP_

#include <atomic>
#include <cstdint>
#include <memory>

#include "cadence/audio/AudioBlockBuffer.hpp"
#include "cadence/audio/AudioRenderer.hpp"
#include "cadence/timing/IReferenceClock.hpp"
#include "cadence/worker/IntervalWorker.hpp"

namespace cadence::worker {

class AudioFeedWorker : public IntervalWorker {
 public:
  AudioFeedWorker(std::shared_ptr<audio::AudioRenderer> renderer,
                  std::shared_ptr<audio::AudioBlockBuffer> blocks,
                  std::shared_ptr<timing::IReferenceClock> clock,
                  std::chrono::nanoseconds period = kDefaultPeriod,
                  IntervalWorkerMode mode = IntervalWorkerMode::kHighPrecision);
  ~AudioFeedWorker() override;

  int64_t BlocksRendered() const { return blocks_rendered_.load(); }
  int64_t CycleExceptions() const { return cycle_exceptions_.load(); }

 protected:
  void ExecuteCycleLogic(const util::CancellationToken& token) override;
  void OnCycleException(const std::exception& error) override;
  void OnDisposing() override;

 private:
  std::shared_ptr<audio::AudioRenderer> renderer_;
  std::shared_ptr<audio::AudioBlockBuffer> blocks_;
  std::shared_ptr<timing::IReferenceClock> clock_;

  std::atomic<int64_t> blocks_rendered_{0};
  std::atomic<int64_t> cycle_exceptions_{0};
};

}  // namespace cadence::worker

#endif  // CADENCE_WORKER_AUDIO_FEED_WORKER_HPP_
