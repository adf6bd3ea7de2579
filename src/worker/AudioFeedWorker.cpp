// Repository: Cadence-audio
// Component: AudioFeedWorker
// Purpose: Producer side of the renderer.
// Copyright (c) 2025 Cadence

#include "cadence/worker/AudioFeedWorker.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

#include "cadence/util/Logger.hpp"

namespace cadence::worker {

using util::Logger;

AudioFeedWorker::AudioFeedWorker(
    std::shared_ptr<audio::AudioRenderer> renderer,
    std::shared_ptr<audio::AudioBlockBuffer> blocks,
    std::shared_ptr<timing::IReferenceClock> clock,
    std::chrono::nanoseconds period, IntervalWorkerMode mode)
    : IntervalWorker("AudioFeed", period, mode),
      renderer_(std::move(renderer)),
      blocks_(std::move(blocks)),
      clock_(std::move(clock)) {
  if (!renderer_ || !blocks_ || !clock_) {
    throw std::invalid_argument(
        "AudioFeedWorker requires a renderer, a block buffer and a clock");
  }
}

AudioFeedWorker::~AudioFeedWorker() {
  Dispose();
}

void AudioFeedWorker::ExecuteCycleLogic(const util::CancellationToken& token) {
  if (token.IsCancellationRequested()) return;

  const int64_t position_us = clock_->PositionUs();
  audio::PcmBlockPtr block = blocks_->BlockAt(position_us);
  if (!block) {
    // Clock precedes the buffered range: start with the earliest block.
    block = blocks_->Next(nullptr);
  }
  if (!block) return;

  renderer_->Render(block, position_us);
  blocks_rendered_.fetch_add(1);
}

void AudioFeedWorker::OnCycleException(const std::exception& error) {
  cycle_exceptions_.fetch_add(1);
  std::ostringstream oss;
  oss << "[AudioFeedWorker] CYCLE_EXCEPTION what=" << error.what()
      << " clock_us=" << clock_->PositionUs();
  Logger::Error(oss.str());
}

void AudioFeedWorker::OnDisposing() {
  Logger::Debug("[AudioFeedWorker] DISPOSING blocks_rendered=" +
                std::to_string(blocks_rendered_.load()));
}

}  // namespace cadence::worker
