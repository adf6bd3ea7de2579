// Repository: Cadence-audio
// Component: PcmBlock
// Purpose: Immutable, timestamped chunk of house-format PCM handed from the
//          decoder side to the renderer.
// Copyright (c) 2025 Cadence

#ifndef CADENCE_AUDIO_PCM_BLOCK_HPP_
#define CADENCE_AUDIO_PCM_BLOCK_HPP_

#include <cstdint>
#include <memory>
#include <vector>

#include "cadence/audio/WaveFormat.hpp"

namespace cadence::audio {

struct PcmBlock {
  std::vector<uint8_t> data;   // S16 interleaved
  int64_t start_time_us = 0;   // since stream start
  int64_t duration_us = 0;
  int sample_rate = kDefaultSampleRate;
  int channels = kHouseChannels;
  int samples_per_channel = 0;

  int64_t EndTimeUs() const { return start_time_us + duration_us; }
  int SizeBytes() const { return static_cast<int>(data.size()); }
};

using PcmBlockPtr = std::shared_ptr<const PcmBlock>;

// Builds a block from raw interleaved bytes; duration and sample count are
// derived from the format.
PcmBlockPtr MakePcmBlock(std::vector<uint8_t> data, int64_t start_time_us,
                         const WaveFormat& format);

}  // namespace cadence::audio

#endif  // CADENCE_AUDIO_PCM_BLOCK_HPP_
