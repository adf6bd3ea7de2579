// Repository: Cadence-audio
// Component: PcmBlock
// Purpose: Immutable, timestamped chunk of house-format PCM.
// Copyright (c) 2025 Cadence

#include "cadence/audio/PcmBlock.hpp"

namespace cadence::audio {

PcmBlockPtr MakePcmBlock(std::vector<uint8_t> data, int64_t start_time_us,
                         const WaveFormat& format) {
  auto block = std::make_shared<PcmBlock>();
  block->sample_rate = format.sample_rate;
  block->channels = format.channels;
  block->samples_per_channel =
      format.BlockAlign() > 0
          ? static_cast<int>(data.size()) / format.BlockAlign()
          : 0;
  block->duration_us =
      format.BytesToDurationUs(static_cast<int64_t>(data.size()));
  block->start_time_us = start_time_us;
  block->data = std::move(data);
  return block;
}

}  // namespace cadence::audio
