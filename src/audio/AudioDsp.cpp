// Repository: Cadence-audio
// Component: AudioDsp
// Purpose: Sample-level speed change and per-channel gain on S16 PCM.
// Copyright (c) 2025 Cadence

#include "cadence/audio/AudioDsp.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace cadence::audio::dsp {

namespace {

constexpr int kBytesPerSample = 2;

inline int16_t LoadSample(const uint8_t* p) {
  return static_cast<int16_t>(static_cast<uint16_t>(p[0]) |
                              (static_cast<uint16_t>(p[1]) << 8));
}

inline void StoreSample(uint8_t* p, int16_t value) {
  const auto u = static_cast<uint16_t>(value);
  p[0] = static_cast<uint8_t>(u & 0xFF);
  p[1] = static_cast<uint8_t>(u >> 8);
}

}  // namespace

int ToMultipleOf(double value, int multiple) {
  if (multiple <= 0 || value <= 0.0) return 0;
  return static_cast<int>(value / multiple) * multiple;
}

int ToMultipleOfCeil(double value, int multiple) {
  if (multiple <= 0 || value <= 0.0) return 0;
  // Tolerate binary noise such as 1.1 * 10 = 11.000000000000002.
  const double units = std::ceil(value / multiple - 1e-9);
  return static_cast<int>(units) * multiple;
}

ChannelVolumes ComputeChannelVolumes(double volume, double balance) {
  volume = std::clamp(volume, 0.0, 1.0);
  balance = std::clamp(balance, -1.0, 1.0);
  ChannelVolumes v;
  v.left = volume * (balance > 0.0 ? 1.0 - balance : 1.0);
  v.right = volume * (balance < 0.0 ? 1.0 + balance : 1.0);
  return v;
}

void StretchBlocks(const uint8_t* source, int source_bytes, uint8_t* target,
                   int target_bytes, int block_align) {
  if (target_bytes <= 0 || block_align <= 0) return;
  const int source_frames = source_bytes / block_align;
  const int target_frames = target_bytes / block_align;
  if (source_frames <= 0) {
    std::memset(target, 0, static_cast<size_t>(target_bytes));
    return;
  }

  int source_index = 0;
  int accumulator = 0;
  for (int t = 0; t < target_frames; ++t) {
    std::memcpy(target + t * block_align, source + source_index * block_align,
                static_cast<size_t>(block_align));
    accumulator += source_frames;
    if (accumulator >= target_frames) {
      accumulator -= target_frames;
      source_index = std::min(source_index + 1, source_frames - 1);
    }
  }
}

void ShrinkBlocks(const uint8_t* source, int source_bytes, uint8_t* target,
                  int target_bytes, int channels) {
  if (target_bytes <= 0 || channels <= 0) return;
  const int block_align = channels * kBytesPerSample;
  const int source_frames = source_bytes / block_align;
  const int target_frames = target_bytes / block_align;
  if (source_frames < target_frames) {
    std::memset(target, 0, static_cast<size_t>(target_bytes));
    return;
  }

  int source_index = 0;
  int accumulator = 0;
  for (int t = 0; t < target_frames; ++t) {
    accumulator += source_frames;
    const int group = accumulator / target_frames;
    accumulator %= target_frames;

    for (int c = 0; c < channels; ++c) {
      int64_t sum = 0;
      for (int g = 0; g < group; ++g) {
        sum += LoadSample(source + (source_index + g) * block_align +
                          c * kBytesPerSample);
      }
      const auto average = static_cast<int16_t>(
          std::lround(static_cast<double>(sum) / group));
      StoreSample(target + t * block_align + c * kBytesPerSample, average);
    }
    source_index += group;
  }
}

void ApplyVolumeAndBalance(uint8_t* buffer, int byte_count, int channels,
                           const ChannelVolumes& volumes, bool muted) {
  if (byte_count <= 0) return;
  if (muted) {
    std::memset(buffer, 0, static_cast<size_t>(byte_count));
    return;
  }
  if (volumes.left == 1.0 && volumes.right == 1.0) return;
  if (channels <= 0) return;

  const int samples = byte_count / kBytesPerSample;
  for (int i = 0; i < samples; ++i) {
    const int channel = i % channels;
    // Channels beyond the first two are treated as right.
    const double factor = channel == 0 ? volumes.left : volumes.right;
    if (factor == 1.0) continue;
    uint8_t* p = buffer + i * kBytesPerSample;
    StoreSample(p, static_cast<int16_t>(LoadSample(p) * factor));
  }
}

}  // namespace cadence::audio::dsp
