// Repository: Cadence-audio
// Component: WaveFormat
// Purpose: PCM format description and the byte/time conversions used by
//          the ring sizing, latency model and device sink.
// Copyright (c) 2025 Cadence

#ifndef CADENCE_AUDIO_WAVE_FORMAT_HPP_
#define CADENCE_AUDIO_WAVE_FORMAT_HPP_

#include <cstdint>
#include <string>

namespace cadence::audio {

// House format: signed 16-bit little-endian, 2 channels, interleaved.
constexpr int kHouseBitsPerSample = 16;
constexpr int kHouseChannels = 2;
constexpr int kDefaultSampleRate = 48000;

struct WaveFormat {
  int sample_rate = kDefaultSampleRate;
  int bits_per_sample = kHouseBitsPerSample;
  int channels = kHouseChannels;

  static WaveFormat House(int sample_rate = kDefaultSampleRate);

  // Bytes per sample frame (all channels).
  int BlockAlign() const { return channels * (bits_per_sample / 8); }
  int AverageBytesPerSecond() const { return sample_rate * BlockAlign(); }

  bool IsHouseFormat() const {
    return bits_per_sample == kHouseBitsPerSample && channels == kHouseChannels;
  }

  // Bytes covering latency_ms, rounded up to a whole sample frame.
  int64_t ConvertLatencyToByteCount(int64_t latency_ms) const;
  // As above, saturated to the largest frame multiple that fits an int.
  int ConvertLatencyToByteSize(int latency_ms) const;

  // Duration of byte_count bytes, rounded to the nearest microsecond.
  int64_t BytesToDurationUs(int64_t byte_count) const;

  // e.g. "48000 Hz s16 2ch".
  std::string ToString() const;
};

}  // namespace cadence::audio

#endif  // CADENCE_AUDIO_WAVE_FORMAT_HPP_
