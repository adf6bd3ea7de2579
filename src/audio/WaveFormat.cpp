// Repository: Cadence-audio
// Component: WaveFormat
// Purpose: PCM format description and byte/time conversions.
// Copyright (c) 2025 Cadence

#include "cadence/audio/WaveFormat.hpp"

#include <algorithm>
#include <limits>
#include <sstream>

extern "C" {
#include <libavutil/mathematics.h>
#include <libavutil/samplefmt.h>
}

namespace cadence::audio {

WaveFormat WaveFormat::House(int sample_rate) {
  WaveFormat format;
  format.sample_rate = sample_rate;
  return format;
}

int64_t WaveFormat::ConvertLatencyToByteCount(int64_t latency_ms) const {
  int64_t bytes = static_cast<int64_t>(
      static_cast<double>(AverageBytesPerSecond()) / 1000.0 * latency_ms);
  const int64_t align = BlockAlign();
  if (align > 0 && bytes % align != 0) {
    bytes = bytes + align - (bytes % align);
  }
  return bytes;
}

int WaveFormat::ConvertLatencyToByteSize(int latency_ms) const {
  const int align = BlockAlign();
  const int64_t limit = std::numeric_limits<int>::max() -
                        (align > 0 ? std::numeric_limits<int>::max() % align : 0);
  return static_cast<int>(
      std::clamp<int64_t>(ConvertLatencyToByteCount(latency_ms), -limit, limit));
}

int64_t WaveFormat::BytesToDurationUs(int64_t byte_count) const {
  const int bytes_per_second = AverageBytesPerSecond();
  if (bytes_per_second <= 0) return 0;
  return av_rescale(byte_count, 1'000'000, bytes_per_second);
}

std::string WaveFormat::ToString() const {
  const char* name = nullptr;
  switch (bits_per_sample) {
    case 8:  name = av_get_sample_fmt_name(AV_SAMPLE_FMT_U8); break;
    case 16: name = av_get_sample_fmt_name(AV_SAMPLE_FMT_S16); break;
    case 32: name = av_get_sample_fmt_name(AV_SAMPLE_FMT_S32); break;
    default: break;
  }
  std::ostringstream oss;
  oss << sample_rate << " Hz ";
  if (name) {
    oss << name;
  } else {
    oss << bits_per_sample << "bit";
  }
  oss << " " << channels << "ch";
  return oss.str();
}

}  // namespace cadence::audio
