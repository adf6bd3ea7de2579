// Repository: Cadence-audio
// Component: AudioBlockConverter
// Purpose: Converts decoded FFmpeg audio frames of any layout, sample format
//          and rate into house-format PcmBlocks (S16 interleaved stereo).
// Copyright (c) 2025 Cadence

#ifndef CADENCE_AUDIO_AUDIO_BLOCK_CONVERTER_HPP_
#define CADENCE_AUDIO_AUDIO_BLOCK_CONVERTER_HPP_

#include <cstdint>

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/frame.h>
#include <libswresample/swresample.h>
}

#include "cadence/audio/PcmBlock.hpp"
#include "cadence/audio/WaveFormat.hpp"

namespace cadence::audio {

// The resampler is created on the first frame and rebuilt whenever the
// input rate, sample format or channel layout changes. Resampler delay is
// carried between frames of the same input format.
//
// Not thread-safe; owned by a single decode thread.
class AudioBlockConverter {
 public:
  explicit AudioBlockConverter(int output_sample_rate = kDefaultSampleRate);
  ~AudioBlockConverter();

  AudioBlockConverter(const AudioBlockConverter&) = delete;
  AudioBlockConverter& operator=(const AudioBlockConverter&) = delete;

  // Returns nullptr (and logs) when the frame is empty or conversion fails.
  PcmBlockPtr Convert(const AVFrame* frame, int64_t start_time_us);

  // Drops the resampler and any buffered delay (call on seek).
  void Reset();

  const WaveFormat& OutputFormat() const { return output_format_; }

 private:
  bool EnsureResampler(const AVFrame* frame);

  WaveFormat output_format_;
  SwrContext* swr_ctx_ = nullptr;
  int src_sample_rate_ = 0;
  int src_sample_format_ = -1;
  AVChannelLayout src_ch_layout_{};
};

}  // namespace cadence::audio

#endif  // CADENCE_AUDIO_AUDIO_BLOCK_CONVERTER_HPP_
