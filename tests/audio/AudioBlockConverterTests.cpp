// Repository: Cadence-audio
// Component: AudioBlockConverter Tests
// Purpose: FFmpeg frames of various formats become S16 stereo blocks.
// Copyright (c) 2025 Cadence

#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <memory>

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/frame.h>
#include <libavutil/samplefmt.h>
}

#include "cadence/audio/AudioBlockConverter.hpp"

namespace cadence::audio::testing {
namespace {

struct FrameDeleter {
  void operator()(AVFrame* f) const { av_frame_free(&f); }
};
using FramePtr = std::unique_ptr<AVFrame, FrameDeleter>;

static FramePtr MakeFrame(AVSampleFormat format, int sample_rate, int channels,
                          int nb_samples) {
  FramePtr frame(av_frame_alloc());
  frame->format = format;
  frame->sample_rate = sample_rate;
  frame->nb_samples = nb_samples;
  av_channel_layout_default(&frame->ch_layout, channels);
  if (av_frame_get_buffer(frame.get(), 0) < 0) return nullptr;
  return frame;
}

static int16_t SampleAt(const PcmBlock& block, int index) {
  int16_t s;
  std::memcpy(&s, block.data.data() + index * 2, 2);
  return s;
}

TEST(AudioBlockConverterTest, PlanarFloatStereoBecomesInterleavedS16) {
  auto frame = MakeFrame(AV_SAMPLE_FMT_FLTP, 48000, 2, 480);
  ASSERT_NE(frame, nullptr);
  auto* left = reinterpret_cast<float*>(frame->data[0]);
  auto* right = reinterpret_cast<float*>(frame->data[1]);
  for (int i = 0; i < 480; ++i) {
    left[i] = 0.5f;
    right[i] = -0.5f;
  }

  AudioBlockConverter converter(48000);
  auto block = converter.Convert(frame.get(), 120'000);
  ASSERT_NE(block, nullptr);
  EXPECT_EQ(block->start_time_us, 120'000);
  EXPECT_EQ(block->channels, 2);
  EXPECT_EQ(block->sample_rate, 48000);
  EXPECT_EQ(block->samples_per_channel, 480);
  EXPECT_EQ(block->SizeBytes(), 480 * 4);
  EXPECT_EQ(block->duration_us, 10'000);
  EXPECT_NEAR(SampleAt(*block, 0), 16384, 2);
  EXPECT_NEAR(SampleAt(*block, 1), -16384, 2);
}

TEST(AudioBlockConverterTest, MonoIsUpmixedToBothChannels) {
  auto frame = MakeFrame(AV_SAMPLE_FMT_S16, 48000, 1, 256);
  ASSERT_NE(frame, nullptr);
  auto* samples = reinterpret_cast<int16_t*>(frame->data[0]);
  for (int i = 0; i < 256; ++i) samples[i] = 8000;

  AudioBlockConverter converter(48000);
  auto block = converter.Convert(frame.get(), 0);
  ASSERT_NE(block, nullptr);
  ASSERT_EQ(block->samples_per_channel, 256);
  EXPECT_EQ(SampleAt(*block, 0), SampleAt(*block, 1));
  EXPECT_GT(SampleAt(*block, 0), 0);
}

TEST(AudioBlockConverterTest, ResamplesToOutputRate) {
  AudioBlockConverter converter(48000);
  int total = 0;
  for (int i = 0; i < 10; ++i) {
    auto frame = MakeFrame(AV_SAMPLE_FMT_S16, 44100, 2, 441);
    ASSERT_NE(frame, nullptr);
    std::memset(frame->data[0], 0, 441 * 4);
    auto block = converter.Convert(frame.get(), i * 10'000);
    ASSERT_NE(block, nullptr);
    EXPECT_EQ(block->sample_rate, 48000);
    total += block->samples_per_channel;
  }
  // 100 ms of input; the resampler may hold back a few samples.
  EXPECT_GT(total, 4700);
  EXPECT_LE(total, 4800);
}

TEST(AudioBlockConverterTest, EmptyFrameIsRejected) {
  AudioBlockConverter converter;
  EXPECT_EQ(converter.Convert(nullptr, 0), nullptr);
  FramePtr frame(av_frame_alloc());
  EXPECT_EQ(converter.Convert(frame.get(), 0), nullptr);
}

}  // namespace
}  // namespace cadence::audio::testing
