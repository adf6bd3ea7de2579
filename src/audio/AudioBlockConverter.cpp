// Repository: Cadence-audio
// Component: AudioBlockConverter
// Purpose: FFmpeg frame to house-format PcmBlock conversion.
// Copyright (c) 2025 Cadence

#include "cadence/audio/AudioBlockConverter.hpp"

#include <sstream>
#include <vector>

extern "C" {
#include <libavutil/mathematics.h>
#include <libavutil/samplefmt.h>
}

#include "cadence/util/Logger.hpp"

namespace cadence::audio {

using util::Logger;

AudioBlockConverter::AudioBlockConverter(int output_sample_rate)
    : output_format_(WaveFormat::House(output_sample_rate)) {}

AudioBlockConverter::~AudioBlockConverter() {
  Reset();
}

void AudioBlockConverter::Reset() {
  if (swr_ctx_) {
    swr_free(&swr_ctx_);
  }
  av_channel_layout_uninit(&src_ch_layout_);
  src_sample_rate_ = 0;
  src_sample_format_ = -1;
}

bool AudioBlockConverter::EnsureResampler(const AVFrame* frame) {
  if (swr_ctx_ && frame->sample_rate == src_sample_rate_ &&
      frame->format == src_sample_format_ &&
      av_channel_layout_compare(&frame->ch_layout, &src_ch_layout_) == 0) {
    return true;
  }

  Reset();

  AVChannelLayout src_ch_layout;
  av_channel_layout_uninit(&src_ch_layout);
  if (frame->ch_layout.nb_channels > 0) {
    if (av_channel_layout_copy(&src_ch_layout, &frame->ch_layout) < 0) {
      Logger::Error("[AudioBlockConverter] Failed to copy input channel layout");
      return false;
    }
  } else {
    // Unspecified layout: assume mono.
    av_channel_layout_default(&src_ch_layout, 1);
  }

  AVChannelLayout dst_ch_layout;
  av_channel_layout_uninit(&dst_ch_layout);
  if (av_channel_layout_from_mask(&dst_ch_layout, AV_CH_LAYOUT_STEREO) < 0) {
    Logger::Error("[AudioBlockConverter] Failed to build stereo layout");
    av_channel_layout_uninit(&src_ch_layout);
    return false;
  }

  swr_ctx_ = swr_alloc();
  if (!swr_ctx_) {
    Logger::Error("[AudioBlockConverter] swr_alloc failed");
    av_channel_layout_uninit(&src_ch_layout);
    av_channel_layout_uninit(&dst_ch_layout);
    return false;
  }

  const auto src_fmt = static_cast<AVSampleFormat>(frame->format);
  if (swr_alloc_set_opts2(&swr_ctx_,
                          &dst_ch_layout, AV_SAMPLE_FMT_S16,
                          output_format_.sample_rate,
                          &src_ch_layout, src_fmt, frame->sample_rate,
                          0, nullptr) < 0) {
    Logger::Error("[AudioBlockConverter] swr_alloc_set_opts2 failed");
    swr_free(&swr_ctx_);
    av_channel_layout_uninit(&src_ch_layout);
    av_channel_layout_uninit(&dst_ch_layout);
    return false;
  }
  av_channel_layout_uninit(&dst_ch_layout);

  if (swr_init(swr_ctx_) < 0) {
    std::ostringstream oss;
    oss << "[AudioBlockConverter] swr_init failed for rate="
        << frame->sample_rate << " format="
        << (av_get_sample_fmt_name(src_fmt) ? av_get_sample_fmt_name(src_fmt)
                                            : "unknown")
        << " channels=" << src_ch_layout.nb_channels;
    Logger::Error(oss.str());
    swr_free(&swr_ctx_);
    av_channel_layout_uninit(&src_ch_layout);
    return false;
  }

  src_ch_layout_ = src_ch_layout;
  src_sample_rate_ = frame->sample_rate;
  src_sample_format_ = frame->format;

  std::ostringstream oss;
  oss << "[AudioBlockConverter] RESAMPLER in=" << frame->sample_rate << "Hz/"
      << src_ch_layout_.nb_channels << "ch out=" << output_format_.ToString();
  Logger::Debug(oss.str());
  return true;
}

PcmBlockPtr AudioBlockConverter::Convert(const AVFrame* frame,
                                         int64_t start_time_us) {
  if (!frame || frame->nb_samples <= 0 || frame->sample_rate <= 0) {
    Logger::Warn("[AudioBlockConverter] Empty or invalid frame dropped");
    return nullptr;
  }
  if (!EnsureResampler(frame)) {
    return nullptr;
  }

  const int64_t delay = swr_get_delay(swr_ctx_, frame->sample_rate);
  const int64_t out_samples =
      av_rescale_rnd(delay + frame->nb_samples, output_format_.sample_rate,
                     frame->sample_rate, AV_ROUND_UP);

  const int out_sample_size = av_get_bytes_per_sample(AV_SAMPLE_FMT_S16);
  std::vector<uint8_t> out(static_cast<size_t>(
      out_samples * output_format_.channels * out_sample_size));
  uint8_t* out_data[1] = {out.data()};

  const int converted = swr_convert(
      swr_ctx_, out_data, static_cast<int>(out_samples),
      const_cast<const uint8_t**>(frame->extended_data), frame->nb_samples);
  if (converted < 0) {
    Logger::Error("[AudioBlockConverter] Audio resampling failed");
    return nullptr;
  }

  out.resize(static_cast<size_t>(converted * output_format_.channels *
                                 out_sample_size));
  return MakePcmBlock(std::move(out), start_time_us, output_format_);
}

}  // namespace cadence::audio
