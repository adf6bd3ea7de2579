// Repository: Cadence-audio
// Component: AudioRendererConfig
// Purpose: Tunables for the renderer, its latency model and the device.
// Copyright (c) 2025 Cadence

#ifndef CADENCE_AUDIO_AUDIO_RENDERER_CONFIG_HPP_
#define CADENCE_AUDIO_AUDIO_RENDERER_CONFIG_HPP_

#include "cadence/audio/WaveFormat.hpp"

namespace cadence::audio {

struct AudioRendererConfig {
  // The renderer only accepts 16-bit stereo.
  WaveFormat format;

  // Device
  int desired_latency_ms = 200;
  int number_of_buffers = 2;

  // Sync threshold = fraction of the device's desired latency.
  double sync_threshold_fraction = 0.05;
  // Skip when latency exceeds threshold * skip_factor.
  double skip_threshold_factor = 0.5;
  // Rewind or wait when latency is below -threshold * wait_factor.
  double wait_threshold_factor = 2.0;
  bool rewind_enabled = true;

  // Render() stops feeding the ring at this fill level.
  double high_water_capacity_percent = 0.8;

  // 0 = latency bytes * block buffer capacity / 2.
  int ring_buffer_bytes = 0;
};

// Tracks of the opened stream.
struct StreamInfo {
  bool has_audio = true;
  // Audio is slaved to the reference clock only when a video track exists.
  bool has_video = false;
};

}  // namespace cadence::audio

#endif  // CADENCE_AUDIO_AUDIO_RENDERER_CONFIG_HPP_
