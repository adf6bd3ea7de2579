// Repository: Cadence-audio
// Component: AudioClock
// Purpose: Latency model. Derives the audible position from the ring
//          buffer state and decides skip / rewind / wait corrections
//          against the reference clock.
// Copyright (c) 2025 Cadence

#ifndef CADENCE_AUDIO_AUDIO_CLOCK_HPP_
#define CADENCE_AUDIO_AUDIO_CLOCK_HPP_

#include <cstdint>

#include "cadence/audio/AudioRendererConfig.hpp"
#include "cadence/audio/WaveFormat.hpp"
#include "cadence/buffer/CircularBuffer.hpp"

namespace cadence::audio {

enum class SyncAction { kNone, kSkip, kRewind, kWait };

const char* SyncActionName(SyncAction action);

struct SyncDecision {
  SyncAction action = SyncAction::kNone;
  int bytes = 0;
  double latency_ms = 0.0;
};

// Position = WriteTag - duration(readable). Before the first write it is the
// duration of everything consumed so far.
// Latency  = reference position - Position (positive: audio lags).
class AudioClock {
 public:
  AudioClock(const WaveFormat& format, const AudioRendererConfig& config,
             int desired_latency_ms);

  double SyncThresholdMs() const { return sync_threshold_ms_; }
  int DesiredLatencyMs() const { return desired_latency_ms_; }

  int64_t PositionUs(const buffer::CircularBufferSnapshot& snap) const;
  int64_t LatencyUs(int64_t reference_position_us,
                    const buffer::CircularBufferSnapshot& snap) const;

  // Correction for a pull of requested_bytes:
  //   latency >  threshold * skip_factor  -> kSkip min(bytes(latency), readable)
  //   latency < -threshold * wait_factor  -> kRewind bytes(|latency|) when
  //       enabled, larger than requested_bytes and within rewindable;
  //       otherwise kWait
  //   else kNone
  SyncDecision EvaluateSync(int64_t reference_position_us,
                            const buffer::CircularBufferSnapshot& snap,
                            int requested_bytes) const;

 private:
  WaveFormat format_;
  AudioRendererConfig config_;
  int desired_latency_ms_;
  double sync_threshold_ms_;
};

}  // namespace cadence::audio

#endif  // CADENCE_AUDIO_AUDIO_CLOCK_HPP_
