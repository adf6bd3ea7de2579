// Repository: Cadence-audio
// Component: AudioClock
// Purpose: Latency model and sync decisions.
// Copyright (c) 2025 Cadence

#include "cadence/audio/AudioClock.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace cadence::audio {

const char* SyncActionName(SyncAction action) {
  switch (action) {
    case SyncAction::kNone:   return "NONE";
    case SyncAction::kSkip:   return "SKIP";
    case SyncAction::kRewind: return "REWIND";
    case SyncAction::kWait:   return "WAIT";
  }
  return "UNKNOWN";
}

AudioClock::AudioClock(const WaveFormat& format,
                       const AudioRendererConfig& config,
                       int desired_latency_ms)
    : format_(format),
      config_(config),
      desired_latency_ms_(desired_latency_ms),
      sync_threshold_ms_(config.sync_threshold_fraction * desired_latency_ms) {}

int64_t AudioClock::PositionUs(
    const buffer::CircularBufferSnapshot& snap) const {
  if (snap.write_tag_us == buffer::kNoWriteTag) {
    return format_.BytesToDurationUs(snap.total_bytes_consumed);
  }
  return snap.write_tag_us - format_.BytesToDurationUs(snap.readable);
}

int64_t AudioClock::LatencyUs(
    int64_t reference_position_us,
    const buffer::CircularBufferSnapshot& snap) const {
  return reference_position_us - PositionUs(snap);
}

SyncDecision AudioClock::EvaluateSync(
    int64_t reference_position_us, const buffer::CircularBufferSnapshot& snap,
    int requested_bytes) const {
  SyncDecision decision;
  decision.latency_ms =
      static_cast<double>(LatencyUs(reference_position_us, snap)) / 1000.0;

  if (decision.latency_ms > sync_threshold_ms_ * config_.skip_threshold_factor) {
    const int64_t bytes = format_.ConvertLatencyToByteCount(
        static_cast<int64_t>(std::ceil(decision.latency_ms)));
    decision.bytes =
        static_cast<int>(std::min<int64_t>(bytes, snap.readable));
    decision.action =
        decision.bytes > 0 ? SyncAction::kSkip : SyncAction::kNone;
    return decision;
  }

  if (decision.latency_ms <
      -sync_threshold_ms_ * config_.wait_threshold_factor) {
    const int64_t bytes = format_.ConvertLatencyToByteCount(
        static_cast<int64_t>(std::ceil(-decision.latency_ms)));
    if (config_.rewind_enabled && bytes > requested_bytes &&
        bytes <= snap.rewindable) {
      decision.action = SyncAction::kRewind;
    } else {
      decision.action = SyncAction::kWait;
    }
    decision.bytes = static_cast<int>(
        std::min<int64_t>(bytes, std::numeric_limits<int>::max()));
  }
  return decision;
}

}  // namespace cadence::audio
