// Repository: Cadence-audio
// Component: AudioDsp
// Purpose: Sample-level speed change (repeat / average) and per-channel
//          gain on S16 interleaved PCM. Allocation-free; safe to call from
//          the device callback.
// Copyright (c) 2025 Cadence

#ifndef CADENCE_AUDIO_AUDIO_DSP_HPP_
#define CADENCE_AUDIO_AUDIO_DSP_HPP_

#include <cstdint>

#include "cadence/timing/IReferenceClock.hpp"

namespace cadence::audio::dsp {

using timing::kDefaultSpeedRatio;
using timing::kMaxSpeedRatio;
using timing::kMinSpeedRatio;

// Largest multiple of `multiple` not above value (0 for value < multiple).
int ToMultipleOf(double value, int multiple);

// Smallest multiple of `multiple` not below value.
int ToMultipleOfCeil(double value, int multiple);

struct ChannelVolumes {
  double left = 1.0;
  double right = 1.0;
};

// volume clamped to [0, 1], balance to [-1, 1].
//   left  = volume * (balance > 0 ? 1 - balance : 1)
//   right = volume * (balance < 0 ? 1 + balance : 1)
ChannelVolumes ComputeChannelVolumes(double volume, double balance);

// Stretch: fills target_bytes of target from source_bytes of source by
// repeating whole sample frames. Repeats are spread with an integer
// accumulator, so each source frame appears floor(f) or ceil(f) times where
// f = target / source, and every source frame appears. An empty source
// yields silence. Sizes must be multiples of block_align.
void StretchBlocks(const uint8_t* source, int source_bytes, uint8_t* target,
                   int target_bytes, int block_align);

// Shrink: fills target_bytes of target by averaging consecutive groups of
// source frames per channel, rounding to nearest. Group sizes are spread
// with an integer accumulator and sum to the source frame count. Requires
// source_bytes >= target_bytes.
void ShrinkBlocks(const uint8_t* source, int source_bytes, uint8_t* target,
                  int target_bytes, int channels);

// Applies per-channel gain in place to 16-bit little-endian samples
// (channel 0 = left, 1 = right). Muted output is zeroed. A factor of
// exactly 1.0 leaves samples untouched.
void ApplyVolumeAndBalance(uint8_t* buffer, int byte_count, int channels,
                           const ChannelVolumes& volumes, bool muted);

}  // namespace cadence::audio::dsp

#endif  // CADENCE_AUDIO_AUDIO_DSP_HPP_
