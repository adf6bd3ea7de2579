// Repository: Cadence-audio
// Component: AudioBlockBuffer
// Purpose: Bounded queue of decoded PCM blocks ordered by start time. The
//          decoder side adds blocks; the feed worker walks them with Next().
// Copyright (c) 2025 Cadence

#ifndef CADENCE_AUDIO_AUDIO_BLOCK_BUFFER_HPP_
#define CADENCE_AUDIO_AUDIO_BLOCK_BUFFER_HPP_

#include <cstdint>
#include <mutex>
#include <vector>

#include "cadence/audio/PcmBlock.hpp"

namespace cadence::audio {

// AudioBlockBuffer keeps at most Capacity() blocks sorted by start time.
//
// Add() replaces a block with the same start time. When full, the block
// with the earliest start time is evicted to make room.
//
// Capacity() is also the sizing hint for the renderer's ring buffer.
//
// Thread safety: all public methods are mutex-protected.
class AudioBlockBuffer {
 public:
  explicit AudioBlockBuffer(int capacity);

  void Add(PcmBlockPtr block);
  void Clear();

  // First block starting after current, or the first block when current is
  // null. Works even if current was already evicted.
  PcmBlockPtr Next(const PcmBlockPtr& current) const;

  // Block whose [start, end) contains time_us; when time_us falls in a gap,
  // the last block starting before it. Null when time_us precedes the range
  // or the buffer is empty.
  PcmBlockPtr BlockAt(int64_t time_us) const;

  // Index of the block BlockAt() would return, or -1.
  int IndexOf(int64_t time_us) const;

  PcmBlockPtr At(int index) const;

  int Capacity() const { return capacity_; }
  int Count() const;
  bool IsFull() const;
  double CapacityPercent() const;

  int64_t RangeStartUs() const;
  int64_t RangeEndUs() const;
  bool IsInRange(int64_t time_us) const;

 private:
  int IndexOfLocked(int64_t time_us) const;

  const int capacity_;
  mutable std::mutex mutex_;
  std::vector<PcmBlockPtr> blocks_;
};

}  // namespace cadence::audio

#endif  // CADENCE_AUDIO_AUDIO_BLOCK_BUFFER_HPP_
