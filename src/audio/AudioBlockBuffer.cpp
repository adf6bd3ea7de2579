// Repository: Cadence-audio
// Component: AudioBlockBuffer
// Purpose: Bounded queue of decoded PCM blocks ordered by start time.
// Copyright (c) 2025 Cadence

#include "cadence/audio/AudioBlockBuffer.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace cadence::audio {

namespace {

bool StartsBefore(const PcmBlockPtr& block, int64_t time_us) {
  return block->start_time_us < time_us;
}

}  // namespace

AudioBlockBuffer::AudioBlockBuffer(int capacity) : capacity_(capacity) {
  if (capacity <= 0) {
    throw std::invalid_argument(
        "AudioBlockBuffer capacity must be positive, got " +
        std::to_string(capacity));
  }
  blocks_.reserve(static_cast<size_t>(capacity));
}

void AudioBlockBuffer::Add(PcmBlockPtr block) {
  if (!block) return;
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = std::lower_bound(blocks_.begin(), blocks_.end(),
                             block->start_time_us, StartsBefore);
  if (it != blocks_.end() && (*it)->start_time_us == block->start_time_us) {
    *it = std::move(block);
    return;
  }

  if (static_cast<int>(blocks_.size()) >= capacity_) {
    // A block older than everything held would be evicted immediately.
    if (it == blocks_.begin()) return;
    blocks_.erase(blocks_.begin());
    it = std::lower_bound(blocks_.begin(), blocks_.end(),
                          block->start_time_us, StartsBefore);
  }
  blocks_.insert(it, std::move(block));
}

void AudioBlockBuffer::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  blocks_.clear();
}

PcmBlockPtr AudioBlockBuffer::Next(const PcmBlockPtr& current) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (blocks_.empty()) return nullptr;
  if (!current) return blocks_.front();

  auto it = std::upper_bound(
      blocks_.begin(), blocks_.end(), current->start_time_us,
      [](int64_t time_us, const PcmBlockPtr& block) {
        return time_us < block->start_time_us;
      });
  return it == blocks_.end() ? nullptr : *it;
}

int AudioBlockBuffer::IndexOfLocked(int64_t time_us) const {
  if (blocks_.empty()) return -1;
  // First block starting after time_us; the one before it is the candidate.
  auto it = std::upper_bound(
      blocks_.begin(), blocks_.end(), time_us,
      [](int64_t t, const PcmBlockPtr& block) {
        return t < block->start_time_us;
      });
  if (it == blocks_.begin()) return -1;
  return static_cast<int>(std::distance(blocks_.begin(), it)) - 1;
}

PcmBlockPtr AudioBlockBuffer::BlockAt(int64_t time_us) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const int index = IndexOfLocked(time_us);
  return index < 0 ? nullptr : blocks_[static_cast<size_t>(index)];
}

int AudioBlockBuffer::IndexOf(int64_t time_us) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return IndexOfLocked(time_us);
}

PcmBlockPtr AudioBlockBuffer::At(int index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index < 0 || index >= static_cast<int>(blocks_.size())) return nullptr;
  return blocks_[static_cast<size_t>(index)];
}

int AudioBlockBuffer::Count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int>(blocks_.size());
}

bool AudioBlockBuffer::IsFull() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int>(blocks_.size()) >= capacity_;
}

double AudioBlockBuffer::CapacityPercent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<double>(blocks_.size()) / static_cast<double>(capacity_);
}

int64_t AudioBlockBuffer::RangeStartUs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_.empty() ? 0 : blocks_.front()->start_time_us;
}

int64_t AudioBlockBuffer::RangeEndUs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_.empty() ? 0 : blocks_.back()->EndTimeUs();
}

bool AudioBlockBuffer::IsInRange(int64_t time_us) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (blocks_.empty()) return false;
  return time_us >= blocks_.front()->start_time_us &&
         time_us < blocks_.back()->EndTimeUs();
}

}  // namespace cadence::audio
