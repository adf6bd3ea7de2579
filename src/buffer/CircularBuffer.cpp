// Repository: Cadence-audio
// Component: CircularBuffer
// Purpose: Fixed-capacity byte ring of decoded PCM between the block
//          producer and the device pull callback.
// Copyright (c) 2025 Cadence

#include "cadence/buffer/CircularBuffer.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

namespace cadence::buffer {

CircularBuffer::CircularBuffer(int capacity)
    : capacity_(capacity) {
  if (capacity <= 0) {
    throw std::invalid_argument("CircularBuffer capacity must be positive, got " +
                                std::to_string(capacity));
  }
  data_.resize(static_cast<size_t>(capacity));
}

bool CircularBuffer::Write(const uint8_t* data, int length,
                           int64_t start_time_us, bool reject_out_of_order) {
  if (length < 0) {
    throw std::invalid_argument("CircularBuffer::Write negative length");
  }

  std::lock_guard<std::mutex> lock(mutex_);

  if (reject_out_of_order && write_tag_us_ != kNoWriteTag &&
      start_time_us <= write_tag_us_) {
    return false;
  }

  // Only the trailing capacity_ bytes of an oversized write can survive.
  const uint8_t* src = data;
  int count = length;
  if (count > capacity_) {
    src += count - capacity_;
    count = capacity_;
  }

  int copied = 0;
  while (copied < count) {
    const int chunk = std::min(count - copied, capacity_ - write_index_);
    std::memcpy(data_.data() + write_index_, src + copied,
                static_cast<size_t>(chunk));
    copied += chunk;
    write_index_ = (write_index_ + chunk) % capacity_;
  }

  filled_ = std::min(capacity_, filled_ + count);
  readable_ += count;
  if (readable_ > capacity_) {
    // Oldest unread bytes were overwritten; they leave the timeline.
    total_consumed_ += readable_ - capacity_;
    readable_ = capacity_;
    read_index_ = write_index_;
  }

  write_tag_us_ = start_time_us;
  return true;
}

void CircularBuffer::Read(int count, uint8_t* destination,
                          int destination_offset) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (count < 0 || count > readable_) {
    throw std::out_of_range("CircularBuffer::Read count " +
                            std::to_string(count) + " exceeds readable " +
                            std::to_string(readable_));
  }

  int copied = 0;
  while (copied < count) {
    const int chunk = std::min(count - copied, capacity_ - read_index_);
    std::memcpy(destination + destination_offset + copied,
                data_.data() + read_index_, static_cast<size_t>(chunk));
    copied += chunk;
    read_index_ = (read_index_ + chunk) % capacity_;
  }
  readable_ -= count;
  total_consumed_ += count;
}

void CircularBuffer::Skip(int count) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (count < 0 || count > readable_) {
    throw std::out_of_range("CircularBuffer::Skip count " +
                            std::to_string(count) + " exceeds readable " +
                            std::to_string(readable_));
  }
  read_index_ = (read_index_ + count) % capacity_;
  readable_ -= count;
  total_consumed_ += count;
}

void CircularBuffer::Rewind(int count) {
  std::lock_guard<std::mutex> lock(mutex_);
  const int rewindable = filled_ - readable_;
  if (count < 0 || count > rewindable) {
    throw std::out_of_range("CircularBuffer::Rewind count " +
                            std::to_string(count) + " exceeds rewindable " +
                            std::to_string(rewindable));
  }
  read_index_ = (read_index_ - count + capacity_) % capacity_;
  readable_ += count;
  total_consumed_ -= count;
}

int CircularBuffer::RewindUpTo(int count) {
  std::lock_guard<std::mutex> lock(mutex_);
  const int rewound = std::clamp(count, 0, filled_ - readable_);
  read_index_ = (read_index_ - rewound + capacity_) % capacity_;
  readable_ += rewound;
  total_consumed_ -= rewound;
  return rewound;
}

void CircularBuffer::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  read_index_ = 0;
  write_index_ = 0;
  readable_ = 0;
  filled_ = 0;
  write_tag_us_ = kNoWriteTag;
  total_consumed_ = 0;
}

int CircularBuffer::ReadableCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return readable_;
}

int CircularBuffer::WritableCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return capacity_ - readable_;
}

int CircularBuffer::RewindableCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return filled_ - readable_;
}

int64_t CircularBuffer::WriteTag() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return write_tag_us_;
}

double CircularBuffer::CapacityPercent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<double>(readable_) / static_cast<double>(capacity_);
}

int64_t CircularBuffer::TotalBytesConsumed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_consumed_;
}

CircularBufferSnapshot CircularBuffer::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  CircularBufferSnapshot snap;
  snap.capacity = capacity_;
  snap.readable = readable_;
  snap.rewindable = filled_ - readable_;
  snap.write_tag_us = write_tag_us_;
  snap.total_bytes_consumed = total_consumed_;
  return snap;
}

}  // namespace cadence::buffer
