// Repository: Cadence-audio
// Component: CircularBuffer
// Purpose: Fixed-capacity byte ring of decoded PCM between the block
//          producer and the device pull callback. Tracks the start time of
//          the last written block and supports skip/rewind for sync.
// Copyright (c) 2025 Cadence

#ifndef CADENCE_BUFFER_CIRCULAR_BUFFER_HPP_
#define CADENCE_BUFFER_CIRCULAR_BUFFER_HPP_

#include <cstdint>
#include <limits>
#include <mutex>
#include <vector>

namespace cadence::buffer {

// Sentinel WriteTag: nothing written since construction or Clear().
constexpr int64_t kNoWriteTag = std::numeric_limits<int64_t>::min();

// Consistent view of the counters taken under one lock.
struct CircularBufferSnapshot {
  int capacity = 0;
  int readable = 0;
  int rewindable = 0;
  int64_t write_tag_us = kNoWriteTag;
  int64_t total_bytes_consumed = 0;
};

// CircularBuffer stores raw bytes in a ring of fixed capacity.
//
// Invariants:
//   0 <= ReadableCount() <= Capacity()
//   ReadableCount() + RewindableCount() <= Capacity()
//
// A write larger than the free space overwrites the oldest unread bytes and
// moves the read cursor to the oldest surviving byte. A write larger than
// the capacity keeps only its trailing Capacity() bytes.
//
// Read/Skip past ReadableCount() and Rewind past RewindableCount() are
// caller bugs and throw std::out_of_range.
//
// Thread safety: all public methods are mutex-protected.
class CircularBuffer {
 public:
  explicit CircularBuffer(int capacity);

  CircularBuffer(const CircularBuffer&) = delete;
  CircularBuffer& operator=(const CircularBuffer&) = delete;

  // Appends length bytes. With reject_out_of_order set, a write whose
  // start_time_us is not newer than WriteTag() is dropped and false is
  // returned; content and tag are unchanged.
  bool Write(const uint8_t* data, int length, int64_t start_time_us,
             bool reject_out_of_order);

  // Copies count bytes into destination + destination_offset and advances
  // the read cursor.
  void Read(int count, uint8_t* destination, int destination_offset);

  void Skip(int count);
  void Rewind(int count);
  // Rewinds min(count, RewindableCount()) under one lock; returns the bytes
  // actually rewound. For callers whose count came from an older snapshot.
  int RewindUpTo(int count);

  // Drops all content and resets the tag and counters.
  void Clear();

  int Capacity() const { return capacity_; }
  int ReadableCount() const;
  int WritableCount() const;
  int RewindableCount() const;
  int64_t WriteTag() const;
  double CapacityPercent() const;
  int64_t TotalBytesConsumed() const;

  CircularBufferSnapshot Snapshot() const;

 private:
  const int capacity_;
  std::vector<uint8_t> data_;

  mutable std::mutex mutex_;
  int read_index_ = 0;
  int write_index_ = 0;
  int readable_ = 0;
  // Bytes holding valid data (readable plus history behind the cursor).
  int filled_ = 0;
  int64_t write_tag_us_ = kNoWriteTag;
  int64_t total_consumed_ = 0;
};

}  // namespace cadence::buffer

#endif  // CADENCE_BUFFER_CIRCULAR_BUFFER_HPP_
