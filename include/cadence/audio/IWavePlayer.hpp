// Repository: Cadence-audio
// Component: Wave Player Interfaces
// Purpose: Pull-model device sink. The device owns the native stream and
//          calls the provider from its callback thread.
// Copyright (c) 2025 Cadence

#ifndef CADENCE_AUDIO_IWAVE_PLAYER_HPP_
#define CADENCE_AUDIO_IWAVE_PLAYER_HPP_

#include <cstdint>

#include "cadence/audio/WaveFormat.hpp"

namespace cadence::audio {

// Source of samples for a device. Read() runs on the device callback thread;
// it must fill exactly requested_bytes, must not throw and must not block
// for long. Returns the number of bytes written.
class IWaveProvider {
 public:
  virtual ~IWaveProvider() = default;
  virtual const WaveFormat& Format() const = 0;
  virtual int Read(uint8_t* target, int requested_bytes) = 0;
};

enum class PlaybackState { kStopped, kPlaying, kPaused };

// Destroying the player stops and releases the native stream.
class IWavePlayer {
 public:
  virtual ~IWavePlayer() = default;

  // Opens the stream for the provider's format. Throws on failure.
  virtual void Init(IWaveProvider* provider) = 0;
  virtual void Play() = 0;
  virtual void Pause() = 0;
  virtual void Stop() = 0;

  virtual int DesiredLatencyMs() const = 0;
  virtual int NumberOfBuffers() const = 0;
  virtual PlaybackState State() const = 0;
};

}  // namespace cadence::audio

#endif  // CADENCE_AUDIO_IWAVE_PLAYER_HPP_
