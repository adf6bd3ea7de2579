// Repository: Cadence-audio
// Component: PortAudioWavePlayer
// Purpose: Low-latency output device on PortAudio. The stream callback
//          pulls from an IWaveProvider in fixed-size buffers.
// Copyright (c) 2025 Cadence

#ifndef CADENCE_AUDIO_PORT_AUDIO_WAVE_PLAYER_HPP_
#define CADENCE_AUDIO_PORT_AUDIO_WAVE_PLAYER_HPP_

#include <atomic>
#include <mutex>

#include <portaudio.h>

#include "cadence/audio/IWavePlayer.hpp"

namespace cadence::audio {

// Opens a paInt16 output stream on the default (or given) device.
// The latency budget is split over number_of_buffers callback buffers.
// Pause() keeps the stream running; the provider renders silence instead.
class PortAudioWavePlayer : public IWavePlayer {
 public:
  // Throws std::runtime_error when PortAudio fails to initialize.
  PortAudioWavePlayer(int desired_latency_ms, int number_of_buffers,
                      int device_index = -1);
  ~PortAudioWavePlayer() override;

  PortAudioWavePlayer(const PortAudioWavePlayer&) = delete;
  PortAudioWavePlayer& operator=(const PortAudioWavePlayer&) = delete;

  void Init(IWaveProvider* provider) override;
  void Play() override;
  void Pause() override;
  void Stop() override;

  int DesiredLatencyMs() const override { return desired_latency_ms_; }
  int NumberOfBuffers() const override { return number_of_buffers_; }
  PlaybackState State() const override { return state_.load(); }

 private:
  static int StreamCallback(const void* input, void* output,
                            unsigned long frame_count,
                            const PaStreamCallbackTimeInfo* time_info,
                            PaStreamCallbackFlags status_flags,
                            void* user_data);

  const int desired_latency_ms_;
  const int number_of_buffers_;
  const int device_index_;

  std::mutex mutex_;
  PaStream* stream_ = nullptr;
  IWaveProvider* provider_ = nullptr;
  int block_align_ = 0;
  std::atomic<PlaybackState> state_{PlaybackState::kStopped};
};

}  // namespace cadence::audio

#endif  // CADENCE_AUDIO_PORT_AUDIO_WAVE_PLAYER_HPP_
