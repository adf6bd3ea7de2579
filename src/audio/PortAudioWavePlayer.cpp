// Repository: Cadence-audio
// Component: PortAudioWavePlayer
// Purpose: Low-latency output device on PortAudio.
// Copyright (c) 2025 Cadence

#include "cadence/audio/PortAudioWavePlayer.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>

#include "cadence/util/Logger.hpp"

namespace cadence::audio {

using util::Logger;

namespace {

std::runtime_error PaFailure(const char* what, PaError err) {
  return std::runtime_error(std::string("[PortAudioWavePlayer] ") + what +
                            ": " + Pa_GetErrorText(err));
}

}  // namespace

PortAudioWavePlayer::PortAudioWavePlayer(int desired_latency_ms,
                                         int number_of_buffers,
                                         int device_index)
    : desired_latency_ms_(desired_latency_ms),
      number_of_buffers_(std::max(number_of_buffers, 1)),
      device_index_(device_index) {
  if (desired_latency_ms <= 0) {
    throw std::invalid_argument("PortAudioWavePlayer latency must be positive");
  }
  const PaError err = Pa_Initialize();
  if (err != paNoError) {
    throw PaFailure("Pa_Initialize failed", err);
  }
}

PortAudioWavePlayer::~PortAudioWavePlayer() {
  Stop();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream_) {
      const PaError err = Pa_CloseStream(stream_);
      if (err != paNoError) {
        Logger::Warn(std::string("[PortAudioWavePlayer] Pa_CloseStream: ") +
                     Pa_GetErrorText(err));
      }
      stream_ = nullptr;
    }
  }
  Pa_Terminate();
}

void PortAudioWavePlayer::Init(IWaveProvider* provider) {
  if (!provider) {
    throw std::invalid_argument("PortAudioWavePlayer::Init null provider");
  }
  const WaveFormat& format = provider->Format();
  if (format.bits_per_sample != 16) {
    throw std::invalid_argument("PortAudioWavePlayer supports 16-bit PCM only, got " +
                                format.ToString());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (stream_) {
    throw std::runtime_error("PortAudioWavePlayer already initialized");
  }

  const PaDeviceIndex device =
      device_index_ >= 0 ? device_index_ : Pa_GetDefaultOutputDevice();
  if (device == paNoDevice) {
    throw std::runtime_error("[PortAudioWavePlayer] No output device");
  }

  PaStreamParameters params;
  std::memset(&params, 0, sizeof(params));
  params.device = device;
  params.channelCount = format.channels;
  params.sampleFormat = paInt16;
  params.suggestedLatency = desired_latency_ms_ / 1000.0;
  params.hostApiSpecificStreamInfo = nullptr;

  // Each callback buffer covers latency / number_of_buffers.
  const int buffer_ms =
      (desired_latency_ms_ + number_of_buffers_ - 1) / number_of_buffers_;
  const unsigned long frames_per_buffer = static_cast<unsigned long>(
      format.ConvertLatencyToByteSize(buffer_ms) / format.BlockAlign());

  provider_ = provider;
  block_align_ = format.BlockAlign();

  const PaError err = Pa_OpenStream(&stream_, nullptr, &params,
                                    format.sample_rate, frames_per_buffer,
                                    paClipOff, &PortAudioWavePlayer::StreamCallback,
                                    this);
  if (err != paNoError) {
    stream_ = nullptr;
    provider_ = nullptr;
    throw PaFailure("Pa_OpenStream failed", err);
  }

  const PaDeviceInfo* info = Pa_GetDeviceInfo(device);
  std::ostringstream oss;
  oss << "[PortAudioWavePlayer] OPEN device=" << (info ? info->name : "?")
      << " format=" << format.ToString()
      << " frames_per_buffer=" << frames_per_buffer
      << " latency_ms=" << desired_latency_ms_;
  Logger::Info(oss.str());
}

void PortAudioWavePlayer::Play() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!stream_ || state_.load() == PlaybackState::kPlaying) return;
  if (Pa_IsStreamActive(stream_) != 1) {
    const PaError err = Pa_StartStream(stream_);
    if (err != paNoError) {
      throw PaFailure("Pa_StartStream failed", err);
    }
  }
  state_.store(PlaybackState::kPlaying);
}

void PortAudioWavePlayer::Pause() {
  // The stream keeps pulling; the provider renders silence while paused.
}

void PortAudioWavePlayer::Stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!stream_ || state_.load() == PlaybackState::kStopped) return;
  const PaError err = Pa_StopStream(stream_);
  if (err != paNoError) {
    Logger::Warn(std::string("[PortAudioWavePlayer] Pa_StopStream: ") +
                 Pa_GetErrorText(err));
  }
  state_.store(PlaybackState::kStopped);
}

int PortAudioWavePlayer::StreamCallback(const void* /*input*/, void* output,
                                        unsigned long frame_count,
                                        const PaStreamCallbackTimeInfo*,
                                        PaStreamCallbackFlags,
                                        void* user_data) {
  auto* self = static_cast<PortAudioWavePlayer*>(user_data);
  auto* out = static_cast<uint8_t*>(output);
  const int bytes = static_cast<int>(frame_count) * self->block_align_;
  const int written = self->provider_->Read(out, bytes);
  if (written < bytes) {
    std::memset(out + written, 0, static_cast<size_t>(bytes - written));
  }
  return paContinue;
}

}  // namespace cadence::audio
