// Repository: Cadence-audio
// Component: AudioRenderer
// Purpose: Real-time audio renderer: ring feeding, device pull callback,
//          clock sync, speed change, volume / balance / mute.
// Copyright (c) 2025 Cadence

#include "cadence/audio/AudioRenderer.hpp"

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <typeinfo>

#include "cadence/util/Logger.hpp"

namespace cadence::audio {

using util::Logger;

namespace {

WaveFormat ValidateFormat(const WaveFormat& format) {
  if (!format.IsHouseFormat() || format.sample_rate <= 0) {
    throw std::invalid_argument(
        "AudioRenderer requires 16-bit stereo PCM, got " + format.ToString());
  }
  return format;
}

}  // namespace

AudioRenderer::AudioRenderer(const AudioRendererConfig& config,
                             const StreamInfo& stream,
                             std::shared_ptr<timing::IReferenceClock> clock,
                             std::shared_ptr<AudioBlockBuffer> blocks,
                             WavePlayerFactory player_factory)
    : config_(config),
      stream_(stream),
      format_(ValidateFormat(config.format)),
      clock_(std::move(clock)),
      blocks_(std::move(blocks)),
      player_factory_(std::move(player_factory)) {
  if (!clock_) {
    throw std::invalid_argument("AudioRenderer requires a reference clock");
  }
  speed_ratio_.store(clock_->SpeedRatio());
  if (stream_.has_audio) {
    Initialize();
  }
}

AudioRenderer::~AudioRenderer() {
  Close();
}

void AudioRenderer::Initialize() {
  if (!player_factory_) {
    throw std::invalid_argument("AudioRenderer requires a wave player factory");
  }
  auto device = player_factory_(config_);
  if (!device) {
    throw std::runtime_error("AudioRenderer: wave player factory returned null");
  }

  const int desired_latency_ms = device->DesiredLatencyMs();
  const int block_align = format_.BlockAlign();
  const int block_capacity = blocks_ ? blocks_->Capacity() : 2;

  int ring_bytes = config_.ring_buffer_bytes;
  if (ring_bytes <= 0) {
    ring_bytes = format_.ConvertLatencyToByteSize(desired_latency_ms) *
                 block_capacity / 2;
  }
  ring_bytes -= ring_bytes % block_align;
  ring_bytes = std::max(ring_bytes, block_align);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    ring_ = std::make_shared<buffer::CircularBuffer>(ring_bytes);
    audio_clock_ =
        std::make_unique<AudioClock>(format_, config_, desired_latency_ms);
    // No device pull exceeds the full latency, so the callback never
    // allocates.
    read_buffer_.assign(ReadBufferSizeFor(format_.ConvertLatencyToByteSize(
                            desired_latency_ms)),
                        0);
    device_ = std::move(device);
  }

  std::ostringstream oss;
  oss << "[AudioRenderer] INIT format=" << format_.ToString()
      << " latency_ms=" << desired_latency_ms
      << " buffers=" << device_->NumberOfBuffers()
      << " ring_bytes=" << ring_bytes
      << " sync_threshold_ms=" << audio_clock_->SyncThresholdMs()
      << " sync_target=" << (stream_.has_video ? "video" : "none");
  Logger::Info(oss.str());

  // The device pulls from here on; Read() renders silence until Play().
  device_->Init(this);
  device_->Play();
}

// =============================================================================
// Host control
// =============================================================================

void AudioRenderer::Play() {
  playing_.store(true);
  std::lock_guard<std::mutex> lock(mutex_);
  if (device_ && device_->State() != PlaybackState::kPlaying) {
    device_->Play();
  }
}

void AudioRenderer::Pause() {
  playing_.store(false);
  std::lock_guard<std::mutex> lock(mutex_);
  if (device_) {
    device_->Pause();
  }
}

void AudioRenderer::Stop() {
  playing_.store(false);
  Seek();
}

void AudioRenderer::Seek() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ring_) {
    ring_->Clear();
  }
  std::fill(read_buffer_.begin(), read_buffer_.end(), 0);
}

void AudioRenderer::Close() {
  playing_.store(false);
  Seek();

  // The device is stopped outside the lock: stopping waits for an
  // in-flight callback, which itself takes the lock.
  std::unique_ptr<IWavePlayer> device;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    device = std::move(device_);
  }
  if (device) {
    device->Stop();
    device.reset();
    Logger::Info("[AudioRenderer] CLOSED");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  ring_.reset();
  audio_clock_.reset();
  read_buffer_.clear();
  read_buffer_.shrink_to_fit();
}

bool AudioRenderer::WaitForReadyState(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(ready_mutex_);
  return ready_cv_.wait_for(lock, timeout, [this] { return ready_.load(); });
}

void AudioRenderer::SignalReady() {
  if (ready_.load()) return;
  {
    std::lock_guard<std::mutex> lock(ready_mutex_);
    ready_.store(true);
  }
  ready_cv_.notify_all();
}

void AudioRenderer::SetVolume(double volume) {
  volume_.store(std::clamp(volume, 0.0, 1.0));
}

void AudioRenderer::SetBalance(double balance) {
  balance_.store(std::clamp(balance, -1.0, 1.0));
}

double AudioRenderer::LeftVolume() const {
  return dsp::ComputeChannelVolumes(volume_.load(), balance_.load()).left;
}

double AudioRenderer::RightVolume() const {
  return dsp::ComputeChannelVolumes(volume_.load(), balance_.load()).right;
}

double AudioRenderer::SpeedRatio() const {
  return speed_ratio_.load();
}

void AudioRenderer::SetSpeedRatio(double ratio) {
  ratio = std::clamp(ratio, dsp::kMinSpeedRatio, dsp::kMaxSpeedRatio);
  clock_->SetSpeedRatio(ratio);
  speed_ratio_.store(ratio);
}

void AudioRenderer::SetRenderingAudioCallback(RenderingAudioCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  rendering_callback_ = std::move(callback);
}

// =============================================================================
// Diagnostics
// =============================================================================

int64_t AudioRenderer::PositionUs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!ring_ || !audio_clock_) return 0;
  return audio_clock_->PositionUs(ring_->Snapshot());
}

int64_t AudioRenderer::LatencyUs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!ring_ || !audio_clock_) return 0;
  return audio_clock_->LatencyUs(clock_->PositionUs(), ring_->Snapshot());
}

int AudioRenderer::DesiredLatencyMs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return audio_clock_ ? audio_clock_->DesiredLatencyMs() : 0;
}

double AudioRenderer::SyncThresholdMs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return audio_clock_ ? audio_clock_->SyncThresholdMs() : 0.0;
}

int AudioRenderer::RingCapacityBytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ring_ ? ring_->Capacity() : 0;
}

int AudioRenderer::ReadableBytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ring_ ? ring_->ReadableCount() : 0;
}

size_t AudioRenderer::ReadBufferBytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return read_buffer_.size();
}

// =============================================================================
// Producer
// =============================================================================

void AudioRenderer::Render(PcmBlockPtr block, int64_t clock_position_us) {
  std::shared_ptr<buffer::CircularBuffer> ring;
  RenderingAudioCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ring = ring_;
    callback = rendering_callback_;
  }
  if (!ring) return;

  while (block) {
    const int64_t tag = ring->WriteTag();
    if (tag == buffer::kNoWriteTag || tag < block->start_time_us) {
      if (ring->Write(block->data.data(), block->SizeBytes(),
                      block->start_time_us, true) &&
          callback) {
        callback(*block, clock_position_us);
      }
    }

    if (ring->CapacityPercent() >= config_.high_water_capacity_percent) {
      break;
    }
    block = blocks_ ? blocks_->Next(block) : nullptr;
  }
}

// =============================================================================
// Consumer (device callback)
// =============================================================================

void AudioRenderer::RenderSilence(uint8_t* target, int count) const {
  std::memset(target, 0, static_cast<size_t>(count));
}

int AudioRenderer::Read(uint8_t* target, int requested_bytes) {
  if (requested_bytes <= 0) return 0;
  SignalReady();

  std::lock_guard<std::mutex> lock(mutex_);
  try {
    const double speed = std::clamp(clock_->SpeedRatio(), dsp::kMinSpeedRatio,
                                    dsp::kMaxSpeedRatio);
    speed_ratio_.store(speed);

    if (!playing_.load() || speed <= 0.0 || !stream_.has_audio || !ring_ ||
        ring_->ReadableCount() <= 0) {
      RenderSilence(target, requested_bytes);
      return requested_bytes;
    }

    EnsureReadBufferLocked(requested_bytes);

    if (stream_.has_video && !SynchronizeLocked(target, requested_bytes)) {
      return requested_bytes;
    }

    if (speed == dsp::kDefaultSpeedRatio) {
      ReadNormalLocked(target, requested_bytes);
    } else if (speed < dsp::kDefaultSpeedRatio) {
      StretchLocked(target, requested_bytes, speed);
    } else {
      ShrinkLocked(target, requested_bytes, speed);
    }

    const int channels = format_.channels;
    dsp::ApplyVolumeAndBalance(
        target, requested_bytes, channels,
        dsp::ComputeChannelVolumes(volume_.load(), balance_.load()),
        muted_.load());
  } catch (const std::exception& e) {
    LogReadExceptionLocked(typeid(e).name(), e.what());
    RenderSilence(target, requested_bytes);
  } catch (...) {
    // Host clocks may throw anything; nothing may reach the device thread.
    LogReadExceptionLocked("unknown", "non-standard exception");
    RenderSilence(target, requested_bytes);
  }
  return requested_bytes;
}

void AudioRenderer::LogReadExceptionLocked(const char* type,
                                           const char* what) const {
  // The clock itself may be what threw; use the last position it gave.
  int64_t latency_us = 0;
  if (ring_ && audio_clock_) {
    latency_us =
        audio_clock_->LatencyUs(last_clock_position_us_, ring_->Snapshot());
  }
  std::ostringstream oss;
  oss << "[AudioRenderer] READ_EXCEPTION type=" << type << " what=" << what
      << " latency_ms=" << std::fixed << std::setprecision(1)
      << static_cast<double>(latency_us) / 1000.0;
  Logger::Error(oss.str());
}

size_t AudioRenderer::ReadBufferSizeFor(int requested_bytes) const {
  return static_cast<size_t>(
      dsp::ToMultipleOfCeil(requested_bytes * dsp::kMaxSpeedRatio,
                            format_.BlockAlign()) +
      format_.BlockAlign());
}

void AudioRenderer::EnsureReadBufferLocked(int requested_bytes) {
  const size_t needed = ReadBufferSizeFor(requested_bytes);
  if (read_buffer_.size() < needed) {
    // Only a pull larger than the whole device latency gets here.
    Logger::Debug("[AudioRenderer] READ_BUFFER_GROW bytes=" +
                  std::to_string(needed));
    read_buffer_.resize(needed);
  }
}

bool AudioRenderer::SynchronizeLocked(uint8_t* target, int requested_bytes) {
  last_clock_position_us_ = clock_->PositionUs();
  const SyncDecision decision = audio_clock_->EvaluateSync(
      last_clock_position_us_, ring_->Snapshot(), requested_bytes);
  if (decision.action == SyncAction::kNone) {
    return true;
  }

  std::ostringstream oss;
  oss << "[AudioRenderer] SYNC_" << SyncActionName(decision.action)
      << " latency_ms=" << std::fixed << std::setprecision(1)
      << decision.latency_ms << " threshold_ms=" << audio_clock_->SyncThresholdMs()
      << " bytes=" << decision.bytes;
  Logger::Warn(oss.str());

  switch (decision.action) {
    case SyncAction::kSkip:
      ring_->Skip(decision.bytes);
      return true;
    case SyncAction::kRewind:
      // Render() may have overwritten history since the snapshot.
      ring_->RewindUpTo(decision.bytes);
      return true;
    case SyncAction::kWait:
      RenderSilence(target, requested_bytes);
      return false;
    case SyncAction::kNone:
      break;
  }
  return true;
}

void AudioRenderer::ReadNormalLocked(uint8_t* target, int requested_bytes) {
  if (requested_bytes > ring_->ReadableCount()) {
    Logger::Debug("[AudioRenderer] UNDERRUN requested=" +
                  std::to_string(requested_bytes) + " readable=" +
                  std::to_string(ring_->ReadableCount()));
    RenderSilence(target, requested_bytes);
    return;
  }
  ring_->Read(requested_bytes, target, 0);
}

void AudioRenderer::StretchLocked(uint8_t* target, int requested_bytes,
                                  double speed) {
  const int block_align = format_.BlockAlign();
  const int aligned = requested_bytes - requested_bytes % block_align;
  const int bytes_to_read =
      std::min(ring_->ReadableCount(),
               dsp::ToMultipleOf(aligned * speed, block_align));
  if (bytes_to_read <= 0) {
    RenderSilence(target, requested_bytes);
    return;
  }

  ring_->Read(bytes_to_read, read_buffer_.data(), 0);
  dsp::StretchBlocks(read_buffer_.data(), bytes_to_read, target, aligned,
                     block_align);
  RenderSilence(target + aligned, requested_bytes - aligned);
}

void AudioRenderer::ShrinkLocked(uint8_t* target, int requested_bytes,
                                 double speed) {
  const int block_align = format_.BlockAlign();
  const int aligned = requested_bytes - requested_bytes % block_align;
  const int bytes_to_read =
      dsp::ToMultipleOfCeil(aligned * speed, block_align);
  if (bytes_to_read > ring_->ReadableCount()) {
    // Not enough audio to compress: start over from fresh blocks.
    Logger::Debug("[AudioRenderer] SHRINK_UNDERRUN needed=" +
                  std::to_string(bytes_to_read) + " readable=" +
                  std::to_string(ring_->ReadableCount()));
    ring_->Clear();
    std::fill(read_buffer_.begin(), read_buffer_.end(), 0);
    RenderSilence(target, requested_bytes);
    return;
  }

  ring_->Read(bytes_to_read, read_buffer_.data(), 0);
  dsp::ShrinkBlocks(read_buffer_.data(), bytes_to_read, target, aligned,
                    format_.channels);
  RenderSilence(target + aligned, requested_bytes - aligned);
}

}  // namespace cadence::audio
