// Repository: Cadence-audio
// Component: AudioRenderer
// Purpose: Real-time audio renderer. Feeds decoded blocks into a ring
//          buffer and serves the device pull callback: keeps audio in sync
//          with the reference clock, applies speed change, volume, balance
//          and mute, and degrades to silence instead of underrunning.
// Copyright (c) 2025 Cadence

#ifndef CADENCE_AUDIO_AUDIO_RENDERER_HPP_
#define CADENCE_AUDIO_AUDIO_RENDERER_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "cadence/audio/AudioBlockBuffer.hpp"
#include "cadence/audio/AudioClock.hpp"
#include "cadence/audio/AudioDsp.hpp"
#include "cadence/audio/AudioRendererConfig.hpp"
#include "cadence/audio/IWavePlayer.hpp"
#include "cadence/audio/PcmBlock.hpp"
#include "cadence/buffer/CircularBuffer.hpp"
#include "cadence/timing/IReferenceClock.hpp"

namespace cadence::audio {

// AudioRenderer owns the ring buffer and the device.
//
// Producer side: Render() is called from the feed worker with the block at
// the current clock position; it writes that block and its successors
// until the ring reaches the high-water mark.
//
// Consumer side: Read() is the device callback. It always fills the
// requested size, never throws, and only takes the renderer mutex (never
// waits on the producer).
//
// Lifecycle: constructed when the audio track opens (the device starts
// immediately and renders silence until Play()), Stop()/Seek() clear the
// ring, Close() (or destruction) releases the device and the ring.
class AudioRenderer : public IWaveProvider {
 public:
  using WavePlayerFactory =
      std::function<std::unique_ptr<IWavePlayer>(const AudioRendererConfig&)>;
  using RenderingAudioCallback =
      std::function<void(const PcmBlock& block, int64_t clock_position_us)>;

  // Throws std::invalid_argument for a non 16-bit stereo format or a null
  // clock, std::runtime_error when the device cannot be created.
  AudioRenderer(const AudioRendererConfig& config, const StreamInfo& stream,
                std::shared_ptr<timing::IReferenceClock> clock,
                std::shared_ptr<AudioBlockBuffer> blocks,
                WavePlayerFactory player_factory);
  ~AudioRenderer() override;

  AudioRenderer(const AudioRenderer&) = delete;
  AudioRenderer& operator=(const AudioRenderer&) = delete;

  // IWaveProvider
  const WaveFormat& Format() const override { return format_; }
  int Read(uint8_t* target, int requested_bytes) override;

  void Render(PcmBlockPtr block, int64_t clock_position_us);

  // Host control
  void Play();
  void Pause();
  void Stop();
  void Close();
  void Seek();
  bool IsPlaying() const { return playing_.load(); }

  // Blocks until the device has pulled at least once.
  bool WaitForReadyState(std::chrono::milliseconds timeout);

  double Volume() const { return volume_.load(); }
  void SetVolume(double volume);
  double Balance() const { return balance_.load(); }
  void SetBalance(double balance);
  bool IsMuted() const { return muted_.load(); }
  void SetMuted(bool muted) { muted_.store(muted); }
  double LeftVolume() const;
  double RightVolume() const;

  // Reads / writes through to the reference clock; clamped to [0, 8].
  double SpeedRatio() const;
  void SetSpeedRatio(double ratio);

  // Diagnostics
  int64_t PositionUs() const;
  int64_t LatencyUs() const;
  int DesiredLatencyMs() const;
  double SyncThresholdMs() const;
  int RingCapacityBytes() const;
  int ReadableBytes() const;
  // Scratch space for speed changes; sized at construction.
  size_t ReadBufferBytes() const;

  void SetRenderingAudioCallback(RenderingAudioCallback callback);

 private:
  void Initialize();
  void RenderSilence(uint8_t* target, int count) const;
  // False when the pull was answered with silence.
  bool SynchronizeLocked(uint8_t* target, int requested_bytes);
  void ReadNormalLocked(uint8_t* target, int requested_bytes);
  void StretchLocked(uint8_t* target, int requested_bytes, double speed);
  void ShrinkLocked(uint8_t* target, int requested_bytes, double speed);
  size_t ReadBufferSizeFor(int requested_bytes) const;
  void EnsureReadBufferLocked(int requested_bytes);
  void LogReadExceptionLocked(const char* type, const char* what) const;
  void SignalReady();

  const AudioRendererConfig config_;
  const StreamInfo stream_;
  const WaveFormat format_;
  std::shared_ptr<timing::IReferenceClock> clock_;
  std::shared_ptr<AudioBlockBuffer> blocks_;
  WavePlayerFactory player_factory_;

  std::atomic<bool> playing_{false};
  std::atomic<double> volume_{1.0};
  std::atomic<double> balance_{0.0};
  std::atomic<bool> muted_{false};
  std::atomic<double> speed_ratio_{dsp::kDefaultSpeedRatio};

  // Guards everything below. Held by Read() for the whole callback.
  mutable std::mutex mutex_;
  std::unique_ptr<IWavePlayer> device_;
  std::shared_ptr<buffer::CircularBuffer> ring_;
  std::unique_ptr<AudioClock> audio_clock_;
  std::vector<uint8_t> read_buffer_;
  int64_t last_clock_position_us_ = 0;
  RenderingAudioCallback rendering_callback_;

  std::mutex ready_mutex_;
  std::condition_variable ready_cv_;
  std::atomic<bool> ready_{false};
};

}  // namespace cadence::audio

#endif  // CADENCE_AUDIO_AUDIO_RENDERER_HPP_
