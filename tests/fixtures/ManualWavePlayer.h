#ifndef CADENCE_TESTS_FIXTURES_MANUAL_WAVE_PLAYER_H_
#define CADENCE_TESTS_FIXTURES_MANUAL_WAVE_PLAYER_H_

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include "cadence/audio/IWavePlayer.hpp"

namespace cadence::tests::fixtures
{

// Counters shared with the test after the renderer takes ownership of the
// player.
struct ManualWavePlayerProbe
{
  std::atomic<int> init_calls{0};
  std::atomic<int> play_calls{0};
  std::atomic<int> pause_calls{0};
  std::atomic<int> stop_calls{0};
  std::atomic<bool> destroyed{false};
  std::atomic<audio::IWaveProvider*> provider{nullptr};
};

// Device without a native stream: the test drives the pull callback with
// Pull().
class ManualWavePlayer : public audio::IWavePlayer
{
public:
  ManualWavePlayer(std::shared_ptr<ManualWavePlayerProbe> probe,
                   int desired_latency_ms = 200, int number_of_buffers = 2)
      : probe_(std::move(probe)),
        desired_latency_ms_(desired_latency_ms),
        number_of_buffers_(number_of_buffers)
  {
  }

  ~ManualWavePlayer() override
  {
    probe_->provider.store(nullptr);
    probe_->destroyed.store(true);
  }

  void Init(audio::IWaveProvider* provider) override
  {
    probe_->provider.store(provider);
    probe_->init_calls.fetch_add(1);
  }

  void Play() override
  {
    state_ = audio::PlaybackState::kPlaying;
    probe_->play_calls.fetch_add(1);
  }

  void Pause() override { probe_->pause_calls.fetch_add(1); }

  void Stop() override
  {
    state_ = audio::PlaybackState::kStopped;
    probe_->stop_calls.fetch_add(1);
  }

  int DesiredLatencyMs() const override { return desired_latency_ms_; }
  int NumberOfBuffers() const override { return number_of_buffers_; }
  audio::PlaybackState State() const override { return state_; }

  // Simulates one device callback of `bytes` bytes.
  static std::vector<uint8_t> Pull(const ManualWavePlayerProbe& probe,
                                   int bytes)
  {
    std::vector<uint8_t> out(static_cast<size_t>(bytes), 0xEE);
    audio::IWaveProvider* provider = probe.provider.load();
    if (provider)
    {
      provider->Read(out.data(), bytes);
    }
    return out;
  }

private:
  std::shared_ptr<ManualWavePlayerProbe> probe_;
  const int desired_latency_ms_;
  const int number_of_buffers_;
  audio::PlaybackState state_ = audio::PlaybackState::kStopped;
};

}  // namespace cadence::tests::fixtures

#endif  // CADENCE_TESTS_FIXTURES_MANUAL_WAVE_PLAYER_H_
