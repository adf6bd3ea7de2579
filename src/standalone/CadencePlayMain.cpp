// Repository: Cadence-audio
// Component: Standalone Playback Harness
// Purpose: Plays a synthesized tone through the full pipeline (FFmpeg frame
//          conversion, block buffer, feed worker, renderer, PortAudio
//          device) for listening tests and diagnostics.
// Copyright (c) 2025 Cadence
//
// This binary is for testing and diagnostics only.

#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/frame.h>
#include <libavutil/mathematics.h>
#include <libavutil/samplefmt.h>
}

#include "cadence/audio/AudioBlockBuffer.hpp"
#include "cadence/audio/AudioBlockConverter.hpp"
#include "cadence/audio/AudioRenderer.hpp"
#include "cadence/audio/PortAudioWavePlayer.hpp"
#include "cadence/timing/RealTimeClock.hpp"
#include "cadence/util/Logger.hpp"
#include "cadence/worker/AudioFeedWorker.hpp"
#include "cadence/worker/IntervalWorker.hpp"

namespace {

using cadence::util::Logger;

constexpr double kTwoPi = 6.283185307179586;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  int duration_sec = 10;
  double frequency_hz = 440.0;
  int source_sample_rate = 44100;
  int latency_ms = 200;
  int buffers = 2;
  double speed = 1.0;
  double volume = 1.0;
  double balance = 0.0;
  bool mute = false;
  bool sync = true;
  bool high_precision = true;
  int period_ms = 15;
  bool verbose = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Plays a sine tone through the Cadence audio renderer.\n"
            << "\n"
            << "  --duration-sec N     Playback length in seconds (default: 10)\n"
            << "  --frequency HZ       Tone frequency (default: 440)\n"
            << "  --source-rate HZ     Rate of the synthesized frames before\n"
            << "                       resampling (default: 44100)\n"
            << "  --latency-ms N       Device desired latency (default: 200)\n"
            << "  --buffers N          Device buffer count, 2 or 3 (default: 2)\n"
            << "  --speed X            Playback speed ratio 0..8 (default: 1.0)\n"
            << "  --volume X           Volume 0..1 (default: 1.0)\n"
            << "  --balance X          Balance -1..1 (default: 0)\n"
            << "  --mute               Start muted\n"
            << "  --no-sync            Do not slave audio to the clock\n"
            << "  --coarse-timer       Feed worker on the ~15 ms system timer\n"
            << "  --period-ms N        Feed worker period (default: 15)\n"
            << "  --verbose, -v        Debug logs (same as CADENCE_DEBUG=1)\n"
            << "  --help               Show this help message\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--help" || arg == "-h") {
        args.help = true;
        args.valid = true;
        return args;
      } else if (arg == "--duration-sec" && i + 1 < argc) {
        args.duration_sec = std::stoi(argv[++i]);
      } else if (arg == "--frequency" && i + 1 < argc) {
        args.frequency_hz = std::stod(argv[++i]);
      } else if (arg == "--source-rate" && i + 1 < argc) {
        args.source_sample_rate = std::stoi(argv[++i]);
      } else if (arg == "--latency-ms" && i + 1 < argc) {
        args.latency_ms = std::stoi(argv[++i]);
      } else if (arg == "--buffers" && i + 1 < argc) {
        args.buffers = std::stoi(argv[++i]);
      } else if (arg == "--speed" && i + 1 < argc) {
        args.speed = std::stod(argv[++i]);
      } else if (arg == "--volume" && i + 1 < argc) {
        args.volume = std::stod(argv[++i]);
      } else if (arg == "--balance" && i + 1 < argc) {
        args.balance = std::stod(argv[++i]);
      } else if (arg == "--mute") {
        args.mute = true;
      } else if (arg == "--verbose" || arg == "-v") {
        args.verbose = true;
      } else if (arg == "--no-sync") {
        args.sync = false;
      } else if (arg == "--coarse-timer") {
        args.high_precision = false;
      } else if (arg == "--period-ms" && i + 1 < argc) {
        args.period_ms = std::stoi(argv[++i]);
      } else {
        args.error = "Unknown or incomplete argument: " + arg;
        return args;
      }
    }
  } catch (const std::exception& e) {
    args.error = std::string("Invalid argument value: ") + e.what();
    return args;
  }

  if (args.duration_sec <= 0 || args.latency_ms <= 0 || args.period_ms <= 0 ||
      args.source_sample_rate <= 0) {
    args.error = "Durations, latency, period and rate must be positive";
    return args;
  }
  if (args.buffers < 2 || args.buffers > 3) {
    args.error = "--buffers must be 2 or 3";
    return args;
  }
  args.valid = true;
  return args;
}

// =============================================================================
// Tone source: keeps the block buffer filled ahead of the clock
// =============================================================================
class ToneSourceWorker : public cadence::worker::IntervalWorker {
 public:
  static constexpr int kSamplesPerFrame = 1024;
  static constexpr int64_t kLeadUs = 500'000;

  ToneSourceWorker(std::shared_ptr<cadence::audio::AudioBlockBuffer> blocks,
                   std::shared_ptr<cadence::timing::IReferenceClock> clock,
                   double frequency_hz, int sample_rate)
      : IntervalWorker("ToneSource", std::chrono::milliseconds(10),
                       cadence::worker::IntervalWorkerMode::kSystemDefault),
        blocks_(std::move(blocks)),
        clock_(std::move(clock)),
        frequency_hz_(frequency_hz),
        sample_rate_(sample_rate),
        frame_(av_frame_alloc()) {
    if (!frame_) {
      throw std::runtime_error("av_frame_alloc failed");
    }
  }

  ~ToneSourceWorker() override {
    Dispose();
    av_frame_free(&frame_);
  }

 protected:
  void ExecuteCycleLogic(const cadence::util::CancellationToken& token) override {
    const int64_t horizon = clock_->PositionUs() + kLeadUs;
    while (!token.IsCancellationRequested() && next_start_us_ < horizon) {
      if (!FillFrame()) return;
      auto block = converter_.Convert(frame_, next_start_us_);
      samples_generated_ += kSamplesPerFrame;
      next_start_us_ = av_rescale(samples_generated_, 1'000'000, sample_rate_);
      if (block) {
        blocks_->Add(std::move(block));
      }
    }
  }

  void OnCycleException(const std::exception& error) override {
    Logger::Error(std::string("[ToneSource] CYCLE_EXCEPTION what=") +
                  error.what());
  }

 private:
  bool FillFrame() {
    av_frame_unref(frame_);
    frame_->format = AV_SAMPLE_FMT_FLTP;
    frame_->sample_rate = sample_rate_;
    frame_->nb_samples = kSamplesPerFrame;
    av_channel_layout_default(&frame_->ch_layout, 2);
    if (av_frame_get_buffer(frame_, 0) < 0) {
      Logger::Error("[ToneSource] av_frame_get_buffer failed");
      return false;
    }
    auto* left = reinterpret_cast<float*>(frame_->data[0]);
    auto* right = reinterpret_cast<float*>(frame_->data[1]);
    for (int i = 0; i < kSamplesPerFrame; ++i) {
      const double t =
          static_cast<double>(samples_generated_ + i) / sample_rate_;
      const auto v =
          static_cast<float>(0.5 * std::sin(kTwoPi * frequency_hz_ * t));
      left[i] = v;
      right[i] = v;
    }
    return true;
  }

  std::shared_ptr<cadence::audio::AudioBlockBuffer> blocks_;
  std::shared_ptr<cadence::timing::IReferenceClock> clock_;
  const double frequency_hz_;
  const int sample_rate_;
  cadence::audio::AudioBlockConverter converter_;
  AVFrame* frame_;
  int64_t samples_generated_ = 0;
  int64_t next_start_us_ = 0;
};

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  if (args.verbose) {
    Logger::SetDebugEnabled(true);
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  using namespace cadence;

  audio::AudioRendererConfig config;
  config.desired_latency_ms = args.latency_ms;
  config.number_of_buffers = args.buffers;

  audio::StreamInfo stream;
  stream.has_audio = true;
  stream.has_video = args.sync;

  try {
    auto clock = std::make_shared<timing::RealTimeClock>();
    auto blocks = std::make_shared<audio::AudioBlockBuffer>(64);

    auto renderer = std::make_shared<audio::AudioRenderer>(
        config, stream, clock, blocks,
        [](const audio::AudioRendererConfig& c) {
          return std::make_unique<audio::PortAudioWavePlayer>(
              c.desired_latency_ms, c.number_of_buffers);
        });
    renderer->SetVolume(args.volume);
    renderer->SetBalance(args.balance);
    renderer->SetMuted(args.mute);
    renderer->SetSpeedRatio(args.speed);

    ToneSourceWorker source(blocks, clock, args.frequency_hz,
                            args.source_sample_rate);
    worker::AudioFeedWorker feeder(
        renderer, blocks, clock, std::chrono::milliseconds(args.period_ms),
        args.high_precision ? worker::IntervalWorkerMode::kHighPrecision
                            : worker::IntervalWorkerMode::kSystemDefault);

    source.StartAsync().wait();
    feeder.StartAsync().wait();

    if (!renderer->WaitForReadyState(std::chrono::seconds(2))) {
      Logger::Warn("[HARNESS] Device did not pull within 2s");
    }
    renderer->Play();
    clock->Play();

    const auto start = std::chrono::steady_clock::now();
    while (!g_termination_requested.load(std::memory_order_acquire) &&
           std::chrono::steady_clock::now() - start <
               std::chrono::seconds(args.duration_sec)) {
      std::this_thread::sleep_for(std::chrono::seconds(1));
      std::ostringstream oss;
      oss << std::fixed << std::setprecision(1)
          << "[HARNESS] clock_ms=" << clock->PositionUs() / 1000.0
          << " audio_ms=" << renderer->PositionUs() / 1000.0
          << " latency_ms=" << renderer->LatencyUs() / 1000.0
          << " ring_bytes=" << renderer->ReadableBytes()
          << " feed_cycle_ms="
          << std::chrono::duration<double, std::milli>(feeder.LastCycleElapsed())
                 .count()
          << " warnings=" << Logger::Count(util::LogLevel::kWarn)
          << " errors=" << Logger::Count(util::LogLevel::kError);
      Logger::Info(oss.str());
    }

    clock->Pause();
    feeder.StopAsync().wait();
    source.StopAsync().wait();
    renderer->Stop();
    feeder.Dispose();
    source.Dispose();
    renderer->Close();
  } catch (const std::exception& e) {
    Logger::Error(std::string("[HARNESS] Fatal: ") + e.what());
    return 1;
  }

  return 0;
}
