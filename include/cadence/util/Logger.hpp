// Repository: Cadence-audio
// Component: Logger
// Purpose: Line-oriented logging for the renderer, its device callback
//          and the interval workers.
// Copyright (c) 2025 Cadence

#ifndef CADENCE_UTIL_LOGGER_HPP_
#define CADENCE_UTIL_LOGGER_HPP_

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>

namespace cadence::util {

enum class LogLevel { kDebug, kInfo, kWarn, kError };

const char* LogLevelName(LogLevel level);

// Lines are "[Component] TAG key=value ..."; the caller formats them.
//
//   Debug: stdout, only while debug is enabled (CADENCE_DEBUG at first use,
//          or SetDebugEnabled). Cheap to call from the device callback when
//          disabled: one atomic load.
//   Info:  stdout. Lifecycle (INIT, CLOSED) and harness status.
//   Warn:  stderr. Sync corrections, timer fallback, dispose timeouts.
//   Error: stderr. Exceptions caught at the callback and worker boundaries.
//
// One line is written and flushed per call under a single mutex, so the
// device thread and workers never interleave. Every emitted line bumps a
// per-level counter; sinks see the line before the stream does.
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Debug(const std::string& line) { Log(LogLevel::kDebug, line); }
  static void Info(const std::string& line) { Log(LogLevel::kInfo, line); }
  static void Warn(const std::string& line) { Log(LogLevel::kWarn, line); }
  static void Error(const std::string& line) { Log(LogLevel::kError, line); }
  static void Log(LogLevel level, const std::string& line);

  static bool DebugEnabled();
  static void SetDebugEnabled(bool enabled);

  // Lines emitted at a level since start (or the last ResetCounts()).
  static int64_t Count(LogLevel level);
  static void ResetCounts();

  // Captures lines of one level in addition to the stream; nullptr clears.
  static void SetSink(LogLevel level, Sink sink);
  static void SetInfoSink(Sink sink) { SetSink(LogLevel::kInfo, std::move(sink)); }
  static void SetWarnSink(Sink sink) { SetSink(LogLevel::kWarn, std::move(sink)); }
  static void SetErrorSink(Sink sink) { SetSink(LogLevel::kError, std::move(sink)); }

 private:
  static constexpr size_t kLevels = 4;

  static std::mutex mutex_;
  static std::array<Sink, kLevels> sinks_;
  static std::array<std::atomic<int64_t>, kLevels> counts_;
  // -1 until the environment has been consulted.
  static std::atomic<int> debug_enabled_;
};

}  // namespace cadence::util

#endif  // CADENCE_UTIL_LOGGER_HPP_
