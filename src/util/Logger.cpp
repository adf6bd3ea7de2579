// Repository: Cadence-audio
// Component: Logger
// Purpose: Line-oriented logging for the renderer, its device callback
//          and the interval workers.
// Copyright (c) 2025 Cadence

#include "cadence/util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace cadence::util {

std::mutex Logger::mutex_;
std::array<Logger::Sink, Logger::kLevels> Logger::sinks_;
std::array<std::atomic<int64_t>, Logger::kLevels> Logger::counts_{};
std::atomic<int> Logger::debug_enabled_{-1};

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug: return "DEBUG";
    case LogLevel::kInfo:  return "INFO";
    case LogLevel::kWarn:  return "WARN";
    case LogLevel::kError: return "ERROR";
  }
  return "UNKNOWN";
}

bool Logger::DebugEnabled() {
  int enabled = debug_enabled_.load(std::memory_order_relaxed);
  if (enabled < 0) {
    enabled = std::getenv("CADENCE_DEBUG") != nullptr ? 1 : 0;
    int expected = -1;
    // A concurrent SetDebugEnabled() wins over the environment.
    if (!debug_enabled_.compare_exchange_strong(expected, enabled)) {
      enabled = expected;
    }
  }
  return enabled == 1;
}

void Logger::SetDebugEnabled(bool enabled) {
  debug_enabled_.store(enabled ? 1 : 0);
}

void Logger::Log(LogLevel level, const std::string& line) {
  if (level == LogLevel::kDebug && !DebugEnabled()) return;

  const auto index = static_cast<size_t>(level);
  std::lock_guard<std::mutex> lock(mutex_);
  counts_[index].fetch_add(1, std::memory_order_relaxed);
  if (sinks_[index]) {
    sinks_[index](line);
  }
  std::ostream& out =
      level == LogLevel::kWarn || level == LogLevel::kError ? std::cerr
                                                            : std::cout;
  out << line << '\n';
  out.flush();
}

int64_t Logger::Count(LogLevel level) {
  return counts_[static_cast<size_t>(level)].load(std::memory_order_relaxed);
}

void Logger::ResetCounts() {
  for (auto& count : counts_) {
    count.store(0, std::memory_order_relaxed);
  }
}

void Logger::SetSink(LogLevel level, Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sinks_[static_cast<size_t>(level)] = std::move(sink);
}

}  // namespace cadence::util
