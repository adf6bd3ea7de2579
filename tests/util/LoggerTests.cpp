// Repository: Cadence-audio
// Component: Logger Tests
// Purpose: Per-level sinks, counters and the debug switch.
// Copyright (c) 2025 Cadence

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cadence/util/Logger.hpp"

namespace cadence::util::testing {
namespace {

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    was_debug_ = Logger::DebugEnabled();
    Logger::ResetCounts();
  }

  void TearDown() override {
    Logger::SetSink(LogLevel::kDebug, nullptr);
    Logger::SetInfoSink(nullptr);
    Logger::SetWarnSink(nullptr);
    Logger::SetErrorSink(nullptr);
    Logger::SetDebugEnabled(was_debug_);
  }

  bool was_debug_ = false;
};

TEST_F(LoggerTest, SinksReceiveOnlyTheirLevel) {
  std::vector<std::string> warnings;
  std::vector<std::string> errors;
  Logger::SetWarnSink([&](const std::string& line) { warnings.push_back(line); });
  Logger::SetErrorSink([&](const std::string& line) { errors.push_back(line); });

  Logger::Info("[LoggerTest] INFO_LINE");
  Logger::Warn("[LoggerTest] WARN_LINE");
  Logger::Error("[LoggerTest] ERROR_LINE");

  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_EQ(warnings[0], "[LoggerTest] WARN_LINE");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0], "[LoggerTest] ERROR_LINE");
}

TEST_F(LoggerTest, CountsTrackEmittedLinesPerLevel) {
  Logger::Info("[LoggerTest] a");
  Logger::Warn("[LoggerTest] b");
  Logger::Warn("[LoggerTest] c");
  EXPECT_EQ(Logger::Count(LogLevel::kInfo), 1);
  EXPECT_EQ(Logger::Count(LogLevel::kWarn), 2);
  EXPECT_EQ(Logger::Count(LogLevel::kError), 0);

  Logger::ResetCounts();
  EXPECT_EQ(Logger::Count(LogLevel::kWarn), 0);
}

TEST_F(LoggerTest, DebugIsDroppedWhileDisabled) {
  std::vector<std::string> lines;
  Logger::SetSink(LogLevel::kDebug, [&](const std::string& line) { lines.push_back(line); });

  Logger::SetDebugEnabled(false);
  Logger::Debug("[LoggerTest] hidden");
  EXPECT_TRUE(lines.empty());
  EXPECT_EQ(Logger::Count(LogLevel::kDebug), 0);

  Logger::SetDebugEnabled(true);
  Logger::Debug("[LoggerTest] shown");
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], "[LoggerTest] shown");
  EXPECT_EQ(Logger::Count(LogLevel::kDebug), 1);
}

TEST(LogLevelTest, Names) {
  EXPECT_STREQ(LogLevelName(LogLevel::kDebug), "DEBUG");
  EXPECT_STREQ(LogLevelName(LogLevel::kError), "ERROR");
}

}  // namespace
}  // namespace cadence::util::testing
