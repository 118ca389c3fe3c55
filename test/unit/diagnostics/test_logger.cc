/*
 * Copyright 2025 Jinwoo Sung
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <gtest/gtest.h>

#include <unistd.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "modemlink/diagnostics/logger.hpp"

using namespace modemlink::diagnostics;

namespace {

struct Captured {
  LogLevel level;
  std::string text;
};

}  // namespace

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    logger_.set_outputs(0);
    logger_.set_callback([this](LogLevel level, const std::string& text) { captured_.push_back({level, text}); });
    logger_.set_format("[{level}] {component}/{operation}: {message}");
  }

  Logger logger_;
  std::vector<Captured> captured_;
};

TEST_F(LoggerTest, CallbackReceivesFormattedMessage) {
  logger_.info("channel", "open", "/dev/ttyUSB0 ready");
  ASSERT_EQ(captured_.size(), 1u);
  EXPECT_EQ(captured_[0].level, LogLevel::INFO);
  EXPECT_EQ(captured_[0].text, "[INFO] channel/open: /dev/ttyUSB0 ready");
}

TEST_F(LoggerTest, LevelFiltersLowerSeverities) {
  logger_.set_level(LogLevel::WARNING);
  logger_.debug("pool", "scan", "d");
  logger_.info("pool", "scan", "i");
  logger_.warning("pool", "scan", "w");
  logger_.error("pool", "scan", "e");
  logger_.critical("pool", "scan", "c");

  ASSERT_EQ(captured_.size(), 3u);
  EXPECT_EQ(captured_[0].level, LogLevel::WARNING);
  EXPECT_EQ(captured_[2].level, LogLevel::CRITICAL);
}

TEST_F(LoggerTest, DisabledLoggerIsSilent) {
  logger_.set_enabled(false);
  logger_.error("session", "send_sms", "lost");
  EXPECT_TRUE(captured_.empty());
  EXPECT_FALSE(logger_.is_enabled());
}

TEST_F(LoggerTest, UnknownPlaceholderStaysLiteral) {
  logger_.set_format("{thread} {message}");
  logger_.info("x", "y", "hello");
  ASSERT_EQ(captured_.size(), 1u);
  EXPECT_EQ(captured_[0].text, "{thread} hello");
}

TEST_F(LoggerTest, ClearingCallbackDropsCallbackOutput) {
  logger_.set_callback(nullptr);
  EXPECT_EQ(logger_.get_outputs() & static_cast<int>(LogOutput::CALLBACK), 0);
  logger_.info("x", "y", "z");
  EXPECT_TRUE(captured_.empty());
}

TEST_F(LoggerTest, FileOutputAppendsLines) {
  char path[] = "/tmp/modemlink_log_XXXXXX";
  const int fd = ::mkstemp(path);
  ASSERT_GE(fd, 0);
  ::close(fd);

  logger_.set_file_output(path);
  logger_.info("event_bus", "subscribe", "first");
  logger_.info("event_bus", "subscribe", "second");
  logger_.set_file_output("");

  std::ifstream in(path);
  std::stringstream content;
  content << in.rdbuf();
  EXPECT_EQ(content.str(), "[INFO] event_bus/subscribe: first\n[INFO] event_bus/subscribe: second\n");
  std::remove(path);
}

TEST(LogLevelParseTest, AcceptsNamesCaseInsensitively) {
  LogLevel level = LogLevel::INFO;
  EXPECT_TRUE(parse_log_level("DEBUG", level));
  EXPECT_EQ(level, LogLevel::DEBUG);
  EXPECT_TRUE(parse_log_level("warn", level));
  EXPECT_EQ(level, LogLevel::WARNING);
  EXPECT_TRUE(parse_log_level("Critical", level));
  EXPECT_EQ(level, LogLevel::CRITICAL);
  EXPECT_FALSE(parse_log_level("verbose", level));
  EXPECT_EQ(level, LogLevel::CRITICAL);
}
