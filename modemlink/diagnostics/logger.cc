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

#include "modemlink/diagnostics/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <vector>

namespace modemlink {
namespace diagnostics {

bool parse_log_level(std::string_view name, LogLevel& level) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
  if (lower == "debug") {
    level = LogLevel::DEBUG;
  } else if (lower == "info") {
    level = LogLevel::INFO;
  } else if (lower == "warning" || lower == "warn") {
    level = LogLevel::WARNING;
  } else if (lower == "error") {
    level = LogLevel::ERROR;
  } else if (lower == "critical") {
    level = LogLevel::CRITICAL;
  } else {
    return false;
  }
  return true;
}

struct Logger::Impl {
  mutable std::mutex mutex_;
  std::atomic<LogLevel> current_level_{LogLevel::INFO};
  std::atomic<bool> enabled_{true};
  std::atomic<int> outputs_{static_cast<int>(LogOutput::CONSOLE)};

  struct FormatPart {
    enum Type { LITERAL, TIMESTAMP, LEVEL, COMPONENT, OPERATION, MESSAGE };
    Type type;
    std::string value;  // Only used for LITERAL
  };

  std::vector<FormatPart> parsed_format_;
  std::unique_ptr<std::ofstream> file_output_;
  LogCallback callback_;

  Impl() { parse_format("{timestamp} [{level}] [{component}] [{operation}] {message}"); }

  void parse_format(const std::string& format) {
    std::vector<FormatPart> parts;
    size_t start = 0;
    size_t pos = 0;

    while ((pos = format.find('{', start)) != std::string::npos) {
      if (pos > start) parts.push_back({FormatPart::LITERAL, format.substr(start, pos - start)});

      size_t end = format.find('}', pos);
      if (end == std::string::npos) {
        parts.push_back({FormatPart::LITERAL, format.substr(pos)});
        start = format.length();
        break;
      }

      const std::string placeholder = format.substr(pos + 1, end - pos - 1);
      if (placeholder == "timestamp") {
        parts.push_back({FormatPart::TIMESTAMP, ""});
      } else if (placeholder == "level") {
        parts.push_back({FormatPart::LEVEL, ""});
      } else if (placeholder == "component") {
        parts.push_back({FormatPart::COMPONENT, ""});
      } else if (placeholder == "operation") {
        parts.push_back({FormatPart::OPERATION, ""});
      } else if (placeholder == "message") {
        parts.push_back({FormatPart::MESSAGE, ""});
      } else {
        parts.push_back({FormatPart::LITERAL, format.substr(pos, end - pos + 1)});
      }
      start = end + 1;
    }

    if (start < format.length()) parts.push_back({FormatPart::LITERAL, format.substr(start)});

    std::lock_guard<std::mutex> lock(mutex_);
    parsed_format_ = std::move(parts);
  }

  static std::string_view level_to_string(LogLevel level) {
    switch (level) {
      case LogLevel::DEBUG:
        return "DEBUG";
      case LogLevel::INFO:
        return "INFO";
      case LogLevel::WARNING:
        return "WARNING";
      case LogLevel::ERROR:
        return "ERROR";
      case LogLevel::CRITICAL:
        return "CRITICAL";
    }
    return "UNKNOWN";
  }

  static std::string timestamp_now() {
    const auto now = std::chrono::system_clock::now();
    const auto tt = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm time_info{};
    ::localtime_r(&tt, &time_info);
    char date_buf[32] = {0};
    std::strftime(date_buf, sizeof(date_buf), "%Y-%m-%d %H:%M:%S", &time_info);

    char out[48] = {0};
    std::snprintf(out, sizeof(out), "%s.%03d", date_buf, static_cast<int>(ms.count()));
    return out;
  }

  std::string format_message(LogLevel level, std::string_view component, std::string_view operation,
                             std::string_view message) {
    const std::string timestamp = timestamp_now();
    std::string result;
    result.reserve(message.size() + 64);

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& part : parsed_format_) {
      switch (part.type) {
        case FormatPart::LITERAL:
          result.append(part.value);
          break;
        case FormatPart::TIMESTAMP:
          result.append(timestamp);
          break;
        case FormatPart::LEVEL:
          result.append(level_to_string(level));
          break;
        case FormatPart::COMPONENT:
          result.append(component);
          break;
        case FormatPart::OPERATION:
          result.append(operation);
          break;
        case FormatPart::MESSAGE:
          result.append(message);
          break;
      }
    }
    return result;
  }

  void write_to_console(LogLevel level, const std::string& message) {
    if (level >= LogLevel::ERROR) {
      std::cerr << message << std::endl;
    } else {
      std::cout << message << '\n';
    }
  }

  void write_to_file(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_output_ && file_output_->is_open()) {
      *file_output_ << message << '\n';
    }
  }

  void call_callback(LogLevel level, const std::string& message) {
    LogCallback callback;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      callback = callback_;
    }
    if (!callback) return;
    try {
      callback(level, message);
    } catch (const std::exception& e) {
      std::cerr << "Error in log callback: " << e.what() << std::endl;
    }
  }

  void flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_output_ && file_output_->is_open()) file_output_->flush();
    std::cout.flush();
    std::cerr.flush();
  }
};

Logger::Logger() : impl_(std::make_unique<Impl>()) {}

Logger::~Logger() { impl_->flush(); }

Logger& Logger::instance() {
  static Logger instance;
  return instance;
}

void Logger::set_level(LogLevel level) { impl_->current_level_.store(level); }

LogLevel Logger::get_level() const { return impl_->current_level_.load(); }

void Logger::set_console_output(bool enable) {
  if (enable) {
    impl_->outputs_.fetch_or(static_cast<int>(LogOutput::CONSOLE));
  } else {
    impl_->outputs_.fetch_and(~static_cast<int>(LogOutput::CONSOLE));
  }
}

void Logger::set_file_output(const std::string& filename) {
  std::lock_guard<std::mutex> lock(impl_->mutex_);
  if (impl_->file_output_) {
    impl_->file_output_->flush();
    impl_->file_output_.reset();
  }

  if (filename.empty()) {
    impl_->outputs_.fetch_and(~static_cast<int>(LogOutput::FILE));
    return;
  }

  impl_->file_output_ = std::make_unique<std::ofstream>(filename, std::ios::app);
  if (impl_->file_output_->is_open()) {
    impl_->outputs_.fetch_or(static_cast<int>(LogOutput::FILE));
  } else {
    impl_->file_output_.reset();
    impl_->outputs_.fetch_and(~static_cast<int>(LogOutput::FILE));
    std::cerr << "Failed to open log file: " << filename << std::endl;
  }
}

void Logger::set_callback(LogCallback callback) {
  std::lock_guard<std::mutex> lock(impl_->mutex_);
  impl_->callback_ = std::move(callback);
  if (impl_->callback_) {
    impl_->outputs_.fetch_or(static_cast<int>(LogOutput::CALLBACK));
  } else {
    impl_->outputs_.fetch_and(~static_cast<int>(LogOutput::CALLBACK));
  }
}

void Logger::set_outputs(int outputs) { impl_->outputs_.store(outputs); }

int Logger::get_outputs() const { return impl_->outputs_.load(); }

void Logger::set_enabled(bool enabled) { impl_->enabled_.store(enabled); }

bool Logger::is_enabled() const { return impl_->enabled_.load(); }

void Logger::set_format(const std::string& format) { impl_->parse_format(format); }

void Logger::flush() { impl_->flush(); }

void Logger::log(LogLevel level, std::string_view component, std::string_view operation, std::string_view message) {
  if (!impl_->enabled_.load() || level < impl_->current_level_.load()) return;

  const int outputs = impl_->outputs_.load();
  if (outputs == 0) return;

  const std::string formatted = impl_->format_message(level, component, operation, message);

  if (outputs & static_cast<int>(LogOutput::CONSOLE)) impl_->write_to_console(level, formatted);
  if (outputs & static_cast<int>(LogOutput::FILE)) impl_->write_to_file(formatted);
  if (outputs & static_cast<int>(LogOutput::CALLBACK)) impl_->call_callback(level, formatted);
}

void Logger::debug(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::DEBUG, component, operation, message);
}

void Logger::info(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::INFO, component, operation, message);
}

void Logger::warning(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::WARNING, component, operation, message);
}

void Logger::error(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::ERROR, component, operation, message);
}

void Logger::critical(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::CRITICAL, component, operation, message);
}

}  // namespace diagnostics
}  // namespace modemlink
