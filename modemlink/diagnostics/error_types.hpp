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

#pragma once

#include <algorithm>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstdint>
#include <iterator>
#include <sstream>
#include <string>

namespace modemlink {
namespace diagnostics {

/**
 * @brief Error severity levels
 */
enum class ErrorLevel {
  INFO = 0,     // Informational message
  WARNING = 1,  // Degraded item, operation continued
  ERROR = 2,    // Operation failed for its caller
  CRITICAL = 3  // Link unusable
};

/**
 * @brief Error categories for classification
 */
enum class ErrorCategory {
  TRANSPORT = 0,      // Serial open/read/write
  COMMAND = 1,        // Exchange deadline expired
  PROTOCOL = 2,       // ERROR token or unparsable reply
  CODEC = 3,          // Malformed PDU or hex payload
  REGISTRY = 4,       // Pool lookup and scan
  CONFIGURATION = 5,  // Invalid config values
  SYSTEM = 6          // Runtime and OS level
};

constexpr size_t ERROR_LEVEL_COUNT = 4;
constexpr size_t ERROR_CATEGORY_COUNT = 7;

struct ErrorInfo {
  ErrorLevel level;
  ErrorCategory category;
  std::string component;                  // channel, session, pool, ...
  std::string operation;                  // open, exchange, list_sms, ...
  std::string message;
  boost::system::error_code boost_error;
  std::chrono::system_clock::time_point timestamp;
  bool retryable;
  std::string context;                    // device identifier or raw response excerpt

  ErrorInfo(ErrorLevel l, ErrorCategory c, const std::string& comp, const std::string& op, const std::string& msg)
      : level(l),
        category(c),
        component(comp),
        operation(op),
        message(msg),
        timestamp(std::chrono::system_clock::now()),
        retryable(false) {}

  ErrorInfo(ErrorLevel l, ErrorCategory c, const std::string& comp, const std::string& op, const std::string& msg,
            const boost::system::error_code& ec, bool retry = false)
      : level(l),
        category(c),
        component(comp),
        operation(op),
        message(msg),
        boost_error(ec),
        timestamp(std::chrono::system_clock::now()),
        retryable(retry) {}

  std::string get_level_string() const {
    switch (level) {
      case ErrorLevel::INFO:
        return "INFO";
      case ErrorLevel::WARNING:
        return "WARNING";
      case ErrorLevel::ERROR:
        return "ERROR";
      case ErrorLevel::CRITICAL:
        return "CRITICAL";
    }
    return "UNKNOWN";
  }

  std::string get_category_string() const {
    switch (category) {
      case ErrorCategory::TRANSPORT:
        return "TRANSPORT";
      case ErrorCategory::COMMAND:
        return "COMMAND";
      case ErrorCategory::PROTOCOL:
        return "PROTOCOL";
      case ErrorCategory::CODEC:
        return "CODEC";
      case ErrorCategory::REGISTRY:
        return "REGISTRY";
      case ErrorCategory::CONFIGURATION:
        return "CONFIGURATION";
      case ErrorCategory::SYSTEM:
        return "SYSTEM";
    }
    return "UNKNOWN";
  }

  std::string get_summary() const {
    std::ostringstream oss;
    oss << "[" << get_level_string() << "] [" << component << "] [" << operation << "] " << message;
    if (!context.empty()) oss << " {" << context << "}";
    if (boost_error) oss << " (boost: " << boost_error.message() << ", code: " << boost_error.value() << ")";
    if (retryable) oss << " [RETRYABLE]";
    return oss.str();
  }
};

struct ErrorStats {
  size_t total_errors = 0;
  size_t errors_by_level[ERROR_LEVEL_COUNT] = {0, 0, 0, 0};
  size_t errors_by_category[ERROR_CATEGORY_COUNT] = {0, 0, 0, 0, 0, 0, 0};
  size_t retryable_errors = 0;

  std::chrono::system_clock::time_point first_error;
  std::chrono::system_clock::time_point last_error;

  void reset() {
    total_errors = 0;
    std::fill(std::begin(errors_by_level), std::end(errors_by_level), 0);
    std::fill(std::begin(errors_by_category), std::end(errors_by_category), 0);
    retryable_errors = 0;
    first_error = std::chrono::system_clock::time_point{};
    last_error = std::chrono::system_clock::time_point{};
  }
};

}  // namespace diagnostics
}  // namespace modemlink
