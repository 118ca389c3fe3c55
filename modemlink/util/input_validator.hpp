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

#include <cstdint>
#include <string>

#include "modemlink/base/constants.hpp"
#include "modemlink/base/visibility.hpp"
#include "modemlink/diagnostics/exceptions.hpp"

namespace modemlink {
namespace util {

/**
 * @brief Input validation utility class
 *
 * Validates caller-supplied values before they reach a device.
 * Throws ValidationException for invalid inputs with detailed error messages.
 */
class MODEMLINK_API InputValidator {
 public:
  // Serial validation
  static void validate_device_path(const std::string& device);
  static void validate_baud_rate(uint32_t baud_rate);

  // SMS validation
  static void validate_phone_number(const std::string& number);
  static void validate_sms_index(int index);

  static void validate_timeout(unsigned timeout_ms);

  // String validation
  static void validate_non_empty_string(const std::string& str, const std::string& field_name);
  static void validate_string_length(const std::string& str, size_t max_length, const std::string& field_name);

  // Numeric validation
  static void validate_range(int64_t value, int64_t min, int64_t max, const std::string& field_name);

 private:
  static bool is_valid_device_path(const std::string& device);
  static bool is_valid_phone_number(const std::string& number);
};

// Inline implementations for simple validations
inline void InputValidator::validate_non_empty_string(const std::string& str, const std::string& field_name) {
  if (str.empty()) {
    throw diagnostics::ValidationException(field_name + " cannot be empty", field_name, "non-empty string");
  }
}

inline void InputValidator::validate_string_length(const std::string& str, size_t max_length,
                                                   const std::string& field_name) {
  if (str.length() > max_length) {
    throw diagnostics::ValidationException(field_name + " length exceeds maximum allowed length", field_name,
                                           "length <= " + std::to_string(max_length));
  }
}

inline void InputValidator::validate_range(int64_t value, int64_t min, int64_t max, const std::string& field_name) {
  if (value < min || value > max) {
    throw diagnostics::ValidationException(field_name + " out of range", field_name,
                                           std::to_string(min) + " <= value <= " + std::to_string(max));
  }
}

inline void InputValidator::validate_baud_rate(uint32_t baud_rate) {
  validate_range(static_cast<int64_t>(baud_rate), static_cast<int64_t>(base::constants::MIN_BAUD_RATE),
                 static_cast<int64_t>(base::constants::MAX_BAUD_RATE), "baud_rate");
}

inline void InputValidator::validate_timeout(unsigned timeout_ms) {
  validate_range(static_cast<int64_t>(timeout_ms), static_cast<int64_t>(base::constants::MIN_TIMEOUT_MS),
                 static_cast<int64_t>(base::constants::MAX_TIMEOUT_MS), "timeout_ms");
}

inline void InputValidator::validate_sms_index(int index) {
  if (index < 0) {
    throw diagnostics::ValidationException("sms index cannot be negative", "index", "index >= 0");
  }
}

}  // namespace util
}  // namespace modemlink
