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

#include "modemlink/util/input_validator.hpp"

#include <algorithm>
#include <cctype>

namespace modemlink {
namespace util {

void InputValidator::validate_device_path(const std::string& device) {
  validate_non_empty_string(device, "device_path");
  validate_string_length(device, base::constants::MAX_DEVICE_PATH_LENGTH, "device_path");

  if (!is_valid_device_path(device)) {
    throw diagnostics::ValidationException("invalid device path format", "device_path", "valid device path");
  }
}

void InputValidator::validate_phone_number(const std::string& number) {
  validate_non_empty_string(number, "phone_number");

  if (!is_valid_phone_number(number)) {
    throw diagnostics::ValidationException("invalid phone number", "phone_number",
                                           "optional '+' followed by 1-" +
                                               std::to_string(base::constants::MAX_ADDRESS_DIGITS) + " digits");
  }
}

bool InputValidator::is_valid_device_path(const std::string& device) {
  // Unix-style device path (e.g., /dev/ttyUSB0, /dev/ttyACM0)
  if (device.length() < 6 || device.compare(0, 5, "/dev/") != 0) {
    return false;
  }
  return std::all_of(device.begin(), device.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '/' || c == '_' || c == '-' || c == '.';
  });
}

bool InputValidator::is_valid_phone_number(const std::string& number) {
  const size_t start = number[0] == '+' ? 1 : 0;
  const size_t digits = number.size() - start;
  if (digits == 0 || digits > base::constants::MAX_ADDRESS_DIGITS) {
    return false;
  }
  return std::all_of(number.begin() + static_cast<std::ptrdiff_t>(start), number.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

}  // namespace util
}  // namespace modemlink
