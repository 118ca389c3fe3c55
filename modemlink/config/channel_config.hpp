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
#include <string>

#include "modemlink/base/constants.hpp"

namespace modemlink {
namespace config {

/**
 * SMS protocol mode selected with AT+CMGF during channel initialization
 */
enum class SmsMode { Pdu, Text };

inline const char* to_cstr(SmsMode mode) { return mode == SmsMode::Pdu ? "pdu" : "text"; }

struct ChannelConfig {
  std::string device = "/dev/ttyUSB0";
  unsigned baud_rate = base::constants::DEFAULT_BAUD_RATE;
  unsigned char_size = 8;  // 5,6,7,8
  enum class Parity { None, Even, Odd } parity = Parity::None;
  unsigned stop_bits = 1;  // 1 or 2
  enum class Flow { None, Software, Hardware } flow = Flow::None;

  size_t read_chunk = base::constants::DEFAULT_READ_CHUNK;

  unsigned command_timeout_ms = base::constants::DEFAULT_COMMAND_TIMEOUT_MS;
  unsigned sms_timeout_ms = base::constants::DEFAULT_SMS_TIMEOUT_MS;
  unsigned verify_timeout_ms = base::constants::DEFAULT_VERIFY_TIMEOUT_MS;
  unsigned read_error_backoff_ms = base::constants::DEFAULT_READ_BACKOFF_MS;

  SmsMode sms_mode = SmsMode::Pdu;

  bool is_valid() const {
    return !device.empty() && baud_rate >= base::constants::MIN_BAUD_RATE &&
           baud_rate <= base::constants::MAX_BAUD_RATE && char_size >= 5 && char_size <= 8 &&
           (stop_bits == 1 || stop_bits == 2) && read_chunk >= base::constants::MIN_READ_CHUNK &&
           read_chunk <= base::constants::MAX_READ_CHUNK && timeout_in_range(command_timeout_ms) &&
           timeout_in_range(sms_timeout_ms) && timeout_in_range(verify_timeout_ms) &&
           timeout_in_range(read_error_backoff_ms);
  }

  // Apply validation and clamp values to valid ranges
  void validate_and_clamp() {
    char_size = std::clamp(char_size, 5u, 8u);
    if (stop_bits != 1 && stop_bits != 2) stop_bits = 1;
    read_chunk = std::clamp(read_chunk, base::constants::MIN_READ_CHUNK, base::constants::MAX_READ_CHUNK);
    clamp_timeout(command_timeout_ms);
    clamp_timeout(sms_timeout_ms);
    clamp_timeout(verify_timeout_ms);
    clamp_timeout(read_error_backoff_ms);
  }

 private:
  static bool timeout_in_range(unsigned ms) {
    return ms >= base::constants::MIN_TIMEOUT_MS && ms <= base::constants::MAX_TIMEOUT_MS;
  }
  static void clamp_timeout(unsigned& ms) {
    ms = std::clamp(ms, base::constants::MIN_TIMEOUT_MS, base::constants::MAX_TIMEOUT_MS);
  }
};

}  // namespace config
}  // namespace modemlink
