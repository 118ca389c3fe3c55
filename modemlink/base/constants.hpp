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

#include <cstddef>
#include <cstdint>

namespace modemlink {
namespace base {
namespace constants {

// Serial link defaults
constexpr unsigned DEFAULT_BAUD_RATE = 115200;
constexpr uint32_t MIN_BAUD_RATE = 50;
constexpr uint32_t MAX_BAUD_RATE = 4000000;
constexpr size_t DEFAULT_READ_CHUNK = 256;
constexpr size_t MIN_READ_CHUNK = 16;
constexpr size_t MAX_READ_CHUNK = 65536;
constexpr size_t MAX_DEVICE_PATH_LENGTH = 256;

// Exchange timing
constexpr unsigned DEFAULT_COMMAND_TIMEOUT_MS = 1000;   // ordinary AT commands
constexpr unsigned DEFAULT_SMS_TIMEOUT_MS = 60000;      // SMS submission, waits for carrier ack
constexpr unsigned DEFAULT_VERIFY_TIMEOUT_MS = 1000;    // liveness check while opening
constexpr unsigned DEFAULT_READ_BACKOFF_MS = 100;       // listener back-off after a read error
constexpr unsigned MIN_TIMEOUT_MS = 10;
constexpr unsigned MAX_TIMEOUT_MS = 600000;             // 10 minutes
constexpr unsigned EXCHANGE_GRACE_MS = 500;             // caller-side slack over the strand deadline

// Event bus
constexpr size_t DEFAULT_SUBSCRIBER_BUFFER = 100;
constexpr size_t MAX_SUBSCRIBER_BUFFER = 100000;

// Runtime
constexpr size_t DEFAULT_IO_THREADS = 2;
constexpr size_t MAX_IO_THREADS = 64;

// SMS limits (3GPP TS 23.040)
constexpr size_t MAX_USER_DATA_OCTETS = 140;
constexpr size_t MAX_GSM7_SEPTETS = 160;
constexpr size_t MAX_ADDRESS_DIGITS = 20;

}  // namespace constants
}  // namespace base
}  // namespace modemlink
