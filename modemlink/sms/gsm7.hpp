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
#include <string>
#include <vector>

#include "modemlink/base/visibility.hpp"

namespace modemlink {
namespace sms {
namespace gsm7 {

constexpr uint8_t ESCAPE = 0x1B;

/**
 * @brief Map text to GSM 03.38 septets, using the extension table where needed
 * @return false if some character has no GSM-7 representation
 */
MODEMLINK_API bool to_septets(const std::u32string& text, std::vector<uint8_t>& septets);

MODEMLINK_API bool is_encodable(const std::u32string& text);

/**
 * @brief Whether UTF-8 text fits the GSM-7 default alphabet plus extension table
 */
MODEMLINK_API bool is_gsm7_encodable(const std::string& utf8);

/**
 * @brief Inverse of to_septets; an unknown escape sequence yields the base-table character
 */
MODEMLINK_API std::u32string from_septets(const std::vector<uint8_t>& septets);

/**
 * @brief Pack septets LSB-first into octets
 * @param fill_bits Leading padding bits, used to align text after a user data header
 */
MODEMLINK_API std::vector<uint8_t> pack(const std::vector<uint8_t>& septets, unsigned fill_bits = 0);

/**
 * @brief Unpack `septet_count` septets; stops early if the octets run out
 */
MODEMLINK_API std::vector<uint8_t> unpack(const uint8_t* data, size_t length, size_t septet_count,
                                          unsigned fill_bits = 0);

}  // namespace gsm7
}  // namespace sms
}  // namespace modemlink
