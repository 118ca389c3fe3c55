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
#include <vector>

#include "modemlink/base/visibility.hpp"
#include "modemlink/sms/sms_types.hpp"

namespace modemlink {
namespace sms {

/**
 * @brief Build an SMS-SUBMIT PDU for one physical message
 *
 * GSM-7 (DCS 0x00) when every character is in the default alphabet or its
 * extension table, UCS2 (DCS 0x08) otherwise. The SMSC field is empty so
 * the modem uses its configured service centre.
 *
 * @throws CodecException if the number is not a dial string, the text is
 *         not valid UTF-8, or it does not fit in a single PDU
 */
MODEMLINK_API SubmitPdu encode_submit(const std::string& number, const std::string& text);

/**
 * @brief Text as upper-case UTF-16BE hex, the text-mode form used with AT+CSCS="UCS2"
 * @throws CodecException if the text is not valid UTF-8
 */
MODEMLINK_API std::string encode_ucs2_hex(const std::string& text);

/**
 * @brief Decode a hex user-data payload that may start with a concatenation header
 *
 * Recognizes `05 00 03 ref total seq` and `06 08 04 refHi refLo total seq`;
 * the rest is UTF-16BE. Never throws: malformed hex or an odd byte count
 * returns the payload itself as text with total = 1.
 */
MODEMLINK_API FragmentPayload decode_fragment(const std::string& hex_payload);

/**
 * @brief Decode a complete SMS-DELIVER or SMS-SUBMIT PDU as listed by AT+CMGL
 * @throws CodecException on truncated or malformed input
 */
MODEMLINK_API DecodedPdu decode_pdu(const std::string& hex);

/**
 * @brief UCS2 hex to UTF-8; returns the input unchanged if it is not UCS2 hex
 */
MODEMLINK_API std::string decode_ucs2_hex(const std::string& hex);

/**
 * @brief Merge concatenated fragments into logical messages
 *
 * Fragments with total > 1 are grouped by (sender, ref). A group merges
 * only when every part 1..total is present; it is reported with the
 * metadata of part 1. Anything else passes through one message per
 * fragment. Output is ordered by index.
 */
MODEMLINK_API std::vector<LogicalSms> reassemble(const std::vector<SmsFragment>& fragments);

MODEMLINK_API std::string to_hex(const std::vector<uint8_t>& bytes);

/**
 * @return false on odd length or a non-hex character
 */
MODEMLINK_API bool from_hex(const std::string& hex, std::vector<uint8_t>& bytes);

}  // namespace sms
}  // namespace modemlink
