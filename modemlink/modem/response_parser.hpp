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

#include <optional>
#include <string>
#include <vector>

#include "modemlink/base/visibility.hpp"
#include "modemlink/modem/modem_types.hpp"

namespace modemlink {
namespace modem {
namespace parser {

/**
 * @brief First line that is not empty, not `OK` and not a command echo
 */
MODEMLINK_API std::string extract_value(const std::string& response);

MODEMLINK_API bool has_ok_line(const std::string& response);
MODEMLINK_API bool has_error(const std::string& response);

/**
 * @brief Parse `+CSQ: <rssi>,<ber>`
 */
MODEMLINK_API std::optional<SignalReading> parse_csq(const std::string& response);

MODEMLINK_API int signal_level(int rssi);

struct OperatorInfo {
  std::string name;
  std::optional<int> act;
};

/**
 * @brief Parse `+COPS: <mode>[,<format>,"<oper>"[,<AcT>]]`
 */
MODEMLINK_API std::optional<OperatorInfo> parse_cops(const std::string& response);

MODEMLINK_API std::string access_technology_name(int act);

/**
 * @brief Quoted number of the first `+CNUM:` line, as sent by the modem
 */
MODEMLINK_API std::optional<std::string> parse_cnum(const std::string& response);

/**
 * @brief Decode a number the modem reported in UCS2 hex, when it decodes to a dial string
 */
MODEMLINK_API std::string decode_dial_string(const std::string& raw);

struct ListRecord {
  std::string header;  // text after "+CMGL: " on the first line
  std::string body;    // remaining lines with the final OK removed, trimmed
};

MODEMLINK_API std::vector<ListRecord> split_cmgl(const std::string& response);

/**
 * @brief Split a comma separated header; commas inside double quotes do not split and quotes are dropped
 */
MODEMLINK_API std::vector<std::string> split_fields(const std::string& line);

MODEMLINK_API bool parse_int(const std::string& text, int& value);

}  // namespace parser
}  // namespace modem
}  // namespace modemlink
