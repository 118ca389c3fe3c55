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

#include "modemlink/modem/response_parser.hpp"

#include <charconv>
#include <sstream>

#include "modemlink/sms/pdu_codec.hpp"

namespace modemlink {
namespace modem {
namespace parser {

namespace {

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return "";
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

std::vector<std::string> lines_of(const std::string& response) {
  std::vector<std::string> lines;
  std::istringstream stream(response);
  std::string line;
  while (std::getline(stream, line)) {
    lines.push_back(trim(line));
  }
  return lines;
}

bool starts_with(const std::string& s, const char* prefix) { return s.rfind(prefix, 0) == 0; }

}  // namespace

std::string extract_value(const std::string& response) {
  for (const auto& line : lines_of(response)) {
    if (!line.empty() && line != "OK" && !starts_with(line, "AT")) {
      return line;
    }
  }
  return "";
}

bool has_ok_line(const std::string& response) {
  for (const auto& line : lines_of(response)) {
    if (line == "OK") return true;
  }
  return false;
}

bool has_error(const std::string& response) { return response.find("ERROR") != std::string::npos; }

bool parse_int(const std::string& text, int& value) {
  const std::string t = trim(text);
  if (t.empty()) return false;
  const auto result = std::from_chars(t.data(), t.data() + t.size(), value);
  return result.ec == std::errc() && result.ptr == t.data() + t.size();
}

int signal_level(int rssi) {
  if (rssi < 0 || rssi > 31) return 0;
  if (rssi >= 20) return 5;
  if (rssi >= 15) return 4;
  if (rssi >= 10) return 3;
  if (rssi >= 5) return 2;
  if (rssi >= 1) return 1;
  return 0;
}

std::optional<SignalReading> parse_csq(const std::string& response) {
  for (const auto& line : lines_of(response)) {
    if (!starts_with(line, "+CSQ:")) continue;
    const auto fields = split_fields(line.substr(5));
    SignalReading reading;
    if (fields.size() < 2 || !parse_int(fields[0], reading.rssi) || !parse_int(fields[1], reading.quality)) {
      return std::nullopt;
    }
    if (reading.rssi >= 0 && reading.rssi <= 31) {
      reading.dbm = -113 + 2 * reading.rssi;
    }
    reading.level = signal_level(reading.rssi);
    return reading;
  }
  return std::nullopt;
}

std::optional<OperatorInfo> parse_cops(const std::string& response) {
  for (const auto& line : lines_of(response)) {
    if (!starts_with(line, "+COPS:")) continue;
    const auto open = line.find('"');
    if (open == std::string::npos) return std::nullopt;
    const auto close = line.find('"', open + 1);
    if (close == std::string::npos || close == open + 1) return std::nullopt;

    OperatorInfo info;
    info.name = line.substr(open + 1, close - open - 1);
    const auto fields = split_fields(line.substr(6));
    int act = 0;
    if (fields.size() >= 4 && parse_int(fields[3], act)) {
      info.act = act;
    }
    return info;
  }
  return std::nullopt;
}

std::string access_technology_name(int act) {
  switch (act) {
    case 0:
      return "GSM";
    case 1:
      return "GSM Compact";
    case 2:
      return "UTRAN";
    case 3:
      return "GSM/EGPRS";
    case 4:
      return "UTRAN/HSDPA";
    case 5:
      return "UTRAN/HSUPA";
    case 6:
      return "UTRAN/HSPA";
    case 7:
      return "E-UTRAN";
    case 8:
      return "EC-GSM-IoT";
    case 9:
      return "E-UTRAN NB-S1";
    case 10:
      return "E-UTRA 5GCN";
    case 11:
      return "NR 5GCN";
    case 12:
      return "NG-RAN";
    case 13:
      return "E-UTRA-NR";
    default:
      return "AcT " + std::to_string(act);
  }
}

std::optional<std::string> parse_cnum(const std::string& response) {
  for (const auto& line : lines_of(response)) {
    if (!starts_with(line, "+CNUM:")) continue;
    // +CNUM: [<alpha>],"<number>",<type>: the number is the quoted field after the first comma
    const auto comma = line.find(',');
    if (comma == std::string::npos) continue;
    const auto open = line.find('"', comma);
    if (open == std::string::npos) continue;
    const auto close = line.find('"', open + 1);
    if (close == std::string::npos || close == open + 1) continue;
    return line.substr(open + 1, close - open - 1);
  }
  return std::nullopt;
}

std::string decode_dial_string(const std::string& raw) {
  const std::string decoded = sms::decode_ucs2_hex(raw);
  if (decoded.empty() || decoded == raw) return raw;
  if (decoded.find_first_not_of("+0123456789*#") != std::string::npos) return raw;
  return decoded;
}

std::vector<ListRecord> split_cmgl(const std::string& response) {
  static const std::string MARKER = "+CMGL: ";
  std::vector<ListRecord> records;

  size_t pos = response.find(MARKER);
  while (pos != std::string::npos) {
    const size_t start = pos + MARKER.size();
    const size_t next = response.find(MARKER, start);
    const std::string chunk = response.substr(start, next == std::string::npos ? std::string::npos : next - start);
    pos = next;

    const auto newline = chunk.find('\n');
    if (newline == std::string::npos) continue;

    ListRecord record;
    record.header = trim(chunk.substr(0, newline));
    std::string body = trim(chunk.substr(newline + 1));
    if (body.size() >= 2 && body.compare(body.size() - 2, 2, "OK") == 0) {
      body = trim(body.substr(0, body.size() - 2));
    }
    record.body = body;
    records.push_back(std::move(record));
  }
  return records;
}

std::vector<std::string> split_fields(const std::string& line) {
  std::vector<std::string> fields;
  std::string current;
  bool quoted = false;
  for (char c : line) {
    if (c == '"') {
      quoted = !quoted;
    } else if (c == ',' && !quoted) {
      fields.push_back(trim(current));
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  fields.push_back(trim(current));
  return fields;
}

}  // namespace parser
}  // namespace modem
}  // namespace modemlink
