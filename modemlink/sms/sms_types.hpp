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

namespace modemlink {
namespace sms {

enum class DataCoding { Gsm7, EightBit, Ucs2 };

/**
 * Decoded user data of one physical SMS plus its concatenation metadata.
 * total == 1 means a single-part message.
 */
struct FragmentPayload {
  std::string text;
  int ref = 0;
  int total = 1;
  int seq = 1;
};

/**
 * One physical SMS as listed by the device
 */
struct SmsFragment {
  int index = 0;
  std::string status;
  std::string sender;
  std::string timestamp;
  std::string text;
  int ref = 0;
  int total = 1;
  int seq = 1;
};

/**
 * User-facing message, possibly built from several fragments
 */
struct LogicalSms {
  int index = 0;
  std::string status;
  std::string number;
  std::string time;
  std::string message;
};

struct SubmitPdu {
  std::vector<uint8_t> octets;  // SMSC length octet included
  std::string hex;              // upper-case, as written after the CMGS prompt
  size_t tpdu_length = 0;       // value for AT+CMGS=<len>, SMSC part excluded
  DataCoding coding = DataCoding::Gsm7;
};

struct DecodedPdu {
  bool is_submit = false;
  std::string address;    // originating (DELIVER) or destination (SUBMIT) address
  std::string timestamp;  // "YYYY/MM/DD HH:MM:SS"; empty for SUBMIT
  DataCoding coding = DataCoding::Gsm7;
  std::string text;
  int ref = 0;
  int total = 1;
  int seq = 1;
};

/**
 * Name of a PDU-mode <stat> value as reported by AT+CMGL
 */
inline const char* pdu_status_name(int stat) {
  switch (stat) {
    case 0:
      return "REC UNREAD";
    case 1:
      return "REC READ";
    case 2:
      return "STO UNSENT";
    case 3:
      return "STO SENT";
    default:
      return "UNKNOWN";
  }
}

}  // namespace sms
}  // namespace modemlink
