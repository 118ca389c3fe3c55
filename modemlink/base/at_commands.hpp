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

namespace modemlink {
namespace base {
namespace at {

// 3GPP TS 27.007 / 27.005 command set
constexpr const char* CHECK = "AT";
constexpr const char* ECHO_OFF = "ATE0";
constexpr const char* PDU_MODE = "AT+CMGF=0";
constexpr const char* TEXT_MODE = "AT+CMGF=1";
constexpr const char* UCS2_CHARSET = "AT+CSCS=\"UCS2\"";
constexpr const char* TEXT_PARAMS_UCS2 = "AT+CSMP=17,167,0,8";
constexpr const char* MANUFACTURER = "AT+CGMI";
constexpr const char* MODEL = "AT+CGMM";
constexpr const char* IMEI = "AT+CGSN";
constexpr const char* IMSI = "AT+CIMI";
constexpr const char* OPERATOR = "AT+COPS?";
constexpr const char* OWN_NUMBER = "AT+CNUM";
constexpr const char* SIGNAL = "AT+CSQ";
constexpr const char* LIST_ALL_PDU = "AT+CMGL=4";
constexpr const char* LIST_ALL_TEXT = "AT+CMGL=\"ALL\"";
constexpr const char* DELETE_PREFIX = "AT+CMGD=";
constexpr const char* SEND_PREFIX = "AT+CMGS=";

constexpr const char* CRLF = "\r\n";
constexpr const char* CTRL_Z = "\x1A";

}  // namespace at
}  // namespace base
}  // namespace modemlink
