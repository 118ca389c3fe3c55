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

namespace modemlink {
namespace modem {

/**
 * Identity fields; each one is empty when its query failed
 */
struct ModemIdentity {
  std::optional<std::string> manufacturer;
  std::optional<std::string> model;
  std::optional<std::string> imei;
  std::optional<std::string> imsi;
  std::optional<std::string> operator_name;
  std::optional<std::string> access_technology;
  std::optional<std::string> phone_number;
};

struct SignalReading {
  int rssi = 99;
  int quality = 99;
  std::optional<int> dbm;  // -113 + 2 * rssi, only for rssi 0..31
  int level = 0;           // 0..5 bars

  std::string dbm_text() const { return dbm ? std::to_string(*dbm) + " dBm" : "unknown"; }
};

}  // namespace modem
}  // namespace modemlink
