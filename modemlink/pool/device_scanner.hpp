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

#include <memory>
#include <string>
#include <vector>

#include "modemlink/base/visibility.hpp"

namespace modemlink {
namespace pool {

/**
 * Source of candidate device paths for a scan
 */
class DeviceScanner {
 public:
  virtual ~DeviceScanner() = default;

  // Sorted, without duplicates
  virtual std::vector<std::string> candidates() = 0;
};

/**
 * @brief Expands shell glob patterns such as /dev/ttyUSB* against the filesystem
 */
class MODEMLINK_API GlobDeviceScanner : public DeviceScanner {
 public:
  explicit GlobDeviceScanner(std::vector<std::string> patterns);

  std::vector<std::string> candidates() override;

  const std::vector<std::string>& patterns() const { return patterns_; }

 private:
  std::vector<std::string> patterns_;
};

}  // namespace pool
}  // namespace modemlink
