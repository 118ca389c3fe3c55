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

#include "modemlink/pool/device_scanner.hpp"

#include <glob.h>

#include <algorithm>

#include "modemlink/diagnostics/logger.hpp"

namespace modemlink {
namespace pool {

GlobDeviceScanner::GlobDeviceScanner(std::vector<std::string> patterns) : patterns_(std::move(patterns)) {}

std::vector<std::string> GlobDeviceScanner::candidates() {
  std::vector<std::string> paths;
  for (const auto& pattern : patterns_) {
    glob_t result{};
    const int rc = ::glob(pattern.c_str(), 0, nullptr, &result);
    if (rc == 0) {
      for (size_t i = 0; i < result.gl_pathc; ++i) {
        paths.emplace_back(result.gl_pathv[i]);
      }
    } else if (rc != GLOB_NOMATCH) {
      MODEMLINK_LOG_WARNING("pool", "scan", "glob failed for " + pattern + " (rc " + std::to_string(rc) + ")");
    }
    ::globfree(&result);
  }
  std::sort(paths.begin(), paths.end());
  paths.erase(std::unique(paths.begin(), paths.end()), paths.end());
  return paths;
}

}  // namespace pool
}  // namespace modemlink
