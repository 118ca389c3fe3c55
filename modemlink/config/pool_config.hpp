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

#include <string>
#include <vector>

#include "modemlink/base/constants.hpp"
#include "modemlink/config/channel_config.hpp"

namespace modemlink {
namespace config {

struct PoolConfig {
  std::vector<std::string> device_patterns = {"/dev/ttyUSB*", "/dev/ttyACM*"};

  // Settings applied to every discovered device; `device` is overwritten per path
  ChannelConfig channel;

  size_t io_threads = base::constants::DEFAULT_IO_THREADS;
  size_t subscriber_buffer = base::constants::DEFAULT_SUBSCRIBER_BUFFER;

  bool is_valid() const {
    return !device_patterns.empty() && channel.is_valid() && io_threads >= 1 &&
           io_threads <= base::constants::MAX_IO_THREADS && subscriber_buffer >= 1 &&
           subscriber_buffer <= base::constants::MAX_SUBSCRIBER_BUFFER;
  }
};

}  // namespace config
}  // namespace modemlink
