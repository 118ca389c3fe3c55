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

#include "modemlink/base/visibility.hpp"
#include "modemlink/config/channel_config.hpp"
#include "modemlink/config/config_manager.hpp"
#include "modemlink/config/pool_config.hpp"

namespace modemlink {
namespace config {

/**
 * Factory for creating configuration managers
 */
class MODEMLINK_API ConfigFactory {
 public:
  /**
   * Create an empty configuration manager
   */
  static std::shared_ptr<ConfigManager> create();

  /**
   * Create a configuration manager with every modemlink key registered
   */
  static std::shared_ptr<ConfigManager> create_with_defaults();

  /**
   * Create a configuration manager with defaults and overlay a file on top
   * @throws ConfigurationException if the file cannot be read or a value is rejected
   */
  static std::shared_ptr<ConfigManager> create_from_file(const std::string& filepath);

  static ChannelConfig build_channel_config(const ConfigManager& config);
  static PoolConfig build_pool_config(const ConfigManager& config);

  /**
   * Push `log.level` and `log.file` into the process-wide Logger
   */
  static void apply_logging(const ConfigManager& config);
};

/**
 * Registers the modemlink keys with their defaults and validators
 */
class MODEMLINK_API ConfigPresets {
 public:
  static void setup_serial_defaults(ConfigManager& config);
  static void setup_sms_defaults(ConfigManager& config);
  static void setup_pool_defaults(ConfigManager& config);
  static void setup_event_defaults(ConfigManager& config);
  static void setup_logging_defaults(ConfigManager& config);
  static void setup_all_defaults(ConfigManager& config);
};

}  // namespace config
}  // namespace modemlink
