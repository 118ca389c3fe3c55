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

#include "modemlink/config/config_factory.hpp"

#include <sstream>

#include "modemlink/base/constants.hpp"
#include "modemlink/diagnostics/error_handler.hpp"
#include "modemlink/diagnostics/exceptions.hpp"
#include "modemlink/diagnostics/logger.hpp"

namespace modemlink {
namespace config {

using namespace base::constants;

namespace {

std::function<ValidationResult(const std::any&)> int_range(const std::string& key, int64_t min, int64_t max) {
  return [key, min, max](const std::any& value) {
    const int v = std::any_cast<int>(value);
    if (v < min || v > max) {
      return ValidationResult::error(key + " must be in [" + std::to_string(min) + ", " + std::to_string(max) + "]");
    }
    return ValidationResult::success();
  };
}

void register_int(ConfigManager& config, const std::string& key, int value, const std::string& description,
                  int64_t min, int64_t max) {
  ConfigItem item(key, value, ConfigType::Integer, false, description);
  item.validator = int_range(key, min, max);
  config.register_item(item);
}

std::vector<std::string> split_patterns(const std::string& value) {
  std::vector<std::string> patterns;
  std::stringstream ss(value);
  std::string token;
  while (std::getline(ss, token, ',')) {
    const auto first = token.find_first_not_of(" \t");
    if (first == std::string::npos) continue;
    const auto last = token.find_last_not_of(" \t");
    patterns.push_back(token.substr(first, last - first + 1));
  }
  return patterns;
}

}  // namespace

std::shared_ptr<ConfigManager> ConfigFactory::create() { return std::make_shared<ConfigManager>(); }

std::shared_ptr<ConfigManager> ConfigFactory::create_with_defaults() {
  auto config = create();
  ConfigPresets::setup_all_defaults(*config);
  return config;
}

std::shared_ptr<ConfigManager> ConfigFactory::create_from_file(const std::string& filepath) {
  auto config = create_with_defaults();
  auto result = config->load_from_file(filepath);
  if (!result.is_valid) {
    diagnostics::error_reporting::report_configuration_error("config", "load", result.error_message);
    throw diagnostics::ConfigurationException(result.error_message, "", "load_from_file");
  }
  MODEMLINK_LOG_INFO("config", "load", "Loaded configuration from " + filepath);
  return config;
}

ChannelConfig ConfigFactory::build_channel_config(const ConfigManager& config) {
  ChannelConfig channel;
  channel.baud_rate = static_cast<unsigned>(config.get_int("serial.baud_rate"));
  channel.read_chunk = static_cast<size_t>(config.get_int("serial.read_chunk"));
  channel.command_timeout_ms = static_cast<unsigned>(config.get_int("serial.command_timeout_ms"));
  channel.sms_timeout_ms = static_cast<unsigned>(config.get_int("serial.sms_timeout_ms"));
  channel.verify_timeout_ms = static_cast<unsigned>(config.get_int("serial.verify_timeout_ms"));
  channel.read_error_backoff_ms = static_cast<unsigned>(config.get_int("serial.read_error_backoff_ms"));
  channel.sms_mode = config.get_string("sms.mode") == "text" ? SmsMode::Text : SmsMode::Pdu;
  return channel;
}

PoolConfig ConfigFactory::build_pool_config(const ConfigManager& config) {
  PoolConfig pool;
  pool.device_patterns = split_patterns(config.get_string("pool.device_patterns"));
  pool.channel = build_channel_config(config);
  pool.io_threads = static_cast<size_t>(config.get_int("pool.io_threads"));
  pool.subscriber_buffer = static_cast<size_t>(config.get_int("events.buffer_size"));
  if (!pool.is_valid()) {
    throw diagnostics::ConfigurationException("pool configuration is invalid", "pool", "build_pool_config");
  }
  return pool;
}

void ConfigFactory::apply_logging(const ConfigManager& config) {
  diagnostics::LogLevel level = diagnostics::LogLevel::INFO;
  if (diagnostics::parse_log_level(config.get_string("log.level"), level)) {
    diagnostics::Logger::instance().set_level(level);
  }
  diagnostics::Logger::instance().set_file_output(config.get_string("log.file"));
}

void ConfigPresets::setup_serial_defaults(ConfigManager& config) {
  register_int(config, "serial.baud_rate", static_cast<int>(DEFAULT_BAUD_RATE), "Serial line speed", MIN_BAUD_RATE,
               MAX_BAUD_RATE);
  register_int(config, "serial.read_chunk", static_cast<int>(DEFAULT_READ_CHUNK), "Bytes requested per read",
               static_cast<int64_t>(MIN_READ_CHUNK), static_cast<int64_t>(MAX_READ_CHUNK));
  register_int(config, "serial.command_timeout_ms", static_cast<int>(DEFAULT_COMMAND_TIMEOUT_MS),
               "Deadline for ordinary AT commands", MIN_TIMEOUT_MS, MAX_TIMEOUT_MS);
  register_int(config, "serial.sms_timeout_ms", static_cast<int>(DEFAULT_SMS_TIMEOUT_MS),
               "Deadline for SMS submission", MIN_TIMEOUT_MS, MAX_TIMEOUT_MS);
  register_int(config, "serial.verify_timeout_ms", static_cast<int>(DEFAULT_VERIFY_TIMEOUT_MS),
               "Deadline for the AT liveness check on open", MIN_TIMEOUT_MS, MAX_TIMEOUT_MS);
  register_int(config, "serial.read_error_backoff_ms", static_cast<int>(DEFAULT_READ_BACKOFF_MS),
               "Listener pause after a read error", MIN_TIMEOUT_MS, MAX_TIMEOUT_MS);
}

void ConfigPresets::setup_sms_defaults(ConfigManager& config) {
  ConfigItem item("sms.mode", std::string("pdu"), ConfigType::String, false, "SMS mode: pdu or text");
  item.validator = [](const std::any& value) {
    const auto& mode = std::any_cast<const std::string&>(value);
    if (mode != "pdu" && mode != "text") return ValidationResult::error("sms.mode must be 'pdu' or 'text'");
    return ValidationResult::success();
  };
  config.register_item(item);
}

void ConfigPresets::setup_pool_defaults(ConfigManager& config) {
  ConfigItem patterns("pool.device_patterns", std::string("/dev/ttyUSB*,/dev/ttyACM*"), ConfigType::String, false,
                      "Comma-separated glob patterns for device discovery");
  patterns.validator = [](const std::any& value) {
    if (split_patterns(std::any_cast<const std::string&>(value)).empty()) {
      return ValidationResult::error("pool.device_patterns needs at least one pattern");
    }
    return ValidationResult::success();
  };
  config.register_item(patterns);

  register_int(config, "pool.io_threads", static_cast<int>(DEFAULT_IO_THREADS), "I/O worker threads", 1,
               static_cast<int64_t>(MAX_IO_THREADS));
}

void ConfigPresets::setup_event_defaults(ConfigManager& config) {
  register_int(config, "events.buffer_size", static_cast<int>(DEFAULT_SUBSCRIBER_BUFFER),
               "Default per-subscriber queue capacity", 1, static_cast<int64_t>(MAX_SUBSCRIBER_BUFFER));
}

void ConfigPresets::setup_logging_defaults(ConfigManager& config) {
  ConfigItem level("log.level", std::string("info"), ConfigType::String, false,
                   "debug, info, warning, error or critical");
  level.validator = [](const std::any& value) {
    diagnostics::LogLevel parsed;
    if (!diagnostics::parse_log_level(std::any_cast<const std::string&>(value), parsed)) {
      return ValidationResult::error("log.level is not a known level");
    }
    return ValidationResult::success();
  };
  config.register_item(level);
  config.register_item(ConfigItem("log.file", std::string(), ConfigType::String, false, "Log file path, empty for none"));
}

void ConfigPresets::setup_all_defaults(ConfigManager& config) {
  setup_serial_defaults(config);
  setup_sms_defaults(config);
  setup_pool_defaults(config);
  setup_event_defaults(config);
  setup_logging_defaults(config);
}

}  // namespace config
}  // namespace modemlink
