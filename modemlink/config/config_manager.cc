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

#include "modemlink/config/config_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include "modemlink/diagnostics/exceptions.hpp"
#include "modemlink/diagnostics/logger.hpp"

namespace modemlink {
namespace config {

namespace {

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r");
  if (first == std::string::npos) return "";
  const auto last = s.find_last_not_of(" \t\r");
  return s.substr(first, last - first + 1);
}

ConfigType type_of(const std::any& value) {
  if (value.type() == typeid(int)) return ConfigType::Integer;
  if (value.type() == typeid(bool)) return ConfigType::Boolean;
  if (value.type() == typeid(double)) return ConfigType::Double;
  return ConfigType::String;
}

}  // namespace

std::any ConfigManager::get(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it == config_items_.end()) {
    throw diagnostics::ConfigurationException("configuration key not found", key, "get");
  }
  return it->second.value;
}

std::any ConfigManager::get(const std::string& key, const std::any& default_value) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it != config_items_.end()) return it->second.value;
  return default_value;
}

bool ConfigManager::has(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_items_.find(key) != config_items_.end();
}

ValidationResult ConfigManager::set(const std::string& key, const std::any& value) {
  ConfigChangeCallback callback;
  std::any old_value;
  {
    std::lock_guard<std::mutex> lock(mutex_);

    auto result = validate_value(key, value);
    if (!result.is_valid) return result;

    auto it = config_items_.find(key);
    if (it != config_items_.end()) {
      old_value = it->second.value;
      it->second.value = value;
      auto cb = change_callbacks_.find(key);
      if (cb != change_callbacks_.end()) callback = cb->second;
    } else {
      config_items_[key] = ConfigItem(key, value, type_of(value), false);
    }
  }

  if (callback) {
    try {
      callback(key, old_value, value);
    } catch (const std::exception& e) {
      MODEMLINK_LOG_ERROR("config", "on_change", "Error in change callback for '" + key + "': " + e.what());
    }
  }
  return ValidationResult::success();
}

bool ConfigManager::remove(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_items_.erase(key) > 0;
}

void ConfigManager::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  config_items_.clear();
}

ValidationResult ConfigManager::validate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [key, item] : config_items_) {
    if (item.required && !item.value.has_value()) {
      return ValidationResult::error("Required configuration key missing: " + key);
    }
    auto result = validate_value(key, item.value);
    if (!result.is_valid) return result;
  }
  return ValidationResult::success();
}

ValidationResult ConfigManager::validate(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it == config_items_.end()) {
    return ValidationResult::error("Configuration key not found: " + key);
  }
  return validate_value(key, it->second.value);
}

void ConfigManager::register_item(const ConfigItem& item) {
  std::lock_guard<std::mutex> lock(mutex_);
  config_items_[item.key] = item;
}

void ConfigManager::register_validator(const std::string& key,
                                       std::function<ValidationResult(const std::any&)> validator) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it != config_items_.end()) it->second.validator = std::move(validator);
}

void ConfigManager::on_change(const std::string& key, ConfigChangeCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  change_callbacks_[key] = std::move(callback);
}

void ConfigManager::remove_change_callback(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  change_callbacks_.erase(key);
}

bool ConfigManager::save_to_file(const std::string& filepath) const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::ofstream file(filepath);
  if (!file.is_open()) {
    MODEMLINK_LOG_ERROR("config", "save", "Cannot open configuration file for writing: " + filepath);
    return false;
  }

  std::vector<std::string> keys;
  keys.reserve(config_items_.size());
  for (const auto& entry : config_items_) keys.push_back(entry.first);
  std::sort(keys.begin(), keys.end());

  file << "# modemlink configuration\n\n";
  for (const auto& key : keys) {
    const auto& item = config_items_.at(key);
    if (!item.description.empty()) file << "# " << item.description << "\n";
    file << key << "=" << serialize_value(item.value, item.type) << "\n";
  }
  return static_cast<bool>(file);
}

ValidationResult ConfigManager::load_from_file(const std::string& filepath) {
  std::ifstream file(filepath);
  if (!file.is_open()) {
    return ValidationResult::error("Cannot open configuration file: " + filepath);
  }

  std::string line;
  size_t line_no = 0;
  while (std::getline(file, line)) {
    ++line_no;
    line = trim(line);
    if (line.empty() || line[0] == '#') continue;

    const auto pos = line.find('=');
    if (pos == std::string::npos) {
      return ValidationResult::error(filepath + ":" + std::to_string(line_no) + ": expected key=value");
    }

    const std::string key = trim(line.substr(0, pos));
    const std::string value_str = trim(line.substr(pos + 1));

    ConfigType type = ConfigType::String;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = config_items_.find(key);
      if (it != config_items_.end()) type = it->second.type;
    }

    std::any value;
    if (!deserialize_value(value_str, type, value)) {
      return ValidationResult::error(filepath + ":" + std::to_string(line_no) + ": invalid value for '" + key + "'");
    }

    auto result = set(key, value);
    if (!result.is_valid) {
      return ValidationResult::error(filepath + ":" + std::to_string(line_no) + ": " + result.error_message);
    }
  }

  return ValidationResult::success();
}

std::vector<std::string> ConfigManager::get_keys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> keys;
  keys.reserve(config_items_.size());
  for (const auto& entry : config_items_) keys.push_back(entry.first);
  return keys;
}

ConfigType ConfigManager::get_type(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it == config_items_.end()) {
    throw diagnostics::ConfigurationException("configuration key not found", key, "get_type");
  }
  return it->second.type;
}

std::string ConfigManager::get_description(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  return it != config_items_.end() ? it->second.description : "";
}

bool ConfigManager::is_required(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  return it != config_items_.end() && it->second.required;
}

std::string ConfigManager::get_string(const std::string& key) const {
  try {
    return std::any_cast<std::string>(get(key));
  } catch (const std::bad_any_cast&) {
    throw diagnostics::ConfigurationException("configuration value is not a string", key, "get_string");
  }
}

int ConfigManager::get_int(const std::string& key) const {
  try {
    return std::any_cast<int>(get(key));
  } catch (const std::bad_any_cast&) {
    throw diagnostics::ConfigurationException("configuration value is not an integer", key, "get_int");
  }
}

bool ConfigManager::get_bool(const std::string& key) const {
  try {
    return std::any_cast<bool>(get(key));
  } catch (const std::bad_any_cast&) {
    throw diagnostics::ConfigurationException("configuration value is not a boolean", key, "get_bool");
  }
}

ValidationResult ConfigManager::validate_value(const std::string& key, const std::any& value) const {
  auto it = config_items_.find(key);
  if (it == config_items_.end()) return ValidationResult::success();

  if (it->second.value.has_value() && type_of(value) != it->second.type) {
    return ValidationResult::error("Type mismatch for key '" + key + "'");
  }
  if (it->second.validator) return it->second.validator(value);
  return ValidationResult::success();
}

std::string ConfigManager::serialize_value(const std::any& value, ConfigType type) const {
  try {
    switch (type) {
      case ConfigType::String:
        return std::any_cast<std::string>(value);
      case ConfigType::Integer:
        return std::to_string(std::any_cast<int>(value));
      case ConfigType::Boolean:
        return std::any_cast<bool>(value) ? "true" : "false";
      case ConfigType::Double:
        return std::to_string(std::any_cast<double>(value));
    }
  } catch (const std::bad_any_cast&) {
    MODEMLINK_LOG_WARNING("config", "save", "Value does not match its registered type");
  }
  return "";
}

bool ConfigManager::deserialize_value(const std::string& value_str, ConfigType type, std::any& out) const {
  try {
    switch (type) {
      case ConfigType::String:
        out = value_str;
        return true;
      case ConfigType::Integer: {
        size_t consumed = 0;
        const int v = std::stoi(value_str, &consumed);
        if (consumed != value_str.size()) return false;
        out = v;
        return true;
      }
      case ConfigType::Boolean:
        if (value_str == "true" || value_str == "1") {
          out = true;
        } else if (value_str == "false" || value_str == "0") {
          out = false;
        } else {
          return false;
        }
        return true;
      case ConfigType::Double: {
        size_t consumed = 0;
        const double v = std::stod(value_str, &consumed);
        if (consumed != value_str.size()) return false;
        out = v;
        return true;
      }
    }
  } catch (const std::exception&) {
    return false;
  }
  return false;
}

}  // namespace config
}  // namespace modemlink
