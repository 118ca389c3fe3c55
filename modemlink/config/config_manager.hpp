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

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "modemlink/base/visibility.hpp"
#include "modemlink/config/iconfig_manager.hpp"

namespace modemlink {
namespace config {

/**
 * Thread-safe configuration manager implementation
 *
 * Values are typed by their registered item. Files use one `key=value` pair
 * per line; `#` starts a comment line. Loading a file converts each value to
 * the registered type of its key and runs the key's validator, so a bad
 * value is rejected with the line it came from.
 */
class MODEMLINK_API ConfigManager : public ConfigManagerInterface {
 public:
  ConfigManager() = default;
  ~ConfigManager() override = default;

  std::any get(const std::string& key) const override;
  std::any get(const std::string& key, const std::any& default_value) const override;
  bool has(const std::string& key) const override;

  ValidationResult set(const std::string& key, const std::any& value) override;
  bool remove(const std::string& key) override;
  void clear() override;

  ValidationResult validate() const override;
  ValidationResult validate(const std::string& key) const override;

  void register_item(const ConfigItem& item) override;
  void register_validator(const std::string& key, std::function<ValidationResult(const std::any&)> validator) override;

  void on_change(const std::string& key, ConfigChangeCallback callback) override;
  void remove_change_callback(const std::string& key) override;

  bool save_to_file(const std::string& filepath) const override;
  ValidationResult load_from_file(const std::string& filepath) override;

  std::vector<std::string> get_keys() const override;
  ConfigType get_type(const std::string& key) const override;
  std::string get_description(const std::string& key) const override;
  bool is_required(const std::string& key) const override;

  // Typed accessors; throw ConfigurationException on missing key or type mismatch
  std::string get_string(const std::string& key) const;
  int get_int(const std::string& key) const;
  bool get_bool(const std::string& key) const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, ConfigItem> config_items_;
  std::unordered_map<std::string, ConfigChangeCallback> change_callbacks_;

  ValidationResult validate_value(const std::string& key, const std::any& value) const;
  std::string serialize_value(const std::any& value, ConfigType type) const;
  bool deserialize_value(const std::string& value_str, ConfigType type, std::any& out) const;
};

}  // namespace config
}  // namespace modemlink
