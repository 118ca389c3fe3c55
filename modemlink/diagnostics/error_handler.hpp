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

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "modemlink/base/visibility.hpp"
#include "modemlink/diagnostics/error_types.hpp"

namespace modemlink {
namespace diagnostics {

/**
 * @brief Centralized error reporting
 *
 * Collects every failure the engine surfaces (including the ones that are
 * degraded instead of propagated) so operators can see per-component counts
 * and recent history. Callbacks run outside the internal lock.
 */
class MODEMLINK_API ErrorHandler {
 public:
  using ErrorCallback = std::function<void(const ErrorInfo&)>;

  static ErrorHandler& instance();

  ErrorHandler();
  ~ErrorHandler();

  void report_error(const ErrorInfo& error);

  void register_callback(ErrorCallback callback);
  void clear_callbacks();

  /**
   * @brief Set minimum error level to report
   * @param level Errors below this level are ignored
   */
  void set_min_error_level(ErrorLevel level);
  ErrorLevel get_min_error_level() const;

  void set_enabled(bool enabled);
  bool is_enabled() const;

  ErrorStats get_error_stats() const;

  /**
   * @brief Reset statistics and forget recorded errors
   */
  void reset_stats();

  std::vector<ErrorInfo> get_errors_by_component(const std::string& component) const;

  /**
   * @brief Get recent errors
   * @param count Maximum number of recent errors to return (newest last)
   */
  std::vector<ErrorInfo> get_recent_errors(size_t count = 10) const;

  bool has_errors(const std::string& component) const;
  size_t get_error_count(const std::string& component, ErrorLevel level) const;

 private:
  ErrorHandler(const ErrorHandler&) = delete;
  ErrorHandler& operator=(const ErrorHandler&) = delete;

  mutable std::mutex mutex_;
  std::vector<ErrorCallback> callbacks_;
  std::atomic<ErrorLevel> min_level_{ErrorLevel::INFO};
  std::atomic<bool> enabled_{true};

  ErrorStats stats_;
  std::vector<ErrorInfo> recent_errors_;
  std::unordered_map<std::string, std::vector<ErrorInfo>> errors_by_component_;

  static constexpr size_t MAX_RECENT_ERRORS = 1000;
  static constexpr size_t MAX_ERRORS_PER_COMPONENT = 200;

  void update_stats(const ErrorInfo& error);
  void notify_callbacks(const std::vector<ErrorCallback>& callbacks, const ErrorInfo& error);
};

/**
 * @brief Convenience functions for the failure kinds the engine produces
 */
namespace error_reporting {

MODEMLINK_API void report_transport_error(const std::string& component, const std::string& operation,
                                          const std::string& device, const boost::system::error_code& ec,
                                          bool retryable = false);

MODEMLINK_API void report_timeout(const std::string& component, const std::string& operation,
                                  const std::string& device, const std::string& command);

/**
 * @param raw_response Device reply that carried the error token, kept as context
 */
MODEMLINK_API void report_protocol_error(const std::string& component, const std::string& operation,
                                         const std::string& device, const std::string& message,
                                         const std::string& raw_response);

MODEMLINK_API void report_codec_error(const std::string& component, const std::string& operation,
                                      const std::string& message, const std::string& payload);

MODEMLINK_API void report_registry_error(const std::string& component, const std::string& operation,
                                         const std::string& message);

MODEMLINK_API void report_configuration_error(const std::string& component, const std::string& operation,
                                              const std::string& message);

MODEMLINK_API void report_system_error(const std::string& component, const std::string& operation,
                                       const std::string& message);

MODEMLINK_API void report_warning(const std::string& component, const std::string& operation,
                                  const std::string& message);

}  // namespace error_reporting

}  // namespace diagnostics
}  // namespace modemlink
