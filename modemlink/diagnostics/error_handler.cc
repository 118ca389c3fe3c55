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

#include "modemlink/diagnostics/error_handler.hpp"

#include <algorithm>

#include "modemlink/diagnostics/error_mapping.hpp"
#include "modemlink/diagnostics/logger.hpp"

namespace modemlink {
namespace diagnostics {

namespace {

template <typename T>
void trim_front(std::vector<T>& items, size_t limit) {
  if (items.size() > limit) {
    items.erase(items.begin(), items.begin() + static_cast<std::ptrdiff_t>(items.size() - limit));
  }
}

}  // namespace

ErrorHandler::ErrorHandler() = default;
ErrorHandler::~ErrorHandler() = default;

ErrorHandler& ErrorHandler::instance() {
  static ErrorHandler instance;
  return instance;
}

void ErrorHandler::report_error(const ErrorInfo& error) {
  if (!enabled_.load()) return;
  if (error.level < min_level_.load()) return;

  std::vector<ErrorCallback> callbacks_copy;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    update_stats(error);

    recent_errors_.push_back(error);
    trim_front(recent_errors_, MAX_RECENT_ERRORS);

    auto& component_errors = errors_by_component_[error.component];
    component_errors.push_back(error);
    trim_front(component_errors, MAX_ERRORS_PER_COMPONENT);

    callbacks_copy = callbacks_;
  }
  notify_callbacks(callbacks_copy, error);
}

void ErrorHandler::register_callback(ErrorCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

void ErrorHandler::clear_callbacks() {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.clear();
}

void ErrorHandler::set_min_error_level(ErrorLevel level) { min_level_.store(level); }

ErrorLevel ErrorHandler::get_min_error_level() const { return min_level_.load(); }

void ErrorHandler::set_enabled(bool enabled) { enabled_.store(enabled); }

bool ErrorHandler::is_enabled() const { return enabled_.load(); }

ErrorStats ErrorHandler::get_error_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void ErrorHandler::reset_stats() {
  std::lock_guard<std::mutex> lock(mutex_);
  stats_.reset();
  recent_errors_.clear();
  errors_by_component_.clear();
}

std::vector<ErrorInfo> ErrorHandler::get_errors_by_component(const std::string& component) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = errors_by_component_.find(component);
  if (it != errors_by_component_.end()) return it->second;
  return {};
}

std::vector<ErrorInfo> ErrorHandler::get_recent_errors(size_t count) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const size_t start = recent_errors_.size() > count ? recent_errors_.size() - count : 0;
  return std::vector<ErrorInfo>(recent_errors_.begin() + static_cast<std::ptrdiff_t>(start), recent_errors_.end());
}

bool ErrorHandler::has_errors(const std::string& component) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = errors_by_component_.find(component);
  return it != errors_by_component_.end() && !it->second.empty();
}

size_t ErrorHandler::get_error_count(const std::string& component, ErrorLevel level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = errors_by_component_.find(component);
  if (it == errors_by_component_.end()) return 0;
  return static_cast<size_t>(std::count_if(it->second.begin(), it->second.end(),
                                           [level](const ErrorInfo& error) { return error.level == level; }));
}

void ErrorHandler::update_stats(const ErrorInfo& error) {
  stats_.total_errors++;
  stats_.errors_by_level[static_cast<size_t>(error.level)]++;
  stats_.errors_by_category[static_cast<size_t>(error.category)]++;
  if (error.retryable) stats_.retryable_errors++;

  if (stats_.first_error == std::chrono::system_clock::time_point{}) stats_.first_error = error.timestamp;
  stats_.last_error = error.timestamp;
}

void ErrorHandler::notify_callbacks(const std::vector<ErrorCallback>& callbacks, const ErrorInfo& error) {
  for (const auto& callback : callbacks) {
    try {
      callback(error);
    } catch (const std::exception& e) {
      // Logger directly, reporting here would recurse
      MODEMLINK_LOG_ERROR("error_handler", "callback", "Error in error callback: " + std::string(e.what()));
    }
  }
}

namespace error_reporting {

void report_transport_error(const std::string& component, const std::string& operation, const std::string& device,
                            const boost::system::error_code& ec, bool retryable) {
  const std::string message = to_string(to_error_code(ec)) + ": " + ec.message();
  ErrorInfo error(ErrorLevel::ERROR, ErrorCategory::TRANSPORT, component, operation, message, ec, retryable);
  error.context = device;
  ErrorHandler::instance().report_error(error);
}

void report_timeout(const std::string& component, const std::string& operation, const std::string& device,
                    const std::string& command) {
  ErrorInfo error(ErrorLevel::WARNING, ErrorCategory::COMMAND, component, operation,
                  "command timeout: " + command);
  error.context = device;
  error.retryable = true;
  ErrorHandler::instance().report_error(error);
}

void report_protocol_error(const std::string& component, const std::string& operation, const std::string& device,
                           const std::string& message, const std::string& raw_response) {
  ErrorInfo error(ErrorLevel::ERROR, ErrorCategory::PROTOCOL, component, operation, message);
  error.context = device + ": " + raw_response;
  ErrorHandler::instance().report_error(error);
}

void report_codec_error(const std::string& component, const std::string& operation, const std::string& message,
                        const std::string& payload) {
  ErrorInfo error(ErrorLevel::WARNING, ErrorCategory::CODEC, component, operation, message);
  error.context = payload;
  ErrorHandler::instance().report_error(error);
}

void report_registry_error(const std::string& component, const std::string& operation, const std::string& message) {
  ErrorInfo error(ErrorLevel::WARNING, ErrorCategory::REGISTRY, component, operation, message);
  ErrorHandler::instance().report_error(error);
}

void report_configuration_error(const std::string& component, const std::string& operation,
                                const std::string& message) {
  ErrorInfo error(ErrorLevel::ERROR, ErrorCategory::CONFIGURATION, component, operation, message);
  ErrorHandler::instance().report_error(error);
}

void report_system_error(const std::string& component, const std::string& operation, const std::string& message) {
  ErrorInfo error(ErrorLevel::ERROR, ErrorCategory::SYSTEM, component, operation, message);
  ErrorHandler::instance().report_error(error);
}

void report_warning(const std::string& component, const std::string& operation, const std::string& message) {
  ErrorInfo error(ErrorLevel::WARNING, ErrorCategory::SYSTEM, component, operation, message);
  ErrorHandler::instance().report_error(error);
}

}  // namespace error_reporting

}  // namespace diagnostics
}  // namespace modemlink
