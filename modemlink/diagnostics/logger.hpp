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
#include <memory>
#include <string>
#include <string_view>

#include "modemlink/base/visibility.hpp"

#ifdef DEBUG
#undef DEBUG
#endif
#ifdef INFO
#undef INFO
#endif
#ifdef WARNING
#undef WARNING
#endif
#ifdef ERROR
#undef ERROR
#endif
#ifdef CRITICAL
#undef CRITICAL
#endif
#ifdef CALLBACK
#undef CALLBACK
#endif

namespace modemlink {
namespace diagnostics {

/**
 * @brief Log severity levels
 */
enum class LogLevel { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

/**
 * @brief Log output destinations
 */
enum class LogOutput { CONSOLE = 0x01, FILE = 0x02, CALLBACK = 0x04 };

/**
 * @brief Parse a level name ("debug", "info", "warning", "error", "critical")
 * @return false if the name is not recognized; level is left untouched
 */
MODEMLINK_API bool parse_log_level(std::string_view name, LogLevel& level);

/**
 * @brief Process-wide logging sink
 *
 * Thread-safe; every modemlink component writes through the
 * MODEMLINK_LOG_* macros with a component tag and an operation name.
 */
class MODEMLINK_API Logger {
 public:
  using LogCallback = std::function<void(LogLevel level, const std::string& formatted_message)>;

  static Logger& instance();

  Logger();
  ~Logger();

  /**
   * @brief Set minimum log level
   * @param level Messages below this level will be ignored
   */
  void set_level(LogLevel level);
  LogLevel get_level() const;

  void set_console_output(bool enable);

  /**
   * @brief Set file output
   * @param filename Log file path (empty string to disable file output)
   */
  void set_file_output(const std::string& filename);

  /**
   * @brief Set log callback
   * @param callback Function to call for each log message (nullptr to clear)
   */
  void set_callback(LogCallback callback);

  /**
   * @brief Set output destinations
   * @param outputs Bitwise OR of LogOutput flags
   */
  void set_outputs(int outputs);
  int get_outputs() const;

  void set_enabled(bool enabled);
  bool is_enabled() const;

  /**
   * @brief Set log format
   * @param format Format string with placeholders: {timestamp}, {level}, {component}, {operation}, {message}
   */
  void set_format(const std::string& format);

  void flush();

  void log(LogLevel level, std::string_view component, std::string_view operation, std::string_view message);

  void debug(std::string_view component, std::string_view operation, std::string_view message);
  void info(std::string_view component, std::string_view operation, std::string_view message);
  void warning(std::string_view component, std::string_view operation, std::string_view message);
  void error(std::string_view component, std::string_view operation, std::string_view message);
  void critical(std::string_view component, std::string_view operation, std::string_view message);

 private:
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  struct Impl;
  std::unique_ptr<Impl> impl_;
};

#define MODEMLINK_LOG_AT(lvl, fn, component, operation, message)                                             \
  do {                                                                                                        \
    if (modemlink::diagnostics::Logger::instance().get_level() <= modemlink::diagnostics::LogLevel::lvl) {   \
      modemlink::diagnostics::Logger::instance().fn(component, operation, message);                          \
    }                                                                                                         \
  } while (0)

#define MODEMLINK_LOG_DEBUG(component, operation, message) \
  MODEMLINK_LOG_AT(DEBUG, debug, component, operation, message)
#define MODEMLINK_LOG_INFO(component, operation, message) MODEMLINK_LOG_AT(INFO, info, component, operation, message)
#define MODEMLINK_LOG_WARNING(component, operation, message) \
  MODEMLINK_LOG_AT(WARNING, warning, component, operation, message)
#define MODEMLINK_LOG_ERROR(component, operation, message) \
  MODEMLINK_LOG_AT(ERROR, error, component, operation, message)
#define MODEMLINK_LOG_CRITICAL(component, operation, message) \
  MODEMLINK_LOG_AT(CRITICAL, critical, component, operation, message)

}  // namespace diagnostics
}  // namespace modemlink
