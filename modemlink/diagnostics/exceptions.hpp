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

#include <stdexcept>
#include <string>

#include "modemlink/base/error_codes.hpp"

namespace modemlink {
namespace diagnostics {

/**
 * @brief Base exception class for all modemlink exceptions
 *
 * Carries the component and operation that failed and the structured
 * ErrorCode callers switch on.
 */
class ModemException : public std::runtime_error {
 public:
  explicit ModemException(const std::string& message, ErrorCode code = ErrorCode::Unknown,
                          const std::string& component = "", const std::string& operation = "")
      : std::runtime_error(message), code_(code), component_(component), operation_(operation) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& get_component() const noexcept { return component_; }
  const std::string& get_operation() const noexcept { return operation_; }

  virtual std::string get_full_message() const {
    std::string full_msg = to_string(code_) + ": " + what();
    if (!component_.empty()) full_msg = "[" + component_ + "] " + full_msg;
    if (!operation_.empty()) full_msg += " (operation: " + operation_ + ")";
    return full_msg;
  }

 private:
  ErrorCode code_;
  std::string component_;
  std::string operation_;
};

/**
 * @brief Serial link open/read/write failure; fatal to the channel
 */
class TransportException : public ModemException {
 public:
  explicit TransportException(const std::string& message, const std::string& device = "",
                              const std::string& operation = "")
      : ModemException(message, ErrorCode::TransportError, "transport", operation), device_(device) {}

  const std::string& get_device() const noexcept { return device_; }

  std::string get_full_message() const override {
    std::string full_msg = ModemException::get_full_message();
    if (!device_.empty()) full_msg += " (device: " + device_ + ")";
    return full_msg;
  }

 private:
  std::string device_;
};

/**
 * @brief No terminal token before the exchange deadline; recoverable per call
 */
class CommandTimeoutException : public ModemException {
 public:
  explicit CommandTimeoutException(const std::string& command, unsigned timeout_ms = 0,
                                   const std::string& device = "")
      : ModemException("command timeout: " + command, ErrorCode::TimedOut, "channel", "exchange"),
        command_(command),
        timeout_ms_(timeout_ms),
        device_(device) {}

  const std::string& get_command() const noexcept { return command_; }
  unsigned get_timeout_ms() const noexcept { return timeout_ms_; }
  const std::string& get_device() const noexcept { return device_; }

  std::string get_full_message() const override {
    std::string full_msg = ModemException::get_full_message();
    if (timeout_ms_ > 0) full_msg += " (after " + std::to_string(timeout_ms_) + " ms)";
    if (!device_.empty()) full_msg += " (device: " + device_ + ")";
    return full_msg;
  }

 private:
  std::string command_;
  unsigned timeout_ms_;
  std::string device_;
};

/**
 * @brief Device answered with an error token, or the reply could not be parsed
 */
class ProtocolException : public ModemException {
 public:
  explicit ProtocolException(const std::string& message, const std::string& raw_response = "",
                             const std::string& operation = "")
      : ModemException(message, ErrorCode::ProtocolError, "session", operation), raw_response_(raw_response) {}

  const std::string& get_raw_response() const noexcept { return raw_response_; }

  std::string get_full_message() const override {
    std::string full_msg = ModemException::get_full_message();
    if (!raw_response_.empty()) full_msg += " (response: " + raw_response_ + ")";
    return full_msg;
  }

 private:
  std::string raw_response_;
};

/**
 * @brief Malformed PDU or hex payload, or text that cannot be encoded
 */
class CodecException : public ModemException {
 public:
  explicit CodecException(const std::string& message, const std::string& operation = "")
      : ModemException(message, ErrorCode::CodecError, "codec", operation) {}
};

class NotConnectedException : public ModemException {
 public:
  explicit NotConnectedException(const std::string& identifier)
      : ModemException("port not connected: " + identifier, ErrorCode::NotConnected, "pool", "get"),
        identifier_(identifier) {}

  const std::string& get_identifier() const noexcept { return identifier_; }

 private:
  std::string identifier_;
};

/**
 * @brief Input parameters failed validation checks
 */
class ValidationException : public ModemException {
 public:
  explicit ValidationException(const std::string& message, const std::string& parameter = "",
                               const std::string& expected = "")
      : ModemException(message, ErrorCode::InvalidArgument, "validation", "validate"),
        parameter_(parameter),
        expected_(expected) {}

  const std::string& get_parameter() const noexcept { return parameter_; }
  const std::string& get_expected() const noexcept { return expected_; }

  std::string get_full_message() const override {
    std::string full_msg = ModemException::get_full_message();
    if (!parameter_.empty()) full_msg += " (parameter: " + parameter_ + ")";
    if (!expected_.empty()) full_msg += " (expected: " + expected_ + ")";
    return full_msg;
  }

 private:
  std::string parameter_;
  std::string expected_;
};

class ConfigurationException : public ModemException {
 public:
  explicit ConfigurationException(const std::string& message, const std::string& config_key = "",
                                  const std::string& operation = "")
      : ModemException(message, ErrorCode::InvalidConfiguration, "configuration", operation),
        config_key_(config_key) {}

  const std::string& get_config_key() const noexcept { return config_key_; }

  std::string get_full_message() const override {
    std::string full_msg = ModemException::get_full_message();
    if (!config_key_.empty()) full_msg += " (key: " + config_key_ + ")";
    return full_msg;
  }

 private:
  std::string config_key_;
};

}  // namespace diagnostics
}  // namespace modemlink
