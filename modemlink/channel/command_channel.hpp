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

#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "modemlink/base/channel_state.hpp"
#include "modemlink/base/visibility.hpp"
#include "modemlink/concurrency/atomic_state.hpp"
#include "modemlink/config/channel_config.hpp"
#include "modemlink/interface/iserial_port.hpp"

namespace modemlink {
namespace channel {

namespace net = boost::asio;

enum class ExchangeOutcome { Success, Timeout, TransportError };

inline const char* to_cstr(ExchangeOutcome outcome) {
  switch (outcome) {
    case ExchangeOutcome::Success:
      return "success";
    case ExchangeOutcome::Timeout:
      return "timeout";
    case ExchangeOutcome::TransportError:
      return "transport error";
  }
  return "?";
}

/**
 * Result of one command/response round trip
 */
struct CommandExchange {
  std::string command;
  std::string response;  // raw accumulated bytes
  std::chrono::milliseconds elapsed{0};
  ExchangeOutcome outcome = ExchangeOutcome::Success;
  std::string error;

  bool ok() const { return outcome == ExchangeOutcome::Success; }
};

/**
 * @brief Whether accumulated modem output ends the current exchange
 *
 * Terminal lines: exactly `OK`, anything containing `ERROR`, or a `>`
 * prompt. The trailing unterminated line is checked too, since the SMS
 * prompt arrives without a newline.
 */
MODEMLINK_API bool has_terminal_token(std::string_view buffer);

/**
 * @brief Owns one serial link to a modem and serializes AT exchanges on it
 *
 * Every port operation runs on the channel's strand. A single read loop
 * stays armed while the port is open: bytes arriving during an exchange
 * belong to that exchange, otherwise they go to the OnBytes callback once
 * the channel is Active. Callers of exchange() queue on a mutex, so one
 * command is in flight at a time.
 */
class MODEMLINK_API CommandChannel : public std::enable_shared_from_this<CommandChannel> {
 public:
  using OnBytes = std::function<void(const std::string& device, const std::string& chunk)>;
  using OnState = std::function<void(base::ChannelState state)>;

  static std::shared_ptr<CommandChannel> create(const config::ChannelConfig& cfg, net::io_context& ioc);
  // Dependency injection for tests
  static std::shared_ptr<CommandChannel> create(const config::ChannelConfig& cfg,
                                                std::unique_ptr<interface::SerialPortInterface> port,
                                                net::io_context& ioc);
  ~CommandChannel();

  /**
   * @brief Open and configure the port, then check the device answers `AT`
   * @throws TransportException on open/configure failure or a silent device; state becomes Failed
   */
  void open();

  /**
   * @brief Echo off and SMS mode selection; failures are logged, not thrown
   */
  void initialize();

  /**
   * @brief Enter Active: unsolicited bytes are handed to the OnBytes callback
   */
  void start_listening();

  /**
   * @brief Release the port; a pending exchange fails and later ones are rejected
   */
  void close();

  /**
   * @brief Write payload + terminator and collect the reply until a terminal token or the deadline
   *
   * Never throws; the outcome field tells success, timeout or transport error.
   */
  CommandExchange exchange(const std::string& payload, const std::string& terminator,
                           std::chrono::milliseconds timeout);

  /**
   * @brief exchange() with CRLF and the configured command timeout
   * @return trimmed response
   * @throws CommandTimeoutException, TransportException
   */
  std::string send_command(const std::string& text);

  std::string send_raw(const std::string& payload, const std::string& terminator, std::chrono::milliseconds timeout);

  void on_bytes(OnBytes cb);
  void on_state(OnState cb);

  base::ChannelState state() const { return state_.get(); }
  bool is_active() const { return state_.is_state(base::ChannelState::Active); }
  const std::string& device() const { return cfg_.device; }
  const config::ChannelConfig& config() const { return cfg_; }

 private:
  struct PendingExchange {
    std::string command;
    std::string buffer;
    std::promise<CommandExchange> promise;
    bool done = false;
  };

  CommandChannel(const config::ChannelConfig& cfg, std::unique_ptr<interface::SerialPortInterface> port,
                 net::io_context& ioc);

  void configure_port();
  void fail_open(const std::string& message, const boost::system::error_code& ec);

  // Strand-only
  void begin_exchange(const std::shared_ptr<PendingExchange>& ex, const std::string& bytes,
                      std::chrono::milliseconds timeout);
  void complete_exchange(std::shared_ptr<PendingExchange> ex, ExchangeOutcome outcome,
                         const std::string& error = "");
  void start_read();
  void handle_read(const boost::system::error_code& ec, std::size_t n);
  void schedule_read_retry();
  void close_port();

  void set_state(base::ChannelState state);
  void best_effort(const std::string& command);

  net::io_context& ioc_;
  net::strand<net::io_context::executor_type> strand_;
  std::unique_ptr<interface::SerialPortInterface> port_;
  config::ChannelConfig cfg_;
  net::steady_timer deadline_timer_;
  net::steady_timer backoff_timer_;

  std::vector<char> rx_;
  bool reading_ = false;
  bool closing_ = false;
  std::shared_ptr<PendingExchange> pending_;

  std::mutex exchange_mutex_;
  concurrency::AtomicState<base::ChannelState> state_{base::ChannelState::Opening};

  std::mutex callback_mutex_;
  OnBytes on_bytes_;
  OnState on_state_;
};

}  // namespace channel
}  // namespace modemlink
