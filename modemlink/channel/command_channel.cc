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

#include "modemlink/channel/command_channel.hpp"

#include "modemlink/base/at_commands.hpp"
#include "modemlink/base/constants.hpp"
#include "modemlink/diagnostics/error_handler.hpp"
#include "modemlink/diagnostics/error_mapping.hpp"
#include "modemlink/diagnostics/exceptions.hpp"
#include "modemlink/diagnostics/logger.hpp"
#include "modemlink/transport/serial/boost_serial_port.hpp"

namespace modemlink {
namespace channel {

using base::ChannelState;
using config::ChannelConfig;
namespace net = boost::asio;

namespace {

std::string_view trim_view(std::string_view s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) return {};
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

std::string trim(const std::string& s) { return std::string(trim_view(s)); }

bool is_terminal_line(std::string_view line) {
  line = trim_view(line);
  if (line.empty()) return false;
  return line == "OK" || line.find("ERROR") != std::string_view::npos || line.front() == '>';
}

}  // namespace

bool has_terminal_token(std::string_view buffer) {
  size_t start = 0;
  while (start <= buffer.size()) {
    const auto end = buffer.find('\n', start);
    const auto line = buffer.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
    if (is_terminal_line(line)) return true;
    if (end == std::string_view::npos) break;
    start = end + 1;
  }
  return false;
}

std::shared_ptr<CommandChannel> CommandChannel::create(const ChannelConfig& cfg, net::io_context& ioc) {
  return std::shared_ptr<CommandChannel>(new CommandChannel(cfg, transport::BoostSerialPort::create(ioc), ioc));
}

std::shared_ptr<CommandChannel> CommandChannel::create(const ChannelConfig& cfg,
                                                       std::unique_ptr<interface::SerialPortInterface> port,
                                                       net::io_context& ioc) {
  return std::shared_ptr<CommandChannel>(new CommandChannel(cfg, std::move(port), ioc));
}

CommandChannel::CommandChannel(const ChannelConfig& cfg, std::unique_ptr<interface::SerialPortInterface> port,
                               net::io_context& ioc)
    : ioc_(ioc),
      strand_(ioc_.get_executor()),
      port_(std::move(port)),
      cfg_(cfg),
      deadline_timer_(ioc_),
      backoff_timer_(ioc_) {
  cfg_.validate_and_clamp();
  rx_.resize(cfg_.read_chunk);
}

CommandChannel::~CommandChannel() {
  // No handler can be outstanding here: each one holds a reference to this channel
  if (port_ && port_->is_open()) {
    boost::system::error_code ec;
    port_->close(ec);
  }
}

void CommandChannel::on_bytes(OnBytes cb) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  on_bytes_ = std::move(cb);
}

void CommandChannel::on_state(OnState cb) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  on_state_ = std::move(cb);
}

void CommandChannel::set_state(ChannelState state) {
  state_.set(state);
  OnState cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb = on_state_;
  }
  MODEMLINK_LOG_DEBUG("channel", "state", cfg_.device + " -> " + base::to_cstr(state));
  if (cb) cb(state);
}

void CommandChannel::open() {
  set_state(ChannelState::Opening);
  MODEMLINK_LOG_INFO("channel", "open", "Opening device: " + cfg_.device);

  boost::system::error_code ec;
  port_->open(cfg_.device, ec);
  if (ec) {
    fail_open("Failed to open device", ec);
  }
  configure_port();

  set_state(ChannelState::Verifying);
  net::post(strand_, [self = shared_from_this()] { self->start_read(); });

  const auto verify = exchange(base::at::CHECK, base::at::CRLF, std::chrono::milliseconds(cfg_.verify_timeout_ms));
  if (!verify.ok() || verify.response.find("OK") == std::string::npos) {
    const std::string reason = verify.ok() ? "unexpected reply: " + trim(verify.response) : verify.error;
    MODEMLINK_LOG_WARNING("channel", "verify", cfg_.device + " did not answer AT (" + reason + ")");
    diagnostics::error_reporting::report_protocol_error("channel", "verify", cfg_.device, "AT check failed",
                                                        verify.response);

    auto done = std::make_shared<std::promise<void>>();
    auto closed = done->get_future();
    net::post(strand_, [self = shared_from_this(), done] {
      self->closing_ = true;
      self->close_port();
      done->set_value();
    });
    closed.wait_for(std::chrono::milliseconds(base::constants::EXCHANGE_GRACE_MS));

    set_state(ChannelState::Failed);
    throw diagnostics::TransportException("modem did not answer AT: " + reason, cfg_.device, "open");
  }

  set_state(ChannelState::Initialized);
  MODEMLINK_LOG_INFO("channel", "open", "Device verified: " + cfg_.device + " @ " + std::to_string(cfg_.baud_rate));
}

void CommandChannel::configure_port() {
  boost::system::error_code ec;

  port_->set_option(net::serial_port_base::baud_rate(cfg_.baud_rate), ec);
  if (ec) fail_open("Failed to set baud rate " + std::to_string(cfg_.baud_rate), ec);

  port_->set_option(net::serial_port_base::character_size(cfg_.char_size), ec);
  if (ec) fail_open("Failed to set character size", ec);

  using sb = net::serial_port_base::stop_bits;
  port_->set_option(sb(cfg_.stop_bits == 2 ? sb::two : sb::one), ec);
  if (ec) fail_open("Failed to set stop bits", ec);

  using pa = net::serial_port_base::parity;
  pa::type p = pa::none;
  if (cfg_.parity == ChannelConfig::Parity::Even)
    p = pa::even;
  else if (cfg_.parity == ChannelConfig::Parity::Odd)
    p = pa::odd;
  port_->set_option(pa(p), ec);
  if (ec) fail_open("Failed to set parity", ec);

  using fc = net::serial_port_base::flow_control;
  fc::type f = fc::none;
  if (cfg_.flow == ChannelConfig::Flow::Software)
    f = fc::software;
  else if (cfg_.flow == ChannelConfig::Flow::Hardware)
    f = fc::hardware;
  port_->set_option(fc(f), ec);
  if (ec) fail_open("Failed to set flow control", ec);
}

void CommandChannel::fail_open(const std::string& message, const boost::system::error_code& ec) {
  MODEMLINK_LOG_ERROR("channel", "open", message + ": " + cfg_.device + " - " + ec.message());
  diagnostics::error_reporting::report_transport_error("channel", "open", cfg_.device, ec);
  if (port_->is_open()) {
    boost::system::error_code ignore;
    port_->close(ignore);
  }
  set_state(ChannelState::Failed);
  throw diagnostics::TransportException(message + ": " + ec.message(), cfg_.device, "open");
}

void CommandChannel::best_effort(const std::string& command) {
  const auto result = exchange(command, base::at::CRLF, std::chrono::milliseconds(cfg_.command_timeout_ms));
  if (!result.ok() || result.response.find("ERROR") != std::string::npos) {
    const std::string detail = result.ok() ? trim(result.response) : result.error;
    MODEMLINK_LOG_WARNING("channel", "initialize", cfg_.device + ": " + command + " failed (" + detail + ")");
    diagnostics::error_reporting::report_warning("channel", "initialize", cfg_.device + ": " + command + " failed");
  }
}

void CommandChannel::initialize() {
  best_effort(base::at::ECHO_OFF);
  if (cfg_.sms_mode == config::SmsMode::Pdu) {
    best_effort(base::at::PDU_MODE);
  } else {
    best_effort(base::at::TEXT_MODE);
    best_effort(base::at::UCS2_CHARSET);
    best_effort(base::at::TEXT_PARAMS_UCS2);
  }
  MODEMLINK_LOG_DEBUG("channel", "initialize",
                      cfg_.device + " initialized in " + config::to_cstr(cfg_.sms_mode) + " mode");
}

void CommandChannel::start_listening() {
  const auto current = state_.get();
  if (current == ChannelState::Closed || current == ChannelState::Failed) {
    throw diagnostics::TransportException(std::string("cannot listen in state ") + base::to_cstr(current),
                                          cfg_.device, "start_listening");
  }
  set_state(ChannelState::Active);
  net::post(strand_, [self = shared_from_this()] { self->start_read(); });
  MODEMLINK_LOG_INFO("channel", "listen", "Listening on " + cfg_.device);
}

void CommandChannel::close() {
  if (state_.exchange(ChannelState::Closed) == ChannelState::Closed) return;

  auto done = std::make_shared<std::promise<void>>();
  auto closed = done->get_future();
  net::post(strand_, [self = shared_from_this(), done] {
    self->closing_ = true;
    self->backoff_timer_.cancel();
    if (self->pending_) {
      self->complete_exchange(self->pending_, ExchangeOutcome::TransportError, "channel closed");
    }
    self->close_port();
    done->set_value();
  });
  if (closed.wait_for(std::chrono::milliseconds(base::constants::EXCHANGE_GRACE_MS)) != std::future_status::ready) {
    MODEMLINK_LOG_WARNING("channel", "close", "I/O runtime did not confirm close of " + cfg_.device);
  }

  set_state(ChannelState::Closed);
  MODEMLINK_LOG_INFO("channel", "close", "Closed " + cfg_.device);
}

CommandExchange CommandChannel::exchange(const std::string& payload, const std::string& terminator,
                                         std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lock(exchange_mutex_);

  const auto started = std::chrono::steady_clock::now();
  const auto current = state_.get();
  if (current == ChannelState::Closed || current == ChannelState::Failed) {
    CommandExchange rejected;
    rejected.command = payload;
    rejected.outcome = ExchangeOutcome::TransportError;
    rejected.error = std::string("channel is ") + base::to_cstr(current);
    return rejected;
  }

  auto ex = std::make_shared<PendingExchange>();
  ex->command = payload;
  auto future = ex->promise.get_future();

  MODEMLINK_LOG_DEBUG("channel", "exchange", cfg_.device + " <- " + payload);
  net::post(strand_, [self = shared_from_this(), ex, bytes = payload + terminator, timeout] {
    self->begin_exchange(ex, bytes, timeout);
  });

  CommandExchange result;
  if (future.wait_for(timeout + std::chrono::milliseconds(base::constants::EXCHANGE_GRACE_MS)) !=
      std::future_status::ready) {
    // The runtime is stalled; give up without waiting for it
    net::post(strand_, [self = shared_from_this(), ex] {
      self->complete_exchange(ex, ExchangeOutcome::Timeout, "abandoned");
    });
    result.command = payload;
    result.outcome = ExchangeOutcome::Timeout;
    result.error = "no completion from I/O runtime";
  } else {
    result = future.get();
  }
  result.elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

  switch (result.outcome) {
    case ExchangeOutcome::Success:
      MODEMLINK_LOG_DEBUG("channel", "exchange", cfg_.device + " -> " + trim(result.response));
      break;
    case ExchangeOutcome::Timeout:
      MODEMLINK_LOG_WARNING("channel", "exchange",
                            cfg_.device + ": timeout after " + std::to_string(result.elapsed.count()) + " ms for " +
                                payload);
      diagnostics::error_reporting::report_timeout("channel", "exchange", cfg_.device, payload);
      break;
    case ExchangeOutcome::TransportError:
      MODEMLINK_LOG_ERROR("channel", "exchange", cfg_.device + ": " + result.error);
      break;
  }
  return result;
}

std::string CommandChannel::send_command(const std::string& text) {
  return send_raw(text, base::at::CRLF, std::chrono::milliseconds(cfg_.command_timeout_ms));
}

std::string CommandChannel::send_raw(const std::string& payload, const std::string& terminator,
                                     std::chrono::milliseconds timeout) {
  auto result = exchange(payload, terminator, timeout);
  switch (result.outcome) {
    case ExchangeOutcome::Timeout:
      throw diagnostics::CommandTimeoutException(payload, static_cast<unsigned>(timeout.count()), cfg_.device);
    case ExchangeOutcome::TransportError:
      throw diagnostics::TransportException(result.error, cfg_.device, "exchange");
    case ExchangeOutcome::Success:
      break;
  }
  return trim(result.response);
}

void CommandChannel::begin_exchange(const std::shared_ptr<PendingExchange>& ex, const std::string& bytes,
                                    std::chrono::milliseconds timeout) {
  if (ex->done) return;
  if (closing_ || !port_->is_open()) {
    complete_exchange(ex, ExchangeOutcome::TransportError, "port is not open");
    return;
  }

  if (pending_ && pending_ != ex) {
    complete_exchange(pending_, ExchangeOutcome::Timeout, "superseded");
  }
  pending_ = ex;

  // Stale unsolicited output must not be taken as this command's reply
  boost::system::error_code ec;
  port_->flush_input(ec);
  if (ec) {
    MODEMLINK_LOG_DEBUG("channel", "flush", cfg_.device + ": " + ec.message());
  }

  auto self = shared_from_this();
  deadline_timer_.expires_after(timeout);
  deadline_timer_.async_wait(net::bind_executor(strand_, [self, ex](const boost::system::error_code& tec) {
    if (tec == net::error::operation_aborted) return;
    self->complete_exchange(ex, ExchangeOutcome::Timeout, "no terminal token before deadline");
  }));

  auto data = std::make_shared<std::string>(bytes);
  port_->async_write(net::buffer(*data), [self, ex, data](const boost::system::error_code& wec, std::size_t) {
    net::dispatch(self->strand_, [self, ex, wec] {
      if (!wec) return;
      MODEMLINK_LOG_ERROR("channel", "write", self->cfg_.device + " - " + wec.message());
      diagnostics::error_reporting::report_transport_error("channel", "write", self->cfg_.device, wec);
      // Failed must be visible before the caller wakes up
      if (!self->closing_) self->set_state(ChannelState::Failed);
      self->complete_exchange(ex, ExchangeOutcome::TransportError, "write failed: " + wec.message());
    });
  });

  start_read();
}

void CommandChannel::complete_exchange(std::shared_ptr<PendingExchange> ex, ExchangeOutcome outcome,
                                       const std::string& error) {
  if (ex->done) return;
  ex->done = true;
  if (pending_ == ex) {
    pending_.reset();
    deadline_timer_.cancel();
  }

  CommandExchange result;
  result.command = ex->command;
  result.response = std::move(ex->buffer);
  result.outcome = outcome;
  result.error = error;
  ex->promise.set_value(std::move(result));
}

void CommandChannel::start_read() {
  if (reading_ || closing_ || !port_->is_open()) return;
  reading_ = true;

  auto self = shared_from_this();
  port_->async_read_some(net::buffer(rx_.data(), rx_.size()),
                         [self](const boost::system::error_code& ec, std::size_t n) {
                           net::dispatch(self->strand_, [self, ec, n] { self->handle_read(ec, n); });
                         });
}

void CommandChannel::handle_read(const boost::system::error_code& ec, std::size_t n) {
  reading_ = false;

  if (!ec) {
    std::string chunk(rx_.data(), n);
    if (pending_) {
      pending_->buffer += chunk;
      if (has_terminal_token(pending_->buffer)) {
        complete_exchange(pending_, ExchangeOutcome::Success);
      }
    } else if (state_.is_state(ChannelState::Active)) {
      OnBytes cb;
      {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = on_bytes_;
      }
      if (cb) cb(cfg_.device, chunk);
    } else {
      MODEMLINK_LOG_DEBUG("channel", "read", cfg_.device + ": dropping " + std::to_string(n) + " unsolicited bytes");
    }
    start_read();
    return;
  }

  if (closing_ || !diagnostics::is_retryable_read_error(ec)) {
    MODEMLINK_LOG_DEBUG("channel", "read", cfg_.device + ": read loop ended (" + ec.message() + ")");
    if (pending_) complete_exchange(pending_, ExchangeOutcome::TransportError, "read aborted: " + ec.message());
    return;
  }

  if (ec == net::error::eof) {
    // End of data: whatever the exchange gathered is its answer
    if (pending_ && !pending_->buffer.empty()) {
      complete_exchange(pending_, ExchangeOutcome::Success);
    }
    schedule_read_retry();
    return;
  }

  MODEMLINK_LOG_WARNING("channel", "read", cfg_.device + " - " + ec.message());
  diagnostics::error_reporting::report_transport_error("channel", "read", cfg_.device, ec, true);
  if (pending_) {
    if (!pending_->buffer.empty()) {
      complete_exchange(pending_, ExchangeOutcome::Success);
    } else {
      set_state(ChannelState::Failed);
      complete_exchange(pending_, ExchangeOutcome::TransportError, "read failed: " + ec.message());
    }
  }
  schedule_read_retry();
}

void CommandChannel::schedule_read_retry() {
  backoff_timer_.expires_after(std::chrono::milliseconds(cfg_.read_error_backoff_ms));
  backoff_timer_.async_wait(
      net::bind_executor(strand_, [self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec) return;
        self->start_read();
      }));
}

void CommandChannel::close_port() {
  deadline_timer_.cancel();
  backoff_timer_.cancel();
  if (!port_->is_open()) return;
  boost::system::error_code ec;
  port_->close(ec);
  if (ec) {
    MODEMLINK_LOG_WARNING("channel", "close", cfg_.device + " - " + ec.message());
  }
}

}  // namespace channel
}  // namespace modemlink
