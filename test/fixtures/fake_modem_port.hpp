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

#include <algorithm>
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <cstring>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "modemlink/interface/iserial_port.hpp"

namespace modemlink {
namespace test {

/**
 * @brief Scripted modem behind interface::SerialPortInterface
 *
 * Each write is matched against exact rules, then prefix rules, then the
 * built-in replies for the initialization commands. The matched reply is
 * queued as device output and handed to the outstanding read. Handlers are
 * posted to the io_context, like a real port would complete them.
 */
class FakeModemPort : public interface::SerialPortInterface {
 public:
  using Handler = std::function<void(const boost::system::error_code&, std::size_t)>;
  // Runs at open(), before the port decides whether the open succeeds
  using OpenHook = std::function<void(FakeModemPort& port, const std::string& device)>;

  explicit FakeModemPort(boost::asio::io_context& ioc, OpenHook on_open = nullptr)
      : ioc_(ioc), on_open_(std::move(on_open)) {}

  // Script
  void respond(const std::string& command, const std::string& reply) {
    std::lock_guard<std::mutex> lock(mutex_);
    exact_[command] = reply;
  }
  void respond_prefix(const std::string& prefix, const std::string& reply) {
    std::lock_guard<std::mutex> lock(mutex_);
    prefix_.emplace_back(prefix, reply);
  }
  void set_silent(bool silent) {
    std::lock_guard<std::mutex> lock(mutex_);
    silent_ = silent;
  }
  void fail_open(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_open_ = fail;
  }
  // Replies are delivered at most this many bytes per read completion
  void set_max_chunk(std::size_t n) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_chunk_ = n;
  }

  // Device output that does not answer any command
  void inject(const std::string& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    rx_ += bytes;
    deliver_locked();
  }

  // The next read (or the outstanding one) completes with this error
  void fail_next_read(const boost::system::error_code& ec) {
    std::lock_guard<std::mutex> lock(mutex_);
    read_error_ = ec;
    deliver_locked();
  }

  // Fail every later write
  void fail_writes(const boost::system::error_code& ec) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_error_ = ec;
  }

  std::vector<std::string> written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return written_;
  }
  int flush_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return flush_count_;
  }
  std::string opened_device() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return device_;
  }

  // SerialPortInterface
  void open(const std::string& device, boost::system::error_code& ec) override {
    if (on_open_) on_open_(*this, device);
    std::lock_guard<std::mutex> lock(mutex_);
    device_ = device;
    if (fail_open_) {
      ec = make_error_code(boost::system::errc::no_such_file_or_directory);
      return;
    }
    open_ = true;
    ec.clear();
  }
  bool is_open() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
  }
  void close(boost::system::error_code& ec) override {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
    ec.clear();
    if (read_handler_) {
      auto handler = std::move(read_handler_);
      read_handler_ = nullptr;
      boost::asio::post(ioc_, [handler] { handler(make_error_code(boost::asio::error::operation_aborted), 0); });
    }
  }

  void set_option(const boost::asio::serial_port_base::baud_rate&, boost::system::error_code& ec) override {
    ec.clear();
  }
  void set_option(const boost::asio::serial_port_base::character_size&, boost::system::error_code& ec) override {
    ec.clear();
  }
  void set_option(const boost::asio::serial_port_base::stop_bits&, boost::system::error_code& ec) override {
    ec.clear();
  }
  void set_option(const boost::asio::serial_port_base::parity&, boost::system::error_code& ec) override { ec.clear(); }
  void set_option(const boost::asio::serial_port_base::flow_control&, boost::system::error_code& ec) override {
    ec.clear();
  }

  void flush_input(boost::system::error_code& ec) override {
    std::lock_guard<std::mutex> lock(mutex_);
    rx_.clear();
    ++flush_count_;
    ec.clear();
  }

  void async_read_some(const boost::asio::mutable_buffer& buffer, Handler handler) override {
    std::lock_guard<std::mutex> lock(mutex_);
    read_buffer_ = buffer;
    read_handler_ = std::move(handler);
    deliver_locked();
  }

  void async_write(const boost::asio::const_buffer& buffer, Handler handler) override {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string data(static_cast<const char*>(buffer.data()), buffer.size());
    written_.push_back(data);

    if (write_error_) {
      auto ec = write_error_;
      boost::asio::post(ioc_, [handler = std::move(handler), ec] { handler(ec, 0); });
      return;
    }
    const auto size = buffer.size();
    boost::asio::post(ioc_, [handler = std::move(handler), size] { handler(boost::system::error_code(), size); });

    if (silent_) return;
    rx_ += reply_for(strip(data));
    deliver_locked();
  }

 private:
  static std::string strip(const std::string& data) {
    std::string s = data;
    while (!s.empty() && (s.back() == '\r' || s.back() == '\n' || s.back() == '\x1A')) s.pop_back();
    return s;
  }

  std::string reply_for(const std::string& command) const {
    auto it = exact_.find(command);
    if (it != exact_.end()) return it->second;
    for (const auto& rule : prefix_) {
      if (command.rfind(rule.first, 0) == 0) return rule.second;
    }
    if (command == "AT" || command == "ATE0" || command.rfind("AT+CMGF=", 0) == 0 ||
        command.rfind("AT+CSCS=", 0) == 0 || command.rfind("AT+CSMP=", 0) == 0) {
      return "\r\nOK\r\n";
    }
    return "\r\nERROR\r\n";
  }

  void deliver_locked() {
    if (!read_handler_) return;
    if (read_error_) {
      auto handler = std::move(read_handler_);
      read_handler_ = nullptr;
      auto ec = read_error_;
      read_error_.clear();
      boost::asio::post(ioc_, [handler, ec] { handler(ec, 0); });
      return;
    }
    if (rx_.empty()) return;

    const std::size_t n = std::min({rx_.size(), read_buffer_.size(), max_chunk_});
    std::memcpy(read_buffer_.data(), rx_.data(), n);
    rx_.erase(0, n);
    auto handler = std::move(read_handler_);
    read_handler_ = nullptr;
    boost::asio::post(ioc_, [handler, n] { handler(boost::system::error_code(), n); });
  }

  boost::asio::io_context& ioc_;
  OpenHook on_open_;
  mutable std::mutex mutex_;

  std::map<std::string, std::string> exact_;
  std::vector<std::pair<std::string, std::string>> prefix_;
  bool silent_ = false;
  bool fail_open_ = false;
  std::size_t max_chunk_ = static_cast<std::size_t>(-1);
  boost::system::error_code read_error_;
  boost::system::error_code write_error_;

  bool open_ = false;
  std::string device_;
  std::string rx_;
  boost::asio::mutable_buffer read_buffer_;
  Handler read_handler_;
  std::vector<std::string> written_;
  int flush_count_ = 0;
};

}  // namespace test
}  // namespace modemlink
