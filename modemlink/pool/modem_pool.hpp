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

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "modemlink/base/visibility.hpp"
#include "modemlink/concurrency/io_context_manager.hpp"
#include "modemlink/config/pool_config.hpp"
#include "modemlink/event/event_bus.hpp"
#include "modemlink/interface/iserial_port.hpp"
#include "modemlink/modem/modem_session.hpp"
#include "modemlink/pool/device_scanner.hpp"

namespace modemlink {
namespace pool {

struct DeviceStatus {
  std::string identifier;
  bool connected = false;
};

/**
 * @brief Registry of live modem sessions keyed by device path
 *
 * scan() opens every candidate path that is not registered yet; existing
 * sessions are left alone. Opened channels feed their unsolicited output
 * into the event bus as "[device] chunk".
 *
 * The pool borrows the runtime and the bus; both must outlive it.
 */
class MODEMLINK_API ModemPool {
 public:
  ModemPool(config::PoolConfig cfg, concurrency::IoContextManager& runtime, event::EventBus& bus,
            std::unique_ptr<DeviceScanner> scanner = nullptr,
            interface::SerialPortFactory port_factory = nullptr);
  ~ModemPool();

  ModemPool(const ModemPool&) = delete;
  ModemPool& operator=(const ModemPool&) = delete;

  /**
   * @brief Open candidates in parallel and register the ones that answer
   * @return status of every registered device after the scan
   */
  std::vector<DeviceStatus> scan();

  /**
   * @throws NotConnectedException when the identifier is not registered
   */
  std::shared_ptr<modem::ModemSession> get(const std::string& identifier) const;

  // Sorted by identifier
  std::vector<DeviceStatus> list() const;

  void close_all();
  size_t size() const;

  const config::PoolConfig& config() const { return cfg_; }

 private:
  std::shared_ptr<modem::ModemSession> open_session(const std::string& device);
  bool is_registered(const std::string& device) const;

  config::PoolConfig cfg_;
  concurrency::IoContextManager& runtime_;
  event::EventBus& bus_;
  std::unique_ptr<DeviceScanner> scanner_;
  interface::SerialPortFactory port_factory_;

  std::mutex scan_mutex_;
  mutable std::mutex registry_mutex_;
  std::map<std::string, std::shared_ptr<modem::ModemSession>> sessions_;
};

}  // namespace pool
}  // namespace modemlink
