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

#include "modemlink/pool/modem_pool.hpp"

#include <future>
#include <utility>

#include "modemlink/channel/command_channel.hpp"
#include "modemlink/diagnostics/error_handler.hpp"
#include "modemlink/diagnostics/exceptions.hpp"
#include "modemlink/diagnostics/logger.hpp"

namespace modemlink {
namespace pool {

ModemPool::ModemPool(config::PoolConfig cfg, concurrency::IoContextManager& runtime, event::EventBus& bus,
                     std::unique_ptr<DeviceScanner> scanner, interface::SerialPortFactory port_factory)
    : cfg_(std::move(cfg)),
      runtime_(runtime),
      bus_(bus),
      scanner_(std::move(scanner)),
      port_factory_(std::move(port_factory)) {
  if (!cfg_.is_valid()) {
    throw diagnostics::ConfigurationException("invalid pool configuration", "pool", "construct");
  }
  if (!scanner_) {
    scanner_ = std::make_unique<GlobDeviceScanner>(cfg_.device_patterns);
  }
}

ModemPool::~ModemPool() { close_all(); }

std::vector<DeviceStatus> ModemPool::scan() {
  std::lock_guard<std::mutex> scan_lock(scan_mutex_);

  std::vector<std::string> fresh;
  for (const auto& device : scanner_->candidates()) {
    if (!is_registered(device)) fresh.push_back(device);
  }
  MODEMLINK_LOG_DEBUG("pool", "scan", std::to_string(fresh.size()) + " unregistered candidate(s)");

  std::vector<std::pair<std::string, std::future<std::shared_ptr<modem::ModemSession>>>> attempts;
  attempts.reserve(fresh.size());
  for (const auto& device : fresh) {
    attempts.emplace_back(device, std::async(std::launch::async, [this, device] { return open_session(device); }));
  }

  for (auto& attempt : attempts) {
    auto session = attempt.second.get();
    if (!session) continue;
    {
      std::lock_guard<std::mutex> lock(registry_mutex_);
      sessions_[attempt.first] = session;
    }
    MODEMLINK_LOG_INFO("pool", "scan", "registered " + attempt.first);
  }

  return list();
}

std::shared_ptr<modem::ModemSession> ModemPool::open_session(const std::string& device) {
  auto channel_cfg = cfg_.channel;
  channel_cfg.device = device;

  std::shared_ptr<channel::CommandChannel> link;
  try {
    auto& ioc = runtime_.get_context();
    link = port_factory_ ? channel::CommandChannel::create(channel_cfg, port_factory_(ioc), ioc)
                         : channel::CommandChannel::create(channel_cfg, ioc);
    link->open();
    link->initialize();

    event::EventBus* bus = &bus_;
    link->on_bytes([bus](const std::string& source, const std::string& chunk) { bus->publish(source, chunk); });
    link->start_listening();
    return std::make_shared<modem::ModemSession>(std::move(link));
  } catch (const diagnostics::ModemException& e) {
    MODEMLINK_LOG_DEBUG("pool", "scan", "skipping " + device + ": " + e.what());
  } catch (const std::exception& e) {
    diagnostics::error_reporting::report_system_error("pool", "scan", "opening " + device + ": " + e.what());
  }
  if (link) link->close();
  return nullptr;
}

bool ModemPool::is_registered(const std::string& device) const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  return sessions_.count(device) != 0;
}

std::shared_ptr<modem::ModemSession> ModemPool::get(const std::string& identifier) const {
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = sessions_.find(identifier);
    if (it != sessions_.end()) return it->second;
  }
  diagnostics::error_reporting::report_registry_error("pool", "get", "not connected: " + identifier);
  throw diagnostics::NotConnectedException(identifier);
}

std::vector<DeviceStatus> ModemPool::list() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  std::vector<DeviceStatus> statuses;
  statuses.reserve(sessions_.size());
  for (const auto& entry : sessions_) {
    statuses.push_back({entry.first, entry.second->is_connected()});
  }
  return statuses;
}

void ModemPool::close_all() {
  std::map<std::string, std::shared_ptr<modem::ModemSession>> closing;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    closing.swap(sessions_);
  }
  for (auto& entry : closing) {
    entry.second->close();
  }
  if (!closing.empty()) {
    MODEMLINK_LOG_INFO("pool", "close_all", "closed " + std::to_string(closing.size()) + " session(s)");
  }
}

size_t ModemPool::size() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  return sessions_.size();
}

}  // namespace pool
}  // namespace modemlink
