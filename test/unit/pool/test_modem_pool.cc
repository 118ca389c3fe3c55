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

#include <gtest/gtest.h>

#include <stdlib.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "fixtures/fake_modem_port.hpp"
#include "modemlink/concurrency/io_context_manager.hpp"
#include "modemlink/diagnostics/exceptions.hpp"
#include "modemlink/event/event_bus.hpp"
#include "modemlink/pool/device_scanner.hpp"
#include "modemlink/pool/modem_pool.hpp"

using namespace modemlink;
using namespace modemlink::pool;
using namespace std::chrono_literals;

namespace {

class ListScanner : public DeviceScanner {
 public:
  explicit ListScanner(std::shared_ptr<std::vector<std::string>> devices) : devices_(std::move(devices)) {}
  std::vector<std::string> candidates() override { return *devices_; }

 private:
  std::shared_ptr<std::vector<std::string>> devices_;
};

class ModemPoolTest : public ::testing::Test {
 protected:
  void SetUp() override {
    runtime_ = std::make_unique<concurrency::IoContextManager>(2);
    runtime_->start();

    cfg_.channel.verify_timeout_ms = 300;
    cfg_.channel.command_timeout_ms = 200;
    devices_ = std::make_shared<std::vector<std::string>>();
  }

  void TearDown() override {
    pool_.reset();
    runtime_->stop();
  }

  ModemPool& make_pool() {
    auto factory = [this](boost::asio::io_context& ioc) -> std::unique_ptr<interface::SerialPortInterface> {
      ++ports_created_;
      return std::make_unique<test::FakeModemPort>(ioc, [this](test::FakeModemPort& port, const std::string& device) {
        std::lock_guard<std::mutex> lock(mutex_);
        ports_[device] = &port;
        if (silent_.count(device)) port.set_silent(true);
        if (fail_once_.erase(device)) port.fail_open(true);
      });
    };
    pool_ = std::make_unique<ModemPool>(cfg_, *runtime_, bus_, std::make_unique<ListScanner>(devices_), factory);
    return *pool_;
  }

  test::FakeModemPort* port_for(const std::string& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ports_.find(device);
    return it == ports_.end() ? nullptr : it->second;
  }

  config::PoolConfig cfg_;
  std::unique_ptr<concurrency::IoContextManager> runtime_;
  event::EventBus bus_;
  std::unique_ptr<ModemPool> pool_;

  std::shared_ptr<std::vector<std::string>> devices_;
  std::atomic<int> ports_created_{0};
  std::mutex mutex_;
  std::map<std::string, test::FakeModemPort*> ports_;
  std::set<std::string> silent_;
  std::set<std::string> fail_once_;
};

}  // namespace

TEST_F(ModemPoolTest, ScanRegistersOnlyAnsweringDevices) {
  *devices_ = {"/dev/ttyFAKE0", "/dev/ttyFAKE1", "/dev/ttyFAKE2"};
  silent_.insert("/dev/ttyFAKE1");
  auto& pool = make_pool();

  const auto statuses = pool.scan();
  ASSERT_EQ(statuses.size(), 2u);
  EXPECT_EQ(statuses[0].identifier, "/dev/ttyFAKE0");
  EXPECT_TRUE(statuses[0].connected);
  EXPECT_EQ(statuses[1].identifier, "/dev/ttyFAKE2");
  EXPECT_TRUE(statuses[1].connected);
  EXPECT_EQ(pool.size(), 2u);
}

TEST_F(ModemPoolTest, RepeatedScanDoesNotReopen) {
  *devices_ = {"/dev/ttyFAKE0", "/dev/ttyFAKE1"};
  auto& pool = make_pool();
  pool.scan();
  const int created = ports_created_.load();
  auto session = pool.get("/dev/ttyFAKE0");

  const auto statuses = pool.scan();
  EXPECT_EQ(statuses.size(), 2u);
  EXPECT_EQ(ports_created_.load(), created);
  EXPECT_EQ(pool.get("/dev/ttyFAKE0"), session);
}

TEST_F(ModemPoolTest, LaterScanPicksUpNewDevice) {
  *devices_ = {"/dev/ttyFAKE0"};
  auto& pool = make_pool();
  pool.scan();
  const int created = ports_created_.load();

  devices_->push_back("/dev/ttyFAKE5");
  const auto statuses = pool.scan();
  EXPECT_EQ(statuses.size(), 2u);
  EXPECT_EQ(ports_created_.load(), created + 1);
}

TEST_F(ModemPoolTest, FailedDeviceIsRetriedOnNextScan) {
  *devices_ = {"/dev/ttyFAKE3"};
  fail_once_.insert("/dev/ttyFAKE3");
  auto& pool = make_pool();

  EXPECT_TRUE(pool.scan().empty());
  const auto statuses = pool.scan();
  ASSERT_EQ(statuses.size(), 1u);
  EXPECT_EQ(statuses[0].identifier, "/dev/ttyFAKE3");
}

TEST_F(ModemPoolTest, UnknownIdentifierIsNotConnected) {
  auto& pool = make_pool();
  try {
    pool.get("/dev/ttyNOPE");
    FAIL() << "expected NotConnectedException";
  } catch (const diagnostics::NotConnectedException& e) {
    EXPECT_EQ(e.get_identifier(), "/dev/ttyNOPE");
  }
}

TEST_F(ModemPoolTest, ListIsSortedByIdentifier) {
  *devices_ = {"/dev/ttyUSB2", "/dev/ttyACM0", "/dev/ttyUSB0"};
  auto& pool = make_pool();
  pool.scan();

  const auto statuses = pool.list();
  ASSERT_EQ(statuses.size(), 3u);
  EXPECT_EQ(statuses[0].identifier, "/dev/ttyACM0");
  EXPECT_EQ(statuses[1].identifier, "/dev/ttyUSB0");
  EXPECT_EQ(statuses[2].identifier, "/dev/ttyUSB2");
}

TEST_F(ModemPoolTest, OpensCandidatesInParallel) {
  *devices_ = {"/dev/ttyFAKE0", "/dev/ttyFAKE1", "/dev/ttyFAKE2", "/dev/ttyFAKE3"};
  silent_ = {"/dev/ttyFAKE0", "/dev/ttyFAKE1", "/dev/ttyFAKE2", "/dev/ttyFAKE3"};
  auto& pool = make_pool();

  const auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(pool.scan().empty());
  // Serial attempts would take at least 4 x 300 ms
  EXPECT_LT(std::chrono::steady_clock::now() - start, 1100ms);
}

TEST_F(ModemPoolTest, UnsolicitedOutputIsPublished) {
  *devices_ = {"/dev/ttyFAKE0"};
  auto& pool = make_pool();
  auto subscription = bus_.subscribe(10);
  pool.scan();

  auto* port = port_for("/dev/ttyFAKE0");
  ASSERT_NE(port, nullptr);
  port->inject("\r\n+CMTI: \"SM\",7\r\n");

  const auto message = subscription->next(1000ms);
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(*message, "[/dev/ttyFAKE0] \r\n+CMTI: \"SM\",7\r\n");
}

TEST_F(ModemPoolTest, SessionsAnswerCommands) {
  *devices_ = {"/dev/ttyFAKE0"};
  auto& pool = make_pool();
  pool.scan();
  port_for("/dev/ttyFAKE0")->respond("AT+CSQ", "\r\n+CSQ: 25,0\r\n\r\nOK\r\n");

  EXPECT_EQ(pool.get("/dev/ttyFAKE0")->get_signal().rssi, 25);
}

TEST_F(ModemPoolTest, CloseAllEmptiesRegistry) {
  *devices_ = {"/dev/ttyFAKE0", "/dev/ttyFAKE1"};
  auto& pool = make_pool();
  pool.scan();
  auto session = pool.get("/dev/ttyFAKE1");

  pool.close_all();
  EXPECT_EQ(pool.size(), 0u);
  EXPECT_FALSE(session->is_connected());
  EXPECT_FALSE(port_for("/dev/ttyFAKE1")->is_open());
}

TEST_F(ModemPoolTest, InvalidConfigurationIsRejected) {
  cfg_.io_threads = 0;
  EXPECT_THROW(make_pool(), diagnostics::ConfigurationException);
  cfg_.io_threads = 2;
  cfg_.device_patterns.clear();
  EXPECT_THROW(make_pool(), diagnostics::ConfigurationException);
}

// ---------------------------------------------------------------------------
// GlobDeviceScanner
// ---------------------------------------------------------------------------

class GlobDeviceScannerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    char tmpl[] = "/tmp/modemlink_scan_XXXXXX";
    ASSERT_NE(::mkdtemp(tmpl), nullptr);
    dir_ = tmpl;
    for (const char* name : {"ttyUSB1", "ttyUSB0", "ttyACM0", "console"}) {
      std::ofstream(dir_ + "/" + name).put('\n');
    }
  }

  void TearDown() override {
    for (const char* name : {"ttyUSB1", "ttyUSB0", "ttyACM0", "console"}) {
      ::unlink((dir_ + "/" + name).c_str());
    }
    ::rmdir(dir_.c_str());
  }

  std::string dir_;
};

TEST_F(GlobDeviceScannerTest, ExpandsPatternsSortedAndUnique) {
  GlobDeviceScanner scanner({dir_ + "/ttyUSB*", dir_ + "/ttyACM*", dir_ + "/ttyUSB0"});
  const auto candidates = scanner.candidates();
  const std::vector<std::string> expected = {dir_ + "/ttyACM0", dir_ + "/ttyUSB0", dir_ + "/ttyUSB1"};
  EXPECT_EQ(candidates, expected);
}

TEST_F(GlobDeviceScannerTest, NoMatchIsEmpty) {
  GlobDeviceScanner scanner({dir_ + "/ttyS*"});
  EXPECT_TRUE(scanner.candidates().empty());
}
