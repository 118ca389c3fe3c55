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

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "modemlink/modemlink.hpp"

using namespace modemlink;

namespace {

void print_usage(const char* prog) {
  std::cout << "Usage: " << prog << " [--config FILE] [--verbose] <command> [args]\n"
            << "Commands:\n"
            << "  scan                              open every configured device and list them\n"
            << "  info <device>                     manufacturer, model, IMEI, IMSI, operator, number\n"
            << "  signal <device>                   signal strength\n"
            << "  sms-list <device>                 stored messages, long messages merged\n"
            << "  sms-send <device> <number> <text> send one message\n"
            << "  sms-delete <device> <index>...    delete stored messages\n"
            << "  at <device> <command>             raw AT command\n"
            << "  monitor [seconds]                 print unsolicited device output\n";
}

void print_optional(const char* label, const std::optional<std::string>& value) {
  std::cout << "  " << label << ": " << (value ? *value : "-") << "\n";
}

class ModemCli {
 public:
  explicit ModemCli(std::shared_ptr<config::ConfigManager> config) : config_(std::move(config)) {
    pool_cfg_ = config::ConfigFactory::build_pool_config(*config_);
  }

  ~ModemCli() {
    if (pool_) pool_->close_all();
    if (runtime_) runtime_->stop();
  }

  int run(const std::vector<std::string>& args) {
    const std::string& cmd = args[0];
    if (cmd == "scan") return cmd_scan();
    if (cmd == "monitor") return cmd_monitor(args.size() > 1 ? std::stoi(args[1]) : 0);

    if (args.size() < 2) {
      std::cerr << cmd << ": device argument required\n";
      return 2;
    }
    const std::string& device = args[1];
    if (cmd == "info") return cmd_info(device);
    if (cmd == "signal") return cmd_signal(device);
    if (cmd == "sms-list") return cmd_sms_list(device);
    if (cmd == "sms-send") {
      if (args.size() < 4) {
        std::cerr << "sms-send: <number> <text> required\n";
        return 2;
      }
      return cmd_sms_send(device, args[2], args[3]);
    }
    if (cmd == "sms-delete") {
      std::vector<int> indices;
      for (size_t i = 2; i < args.size(); ++i) indices.push_back(std::stoi(args[i]));
      if (indices.empty()) {
        std::cerr << "sms-delete: at least one index required\n";
        return 2;
      }
      return cmd_sms_delete(device, indices);
    }
    if (cmd == "at") {
      if (args.size() < 3) {
        std::cerr << "at: <command> required\n";
        return 2;
      }
      std::cout << open_device(device)->send_raw_command(args[2]) << "\n";
      return 0;
    }

    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
  }

 private:
  void start_pool(const std::vector<std::string>& patterns) {
    auto cfg = pool_cfg_;
    cfg.device_patterns = patterns;
    runtime_ = std::make_unique<concurrency::IoContextManager>(cfg.io_threads);
    runtime_->start();
    pool_ = std::make_unique<pool::ModemPool>(cfg, *runtime_, bus_);
  }

  std::shared_ptr<modem::ModemSession> open_device(const std::string& device) {
    util::InputValidator::validate_device_path(device);
    start_pool({device});
    pool_->scan();
    return pool_->get(device);
  }

  int cmd_scan() {
    start_pool(pool_cfg_.device_patterns);
    const auto devices = pool_->scan();
    if (devices.empty()) {
      std::cout << "no modems found\n";
      return 1;
    }
    for (const auto& status : devices) {
      std::cout << status.identifier << "\t" << (status.connected ? "connected" : "disconnected") << "\n";
    }
    return 0;
  }

  int cmd_info(const std::string& device) {
    const auto identity = open_device(device)->get_identity();
    std::cout << device << "\n";
    print_optional("manufacturer", identity.manufacturer);
    print_optional("model", identity.model);
    print_optional("imei", identity.imei);
    print_optional("imsi", identity.imsi);
    print_optional("operator", identity.operator_name);
    print_optional("access technology", identity.access_technology);
    print_optional("phone number", identity.phone_number);
    return 0;
  }

  int cmd_signal(const std::string& device) {
    const auto signal = open_device(device)->get_signal();
    std::cout << "rssi " << signal.rssi << ", ber " << signal.quality << ", " << signal.dbm_text() << ", level "
              << signal.level << "/5\n";
    return 0;
  }

  int cmd_sms_list(const std::string& device) {
    const auto messages = open_device(device)->list_sms();
    for (const auto& sms : messages) {
      std::cout << "#" << sms.index << " [" << sms.status << "] " << sms.number << " " << sms.time << "\n  "
                << sms.message << "\n";
    }
    std::cout << messages.size() << " message(s)\n";
    return 0;
  }

  int cmd_sms_send(const std::string& device, const std::string& number, const std::string& text) {
    open_device(device)->send_sms(number, text);
    std::cout << "sent\n";
    return 0;
  }

  int cmd_sms_delete(const std::string& device, const std::vector<int>& indices) {
    const auto failed = open_device(device)->delete_sms(indices);
    for (int index : failed) {
      std::cerr << "failed to delete " << index << "\n";
    }
    return failed.empty() ? 0 : 1;
  }

  int cmd_monitor(int seconds) {
    start_pool(pool_cfg_.device_patterns);
    auto subscription = bus_.subscribe(static_cast<int>(pool_cfg_.subscriber_buffer));
    const auto devices = pool_->scan();
    std::cout << "monitoring " << devices.size() << " device(s)\n";

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    while (seconds <= 0 || std::chrono::steady_clock::now() < deadline) {
      if (auto message = subscription->next(std::chrono::milliseconds(500))) {
        std::cout << *message << std::flush;
      }
    }
    subscription->cancel();
    return 0;
  }

  std::shared_ptr<config::ConfigManager> config_;
  config::PoolConfig pool_cfg_;
  event::EventBus bus_;
  std::unique_ptr<concurrency::IoContextManager> runtime_;
  std::unique_ptr<pool::ModemPool> pool_;
};

}  // namespace

int main(int argc, char** argv) {
  std::string config_file;
  bool verbose = false;
  std::vector<std::string> args;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_file = argv[++i];
    } else if (arg == "--verbose" || arg == "-v") {
      verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    } else {
      args.push_back(arg);
    }
  }
  if (args.empty()) {
    print_usage(argv[0]);
    return 2;
  }

  try {
    auto config = config_file.empty() ? config::ConfigFactory::create_with_defaults()
                                      : config::ConfigFactory::create_from_file(config_file);
    config::ConfigFactory::apply_logging(*config);
    if (verbose) {
      diagnostics::Logger::instance().set_level(diagnostics::LogLevel::DEBUG);
    }

    ModemCli cli(config);
    return cli.run(args);
  } catch (const diagnostics::ModemException& e) {
    std::cerr << "Error: " << e.get_full_message() << std::endl;
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
