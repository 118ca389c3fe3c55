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

#include "modemlink/concurrency/io_context_manager.hpp"

#include <algorithm>

#include "modemlink/diagnostics/error_handler.hpp"
#include "modemlink/diagnostics/logger.hpp"

namespace modemlink {
namespace concurrency {

IoContextManager::IoContextManager(size_t thread_count)
    : thread_count_(std::clamp<size_t>(thread_count, 1, base::constants::MAX_IO_THREADS)),
      ioc_(std::make_shared<IoContext>()) {
  // Logger must outlive the worker threads that log on shutdown
  diagnostics::Logger::instance();
}

IoContextManager::IoContextManager(IoContext& external_context)
    : owns_context_(false), thread_count_(0), ioc_(std::shared_ptr<IoContext>(&external_context, [](IoContext*) {})) {
  diagnostics::Logger::instance();
}

IoContextManager::~IoContextManager() { stop(); }

boost::asio::io_context& IoContextManager::get_context() { return *ioc_; }

void IoContextManager::start() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!owns_context_) {
    MODEMLINK_LOG_DEBUG("io_runtime", "start", "Using external io_context; thread creation skipped");
    return;
  }
  if (running_.load()) {
    MODEMLINK_LOG_DEBUG("io_runtime", "start", "Already running, ignoring start call");
    return;
  }

  if (ioc_->stopped()) {
    ioc_->restart();
  }
  work_guard_ = std::make_unique<WorkGuard>(ioc_->get_executor());

  auto context = ioc_;
  for (size_t i = 0; i < thread_count_; ++i) {
    io_threads_.emplace_back([context, i]() {
      MODEMLINK_LOG_DEBUG("io_runtime", "run", "Worker " + std::to_string(i) + " started");
      try {
        context->run();
      } catch (const std::exception& e) {
        MODEMLINK_LOG_ERROR("io_runtime", "run", "Worker terminated: " + std::string(e.what()));
        diagnostics::error_reporting::report_system_error("io_runtime", "run", e.what());
      }
      MODEMLINK_LOG_DEBUG("io_runtime", "run", "Worker " + std::to_string(i) + " finished");
    });
  }
  running_.store(true);
  MODEMLINK_LOG_INFO("io_runtime", "start", "Started " + std::to_string(thread_count_) + " I/O threads");
}

void IoContextManager::stop() {
  std::vector<std::thread> workers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!owns_context_ || !running_.load()) {
      return;
    }

    work_guard_.reset();
    ioc_->stop();
    workers.swap(io_threads_);
    running_.store(false);
  }

  // Join outside the lock; a worker calling stop() on itself must not self-join
  for (auto& worker : workers) {
    if (!worker.joinable()) continue;
    if (worker.get_id() == std::this_thread::get_id()) {
      MODEMLINK_LOG_ERROR("io_runtime", "stop", "stop() called from an I/O thread; detaching it");
      worker.detach();
      continue;
    }
    worker.join();
  }
  MODEMLINK_LOG_DEBUG("io_runtime", "stop", "I/O threads joined");
}

bool IoContextManager::is_running() const { return running_.load(); }

}  // namespace concurrency
}  // namespace modemlink
