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
#include <boost/asio.hpp>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "modemlink/base/constants.hpp"
#include "modemlink/base/visibility.hpp"

namespace modemlink {
namespace concurrency {

/**
 * I/O runtime shared by every channel of a pool
 *
 * Owns one io_context and a fixed set of worker threads running it.
 * Constructed explicitly by whoever owns the pool; channels only borrow
 * the context and put their own strand on top of it.
 */
class MODEMLINK_API IoContextManager {
 public:
  using IoContext = boost::asio::io_context;
  using WorkGuard = boost::asio::executor_work_guard<IoContext::executor_type>;

  explicit IoContextManager(size_t thread_count = base::constants::DEFAULT_IO_THREADS);

  // Wrap a context run by someone else; start() and stop() become no-ops
  explicit IoContextManager(IoContext& external_context);

  ~IoContextManager();

  IoContext& get_context();

  void start();
  void stop();

  bool is_running() const;
  size_t thread_count() const { return thread_count_; }

 private:
  IoContextManager(const IoContextManager&) = delete;
  IoContextManager& operator=(const IoContextManager&) = delete;

  bool owns_context_{true};
  size_t thread_count_;
  std::shared_ptr<IoContext> ioc_;
  std::unique_ptr<WorkGuard> work_guard_;
  std::vector<std::thread> io_threads_;
  std::atomic<bool> running_{false};
  mutable std::mutex mutex_;
};

}  // namespace concurrency
}  // namespace modemlink
