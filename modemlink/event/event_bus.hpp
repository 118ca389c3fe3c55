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

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "modemlink/base/constants.hpp"
#include "modemlink/base/visibility.hpp"

namespace modemlink {
namespace event {

class EventBus;

/**
 * @brief Bounded message queue handed out by EventBus::subscribe()
 *
 * Once cancelled no new messages are queued; messages already queued can
 * still be drained with next()/try_next().
 */
class MODEMLINK_API Subscription {
 public:
  ~Subscription();

  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;

  /**
   * @brief Wait up to timeout for the next message
   * @return std::nullopt on timeout or when cancelled and drained
   */
  std::optional<std::string> next(std::chrono::milliseconds timeout);

  std::optional<std::string> try_next();

  /**
   * @brief Detach from the bus and close the queue; repeated calls do nothing
   */
  void cancel();

  bool closed() const;
  size_t capacity() const { return capacity_; }
  size_t pending() const;

 private:
  friend class EventBus;
  struct Registry;

  Subscription(size_t capacity, std::weak_ptr<Registry> registry);

  // false when the queue is full or closed
  bool offer(const std::string& message);
  // Returns true only for the call that actually closed the queue
  bool close_queue();

  const size_t capacity_;
  std::weak_ptr<Registry> registry_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> queue_;
  bool closed_ = false;
};

/**
 * @brief Lossy fan-out of raw modem output to any number of subscribers
 *
 * broadcast() never blocks: a subscriber whose queue is full misses the
 * message, the others still get it.
 */
class MODEMLINK_API EventBus {
 public:
  EventBus();
  ~EventBus();

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  /**
   * @param buffer_size queue capacity; values <= 0 mean the default of 100
   */
  std::shared_ptr<Subscription> subscribe(int buffer_size = static_cast<int>(base::constants::DEFAULT_SUBSCRIBER_BUFFER));

  void broadcast(const std::string& message);

  // "[source] chunk"
  void publish(const std::string& source, const std::string& chunk);

  size_t subscriber_count() const;
  uint64_t dropped_count() const;

 private:
  std::shared_ptr<Subscription::Registry> registry_;
};

}  // namespace event
}  // namespace modemlink
