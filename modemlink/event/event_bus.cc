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

#include "modemlink/event/event_bus.hpp"

#include <algorithm>
#include <atomic>

#include "modemlink/diagnostics/logger.hpp"

namespace modemlink {
namespace event {

struct Subscription::Registry {
  mutable std::shared_mutex mutex;
  std::vector<std::shared_ptr<Subscription>> subscribers;
  std::atomic<uint64_t> dropped{0};
};

Subscription::Subscription(size_t capacity, std::weak_ptr<Registry> registry)
    : capacity_(capacity), registry_(std::move(registry)) {}

Subscription::~Subscription() = default;

std::optional<std::string> Subscription::next(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
  if (queue_.empty()) return std::nullopt;
  auto message = std::move(queue_.front());
  queue_.pop_front();
  return message;
}

std::optional<std::string> Subscription::try_next() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.empty()) return std::nullopt;
  auto message = std::move(queue_.front());
  queue_.pop_front();
  return message;
}

void Subscription::cancel() {
  if (auto registry = registry_.lock()) {
    std::unique_lock<std::shared_mutex> lock(registry->mutex);
    auto& subs = registry->subscribers;
    subs.erase(std::remove_if(subs.begin(), subs.end(), [this](const auto& s) { return s.get() == this; }),
               subs.end());
  }
  if (close_queue()) {
    MODEMLINK_LOG_DEBUG("event_bus", "cancel", "subscription closed");
  }
}

bool Subscription::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t Subscription::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

bool Subscription::offer(const std::string& message) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || queue_.size() >= capacity_) return false;
    queue_.push_back(message);
  }
  cv_.notify_one();
  return true;
}

bool Subscription::close_queue() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return false;
    closed_ = true;
  }
  cv_.notify_all();
  return true;
}

EventBus::EventBus() : registry_(std::make_shared<Subscription::Registry>()) {}

EventBus::~EventBus() {
  std::vector<std::shared_ptr<Subscription>> remaining;
  {
    std::unique_lock<std::shared_mutex> lock(registry_->mutex);
    remaining.swap(registry_->subscribers);
  }
  for (auto& sub : remaining) {
    sub->close_queue();
  }
}

std::shared_ptr<Subscription> EventBus::subscribe(int buffer_size) {
  const size_t capacity = buffer_size > 0 ? static_cast<size_t>(buffer_size) : base::constants::DEFAULT_SUBSCRIBER_BUFFER;
  std::shared_ptr<Subscription> sub(new Subscription(capacity, registry_));
  {
    std::unique_lock<std::shared_mutex> lock(registry_->mutex);
    registry_->subscribers.push_back(sub);
  }
  MODEMLINK_LOG_DEBUG("event_bus", "subscribe", "subscriber added, buffer " + std::to_string(capacity));
  return sub;
}

void EventBus::broadcast(const std::string& message) {
  std::shared_lock<std::shared_mutex> lock(registry_->mutex);
  for (const auto& sub : registry_->subscribers) {
    if (!sub->offer(message)) {
      registry_->dropped.fetch_add(1, std::memory_order_relaxed);
    }
  }
}

void EventBus::publish(const std::string& source, const std::string& chunk) {
  broadcast("[" + source + "] " + chunk);
}

size_t EventBus::subscriber_count() const {
  std::shared_lock<std::shared_mutex> lock(registry_->mutex);
  return registry_->subscribers.size();
}

uint64_t EventBus::dropped_count() const { return registry_->dropped.load(std::memory_order_relaxed); }

}  // namespace event
}  // namespace modemlink
