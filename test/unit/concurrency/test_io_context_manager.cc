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

#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <future>
#include <set>
#include <thread>

#include "modemlink/base/channel_state.hpp"
#include "modemlink/concurrency/atomic_state.hpp"
#include "modemlink/concurrency/io_context_manager.hpp"

using namespace modemlink;
using namespace modemlink::concurrency;
using namespace std::chrono_literals;

TEST(IoContextManagerTest, RunsPostedWorkOnWorkerThreads) {
  IoContextManager runtime(2);
  EXPECT_FALSE(runtime.is_running());
  runtime.start();
  EXPECT_TRUE(runtime.is_running());

  std::promise<std::thread::id> ran_on;
  auto future = ran_on.get_future();
  boost::asio::post(runtime.get_context(), [&ran_on] { ran_on.set_value(std::this_thread::get_id()); });

  ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
  EXPECT_NE(future.get(), std::this_thread::get_id());
  runtime.stop();
  EXPECT_FALSE(runtime.is_running());
}

TEST(IoContextManagerTest, ThreadCountIsClamped) {
  EXPECT_EQ(IoContextManager(0).thread_count(), 1u);
  EXPECT_EQ(IoContextManager(4).thread_count(), 4u);
  EXPECT_EQ(IoContextManager(1000).thread_count(), 64u);
}

TEST(IoContextManagerTest, StartAndStopAreRepeatable) {
  IoContextManager runtime(1);
  runtime.start();
  runtime.start();
  runtime.stop();
  runtime.stop();

  runtime.start();
  std::promise<void> done;
  auto future = done.get_future();
  boost::asio::post(runtime.get_context(), [&done] { done.set_value(); });
  EXPECT_EQ(future.wait_for(2s), std::future_status::ready);
}

TEST(IoContextManagerTest, ExternalContextIsNotDriven) {
  boost::asio::io_context ioc;
  IoContextManager runtime(ioc);
  runtime.start();
  EXPECT_FALSE(runtime.is_running());
  EXPECT_EQ(&runtime.get_context(), &ioc);

  bool ran = false;
  boost::asio::post(ioc, [&ran] { ran = true; });
  std::this_thread::sleep_for(20ms);
  EXPECT_FALSE(ran);
  ioc.run();
  EXPECT_TRUE(ran);
}

TEST(IoContextManagerTest, SpreadsWorkAcrossThreads) {
  IoContextManager runtime(4);
  runtime.start();

  std::mutex mutex;
  std::set<std::thread::id> ids;
  std::atomic<int> remaining{8};
  std::promise<void> done;
  for (int i = 0; i < 8; ++i) {
    boost::asio::post(runtime.get_context(), [&] {
      std::this_thread::sleep_for(50ms);
      {
        std::lock_guard<std::mutex> lock(mutex);
        ids.insert(std::this_thread::get_id());
      }
      if (--remaining == 0) done.set_value();
    });
  }
  ASSERT_EQ(done.get_future().wait_for(5s), std::future_status::ready);
  EXPECT_GT(ids.size(), 1u);
}

TEST(AtomicStateTest, CompareAndSetTransitions) {
  AtomicState<base::ChannelState> state(base::ChannelState::Opening);
  EXPECT_TRUE(state.is_state(base::ChannelState::Opening));
  EXPECT_TRUE(state.compare_and_set(base::ChannelState::Opening, base::ChannelState::Active));
  EXPECT_FALSE(state.compare_and_set(base::ChannelState::Opening, base::ChannelState::Failed));
  EXPECT_EQ(state.exchange(base::ChannelState::Closed), base::ChannelState::Active);
  EXPECT_EQ(state.get(), base::ChannelState::Closed);
}
