// Copyright 2022 Ringgaard Research ApS
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <errno.h>
#include <unistd.h>
#include <atomic>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "bulkload/base/logging.h"
#include "bulkload/base/status.h"
#include "bulkload/util/queue.h"
#include "bulkload/util/thread.h"
#include "bulkload/util/threadpool.h"
#include "bulkload/util/throttle.h"

namespace bulkload {
namespace {

TEST(LoggingTest, VerboseLogging) {
  Status st(EINVAL, "bad input");
  int verbosity = log_verbosity;
  ::testing::internal::CaptureStderr();
  log_verbosity = 0;
  VLOG(1) << "hidden: " << st;
  log_verbosity = 1;
  VLOG(1) << "shown: " << st;
  string output = ::testing::internal::GetCapturedStderr();
  log_verbosity = verbosity;

  EXPECT_EQ(output.find("hidden"), string::npos);
  EXPECT_NE(output.find("shown: "), string::npos);
  EXPECT_NE(output.find("bad input"), string::npos);
}

TEST(QueueTest, ProducersAndConsumers) {
  const int kProducers = 4;
  const int kItems = 1000;
  Queue<int> queue(3);

  std::atomic<int64> sum{0};
  std::atomic<int> count{0};
  std::vector<ClosureThread> consumers;
  consumers.reserve(3);
  for (int i = 0; i < 3; ++i) {
    consumers.emplace_back([&queue, &sum, &count]() {
      int item;
      while (queue.Get(&item)) {
        sum += item;
        count++;
      }
    });
    consumers.back().SetJoinable(true);
    consumers.back().Start();
  }

  std::vector<ClosureThread> producers;
  producers.reserve(kProducers);
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&queue]() {
      for (int i = 1; i <= kItems; ++i) {
        EXPECT_LE(queue.size(), queue.capacity());
        queue.Put(i);
      }
    });
    producers.back().SetJoinable(true);
    producers.back().Start();
  }
  for (ClosureThread &t : producers) t.Join();
  queue.Close();
  for (ClosureThread &t : consumers) t.Join();

  EXPECT_EQ(count, kProducers * kItems);
  EXPECT_EQ(sum, kProducers * kItems * (kItems + 1) / 2);
}

TEST(QueueTest, GetDrainsClosedQueue) {
  Queue<int> queue(5);
  queue.Put(1);
  queue.Put(2);
  queue.Close();
  queue.Close();
  EXPECT_TRUE(queue.closed());
  int item;
  ASSERT_TRUE(queue.Get(&item));
  EXPECT_EQ(item, 1);
  ASSERT_TRUE(queue.Get(&item));
  EXPECT_EQ(item, 2);
  EXPECT_FALSE(queue.Get(&item));
}

TEST(ThrottleTest, LimitsConcurrency) {
  const int kMax = 3;
  Throttle throttle(kMax);
  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  std::vector<ClosureThread> threads;
  threads.reserve(20);
  for (int i = 0; i < 20; ++i) {
    throttle.Start();
    threads.emplace_back([&]() {
      int now = ++running;
      int seen = peak;
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
      usleep(2000);
      running--;
      throttle.Done();
    });
    threads.back().SetJoinable(true);
    threads.back().Start();
  }
  throttle.Wait();
  EXPECT_EQ(throttle.active(), 0);
  for (ClosureThread &t : threads) t.Join();
  EXPECT_LE(peak, kMax);
  EXPECT_GE(peak, 1);
}

TEST(ThreadPoolTest, RunsAllTasks) {
  std::atomic<int> done{0};
  ThreadPool pool(4, 2);
  pool.StartWorkers();
  for (int i = 0; i < 100; ++i) {
    pool.Schedule([&done]() { done++; });
  }
  pool.Shutdown();
  pool.Join();
  EXPECT_EQ(done, 100);
}

}  // namespace
}  // namespace bulkload
