/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "ThreadPool.h"

#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <stdexcept>
#include <vector>

namespace {

TEST(ThreadPoolTest, ReturnsResultsThroughFutures) {
  ThreadPool pool(3);
  EXPECT_EQ(pool.getThreadCount(), 3u);

  std::vector<std::future<int>> futures;
  for (int i = 0; i < 20; ++i) {
    futures.push_back(pool.submit([](int value) { return value * value; }, i));
  }
  for (int i = 0; i < 20; ++i) {
    EXPECT_EQ(futures[i].get(), i * i);
  }
  EXPECT_EQ(pool.getMetrics().tasks_submitted.load(), 20u);
}

TEST(ThreadPoolTest, ExceptionsReachTheCaller) {
  ThreadPool pool(1);
  auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
  EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, DestructorDrainsQueuedTasks) {
  std::atomic<int> done{0};
  {
    ThreadPool pool(2);
    for (int i = 0; i < 50; ++i) {
      pool.submit([&done]() { ++done; });
    }
  }
  EXPECT_EQ(done.load(), 50);
}

TEST(ThreadPoolTest, ShutdownFinalizesMetrics) {
  ThreadPool pool(2);
  std::vector<std::future<void>> futures;
  for (int i = 0; i < 8; ++i) {
    futures.push_back(pool.submit([]() {}));
  }
  pool.shutdown();
  pool.shutdown();

  const ThreadPoolMetrics& metrics = pool.getMetrics();
  EXPECT_EQ(metrics.tasks_submitted.load(), 8u);
  EXPECT_EQ(metrics.tasks_completed.load(), 8u);
  EXPECT_GE(metrics.getAverageExecutionTime(), 0.0);
  EXPECT_THROW(pool.submit([]() {}), std::runtime_error);
}

TEST(ThreadPoolTest, AverageIsZeroWithoutCompletedTasks) {
  ThreadPool pool(1);
  EXPECT_EQ(pool.getMetrics().getAverageExecutionTime(), 0.0);
}

TEST(ThreadPoolTest, ZeroRequestsAtLeastOneThread) {
  ThreadPool pool(0);
  EXPECT_GE(pool.getThreadCount(), 1u);
}

}  // namespace
