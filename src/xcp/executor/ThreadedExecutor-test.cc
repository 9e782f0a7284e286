// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <gtest/gtest.h>
#include <xcp/executor/ThreadedExecutor.h>
#include <xcp/thread/Wakeup.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace xcp;

TEST(ThreadedExecutor, execute) {
  ThreadedExecutor executor;
  std::atomic<int> count(0);
  const std::thread::id caller = std::this_thread::get_id();
  std::thread::id worker;

  executor.execute([&]() { worker = std::this_thread::get_id(); count++; });
  executor.execute("named", [&]() { count++; });
  executor.joinAll();

  EXPECT_EQ(2, count.load());
  EXPECT_NE(caller, worker);
}

TEST(ThreadedExecutor, exceptionHandler) {
  std::atomic<int> caught(0);
  ThreadedExecutor executor([&](const std::exception&) { caught++; });

  executor.execute([]() { throw std::runtime_error("boom"); });
  executor.joinAll();

  EXPECT_EQ(1, caught.load());
}

TEST(ThreadedExecutor, executeAfter) {
  ThreadedExecutor executor;
  Wakeup fired;

  auto start = std::chrono::steady_clock::now();
  executor.executeAfter(20_milliseconds, [&]() { fired.wakeup(); });
  fired.waitForFirstWakeup();
  auto elapsed = std::chrono::steady_clock::now() - start;
  executor.joinAll();

  EXPECT_LE(std::chrono::milliseconds(20), elapsed);
}

TEST(ThreadedExecutor, executeAfterCancelled) {
  ThreadedExecutor executor;
  std::atomic<bool> fired(false);

  Executor::HandleRef handle =
      executor.executeAfter(10_seconds, [&]() { fired = true; });
  handle->cancel();
  executor.joinAll();

  EXPECT_TRUE(handle->isCancelled());
  EXPECT_FALSE(fired.load());
}

TEST(ThreadedExecutor, cancelAfterFireIsNoop) {
  ThreadedExecutor executor;
  Wakeup fired;
  std::atomic<int> runs(0);

  Executor::HandleRef handle = executor.executeAfter(1_milliseconds, [&]() {
    runs++;
    fired.wakeup();
  });
  fired.waitForFirstWakeup();
  handle->cancel();
  executor.joinAll();

  EXPECT_EQ(1, runs.load());
}
