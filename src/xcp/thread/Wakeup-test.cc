// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <gtest/gtest.h>
#include <xcp/thread/Wakeup.h>
#include <thread>

using namespace xcp;

TEST(Wakeup, generation) {
  Wakeup wakeup;
  EXPECT_EQ(0, wakeup.generation());

  wakeup.wakeup();
  wakeup.wakeup();
  EXPECT_EQ(2, wakeup.generation());

  // returns right away, generation 1 has passed already
  wakeup.waitForWakeup(1);
  wakeup.waitForFirstWakeup();
}

TEST(Wakeup, waitForTimesOut) {
  Wakeup wakeup;
  EXPECT_FALSE(wakeup.waitFor(10_milliseconds, wakeup.generation()));
}

TEST(Wakeup, wakesWaitingThread) {
  Wakeup wakeup;
  long gen = wakeup.generation();

  std::thread waker([&]() { wakeup.wakeup(); });
  wakeup.waitForWakeup(gen);
  waker.join();

  EXPECT_TRUE(wakeup.waitFor(1_milliseconds, gen));
}
