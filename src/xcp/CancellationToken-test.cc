// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <gtest/gtest.h>
#include <xcp/CancellationToken.h>
#include <xcp/executor/ThreadedExecutor.h>
#include <xcp/RuntimeError.h>
#include <xcp/Status.h>
#include <thread>

using namespace xcp;

TEST(CancellationToken, defaultNeverCancels) {
  CancellationToken token;

  EXPECT_FALSE(token.canBeCancelled());
  EXPECT_FALSE(token.isCancelled());
  EXPECT_FALSE(token.error());
  EXPECT_FALSE(token.wait(1_milliseconds));
  EXPECT_THROW(token.wait(), RuntimeError);
}

TEST(CancellationToken, cancel) {
  CancellationSource source;
  CancellationToken token = source.token();

  EXPECT_TRUE(token.canBeCancelled());
  EXPECT_FALSE(token.isCancelled());
  EXPECT_FALSE(token.error());

  EXPECT_TRUE(source.cancel());

  EXPECT_TRUE(source.isCancelled());
  EXPECT_TRUE(token.isCancelled());
  EXPECT_EQ(make_error_code(Status::Cancelled), token.error());
  EXPECT_EQ(make_error_code(Status::Cancelled), token.error());
}

TEST(CancellationToken, firesAtMostOnce) {
  CancellationSource source;
  int fired = 0;
  CancellationRegistration r = source.token().onCancel([&]() { fired++; });

  EXPECT_TRUE(source.cancel(std::make_error_code(std::errc::timed_out)));
  EXPECT_FALSE(source.cancel());

  EXPECT_EQ(1, fired);
  EXPECT_EQ(std::make_error_code(std::errc::timed_out), source.token().error());
}

TEST(CancellationToken, emptyReason) {
  CancellationSource source;

  EXPECT_THROW(source.cancel(std::error_code()), RuntimeError);
  EXPECT_FALSE(source.isCancelled());
}

TEST(CancellationToken, onCancelAfterCancellationRunsImmediately) {
  CancellationSource source;
  source.cancel();

  bool fired = false;
  CancellationRegistration r = source.token().onCancel([&]() { fired = true; });

  EXPECT_TRUE(fired);
}

TEST(CancellationToken, resetRegistration) {
  CancellationSource source;
  bool fired = false;

  CancellationRegistration r = source.token().onCancel([&]() { fired = true; });
  r.reset();
  source.cancel();

  EXPECT_FALSE(fired);
}

TEST(CancellationToken, registrationUnregistersWhenDestroyed) {
  CancellationSource source;
  bool fired = false;

  {
    CancellationRegistration r = source.token().onCancel([&]() { fired = true; });
  }
  source.cancel();

  EXPECT_FALSE(fired);
}

TEST(CancellationToken, movedRegistrationStaysRegistered) {
  CancellationSource source;
  bool fired = false;

  CancellationRegistration outer;
  {
    CancellationRegistration inner = source.token().onCancel([&]() { fired = true; });
    outer = std::move(inner);
  }
  source.cancel();

  EXPECT_TRUE(fired);
}

TEST(CancellationToken, waitFromOtherThread) {
  CancellationSource source;
  CancellationToken token = source.token();

  std::thread canceller([&]() { source.cancel(); });
  token.wait();
  canceller.join();

  EXPECT_TRUE(token.isCancelled());
  EXPECT_TRUE(token.wait(1_milliseconds));
}

TEST(CancellationToken, waitTimesOut) {
  CancellationSource source;

  EXPECT_FALSE(source.token().wait(10_milliseconds));
}

TEST(CancellationToken, cancelAfter) {
  ThreadedExecutor executor;
  CancellationSource source;

  Executor::HandleRef handle = source.cancelAfter(&executor, 10_milliseconds);

  EXPECT_TRUE(source.token().wait(5_seconds));
  EXPECT_EQ(make_error_code(Status::DeadlineExceeded), source.token().error());
}

TEST(CancellationToken, cancelAfterDisarmed) {
  ThreadedExecutor executor;
  CancellationSource source;

  Executor::HandleRef handle = source.cancelAfter(&executor, 10_milliseconds);
  handle->cancel();
  executor.joinAll();

  EXPECT_FALSE(source.isCancelled());
}
