// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <gtest/gtest.h>
#include <xcp/io/Copy.h>
#include <xcp/io/BufferSink.h>
#include <xcp/io/BufferSource.h>
#include <xcp/io/CallbackSink.h>
#include <xcp/io/CallbackSource.h>
#include <xcp/executor/ThreadedExecutor.h>
#include <xcp/thread/Wakeup.h>
#include <xcp/CancellationToken.h>
#include <xcp/RuntimeError.h>
#include <xcp/Status.h>
#include <atomic>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace xcp;

static IOResult ok(size_t n) {
  return IOResult{static_cast<ssize_t>(n), std::error_code()};
}

static CallbackSource fillingSource() {
  return CallbackSource([](char*, size_t size) { return ok(size); });
}

static CallbackSink acceptingSink() {
  return CallbackSink([](const char*, size_t size) { return ok(size); });
}

static CallbackSource panickingSource() {
  return CallbackSource([](char*, size_t) -> IOResult {
    ADD_FAILURE() << "Source must not be read from.";
    return IOResult{0, Status::InternalError};
  });
}

TEST(Copy, cancelledTokenIsNoop) {
  CancellationSource cancellation;
  cancellation.cancel();

  CopyResult result = copy(cancellation.token(), nullptr, nullptr);

  EXPECT_EQ(make_error_code(Status::Cancelled), result.error);
  EXPECT_EQ(0, result.bytesCopied);
}

TEST(Copy, cancelledTokenReportsItsError) {
  CancellationSource cancellation;
  cancellation.cancel(std::make_error_code(std::errc::timed_out));

  CallbackSource source = panickingSource();
  CallbackSink sink = acceptingSink();
  CopyResult result = copy(cancellation.token(), &sink, &source);

  EXPECT_EQ(std::make_error_code(std::errc::timed_out), result.error);
  EXPECT_EQ(0, result.bytesCopied);
}

TEST(Copy, copiesUntilEndOfFile) {
  const std::string text(100000, 'x');
  BufferSource source(text);
  Buffer target;
  BufferSink sink(&target);

  CopyResult result = copy(CancellationToken(), &sink, &source);

  EXPECT_FALSE(result.error);
  EXPECT_EQ(100000, result.bytesCopied);
  EXPECT_EQ(text, target.str());
}

TEST(Copy, noWaitReturnsSnapshotWhileWriteInFlight) {
  CancellationSource cancellation;
  Wakeup unblockWrite;
  auto workerDone = std::make_shared<Wakeup>();
  auto writeTotal = std::make_shared<std::atomic<int64_t>>(0);
  auto workerTotal = std::make_shared<std::atomic<int64_t>>(-1);

  auto sink = std::make_shared<CallbackSink>(
      [&cancellation, &unblockWrite, writeTotal](const char*, size_t size) {
        cancellation.cancel();
        unblockWrite.waitForFirstWakeup();
        *writeTotal += size;
        return ok(size);
      });
  auto source = std::make_shared<CallbackSource>(
      [](char*, size_t size) { return ok(size); });

  CopyResult result = copy(
      cancellation.token(), sink, source,
      CopyOptions().waitForLastOp(false)
                   .completionHandler([workerDone, workerTotal](const CopyResult& r) {
                     *workerTotal = r.bytesCopied;
                     workerDone->wakeup();
                   }));

  EXPECT_EQ(make_error_code(Status::Cancelled), result.error);
  EXPECT_EQ(0, result.bytesCopied);

  unblockWrite.wakeup();
  workerDone->waitForFirstWakeup();

  EXPECT_EQ(32768, writeTotal->load());
  EXPECT_EQ(32768, workerTotal->load());
}

TEST(Copy, waitIncludesWriteInFlight) {
  CancellationSource cancellation;
  Wakeup unblockWrite;
  ThreadedExecutor timers;

  timers.executeAfter(20_milliseconds, [&]() { unblockWrite.wakeup(); });

  CallbackSink sink([&](const char*, size_t size) {
    cancellation.cancel();
    unblockWrite.waitForFirstWakeup();
    return ok(size);
  });
  CallbackSource source = fillingSource();

  CopyResult result = copy(cancellation.token(), &sink, &source,
                           CopyOptions().waitForLastOp(true));

  EXPECT_EQ(make_error_code(Status::Cancelled), result.error);
  EXPECT_EQ(32768, result.bytesCopied);
}

TEST(Copy, writeErrorWinsOverCancellation) {
  CancellationSource cancellation;
  const std::error_code writeError = std::make_error_code(std::errc::broken_pipe);

  CallbackSink sink([&](const char*, size_t) {
    return IOResult{42, writeError};
  });
  CallbackSource source([&](char*, size_t size) {
    cancellation.cancel();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    return ok(size);
  });

  CopyResult result = copy(cancellation.token(), &sink, &source);

  EXPECT_EQ(writeError, result.error);
  EXPECT_EQ(42, result.bytesCopied);
}

TEST(Copy, readErrorWinsOverCancellation) {
  CancellationSource cancellation;
  const std::error_code readError = std::make_error_code(std::errc::io_error);

  CallbackSink sink([](const char*, size_t) { return ok(42); });
  CallbackSource source([&](char*, size_t) {
    cancellation.cancel();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    return IOResult{0, readError};
  });

  CopyResult result = copy(cancellation.token(), &sink, &source);

  EXPECT_EQ(readError, result.error);
  EXPECT_EQ(0, result.bytesCopied);
}

TEST(Copy, readErrorWritesWhatItCan) {
  const std::error_code readError = std::make_error_code(std::errc::io_error);

  CallbackSink sink = acceptingSink();
  CallbackSource source([&](char*, size_t) {
    return IOResult{42, readError};
  });

  CopyResult result = copy(CancellationToken(), &sink, &source);

  EXPECT_EQ(readError, result.error);
  EXPECT_EQ(42, result.bytesCopied);
}

TEST(Copy, invalidWrite) {
  CallbackSink sink([](const char*, size_t) { return ok(100); });
  CallbackSource source([](char*, size_t) { return ok(42); });

  CopyResult result = copy(CancellationToken(), &sink, &source);

  EXPECT_EQ(make_error_code(Status::InvalidWriteError), result.error);
  EXPECT_EQ(0, result.bytesCopied);
}

TEST(Copy, negativeWriteCountIsInvalidWrite) {
  CallbackSink sink([](const char*, size_t) {
    return IOResult{-1, std::error_code()};
  });
  CallbackSource source([](char*, size_t) { return ok(42); });

  CopyResult result = copy(CancellationToken(), &sink, &source);

  EXPECT_EQ(make_error_code(Status::InvalidWriteError), result.error);
  EXPECT_EQ(0, result.bytesCopied);
}

TEST(Copy, shortWriteWithoutErrorIsInvalidWrite) {
  CallbackSink sink([](const char*, size_t size) { return ok(size / 2); });
  CallbackSource source([](char*, size_t) { return ok(42); });

  CopyResult result = copy(CancellationToken(), &sink, &source);

  EXPECT_EQ(make_error_code(Status::InvalidWriteError), result.error);
  EXPECT_EQ(21, result.bytesCopied);
}

TEST(Copy, invalidRead) {
  CallbackSink sink = acceptingSink();
  CallbackSource source([](char*, size_t size) { return ok(size + 1); });

  CopyResult result = copy(CancellationToken(), &sink, &source);

  EXPECT_EQ(make_error_code(Status::InvalidReadError), result.error);
  EXPECT_EQ(0, result.bytesCopied);
}

TEST(Copy, bufferSize) {
  bool called = false;

  CallbackSink sink = acceptingSink();
  CallbackSource source([&](char*, size_t size) {
    called = true;
    return IOResult{static_cast<ssize_t>(size), Status::EndOfFile};
  });

  CopyResult result = copy(CancellationToken(), &sink, &source,
                           CopyOptions().bufferSize(16));

  EXPECT_TRUE(called);
  EXPECT_FALSE(result.error);
  EXPECT_EQ(16, result.bytesCopied);
}

TEST(Copy, exceptionInSourceBecomesError) {
  CallbackSink sink = acceptingSink();
  CallbackSource source([](char*, size_t) -> IOResult {
    throw std::runtime_error("source broke");
  });

  CopyResult result = copy(CancellationToken(), &sink, &source);

  EXPECT_EQ(make_error_code(Status::CaughtUnknownExceptionError), result.error);
  EXPECT_EQ(0, result.bytesCopied);
}

TEST(Copy, systemErrorInSinkKeepsItsCode) {
  CallbackSink sink([](const char*, size_t) -> IOResult {
    RAISE(IOError, "sink broke");
  });
  CallbackSource source = fillingSource();

  CopyResult result = copy(CancellationToken(), &sink, &source);

  EXPECT_EQ(make_error_code(Status::IOError), result.error);
  EXPECT_EQ(0, result.bytesCopied);
}

TEST(Copy, runsOnGivenExecutor) {
  ThreadedExecutor executor;
  const std::thread::id caller = std::this_thread::get_id();
  std::thread::id reader;

  CallbackSink sink = acceptingSink();
  CallbackSource source([&](char*, size_t size) {
    reader = std::this_thread::get_id();
    return IOResult{static_cast<ssize_t>(size), Status::EndOfFile};
  });

  CopyResult result = copy(CancellationToken(), &sink, &source,
                           CopyOptions().executor(&executor).bufferSize(8));

  EXPECT_FALSE(result.error);
  EXPECT_EQ(8, result.bytesCopied);
  EXPECT_NE(caller, reader);
}

TEST(Copy, completionHandlerSeesFinalResult) {
  int64_t handled = -1;
  std::error_code handledError = Status::InternalError;

  BufferSource source("Hello world");
  Buffer target;
  BufferSink sink(&target);

  CopyResult result = copy(
      CancellationToken(), &sink, &source,
      CopyOptions().completionHandler([&](const CopyResult& r) {
        handled = r.bytesCopied;
        handledError = r.error;
      }));

  EXPECT_EQ(11, result.bytesCopied);
  EXPECT_EQ(11, handled);
  EXPECT_FALSE(handledError);
}

TEST(Copy, deadline) {
  CancellationSource cancellation;
  ThreadedExecutor timers;

  CallbackSink sink([](const char*, size_t size) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    return ok(size);
  });
  CallbackSource source = fillingSource();

  Executor::HandleRef deadline = cancellation.cancelAfter(&timers, 20_milliseconds);
  CopyResult result = copy(cancellation.token(), &sink, &source,
                           CopyOptions().bufferSize(1024));

  EXPECT_EQ(make_error_code(Status::DeadlineExceeded), result.error);
  EXPECT_LT(0, result.bytesCopied);
  EXPECT_EQ(0, result.bytesCopied % 1024);
}

TEST(Copy, withBuffer) {
  char buffer[15];
  std::memset(buffer, 0, sizeof(buffer));

  CallbackSink sink = acceptingSink();
  CallbackSource source([](char* buf, size_t) {
    std::memcpy(buf, "hello world", 11);
    return IOResult{11, Status::EndOfFile};
  });

  CopyResult result = copyWithBuffer(CancellationToken(), &sink, &source,
                                     MutableBufferRef(buffer));

  EXPECT_FALSE(result.error);
  EXPECT_EQ(11, result.bytesCopied);
  EXPECT_EQ("hello world", std::string(buffer, 11));
}

TEST(CopyN, onlyCopiesN) {
  std::vector<size_t> bytesRead;

  CallbackSink sink = acceptingSink();
  CallbackSource source([&](char*, size_t size) {
    bytesRead.push_back(size);
    return ok(size);
  });

  CopyResult result = copyN(CancellationToken(), &sink, &source, 100,
                            CopyOptions().bufferSize(64));

  EXPECT_FALSE(result.error);
  EXPECT_EQ(100, result.bytesCopied);
  EXPECT_EQ((std::vector<size_t>{64, 36}), bytesRead);
}

TEST(CopyN, shrinksBufferToLimit) {
  std::vector<size_t> bytesRead;

  CallbackSink sink = acceptingSink();
  CallbackSource source([&](char*, size_t size) {
    bytesRead.push_back(size);
    return ok(size);
  });

  CopyResult result = copyN(CancellationToken(), &sink, &source, 100);

  EXPECT_FALSE(result.error);
  EXPECT_EQ(100, result.bytesCopied);
  EXPECT_EQ((std::vector<size_t>{100}), bytesRead);
}

TEST(CopyN, readLessThanN) {
  CallbackSink sink = acceptingSink();
  CallbackSource source([](char*, size_t) {
    return IOResult{50, Status::EndOfFile};
  });

  CopyResult result = copyN(CancellationToken(), &sink, &source, 100);

  EXPECT_EQ(make_error_code(Status::EndOfFile), result.error);
  EXPECT_EQ(50, result.bytesCopied);
}

TEST(CopyN, zeroDoesNotRead) {
  CopyResult result = copyN(CancellationToken(), nullptr, nullptr, 0);

  EXPECT_FALSE(result.error);
  EXPECT_EQ(0, result.bytesCopied);
}

TEST(CopyN, propagatesWriteError) {
  const std::error_code writeError = std::make_error_code(std::errc::no_space_on_device);

  CallbackSink sink([&](const char*, size_t) { return IOResult{10, writeError}; });
  CallbackSource source = fillingSource();

  CopyResult result = copyN(CancellationToken(), &sink, &source, 100);

  EXPECT_EQ(writeError, result.error);
  EXPECT_EQ(10, result.bytesCopied);
}

TEST(CopyN, noWaitKeepsLimitedSourceAlive) {
  CancellationSource cancellation;
  Wakeup unblockWrite;
  auto workerDone = std::make_shared<Wakeup>();
  auto writeTotal = std::make_shared<std::atomic<int64_t>>(0);
  auto readTotal = std::make_shared<std::atomic<int64_t>>(0);
  auto workerTotal = std::make_shared<std::atomic<int64_t>>(-1);

  CallbackSink sink([&cancellation, &unblockWrite, writeTotal](const char*, size_t size) {
    cancellation.cancel();
    unblockWrite.waitForFirstWakeup();
    *writeTotal += size;
    return ok(size);
  });
  CallbackSource source([readTotal](char*, size_t size) {
    *readTotal += size;
    return ok(size);
  });

  CopyResult result = copyN(
      cancellation.token(), &sink, &source, 100,
      CopyOptions().bufferSize(64)
                   .waitForLastOp(false)
                   .completionHandler([workerDone, workerTotal](const CopyResult& r) {
                     *workerTotal = r.bytesCopied;
                     workerDone->wakeup();
                   }));

  EXPECT_EQ(make_error_code(Status::Cancelled), result.error);
  EXPECT_EQ(0, result.bytesCopied);

  // the worker still reads through the bounded view after copyN returned
  unblockWrite.wakeup();
  workerDone->waitForFirstWakeup();

  EXPECT_EQ(writeTotal->load(), workerTotal->load());
  EXPECT_LT(0, workerTotal->load());
  EXPECT_GE(100, workerTotal->load());
  EXPECT_GE(100, readTotal->load());
}

TEST(CopyN, negativeLimit) {
  CallbackSource source = panickingSource();
  CallbackSink sink = acceptingSink();

  EXPECT_THROW(copyN(CancellationToken(), &sink, &source, -1), RuntimeError);
}

TEST(ReadAll, helloWorld) {
  BufferSource source("Hello world");
  Buffer target;

  std::error_code ec = readAll(CancellationToken(), &source, &target);

  EXPECT_FALSE(ec);
  EXPECT_EQ("Hello world", target.str());
}

TEST(ReadAll, keepsBytesReadBeforeError) {
  const std::error_code readError = std::make_error_code(std::errc::io_error);
  int calls = 0;

  CallbackSource source([&](char* buf, size_t) {
    if (calls++ == 0) {
      std::memcpy(buf, "Hello", 5);
      return ok(5);
    }
    return IOResult{0, readError};
  });
  Buffer target;

  std::error_code ec = readAll(CancellationToken(), &source, &target);

  EXPECT_EQ(readError, ec);
  EXPECT_EQ("Hello", target.str());
}

TEST(ReadAll, replacesPreviousContent) {
  BufferSource source("fresh");
  Buffer target("stale data", 10);

  std::error_code ec = readAll(CancellationToken(), &source, &target);

  EXPECT_FALSE(ec);
  EXPECT_EQ("fresh", target.str());
}
