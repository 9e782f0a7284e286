// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <xcp/io/Copy.h>
#include <xcp/io/BufferSink.h>
#include <xcp/io/LimitedSource.h>
#include <xcp/executor/ThreadedExecutor.h>
#include <xcp/thread/Wakeup.h>
#include <xcp/ExceptionHandler.h>
#include <xcp/RuntimeError.h>
#include <xcp/Status.h>
#include <xcp/logging.h>
#include <atomic>
#include <utility>

namespace xcp {

namespace {

/**
 * State shared between the caller of copy() and its worker.
 *
 * In no-wait mode the worker keeps it alive after the caller returned.
 */
struct CopyState {
  CopyState() : total(0), done(false), error(), wakeup(), storage() {}

  std::atomic<int64_t> total;
  std::atomic<bool> done;
  std::error_code error; // written once, before done becomes true
  Wakeup wakeup;
  Buffer storage;
};

Executor* defaultExecutor() {
  // never destructed, so that unobserved workers do not block process exit
  static ThreadedExecutor* executor =
      new ThreadedExecutor(CatchAndLogExceptionHandler("copy"));
  return executor;
}

std::error_code transfer(const CancellationToken& token,
                         Sink* sink,
                         Source* source,
                         MutableBufferRef buf,
                         std::atomic<int64_t>* total) {
  for (;;) {
    IOResult rv = source->read(buf.data(), buf.size());

    if (rv.count < 0 || static_cast<size_t>(rv.count) > buf.size())
      return Status::InvalidReadError;

    if (rv.count > 0) {
      IOResult wv = sink->write(buf.data(), rv.count);

      if (wv.count < 0 || wv.count > rv.count)
        return Status::InvalidWriteError;

      total->fetch_add(wv.count);

      if (wv.error)
        return wv.error;

      if (wv.count < rv.count)
        return Status::InvalidWriteError;
    }

    if (rv.error) {
      if (rv.error == Status::EndOfFile)
        return std::error_code();

      return rv.error;
    }

    if (token.isCancelled())
      return token.error();
  }
}

void runWorker(std::shared_ptr<CopyState> state,
               CancellationToken token,
               Sink* sink,
               Source* source,
               MutableBufferRef buf,
               CopyCompletionHandler completionHandler) {
  std::error_code error;

  try {
    error = transfer(token, sink, source, buf, &state->total);
  } catch (const std::system_error& e) {
    logError("copy: {}", e.what());
    error = e.code();
  } catch (const std::exception& e) {
    logError("copy: Unhandled exception caught. {}", e.what());
    error = Status::CaughtUnknownExceptionError;
  } catch (...) {
    logError("copy: Unhandled foreign exception caught.");
    error = Status::CaughtUnknownExceptionError;
  }

  CopyResult result{state->total.load(), error};
  logTrace("copy: worker finished with {}", to_string(result));

  if (completionHandler) {
    safeInvoke(CatchAndLogExceptionHandler("copy"),
               [&]() { completionHandler(result); });
  }

  state->error = error;
  state->done.store(true, std::memory_order_release);
  state->wakeup.wakeup();
}

CopyResult copyWithOwners(const CancellationToken& token,
                          Sink* sink,
                          Source* source,
                          std::shared_ptr<void> sinkOwner,
                          std::shared_ptr<void> sourceOwner,
                          const CopyOptions& options) {
  if (token.isCancelled())
    return CopyResult{0, token.error()};

  std::shared_ptr<CopyState> state = std::make_shared<CopyState>();

  MutableBufferRef buf = options.buffer();
  if (!options.hasBuffer()) {
    state->storage.resize(resolveBufferSize(options, source));
    buf = MutableBufferRef(state->storage.data(), state->storage.size());
  }

  logTrace("copy: starting with a {} bytes buffer", buf.size());

  Executor* executor = options.executor() ? options.executor()
                                          : defaultExecutor();

  CancellationRegistration registration = token.onCancel([state]() {
    state->wakeup.wakeup();
  });

  CopyCompletionHandler completionHandler = options.completionHandler();
  executor->execute([state, token, sink, source, buf, completionHandler,
                     sinkOwner, sourceOwner]() {
    runWorker(state, token, sink, source, buf, completionHandler);
  });

  for (;;) {
    long generation = state->wakeup.generation();

    if (state->done.load(std::memory_order_acquire))
      return CopyResult{state->total.load(), state->error};

    if (token.isCancelled())
      break;

    state->wakeup.waitForWakeup(generation);
  }

  if (!options.waitForLastOp()) {
    int64_t snapshot = state->total.load();
    logDebug("copy: cancelled, not waiting for worker ({} bytes so far)",
             snapshot);
    return CopyResult{snapshot, token.error()};
  }

  logDebug("copy: cancelled, waiting for the cycle in flight");

  for (;;) {
    long generation = state->wakeup.generation();

    if (state->done.load(std::memory_order_acquire))
      break;

    state->wakeup.waitForWakeup(generation);
  }

  std::error_code error = state->error ? state->error : token.error();
  return CopyResult{state->total.load(), error};
}

} // namespace

CopyResult copy(const CancellationToken& token,
                Sink* sink,
                Source* source,
                const CopyOptions& options) {
  return copyWithOwners(token, sink, source, nullptr, nullptr, options);
}

CopyResult copy(const CancellationToken& token,
                std::shared_ptr<Sink> sink,
                std::shared_ptr<Source> source,
                const CopyOptions& options) {
  Sink* rawSink = sink.get();
  Source* rawSource = source.get();
  return copyWithOwners(token, rawSink, rawSource,
                        std::move(sink), std::move(source), options);
}

CopyResult copyWithBuffer(const CancellationToken& token,
                          Sink* sink,
                          Source* source,
                          MutableBufferRef buffer,
                          const CopyOptions& options) {
  CopyOptions opts = options;
  opts.buffer(buffer);
  return copy(token, sink, source, opts);
}

CopyResult copyN(const CancellationToken& token,
                 Sink* sink,
                 Source* source,
                 int64_t limit,
                 const CopyOptions& options) {
  if (limit == 0)
    return CopyResult{0, std::error_code()};

  if (limit < 0)
    RAISE(InvalidArgumentError, "Copy limit must not be negative.");

  std::shared_ptr<LimitedSource> limited =
      std::make_shared<LimitedSource>(source, limit);
  CopyResult result = copyWithOwners(token, sink, limited.get(),
                                     nullptr, limited, options);

  if (result.bytesCopied == limit)
    return CopyResult{limit, std::error_code()};

  if (result.bytesCopied < limit && !result.error)
    return CopyResult{result.bytesCopied, Status::EndOfFile};

  return result;
}

std::error_code readAll(const CancellationToken& token,
                        Source* source,
                        Buffer* target) {
  target->clear();

  BufferSink sink(target);
  CopyOptions options;
  options.waitForLastOp(true);
  return copy(token, &sink, source, options).error;
}

} // namespace xcp
