// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#pragma once

#include <xcp/Api.h>
#include <xcp/Buffer.h>
#include <cstdint>
#include <functional>
#include <string>
#include <system_error>

namespace xcp {

class Executor;
class Source;

/**
 * Outcome of a copy operation.
 */
struct CopyResult {
  int64_t bytesCopied;
  std::error_code error;
};

XCP_API std::string to_string(const CopyResult& result);

typedef std::function<void(const CopyResult&)> CopyCompletionHandler;

/**
 * Tunables of a single copy operation.
 *
 * Setters return the options object itself so they can be chained,
 * the last call to a setter wins.
 *
 * @code
 *   copy(token, &sink, &source, CopyOptions().bufferSize(4096)
 *                                            .waitForLastOp(false));
 * @endcode
 */
class XCP_API CopyOptions {
 public:
  static constexpr size_t DefaultBufferSize = 32 * 1024;

  CopyOptions();

  /**
   * Whether or not a cancelled copy waits for the read/write cycle
   * in flight before returning.
   *
   * Without waiting, the returned byte count is a snapshot taken at the
   * time of cancellation and a lower bound of what the still running
   * worker eventually writes.
   *
   * Defaults to @c true.
   */
  CopyOptions& waitForLastOp(bool value);

  /**
   * Size of the work buffer to allocate per copy operation.
   *
   * Defaults to DefaultBufferSize.
   *
   * @throw RuntimeError with Status::InvalidArgumentError if @p value is 0.
   */
  CopyOptions& bufferSize(size_t value);

  /**
   * Caller owned work buffer, taking precedence over bufferSize().
   *
   * @throw RuntimeError with Status::InvalidArgumentError if @p value is empty.
   */
  CopyOptions& buffer(MutableBufferRef value);

  /**
   * Executor to run the copy worker on.
   *
   * Defaults to a process wide executor that spawns a thread per worker.
   */
  CopyOptions& executor(Executor* value);

  /**
   * Handler invoked by the worker with its final result once it terminated.
   */
  CopyOptions& completionHandler(CopyCompletionHandler handler);

  bool waitForLastOp() const noexcept { return waitForLastOp_; }
  size_t bufferSize() const noexcept { return bufferSize_; }
  bool hasBuffer() const noexcept { return !buffer_.empty(); }
  MutableBufferRef buffer() const noexcept { return buffer_; }
  Executor* executor() const noexcept { return executor_; }
  const CopyCompletionHandler& completionHandler() const noexcept {
    return completionHandler_;
  }

 private:
  bool waitForLastOp_;
  size_t bufferSize_;
  MutableBufferRef buffer_;
  Executor* executor_;
  CopyCompletionHandler completionHandler_;
};

/**
 * Computes the chunk size a copy from @p source works with.
 *
 * An explicit buffer's size wins. Otherwise bufferSize() is used,
 * shrunk to the remaining bound of @p source if that is smaller,
 * but never below 1 byte.
 */
XCP_API size_t resolveBufferSize(const CopyOptions& options,
                                 const Source* source);

} // namespace xcp
