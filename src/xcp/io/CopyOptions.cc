// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <xcp/io/CopyOptions.h>
#include <xcp/io/Source.h>
#include <xcp/RuntimeError.h>
#include <xcp/Status.h>
#include <fmt/format.h>
#include <algorithm>

namespace xcp {

constexpr size_t CopyOptions::DefaultBufferSize;

std::string to_string(const CopyResult& result) {
  if (!result.error)
    return fmt::format("{} bytes", result.bytesCopied);

  return fmt::format("{} bytes ({})", result.bytesCopied,
                     result.error.message());
}

CopyOptions::CopyOptions()
    : waitForLastOp_(true),
      bufferSize_(DefaultBufferSize),
      buffer_(),
      executor_(nullptr),
      completionHandler_() {
}

CopyOptions& CopyOptions::waitForLastOp(bool value) {
  waitForLastOp_ = value;
  return *this;
}

CopyOptions& CopyOptions::bufferSize(size_t value) {
  if (value == 0)
    RAISE(InvalidArgumentError, "Buffer size must be greater than zero.");

  bufferSize_ = value;
  return *this;
}

CopyOptions& CopyOptions::buffer(MutableBufferRef value) {
  if (value.empty())
    RAISE(InvalidArgumentError, "Copy buffer must not be empty.");

  buffer_ = value;
  return *this;
}

CopyOptions& CopyOptions::executor(Executor* value) {
  executor_ = value;
  return *this;
}

CopyOptions& CopyOptions::completionHandler(CopyCompletionHandler handler) {
  completionHandler_ = std::move(handler);
  return *this;
}

size_t resolveBufferSize(const CopyOptions& options, const Source* source) {
  if (options.hasBuffer())
    return options.buffer().size();

  size_t size = options.bufferSize();

  if (source != nullptr) {
    if (std::optional<size_t> bound = source->remainingBound()) {
      if (*bound < size) {
        size = std::max<size_t>(*bound, 1);
      }
    }
  }

  return size;
}

} // namespace xcp
