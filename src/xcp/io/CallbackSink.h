// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#pragma once

#include <xcp/io/Sink.h>
#include <functional>

namespace xcp {

/**
 * Synthetic sink, invoking a callback on each write().
 */
class XCP_API CallbackSink : public Sink {
 public:
  typedef std::function<IOResult(const char*, size_t)> Callback;

  explicit CallbackSink(Callback cb) : callback_(std::move(cb)) {}

  IOResult write(const char* buf, size_t size) override {
    return callback_(buf, size);
  }

 private:
  Callback callback_;
};

} // namespace xcp
