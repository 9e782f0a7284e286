// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#pragma once

#include <xcp/io/Source.h>
#include <functional>

namespace xcp {

/**
 * Synthetic source, invoking a callback on each read().
 */
class XCP_API CallbackSource : public Source {
 public:
  typedef std::function<IOResult(char*, size_t)> Callback;

  explicit CallbackSource(Callback cb) : callback_(std::move(cb)) {}

  IOResult read(char* buf, size_t size) override { return callback_(buf, size); }

 private:
  Callback callback_;
};

} // namespace xcp
