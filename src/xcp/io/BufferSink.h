// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#pragma once

#include <xcp/Buffer.h>
#include <xcp/io/Sink.h>

namespace xcp {

/**
 * Sink, appending all incoming data to a growable buffer.
 */
class XCP_API BufferSink : public Sink {
 public:
  explicit BufferSink(Buffer* target);

  IOResult write(const char* buf, size_t size) override;

  Buffer* buffer() const noexcept { return target_; }

 private:
  Buffer* target_;
};

} // namespace xcp
