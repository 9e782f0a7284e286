// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <xcp/io/BufferSink.h>

namespace xcp {

BufferSink::BufferSink(Buffer* target)
    : target_(target) {
}

IOResult BufferSink::write(const char* buf, size_t size) {
  target_->push_back(buf, size);
  return IOResult{static_cast<ssize_t>(size), std::error_code()};
}

} // namespace xcp
