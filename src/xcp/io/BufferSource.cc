// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <xcp/io/BufferSource.h>
#include <xcp/Status.h>
#include <algorithm>
#include <cstring>

namespace xcp {

BufferSource::BufferSource(const BufferRef& data)
    : data_(data),
      offset_(0) {
}

IOResult BufferSource::read(char* buf, size_t size) {
  const size_t n = std::min(size, data_.size() - offset_);
  if (n != 0) {
    std::memcpy(buf, data_.data() + offset_, n);
    offset_ += n;
  }

  if (offset_ == data_.size())
    return IOResult{static_cast<ssize_t>(n), Status::EndOfFile};

  return IOResult{static_cast<ssize_t>(n), std::error_code()};
}

std::optional<size_t> BufferSource::remainingBound() const {
  return data_.size() - offset_;
}

} // namespace xcp
