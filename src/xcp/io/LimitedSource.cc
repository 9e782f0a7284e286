// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <xcp/io/LimitedSource.h>
#include <xcp/Status.h>

namespace xcp {

LimitedSource::LimitedSource(Source* source, int64_t limit)
    : source_(source),
      remaining_(limit) {
}

IOResult LimitedSource::read(char* buf, size_t size) {
  if (remaining_ <= 0)
    return IOResult{0, Status::EndOfFile};

  if (static_cast<uint64_t>(remaining_) < size)
    size = static_cast<size_t>(remaining_);

  IOResult result = source_->read(buf, size);
  if (result.count > 0)
    remaining_ -= result.count;

  return result;
}

std::optional<size_t> LimitedSource::remainingBound() const {
  if (remaining_ <= 0)
    return 0;

  return static_cast<size_t>(remaining_);
}

} // namespace xcp
