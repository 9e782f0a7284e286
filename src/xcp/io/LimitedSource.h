// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#pragma once

#include <xcp/io/Source.h>
#include <cstdint>

namespace xcp {

/**
 * Source decorator that delivers at most a fixed number of bytes.
 *
 * Once the limit is reached, read() reports Status::EndOfFile without
 * touching the underlying source anymore.
 */
class XCP_API LimitedSource : public Source {
 public:
  LimitedSource(Source* source, int64_t limit);

  IOResult read(char* buf, size_t size) override;
  std::optional<size_t> remainingBound() const override;

  int64_t remaining() const noexcept { return remaining_; }

 private:
  Source* source_;
  int64_t remaining_;
};

} // namespace xcp
