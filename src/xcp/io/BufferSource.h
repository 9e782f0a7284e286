// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#pragma once

#include <xcp/Buffer.h>
#include <xcp/io/Source.h>

namespace xcp {

/**
 * Source reading from a memory region it does not own.
 */
class XCP_API BufferSource : public Source {
 public:
  explicit BufferSource(const BufferRef& data);

  IOResult read(char* buf, size_t size) override;
  std::optional<size_t> remainingBound() const override;

  /** Number of bytes already consumed. */
  size_t offset() const noexcept { return offset_; }

 private:
  BufferRef data_;
  size_t offset_;
};

} // namespace xcp
