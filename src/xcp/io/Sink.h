// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#pragma once

#include <xcp/Api.h>
#include <xcp/io/IOResult.h>
#include <cstddef>

namespace xcp {

/**
 * Push based byte consumer.
 *
 * @see Source, copy()
 */
class XCP_API Sink {
 public:
  virtual ~Sink() {}

  /**
   * Consumes up to @p size bytes from @p buf.
   *
   * Returning less than @p size bytes requires a non-empty error.
   */
  virtual IOResult write(const char* buf, size_t size) = 0;
};

} // namespace xcp
