// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#pragma once

#include <sys/types.h>
#include <system_error>

namespace xcp {

/**
 * Outcome of a single Source::read() or Sink::write() call.
 *
 * @c count is signed so that a misbehaving implementation reporting
 * a negative count can be detected.
 */
struct IOResult {
  ssize_t count;
  std::error_code error;
};

} // namespace xcp
