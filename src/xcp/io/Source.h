// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#pragma once

#include <xcp/Api.h>
#include <xcp/io/IOResult.h>
#include <cstddef>
#include <optional>

namespace xcp {

/**
 * Pull based byte producer.
 *
 * @see Sink, copy()
 */
class XCP_API Source {
 public:
  virtual ~Source() {}

  /**
   * Fills up to @p size bytes into @p buf.
   *
   * Reports Status::EndOfFile as error once no more data is available,
   * possibly together with a non-zero count of final bytes.
   */
  virtual IOResult read(char* buf, size_t size) = 0;

  /**
   * Upper bound of bytes this source will still produce, if known.
   */
  virtual std::optional<size_t> remainingBound() const { return std::nullopt; }
};

} // namespace xcp
