// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#pragma once

#include <xcp/io/Source.h>
#include <xcp/io/FileDescriptor.h>
#include <string>

namespace xcp {

/**
 * Source reading sequentially from a file descriptor.
 */
class XCP_API FileSource : public Source {
 public:
  /**
   * Opens @p path for reading, with @c "-" denoting standard input.
   *
   * @throw RuntimeError if the file could not be opened.
   */
  explicit FileSource(const std::string& path);

  explicit FileSource(FileDescriptor&& fd);

  IOResult read(char* buf, size_t size) override;

  int handle() const noexcept { return fd_; }

 private:
  FileDescriptor fd_;
};

} // namespace xcp
