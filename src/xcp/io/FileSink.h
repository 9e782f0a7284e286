// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#pragma once

#include <xcp/io/Sink.h>
#include <xcp/io/FileDescriptor.h>
#include <string>

namespace xcp {

/**
 * Sink writing sequentially into a file descriptor.
 */
class XCP_API FileSink : public Sink {
 public:
  /**
   * Creates or truncates @p path for writing, with @c "-" denoting
   * standard output.
   *
   * @param path file to write to.
   * @param mode permission bits of a newly created file.
   *
   * @throw RuntimeError if the file could not be opened.
   */
  explicit FileSink(const std::string& path, int mode = 0666);

  explicit FileSink(FileDescriptor&& fd);

  IOResult write(const char* buf, size_t size) override;

  int handle() const noexcept { return fd_; }

 private:
  FileDescriptor fd_;
};

} // namespace xcp
