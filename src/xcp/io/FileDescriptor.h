// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#pragma once

#include <xcp/Api.h>

namespace xcp {

/**
 * Represents a system file descriptor that gets automatically closed.
 */
class XCP_API FileDescriptor {
 public:
  FileDescriptor() : fd_(-1) {}
  FileDescriptor(int fd) : fd_(fd) {}
  FileDescriptor(FileDescriptor&& fd) : fd_(fd.release()) {}
  ~FileDescriptor();

  FileDescriptor& operator=(FileDescriptor&& fd);

  FileDescriptor(const FileDescriptor& fd) = delete;
  FileDescriptor& operator=(const FileDescriptor& fd) = delete;

  int get() const noexcept { return fd_; }
  operator int() const noexcept { return fd_; }

  bool isClosed() const noexcept { return fd_ < 0; }
  bool isOpen() const noexcept { return !isClosed(); }

  int release();
  void close();

 private:
  int fd_;
};

}  // namespace xcp
