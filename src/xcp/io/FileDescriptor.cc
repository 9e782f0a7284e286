// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <xcp/io/FileDescriptor.h>
#include <xcp/RuntimeError.h>
#include <xcp/logging.h>
#include <xcp/sysconfig.h>
#include <errno.h>
#include <string.h>

#if defined(HAVE_UNISTD_H)
#include <unistd.h>
#endif

namespace xcp {

FileDescriptor::~FileDescriptor() {
  if (fd_ < 0)
    return;

  if (::close(fd_) < 0 && errno != EINTR) {
    logWarning("Failed to close file descriptor {}. {}", fd_, strerror(errno));
  }
}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& fd) {
  close();
  fd_ = fd.release();

  return *this;
}

int FileDescriptor::release() {
  int fd = fd_;
  fd_ = -1;
  return fd;
}

void FileDescriptor::close() {
  if (fd_ < 0)
    return;

  int fd = release();
  if (::close(fd) < 0 && errno != EINTR) {
    RAISE_ERRNO(errno);
  }
}

}  // namespace xcp
