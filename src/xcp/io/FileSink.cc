// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <xcp/io/FileSink.h>
#include <xcp/RuntimeError.h>
#include <xcp/sysconfig.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <errno.h>
#include <utility>

#if defined(HAVE_UNISTD_H)
#include <unistd.h>
#endif

namespace xcp {

static int openForWriting(const std::string& path, int mode) {
  int fd = path == "-"
      ? ::dup(STDOUT_FILENO)
      : ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);

  if (fd < 0)
    RAISE_SYSERR(errno, path);

  return fd;
}

FileSink::FileSink(const std::string& path, int mode)
    : fd_(openForWriting(path, mode)) {
}

FileSink::FileSink(FileDescriptor&& fd)
    : fd_(std::move(fd)) {
}

// short writes are retried, so that fewer bytes than requested
// are only ever reported together with an error.
IOResult FileSink::write(const char* buf, size_t size) {
  size_t written = 0;

  while (written < size) {
    ssize_t rv = ::write(fd_, buf + written, size - written);
    if (rv > 0) {
      written += rv;
    } else if (rv < 0 && errno != EINTR) {
      return IOResult{static_cast<ssize_t>(written),
                      std::error_code(errno, std::system_category())};
    } else if (rv == 0) {
      return IOResult{static_cast<ssize_t>(written),
                      std::make_error_code(std::errc::io_error)};
    }
  }

  return IOResult{static_cast<ssize_t>(written), std::error_code()};
}

} // namespace xcp
