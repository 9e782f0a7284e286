// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <xcp/io/FileSource.h>
#include <xcp/RuntimeError.h>
#include <xcp/Status.h>
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

static int openForReading(const std::string& path) {
  int fd = path == "-"
      ? ::dup(STDIN_FILENO)
      : ::open(path.c_str(), O_RDONLY | O_CLOEXEC);

  if (fd < 0)
    RAISE_SYSERR(errno, path);

  return fd;
}

FileSource::FileSource(const std::string& path)
    : fd_(openForReading(path)) {
}

FileSource::FileSource(FileDescriptor&& fd)
    : fd_(std::move(fd)) {
}

IOResult FileSource::read(char* buf, size_t size) {
  for (;;) {
    ssize_t rv = ::read(fd_, buf, size);
    if (rv > 0)
      return IOResult{rv, std::error_code()};

    if (rv == 0)
      return IOResult{0, size != 0 ? make_error_code(Status::EndOfFile)
                                   : std::error_code()};

    if (errno != EINTR)
      return IOResult{0, std::error_code(errno, std::system_category())};
  }
}

} // namespace xcp
