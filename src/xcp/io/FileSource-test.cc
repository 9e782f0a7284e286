// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <gtest/gtest.h>
#include <xcp/io/FileSink.h>
#include <xcp/io/FileSource.h>
#include <xcp/RuntimeError.h>
#include <xcp/Status.h>
#include <cerrno>
#include <cstdlib>
#include <string>
#include <unistd.h>

using namespace xcp;

class TempFile {
 public:
  TempFile() : path_("/tmp/xcp-test.XXXXXX") {
    int fd = mkstemp(&path_[0]);
    if (fd < 0)
      RAISE_ERRNO(errno);
    ::close(fd);
  }

  ~TempFile() { ::unlink(path_.c_str()); }

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

TEST(FileSource, writeAndReadBack) {
  TempFile file;

  {
    FileSink sink(file.path());
    IOResult rv = sink.write("Hello world", 11);
    EXPECT_EQ(11, rv.count);
    EXPECT_FALSE(rv.error);
  }

  FileSource source(file.path());
  char buf[32];

  IOResult a = source.read(buf, sizeof(buf));
  EXPECT_EQ(11, a.count);
  EXPECT_FALSE(a.error);
  EXPECT_EQ("Hello world", std::string(buf, 11));

  IOResult b = source.read(buf, sizeof(buf));
  EXPECT_EQ(0, b.count);
  EXPECT_EQ(make_error_code(Status::EndOfFile), b.error);
}

TEST(FileSource, missingFile) {
  EXPECT_THROW(FileSource("/nonexistent/xcp-test"), RuntimeError);
}

TEST(FileSink, unwritablePath) {
  EXPECT_THROW(FileSink("/nonexistent/xcp-test"), RuntimeError);
}

TEST(FileSink, writeErrorIsReported) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));
  FileSink sink{FileDescriptor(fds[0])}; // read end of the pipe
  ::close(fds[1]);

  IOResult rv = sink.write("x", 1);

  EXPECT_EQ(0, rv.count);
  EXPECT_TRUE(static_cast<bool>(rv.error));
}
