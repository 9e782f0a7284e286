// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <gtest/gtest.h>
#include <xcp/io/BufferSource.h>
#include <xcp/io/BufferSink.h>
#include <xcp/Status.h>

using namespace xcp;

TEST(BufferSource, readsInChunks) {
  BufferSource source("Hello world");
  char buf[8];

  IOResult a = source.read(buf, sizeof(buf));
  EXPECT_EQ(8, a.count);
  EXPECT_FALSE(a.error);
  EXPECT_EQ("Hello wo", std::string(buf, 8));
  EXPECT_EQ(3, *source.remainingBound());

  IOResult b = source.read(buf, sizeof(buf));
  EXPECT_EQ(3, b.count);
  EXPECT_EQ(make_error_code(Status::EndOfFile), b.error);
  EXPECT_EQ("rld", std::string(buf, 3));

  IOResult c = source.read(buf, sizeof(buf));
  EXPECT_EQ(0, c.count);
  EXPECT_EQ(make_error_code(Status::EndOfFile), c.error);
}

TEST(BufferSink, appends) {
  Buffer target("foo", 3);
  BufferSink sink(&target);

  IOResult rv = sink.write("bar", 3);

  EXPECT_EQ(3, rv.count);
  EXPECT_FALSE(rv.error);
  EXPECT_EQ("foobar", target.str());
  EXPECT_EQ(&target, sink.buffer());
}
