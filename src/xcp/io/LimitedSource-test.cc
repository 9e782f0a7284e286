// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <gtest/gtest.h>
#include <xcp/io/LimitedSource.h>
#include <xcp/io/CallbackSource.h>
#include <xcp/Status.h>
#include <vector>

using namespace xcp;

TEST(LimitedSource, clampsReads) {
  std::vector<size_t> requested;
  CallbackSource inner([&](char*, size_t size) {
    requested.push_back(size);
    return IOResult{static_cast<ssize_t>(size), std::error_code()};
  });
  LimitedSource source(&inner, 10);
  char buf[8];

  IOResult a = source.read(buf, sizeof(buf));
  EXPECT_EQ(8, a.count);
  EXPECT_FALSE(a.error);
  EXPECT_EQ(2, *source.remainingBound());

  IOResult b = source.read(buf, sizeof(buf));
  EXPECT_EQ(2, b.count);
  EXPECT_FALSE(b.error);
  EXPECT_EQ(0, *source.remainingBound());

  IOResult c = source.read(buf, sizeof(buf));
  EXPECT_EQ(0, c.count);
  EXPECT_EQ(make_error_code(Status::EndOfFile), c.error);

  EXPECT_EQ((std::vector<size_t>{8, 2}), requested);
}

TEST(LimitedSource, passesThroughEndOfFile) {
  CallbackSource inner([](char*, size_t) {
    return IOResult{3, Status::EndOfFile};
  });
  LimitedSource source(&inner, 10);
  char buf[8];

  IOResult rv = source.read(buf, sizeof(buf));
  EXPECT_EQ(3, rv.count);
  EXPECT_EQ(make_error_code(Status::EndOfFile), rv.error);
  EXPECT_EQ(7, source.remaining());
}
