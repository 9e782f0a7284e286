// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <gtest/gtest.h>
#include <xcp/io/CopyOptions.h>
#include <xcp/io/BufferSource.h>
#include <xcp/io/CallbackSource.h>
#include <xcp/io/LimitedSource.h>
#include <xcp/RuntimeError.h>

using namespace xcp;

TEST(CopyOptions, defaults) {
  CopyOptions options;

  EXPECT_TRUE(options.waitForLastOp());
  EXPECT_EQ(32768, options.bufferSize());
  EXPECT_FALSE(options.hasBuffer());
  EXPECT_EQ(nullptr, options.executor());
  EXPECT_FALSE(options.completionHandler());
}

TEST(CopyOptions, lastOneWins) {
  CopyOptions options;
  options.bufferSize(16)
         .waitForLastOp(false)
         .bufferSize(64)
         .waitForLastOp(true);

  EXPECT_TRUE(options.waitForLastOp());
  EXPECT_EQ(64, options.bufferSize());
}

TEST(CopyOptions, zeroBufferSize) {
  CopyOptions options;
  EXPECT_THROW(options.bufferSize(0), RuntimeError);
  EXPECT_EQ(CopyOptions::DefaultBufferSize, options.bufferSize());
}

TEST(CopyOptions, emptyBuffer) {
  CopyOptions options;
  EXPECT_THROW(options.buffer(MutableBufferRef()), RuntimeError);
  EXPECT_FALSE(options.hasBuffer());
}

TEST(CopyOptions, resolveDefault) {
  EXPECT_EQ(32768, resolveBufferSize(CopyOptions(), nullptr));

  CallbackSource unbounded([](char*, size_t) { return IOResult{0, {}}; });
  EXPECT_EQ(32768, resolveBufferSize(CopyOptions(), &unbounded));
}

TEST(CopyOptions, resolveExplicitBufferWins) {
  char buf[15];
  CopyOptions options;
  options.buffer(MutableBufferRef(buf)).bufferSize(4096);

  EXPECT_EQ(15, resolveBufferSize(options, nullptr));

  BufferSource smaller("abc");
  EXPECT_EQ(15, resolveBufferSize(options, &smaller));
}

TEST(CopyOptions, resolveShrinksToRemainingBound) {
  BufferSource data("0123456789");
  LimitedSource limited(&data, 100);

  EXPECT_EQ(10, resolveBufferSize(CopyOptions(), &data));
  EXPECT_EQ(100, resolveBufferSize(CopyOptions(), &limited));
  EXPECT_EQ(64, resolveBufferSize(CopyOptions().bufferSize(64), &limited));
}

TEST(CopyOptions, resolveNeverBelowOneByte) {
  BufferSource empty("");
  LimitedSource limited(&empty, 0);

  EXPECT_EQ(1, resolveBufferSize(CopyOptions(), &empty));
  EXPECT_EQ(1, resolveBufferSize(CopyOptions(), &limited));
}

TEST(CopyResult, to_string) {
  EXPECT_EQ("42 bytes", to_string(CopyResult{42, std::error_code()}));
  EXPECT_EQ("0 bytes (Operation cancelled)",
            to_string(CopyResult{0, make_error_code(Status::Cancelled)}));
}
