// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <gtest/gtest.h>
#include <xcp/Buffer.h>
#include <string>

using namespace xcp;

TEST(Buffer, pushBackGrows) {
  Buffer buffer;
  EXPECT_TRUE(buffer.empty());

  const std::string chunk(Buffer::CHUNK_SIZE + 1, 'a');
  buffer.push_back(chunk);
  buffer.push_back('b');

  EXPECT_EQ(chunk.size() + 1, buffer.size());
  EXPECT_LE(buffer.size(), buffer.capacity());
  EXPECT_EQ(chunk + "b", buffer.str());
}

TEST(Buffer, copyAndMove) {
  Buffer a("Hello", 5);
  Buffer b = a;
  EXPECT_EQ(a, b);

  Buffer c = std::move(a);
  EXPECT_EQ("Hello", c.str());
  EXPECT_TRUE(a.empty());

  b.push_back(" world");
  EXPECT_NE(b, c);
  EXPECT_EQ("Hello world", b.str());
}

TEST(Buffer, pushBackLiteralSkipsTerminator) {
  Buffer buffer;
  buffer.push_back("abc");
  buffer.push_back(BufferRef("de"));
  buffer.push_back(std::string("f"));

  EXPECT_EQ(6, buffer.size());
  EXPECT_EQ("abcdef", buffer.str());
}

TEST(Buffer, resizeAndClear) {
  Buffer buffer;
  buffer.resize(10);
  EXPECT_EQ(10, buffer.size());

  buffer.clear();
  EXPECT_EQ(0, buffer.size());
  EXPECT_LE(10, buffer.capacity());
}

TEST(BufferRef, ref) {
  BufferRef text("Hello world");

  EXPECT_EQ(11, text.size());
  EXPECT_EQ("world", text.ref(6).str());
  EXPECT_EQ("lo", text.ref(3, 2).str());
  EXPECT_TRUE(text.ref(11).empty());
  EXPECT_TRUE(text.ref(42).empty());
  EXPECT_EQ(BufferRef("Hello"), text.ref(0, 5));
}

TEST(MutableBufferRef, writesThrough) {
  char storage[4] = {'a', 'b', 'c', 'd'};
  MutableBufferRef ref(storage);

  EXPECT_EQ(4, ref.size());
  ref[1] = 'x';

  EXPECT_EQ('x', storage[1]);
  EXPECT_EQ("axcd", ref.ref().str());
}
