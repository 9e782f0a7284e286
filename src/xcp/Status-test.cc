// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <gtest/gtest.h>
#include <xcp/Status.h>
#include <xcp/RuntimeError.h>
#include <cstring>

using namespace xcp;

TEST(Status, errorCode) {
  std::error_code ec = Status::EndOfFile;

  EXPECT_TRUE(static_cast<bool>(ec));
  EXPECT_EQ(&StatusCategory::get(), &ec.category());
  EXPECT_EQ("End of file", ec.message());
  EXPECT_TRUE(ec == Status::EndOfFile);
  EXPECT_FALSE(ec == Status::Cancelled);
  EXPECT_FALSE(std::error_code(static_cast<int>(Status::EndOfFile),
                               std::generic_category()) == Status::EndOfFile);
}

TEST(Status, message) {
  EXPECT_EQ("Invalid write result", make_error_code(Status::InvalidWriteError).message());
  EXPECT_EQ("Deadline exceeded", make_error_code(Status::DeadlineExceeded).message());
}

TEST(RuntimeError, sourceLocation) {
  try {
    RAISE(InvalidArgumentError, "bad things");
  } catch (const RuntimeError& e) {
    EXPECT_EQ(make_error_code(Status::InvalidArgumentError), e.code());
    EXPECT_NE(nullptr, std::strstr(e.what(), "bad things"));
    EXPECT_NE(nullptr, std::strstr(e.sourceFile(), "Status-test.cc"));
    EXPECT_LT(0, e.sourceLine());
  }
}
