// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#pragma once

#include <xcp/Api.h>
#include <string>
#include <system_error>

namespace xcp {

enum class Status {
  Success = 0,

  // end-of-data sentinel; not a failure
  EndOfFile,

  Cancelled,
  DeadlineExceeded,
  InvalidWriteError,
  InvalidReadError,

  IOError,
  IllegalStateError,
  InvalidArgumentError,
  InternalError,
  CaughtUnknownExceptionError,
};

class XCP_API StatusCategory : public std::error_category {
 public:
  static StatusCategory& get();

  const char* name() const noexcept override;
  std::string message(int ec) const override;
};

XCP_API std::error_code make_error_code(Status ec);

}  // namespace xcp

namespace std {
  template<> struct is_error_code_enum<xcp::Status> : public true_type {};
}
