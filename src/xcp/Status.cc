// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <xcp/Status.h>
#include <string>

namespace xcp {

std::error_code make_error_code(Status ev) {
  return std::error_code((int) ev, StatusCategory::get());
}

StatusCategory& StatusCategory::get() {
  static StatusCategory cat;
  return cat;
}

const char* StatusCategory::name() const noexcept {
  return "xcp.Status";
}

std::string StatusCategory::message(int ec) const {
  switch (static_cast<Status>(ec)) {
    case Status::Success: return "Success";
    case Status::EndOfFile: return "End of file";
    case Status::Cancelled: return "Operation cancelled";
    case Status::DeadlineExceeded: return "Deadline exceeded";
    case Status::InvalidWriteError: return "Invalid write result";
    case Status::InvalidReadError: return "Invalid read result";
    case Status::IOError: return "I/O Error";
    case Status::IllegalStateError: return "Illegal State Error";
    case Status::InvalidArgumentError: return "Invalid Argument Error";
    case Status::InternalError: return "Internal Error";
    case Status::CaughtUnknownExceptionError: return "Caught Unknown exception Error";
    default: return "Unknown xcp Status Code";
  }
}

} // namespace xcp
