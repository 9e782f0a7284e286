// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <xcp/RuntimeError.h>
#include <xcp/logging.h>

#include <typeinfo>

namespace xcp {

void logAndPass(const std::exception& e) {
  logError("{}: unhandled exception. {}", typeid(e).name(), e.what());
}

RuntimeError::RuntimeError(int ev, const std::error_category& ec)
  : std::system_error(ev, ec),
    sourceFile_(""),
    sourceLine_(0),
    functionName_("") {
}

RuntimeError::RuntimeError(
    int ev,
    const std::error_category& ec,
    const std::string& what)
  : std::system_error(ev, ec, what),
    sourceFile_(""),
    sourceLine_(0),
    functionName_("") {
}

RuntimeError::RuntimeError(Status ev)
  : RuntimeError((int) ev, StatusCategory::get()) {
}

RuntimeError::RuntimeError(Status ev, const std::string& what)
  : RuntimeError((int) ev, StatusCategory::get(), what) {
}

RuntimeError::~RuntimeError() {
}

bool RuntimeError::operator==(Status status) const {
  return code() == status;
}

bool RuntimeError::operator!=(Status status) const {
  return !(*this == status);
}

} // namespace xcp
