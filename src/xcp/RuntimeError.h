// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#pragma once

#include <xcp/Api.h>
#include <xcp/Status.h>
#include <string>
#include <stdexcept>
#include <system_error>
#include <errno.h>

namespace xcp {

class XCP_API RuntimeError : public std::system_error {
 public:
  RuntimeError(int ev, const std::error_category& ec);
  RuntimeError(int ev, const std::error_category& ec, const std::string& what);
  explicit RuntimeError(const std::error_code& ec);
  explicit RuntimeError(Status ev);
  RuntimeError(Status ev, const std::string& what);

  ~RuntimeError();

  template<typename T = RuntimeError>
  T setSource(const char* file, int line, const char* fn);
  const char* sourceFile() const { return sourceFile_; }
  int sourceLine() const noexcept { return sourceLine_; }
  const char* functionName() const { return functionName_; }

  bool operator==(Status status) const;
  bool operator!=(Status status) const;

 private:
  const char* sourceFile_;
  int sourceLine_;
  const char* functionName_;
};

XCP_API void logAndPass(const std::exception& e);

// {{{ inlines
template<typename T>
inline T RuntimeError::setSource(const char* file, int line, const char* fn) {
  sourceFile_ = file;
  sourceLine_ = line;
  functionName_ = fn;
  return T(*this);
}

inline RuntimeError::RuntimeError(const std::error_code& ec)
  : RuntimeError(ec.value(), ec.category()) {
}
// }}}

} // namespace xcp

/**
 * Raises an exception of given type and arguments being passed to the
 * constructor.
 *
 * The exception must derive from RuntimeError, whose additional
 * source information will be initialized after.
 */
#define RAISE_EXCEPTION(E, ...) {                                             \
  throw E(__VA_ARGS__).setSource<E>(__FILE__, __LINE__, __PRETTY_FUNCTION__); \
}

/**
 * Raises an exception of given operating system error code.
 */
#define RAISE_ERRNO(errno) {                                                  \
  RAISE_EXCEPTION(::xcp::RuntimeError, ((int) errno), std::system_category()); \
}

/**
 * Raises an exception of given operating system error code with custom message.
 */
#define RAISE_SYSERR(errno, what) {                                           \
  RAISE_EXCEPTION(::xcp::RuntimeError, ((int) errno), std::system_category(), (what)); \
}

/**
 * Raises a RuntimeError for a member of the enum class Status,
 * with an optional message.
 */
#define RAISE(StatusCode, ...) {                                              \
  RAISE_EXCEPTION(::xcp::RuntimeError, ::xcp::Status:: StatusCode, ##__VA_ARGS__); \
}

