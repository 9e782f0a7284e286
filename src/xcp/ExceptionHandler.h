// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT
#pragma once

#include <xcp/Api.h>
#include <functional>
#include <exception>
#include <string>

namespace xcp {

typedef std::function<void(const std::exception&)> ExceptionHandler;

/**
 * Runs @p task and hands anything it throws to @p handler.
 *
 * Without a handler, or if the handler throws itself, the exception is
 * logged. Nothing escapes this call.
 */
XCP_API void safeInvoke(const ExceptionHandler& handler,
                        const std::function<void()>& task) noexcept;

class XCP_API CatchAndLogExceptionHandler {
public:
  explicit CatchAndLogExceptionHandler(const std::string& component);
  void onException(const std::exception& error) const;
  void operator()(const std::exception& e) { onException(e); }

protected:
  std::string component_;
};

} // namespace xcp
