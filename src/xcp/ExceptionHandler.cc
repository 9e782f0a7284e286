// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <xcp/ExceptionHandler.h>
#include <xcp/RuntimeError.h>
#include <xcp/logging.h>

namespace xcp {

static void passTo(const ExceptionHandler& handler,
                   const std::exception& e) noexcept {
  if (!handler) {
    logAndPass(e);
    return;
  }

  try {
    handler(e);
  } catch (const std::exception& nested) {
    logAndPass(nested);
  } catch (...) {
    logError("Exception handler raised a foreign exception.");
  }
}

void safeInvoke(const ExceptionHandler& handler,
                const std::function<void()>& task) noexcept {
  if (!task)
    return;

  try {
    task();
  } catch (const std::exception& e) {
    passTo(handler, e);
  } catch (...) {
    passTo(handler, RuntimeError(Status::CaughtUnknownExceptionError));
  }
}

CatchAndLogExceptionHandler::CatchAndLogExceptionHandler(
    const std::string& component) :
    component_(component) {
}

void CatchAndLogExceptionHandler::onException(const std::exception& e) const {
  if (auto rte = dynamic_cast<const RuntimeError*>(&e)) {
    logError("[{}] Unhandled exception caught in {} ({}:{}). {}",
             component_, rte->functionName(), rte->sourceFile(),
             rte->sourceLine(), e.what());
  } else if (!component_.empty()) {
    logError("[{}] Unhandled exception caught. {}", component_, e.what());
  } else {
    logError("Unhandled exception caught. {}", e.what());
  }
}

} // namespace xcp
