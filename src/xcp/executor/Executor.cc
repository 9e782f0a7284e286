// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <xcp/executor/Executor.h>

namespace xcp {

// {{{ Executor::Handle
bool Executor::Handle::isCancelled() const {
  return isCancelled_.load();
}

void Executor::Handle::cancel() {
  Task hook;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (isCancelled_.exchange(true))
      return;
    hook.swap(onCancel_);
  }

  if (hook) {
    hook();
  }
}

void Executor::Handle::fire(Task task) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (isCancelled_.exchange(true))
    return;

  onCancel_ = nullptr;
  task();
}
// }}}

Executor::Executor(ExceptionHandler eh)
    : exceptionHandler_(std::move(eh)) {
}

Executor::~Executor() {
}

void Executor::safeCall(const Task& task) noexcept {
  safeInvoke(exceptionHandler_, task);
}

} // namespace xcp
