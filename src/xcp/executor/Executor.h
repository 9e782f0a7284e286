// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#pragma once

#include <xcp/Api.h>
#include <xcp/ExceptionHandler.h>
#include <xcp/Duration.h>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

namespace xcp {

/**
 * Runs tasks somewhere else than on the caller's stack.
 *
 * The copy engine starts its worker via execute(), and deadlines are
 * armed via executeAfter().
 *
 * @see ThreadedExecutor
 */
class XCP_API Executor {
 public:
  typedef std::function<void()> Task;

  /**
   * A task scheduled for later that may still be called off.
   *
   * Whichever of cancel() and fire() comes first wins. The other one
   * becomes a no-op.
   */
  class XCP_API Handle { // {{{
   public:
    Handle()
        : Handle(nullptr) {}

    explicit Handle(Task onCancel)
        : mutex_(),
          isCancelled_(false),
          onCancel_(std::move(onCancel)) {}

    bool isCancelled() const;

    /**
     * Calls off the pending task and runs the cancel hook, if any.
     */
    void cancel();

    /**
     * Runs @p task unless cancel() or fire() was called before.
     */
    void fire(Task task);

   private:
    std::mutex mutex_;
    std::atomic<bool> isCancelled_;
    Task onCancel_;
  }; // }}}
  typedef std::shared_ptr<Handle> HandleRef;

  explicit Executor(ExceptionHandler eh);

  virtual ~Executor();

  /**
   * Runs @p task asynchronously.
   */
  virtual void execute(Task task) = 0;

  /**
   * Runs @p task once @p delay has passed.
   *
   * @return handle to call off the task before it ran.
   */
  virtual HandleRef executeAfter(Duration delay, Task task) = 0;

 protected:
  /**
   * Runs @p task, routing any exception to this executor's handler.
   */
  void safeCall(const Task& task) noexcept;

 private:
  ExceptionHandler exceptionHandler_;
};

} // namespace xcp
