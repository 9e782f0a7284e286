// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#pragma once

#include <xcp/executor/Executor.h>

#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace xcp {

/**
 * Runs every task on a system thread of its own.
 *
 * A thread is owned by the executor while its task runs and detaches
 * itself afterwards. joinAll() (and the destructor) waits for the ones
 * still running.
 */
class XCP_API ThreadedExecutor : public Executor {
 public:
  ThreadedExecutor() : ThreadedExecutor(nullptr) {}
  explicit ThreadedExecutor(ExceptionHandler eh);
  ~ThreadedExecutor();

  /**
   * Runs @p task on a new thread named @p name.
   */
  void execute(const std::string& name, Task task);

  void execute(Task task) override;
  HandleRef executeAfter(Duration delay, Task task) override;

  /**
   * Waits for all threads that are still running.
   */
  void joinAll();

 private:
  void release(std::thread::id id);

 private:
  std::mutex mutex_;
  std::map<std::thread::id, std::thread> running_;
};

} // namespace xcp
