// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <xcp/executor/ThreadedExecutor.h>
#include <xcp/thread/Wakeup.h>
#include <xcp/sysconfig.h>
#include <memory>

#if defined(HAVE_PTHREAD_H)
#include <pthread.h>
#endif

namespace xcp {

static void nameCurrentThread(const std::string& name) {
#if defined(HAVE_PTHREAD_H) && HAVE_DECL_PTHREAD_SETNAME_NP
# if defined(XCP_OS_DARWIN)
  pthread_setname_np(name.c_str());
# else
  // 15 characters plus the terminating zero
  pthread_setname_np(pthread_self(), name.substr(0, 15).c_str());
# endif
#endif
}

ThreadedExecutor::ThreadedExecutor(ExceptionHandler eh)
    : Executor(std::move(eh)),
      mutex_(),
      running_() {
}

ThreadedExecutor::~ThreadedExecutor() {
  joinAll();
}

void ThreadedExecutor::execute(const std::string& name, Task task) {
  // held until the thread is registered, so release() always finds it
  std::lock_guard<std::mutex> lock(mutex_);

  std::thread thread([this, name, task]() {
    nameCurrentThread(name);
    safeCall(task);
    release(std::this_thread::get_id());
  });

  const std::thread::id id = thread.get_id();
  running_.emplace(id, std::move(thread));
}

void ThreadedExecutor::execute(Task task) {
  execute("xcp", std::move(task));
}

Executor::HandleRef ThreadedExecutor::executeAfter(Duration delay, Task task) {
  std::shared_ptr<Wakeup> interrupt = std::make_shared<Wakeup>();
  HandleRef handle = std::make_shared<Handle>([interrupt]() {
    interrupt->wakeup();
  });

  execute("xcp-timer", [this, delay, task, handle, interrupt]() {
    if (interrupt->waitFor(delay, 0))
      return;

    safeCall([&]() { handle->fire(task); });
  });

  return handle;
}

void ThreadedExecutor::release(std::thread::id id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto i = running_.find(id);
  if (i != running_.end()) {
    i->second.detach();
    running_.erase(i);
  }
}

void ThreadedExecutor::joinAll() {
  for (;;) {
    std::thread thread;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (running_.empty())
        return;

      auto i = running_.begin();
      thread = std::move(i->second);
      running_.erase(i);
    }

    if (thread.joinable()) {
      thread.join();
    }
  }
}

} // namespace xcp
