// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <xcp/thread/Wakeup.h>

namespace xcp {

Wakeup::Wakeup()
    : mutex_(),
      changed_(),
      generation_(0) {
}

void Wakeup::waitForFirstWakeup() {
  waitForWakeup(0);
}

void Wakeup::waitForWakeup(long seen) {
  std::unique_lock<std::mutex> lock(mutex_);
  while (generation_ <= seen) {
    changed_.wait(lock);
  }
}

bool Wakeup::waitFor(Duration timeout, long seen) {
  std::unique_lock<std::mutex> lock(mutex_);
  return changed_.wait_for(lock, timeout.toChrono(),
                           [&]() { return generation_ > seen; });
}

void Wakeup::wakeup() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++generation_;
  }
  changed_.notify_all();
}

long Wakeup::generation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return generation_;
}

} // namespace xcp
