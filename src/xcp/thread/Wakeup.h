// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#pragma once

#include <xcp/Api.h>
#include <xcp/Duration.h>
#include <condition_variable>
#include <mutex>

namespace xcp {

/**
 * Generation counter that threads can block on.
 *
 * Every wakeup() bumps the generation. A waiter remembers the generation
 * it has seen and blocks until a newer one shows up, so a wakeup() that
 * happens between reading generation() and waiting is never lost.
 */
class XCP_API Wakeup {
 public:
  Wakeup();

  /**
   * Blocks until wakeup() was called at least once.
   */
  void waitForFirstWakeup();

  /**
   * Blocks until the generation exceeds @p generation.
   */
  void waitForWakeup(long generation);

  /**
   * Like waitForWakeup(long) but gives up after @p timeout.
   *
   * @retval true a newer generation was reached.
   * @retval false the timeout was hit.
   */
  bool waitFor(Duration timeout, long generation);

  /**
   * Bumps the generation and releases all waiters.
   */
  void wakeup();

  long generation() const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable changed_;
  long generation_;
};

} // namespace xcp
