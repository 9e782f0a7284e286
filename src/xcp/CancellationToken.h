// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#pragma once

#include <xcp/Api.h>
#include <xcp/Duration.h>
#include <xcp/executor/Executor.h>
#include <functional>
#include <memory>
#include <system_error>

namespace xcp {

class CancellationState;
class CancellationSource;

/**
 * Keeps a callback registered on a CancellationToken alive.
 *
 * The callback is unregistered as soon as the registration goes out of scope.
 * Once unregistered, the callback will not be invoked anymore, unless
 * it is already being invoked by a concurrent cancel().
 */
class XCP_API CancellationRegistration {
 public:
  CancellationRegistration();
  CancellationRegistration(std::shared_ptr<CancellationState> state, long id);
  CancellationRegistration(CancellationRegistration&& other);
  CancellationRegistration& operator=(CancellationRegistration&& other);
  ~CancellationRegistration();

  CancellationRegistration(const CancellationRegistration&) = delete;
  CancellationRegistration& operator=(const CancellationRegistration&) = delete;

  /**
   * Unregisters the callback, if still registered.
   */
  void reset();

 private:
  std::shared_ptr<CancellationState> state_;
  long id_;
};

/**
 * Cooperative cancellation signal, handed out by a CancellationSource.
 *
 * A token fires at most once. After it fired, error() returns the
 * terminal error the source was cancelled with, any number of times.
 *
 * A default constructed token is never cancelled.
 */
class XCP_API CancellationToken {
 public:
  CancellationToken();

  /**
   * Tests whether this token can ever be cancelled at all.
   */
  bool canBeCancelled() const noexcept { return state_ != nullptr; }

  /**
   * Tests whether cancellation has been requested.
   */
  bool isCancelled() const noexcept;

  /**
   * Retrieves the terminal error, or an empty error code if not cancelled yet.
   */
  std::error_code error() const;

  /**
   * Registers @p callback to be invoked once this token gets cancelled.
   *
   * If the token is cancelled already, @p callback is invoked
   * immediately from within the caller's context.
   * Otherwise it runs in the context of the thread calling
   * CancellationSource::cancel().
   */
  CancellationRegistration onCancel(std::function<void()> callback) const;

  /**
   * Blocks the caller until this token gets cancelled.
   */
  void wait() const;

  /**
   * Blocks the caller until this token gets cancelled or @p timeout passed.
   *
   * @retval true the token was cancelled.
   * @retval false the timeout was hit.
   */
  bool wait(Duration timeout) const;

 private:
  explicit CancellationToken(std::shared_ptr<CancellationState> state);

 private:
  std::shared_ptr<CancellationState> state_;

  friend class CancellationSource;
};

/**
 * The owning side of a cancellation, producing CancellationToken objects.
 */
class XCP_API CancellationSource {
 public:
  CancellationSource();

  CancellationToken token() const;

  bool isCancelled() const noexcept;

  /**
   * Requests cancellation with Status::Cancelled.
   *
   * @retval true this call cancelled the source.
   * @retval false the source was cancelled before.
   */
  bool cancel();

  /**
   * Requests cancellation with given terminal error.
   *
   * @p reason must not be an empty error code.
   */
  bool cancel(std::error_code reason);

  /**
   * Cancels this source with Status::DeadlineExceeded after @p delay.
   *
   * @param executor the executor to run the timer on.
   * @param delay the time to wait until the deadline is reached.
   *
   * @return handle to disarm the deadline.
   */
  Executor::HandleRef cancelAfter(Executor* executor, Duration delay);

 private:
  std::shared_ptr<CancellationState> state_;
};

} // namespace xcp
