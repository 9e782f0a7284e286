// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <xcp/CancellationToken.h>
#include <xcp/ExceptionHandler.h>
#include <xcp/thread/Wakeup.h>
#include <xcp/RuntimeError.h>
#include <xcp/logging.h>
#include <atomic>
#include <list>
#include <mutex>
#include <utility>

namespace xcp {

class CancellationState {
 public:
  CancellationState();

  bool isCancelled() const noexcept;
  std::error_code error() const;
  bool cancel(std::error_code reason);

  /**
   * @return registration id, or 0 if the callback was invoked right away.
   */
  long addCallback(std::function<void()> callback);
  void removeCallback(long id);

  Wakeup* wakeup() noexcept { return &wakeup_; }

 private:
  std::mutex mutex_;
  std::atomic<bool> cancelled_;
  std::error_code error_; // written once, before cancelled_ becomes true
  long nextId_;
  std::list<std::pair<long, std::function<void()>>> callbacks_;
  Wakeup wakeup_;
};

// {{{ CancellationState
CancellationState::CancellationState()
    : mutex_(),
      cancelled_(false),
      error_(),
      nextId_(1),
      callbacks_(),
      wakeup_() {
}

bool CancellationState::isCancelled() const noexcept {
  return cancelled_.load(std::memory_order_acquire);
}

std::error_code CancellationState::error() const {
  if (!isCancelled())
    return std::error_code();

  return error_;
}

bool CancellationState::cancel(std::error_code reason) {
  std::list<std::pair<long, std::function<void()>>> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.load())
      return false;

    error_ = reason;
    cancelled_.store(true, std::memory_order_release);
    callbacks.swap(callbacks_);
  }

  logTrace("CancellationSource: cancelled ({})", reason.message());

  wakeup_.wakeup();

  const ExceptionHandler handler = CatchAndLogExceptionHandler("CancellationToken");
  for (const auto& callback: callbacks) {
    safeInvoke(handler, callback.second);
  }

  return true;
}

long CancellationState::addCallback(std::function<void()> callback) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cancelled_.load()) {
      long id = nextId_++;
      callbacks_.emplace_back(id, std::move(callback));
      return id;
    }
  }

  callback();
  return 0;
}

void CancellationState::removeCallback(long id) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto i = callbacks_.begin(), e = callbacks_.end(); i != e; ++i) {
    if (i->first == id) {
      callbacks_.erase(i);
      return;
    }
  }
}
// }}}
// {{{ CancellationRegistration
CancellationRegistration::CancellationRegistration()
    : state_(),
      id_(0) {
}

CancellationRegistration::CancellationRegistration(
    std::shared_ptr<CancellationState> state, long id)
    : state_(std::move(state)),
      id_(id) {
}

CancellationRegistration::CancellationRegistration(
    CancellationRegistration&& other)
    : state_(std::move(other.state_)),
      id_(other.id_) {
  other.id_ = 0;
}

CancellationRegistration& CancellationRegistration::operator=(
    CancellationRegistration&& other) {
  if (this != &other) {
    reset();
    state_ = std::move(other.state_);
    id_ = other.id_;
    other.id_ = 0;
  }
  return *this;
}

CancellationRegistration::~CancellationRegistration() {
  reset();
}

void CancellationRegistration::reset() {
  if (state_ && id_ != 0) {
    state_->removeCallback(id_);
  }
  state_.reset();
  id_ = 0;
}
// }}}
// {{{ CancellationToken
CancellationToken::CancellationToken()
    : state_() {
}

CancellationToken::CancellationToken(std::shared_ptr<CancellationState> state)
    : state_(std::move(state)) {
}

bool CancellationToken::isCancelled() const noexcept {
  return state_ && state_->isCancelled();
}

std::error_code CancellationToken::error() const {
  if (!state_)
    return std::error_code();

  return state_->error();
}

CancellationRegistration CancellationToken::onCancel(
    std::function<void()> callback) const {
  if (!state_)
    return CancellationRegistration();

  long id = state_->addCallback(std::move(callback));
  return CancellationRegistration(state_, id);
}

void CancellationToken::wait() const {
  if (!state_)
    RAISE(IllegalStateError, "Waiting on a token that can never be cancelled.");

  state_->wakeup()->waitForFirstWakeup();
}

bool CancellationToken::wait(Duration timeout) const {
  if (!state_) {
    Wakeup never;
    return never.waitFor(timeout, 0);
  }

  return state_->wakeup()->waitFor(timeout, 0);
}
// }}}
// {{{ CancellationSource
CancellationSource::CancellationSource()
    : state_(std::make_shared<CancellationState>()) {
}

CancellationToken CancellationSource::token() const {
  return CancellationToken(state_);
}

bool CancellationSource::isCancelled() const noexcept {
  return state_->isCancelled();
}

bool CancellationSource::cancel() {
  return cancel(Status::Cancelled);
}

bool CancellationSource::cancel(std::error_code reason) {
  if (!reason)
    RAISE(InvalidArgumentError, "Cancellation reason must be an error.");

  return state_->cancel(reason);
}

Executor::HandleRef CancellationSource::cancelAfter(Executor* executor,
                                                    Duration delay) {
  std::shared_ptr<CancellationState> state = state_;
  return executor->executeAfter(delay, [state]() {
    state->cancel(Status::DeadlineExceeded);
  });
}
// }}}

} // namespace xcp
