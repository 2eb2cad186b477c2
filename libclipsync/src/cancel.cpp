/**
 * @file cancel.cpp
 * @brief Cancellation source/token implementation
 */

#include "clipsync/cancel.h"
#include <thread>
#include <vector>

namespace clipsync {

// ============================================================================
// CancelRegistration
// ============================================================================

CancelRegistration::~CancelRegistration() { reset(); }

CancelRegistration::CancelRegistration(CancelRegistration &&other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
  other.id_ = 0;
}

CancelRegistration &
CancelRegistration::operator=(CancelRegistration &&other) noexcept {
  if (this != &other) {
    reset();
    state_ = std::move(other.state_);
    id_ = other.id_;
    other.id_ = 0;
  }
  return *this;
}

void CancelRegistration::reset() {
  if (id_ == 0) {
    return;
  }
  if (auto state = state_.lock()) {
    bool pending;
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      pending = state->callbacks.erase(id_) != 0;
    }
    if (!pending) {
      // Already taken by cancel(); wait until it has run
      std::lock_guard<std::recursive_mutex> running(state->running);
    }
  }
  state_.reset();
  id_ = 0;
}

// ============================================================================
// CancellationToken
// ============================================================================

bool CancellationToken::is_cancelled() const {
  if (!state_) {
    return false;
  }
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->cancelled;
}

bool CancellationToken::wait_for(Milliseconds timeout) const {
  if (!state_) {
    std::this_thread::sleep_for(timeout);
    return false;
  }

  std::unique_lock<std::mutex> lock(state_->mutex);
  return state_->cv.wait_for(lock, timeout,
                             [this] { return state_->cancelled; });
}

CancelRegistration
CancellationToken::on_cancel(std::function<void()> callback) const {
  if (!state_) {
    return CancelRegistration();
  }

  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->cancelled) {
      uint64_t id = state_->next_id++;
      state_->callbacks.emplace(id, std::move(callback));
      return CancelRegistration(state_, id);
    }
  }

  callback();
  return CancelRegistration();
}

// ============================================================================
// CancellationSource
// ============================================================================

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancelState>()) {}

void CancellationSource::cancel() {
  std::vector<std::function<void()>> callbacks;
  std::unique_lock<std::recursive_mutex> running(state_->running,
                                                std::defer_lock);
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled) {
      return;
    }
    state_->cancelled = true;
    for (auto &kv : state_->callbacks) {
      callbacks.push_back(std::move(kv.second));
    }
    state_->callbacks.clear();
    running.lock();
  }
  state_->cv.notify_all();

  // Outside the state lock so callbacks may touch the token
  for (auto &cb : callbacks) {
    cb();
  }
}

bool CancellationSource::is_cancelled() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->cancelled;
}

} // namespace clipsync
