/**
 * @file cancel.h
 * @brief Cooperative cancellation for the blocking loops
 *
 * A CancellationSource hands out tokens. Loops check the token between
 * steps and sleep on it, so a cancel wakes them immediately. Code that
 * blocks elsewhere (an io_context, a socket) registers a callback.
 */

#ifndef CLIPSYNC_CANCEL_H
#define CLIPSYNC_CANCEL_H

#include "platform.h"
#include "types.h"
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace clipsync {

namespace detail {
struct CancelState {
  std::mutex mutex;
  std::recursive_mutex running; // Held while cancel callbacks execute
  std::condition_variable cv;
  bool cancelled = false;
  uint64_t next_id = 1;
  std::map<uint64_t, std::function<void()>> callbacks;
};
} // namespace detail

/**
 * @brief Unregisters a cancel callback when destroyed
 *
 * If the callback is executing on another thread, reset() waits for it to
 * finish, so the callback may safely reference the registration's scope.
 */
class CLIPSYNC_API CancelRegistration {
public:
  CancelRegistration() = default;
  CancelRegistration(std::weak_ptr<detail::CancelState> state, uint64_t id)
      : state_(std::move(state)), id_(id) {}
  ~CancelRegistration();

  CancelRegistration(const CancelRegistration &) = delete;
  CancelRegistration &operator=(const CancelRegistration &) = delete;
  CancelRegistration(CancelRegistration &&other) noexcept;
  CancelRegistration &operator=(CancelRegistration &&other) noexcept;

  /// Drop the callback now
  void reset();

private:
  std::weak_ptr<detail::CancelState> state_;
  uint64_t id_ = 0;
};

/**
 * @brief Read side of a cancellation
 *
 * Copyable. A default-constructed token is never cancelled.
 */
class CLIPSYNC_API CancellationToken {
public:
  CancellationToken() = default;

  bool is_cancelled() const;

  /**
   * @brief Sleep for up to timeout
   * @return true if cancelled (before or during the wait)
   */
  bool wait_for(Milliseconds timeout) const;

  /**
   * @brief Run callback on cancel
   *
   * Runs immediately on the calling thread when already cancelled,
   * otherwise on the thread that calls cancel().
   */
  CancelRegistration on_cancel(std::function<void()> callback) const;

private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<detail::CancelState> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::CancelState> state_;
};

/**
 * @brief Write side of a cancellation
 */
class CLIPSYNC_API CancellationSource {
public:
  CancellationSource();

  CancellationSource(const CancellationSource &) = delete;
  CancellationSource &operator=(const CancellationSource &) = delete;

  CancellationToken token() const { return CancellationToken(state_); }

  /// Cancel and wake every waiter; later calls are no-ops
  void cancel();

  bool is_cancelled() const;

private:
  std::shared_ptr<detail::CancelState> state_;
};

} // namespace clipsync

#endif // CLIPSYNC_CANCEL_H
