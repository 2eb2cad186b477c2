/**
 * @file channel.h
 * @brief Bounded queue between the sync loops
 */

#ifndef CLIPSYNC_CHANNEL_H
#define CLIPSYNC_CHANNEL_H

#include "types.h"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace clipsync {

/**
 * @brief Multi-producer multi-consumer queue with a fixed capacity
 *
 * When full, push() discards the oldest entry so a slow consumer always
 * sees the most recent clipboard state. After close(), push() is rejected
 * and pop() drains what is left and then returns nullopt.
 */
template <typename T> class Channel {
public:
  explicit Channel(size_t capacity) : capacity_(capacity ? capacity : 1) {}

  Channel(const Channel &) = delete;
  Channel &operator=(const Channel &) = delete;

  /**
   * @brief Enqueue a value
   * @return false when the channel is closed
   */
  bool push(T value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) {
        return false;
      }
      if (queue_.size() >= capacity_) {
        queue_.pop_front();
        ++dropped_;
      }
      queue_.push_back(std::move(value));
    }
    cv_.notify_one();
    return true;
  }

  /// Block until a value is available or the channel is closed and empty
  std::optional<T> pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    return take_locked();
  }

  /// Like pop(), giving up after timeout
  std::optional<T> pop_for(Milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
    return take_locked();
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  /// Entries discarded because the channel was full
  size_t dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
  }

private:
  std::optional<T> take_locked() {
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> queue_;
  bool closed_ = false;
  size_t dropped_ = 0;
};

} // namespace clipsync

#endif // CLIPSYNC_CHANNEL_H
