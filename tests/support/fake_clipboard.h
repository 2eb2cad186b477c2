/**
 * @file fake_clipboard.h
 * @brief In-memory clipboard backend for tests
 */

#ifndef CLIPSYNC_TESTS_FAKE_CLIPBOARD_H
#define CLIPSYNC_TESTS_FAKE_CLIPBOARD_H

#include <clipsync/clipboard.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace clipsync {
namespace testing {

/**
 * @brief Shared contents of a FakeClipboard
 *
 * Tests keep a shared_ptr to inspect and change the clipboard while the
 * backend itself is owned by a ClipboardOwner.
 */
struct FakeClipboardState {
  mutable std::mutex mutex;
  std::vector<Item> items;
  std::vector<std::vector<Item>> writes;
  std::atomic<int> reads{0};
  std::atomic<bool> fail_writes{false};
  std::thread::id last_thread;

  void set(std::vector<Item> value) {
    std::lock_guard<std::mutex> lock(mutex);
    items = std::move(value);
  }

  std::vector<Item> get() const {
    std::lock_guard<std::mutex> lock(mutex);
    return items;
  }

  size_t write_count() const {
    std::lock_guard<std::mutex> lock(mutex);
    return writes.size();
  }
};

class FakeClipboard : public ClipboardBackend {
public:
  explicit FakeClipboard(std::shared_ptr<FakeClipboardState> state)
      : state_(std::move(state)) {}

  Result<std::vector<Item>> read() override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->reads++;
    state_->last_thread = std::this_thread::get_id();
    return state_->items;
  }

  Result<void> write(const std::vector<Item> &items) override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->last_thread = std::this_thread::get_id();
    if (state_->fail_writes) {
      return Error(ErrorCode::PlatformError, "write refused");
    }
    state_->writes.push_back(items);
    state_->items = items;
    return Result<void>::ok();
  }

  std::string name() const override { return "fake"; }

private:
  std::shared_ptr<FakeClipboardState> state_;
};

} // namespace testing
} // namespace clipsync

#endif // CLIPSYNC_TESTS_FAKE_CLIPBOARD_H
