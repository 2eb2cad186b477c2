/**
 * @file test_sync.cpp
 * @brief Unit tests for the sync service with a fake client and clipboard
 */

#include <clipsync/clipsync.h>
#include <gtest/gtest.h>

#include "fake_clipboard.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

using namespace clipsync;
using clipsync::testing::FakeClipboard;
using clipsync::testing::FakeClipboardState;

namespace {

/// Client that records sends and delivers injected snapshots from poll()
class FakeClient : public Client {
public:
  Result<void> send(const Snapshot &snapshot) override {
    std::lock_guard<std::mutex> lock(mutex_);
    Snapshot stamped = snapshot;
    stamped.stamp_quick_key();
    sent_.push_back(stamped);
    return Result<void>::ok();
  }

  void poll(const CancellationToken &cancel,
            const SnapshotSink &sink) override {
    auto reg = cancel.on_cancel([this] {
      std::lock_guard<std::mutex> lock(mutex_);
      cv_.notify_all();
    });

    std::unique_lock<std::mutex> lock(mutex_);
    while (!cancel.is_cancelled()) {
      cv_.wait(lock, [&] { return cancel.is_cancelled() || !inbox_.empty(); });
      while (!inbox_.empty()) {
        Snapshot snap = std::move(inbox_.front());
        inbox_.pop_front();
        lock.unlock();
        sink(std::move(snap));
        lock.lock();
        delivered_++;
        cv_.notify_all();
      }
    }
  }

  TransportStats stats() const override { return TransportStats(); }
  TransportKind kind() const override { return TransportKind::Poll; }

  /// Hand a snapshot to the running poll loop
  void deliver(Snapshot snap) {
    std::lock_guard<std::mutex> lock(mutex_);
    inbox_.push_back(std::move(snap));
    cv_.notify_all();
  }

  /// Wait until every delivered snapshot went through the sink
  bool wait_delivered(size_t n) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, std::chrono::seconds(5),
                        [&] { return delivered_ >= n; });
  }

  std::vector<Snapshot> sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Snapshot> inbox_;
  std::vector<Snapshot> sent_;
  size_t delivered_ = 0;
};

/// Poll until pred holds or a generous deadline passes
bool eventually(const std::function<bool()> &pred) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

} // namespace

class SyncTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(security_init().is_ok());
    formats_ = register_formats();
    state_ = std::make_shared<FakeClipboardState>();
    owner_ = std::make_unique<ClipboardOwner>(
        std::make_unique<FakeClipboard>(state_));
    ASSERT_TRUE(owner_->start().is_ok());

    auto id = Identity::create("local01", "0011223344556677");
    ASSERT_TRUE(id.is_ok());
    identity_ = std::make_unique<Identity>(id.value());
  }

  void TearDown() override {
    if (service_) {
      service_->stop();
    }
    owner_->stop();
  }

  void start_service() {
    SyncOptions opts;
    opts.watch_interval = Milliseconds(5);
    service_ = std::make_unique<SyncService>(client_, *owner_, *identity_, opts);
    ASSERT_TRUE(service_->start().is_ok());
  }

  Snapshot remote(const std::string &text) const {
    Snapshot s;
    s.origin = "peer02";
    s.ts = unix_now();
    s.items = {make_text_item(formats_, text)};
    s.stamp_quick_key();
    return s;
  }

  /// Let the watcher take several more samples
  void settle() const {
    int reads = state_->reads.load();
    eventually([&] { return state_->reads.load() >= reads + 10; });
  }

  ClipboardFormats formats_;
  std::shared_ptr<FakeClipboardState> state_;
  std::unique_ptr<ClipboardOwner> owner_;
  std::unique_ptr<Identity> identity_;
  FakeClient client_;
  std::unique_ptr<SyncService> service_;
};

TEST_F(SyncTest, RequiresRunningClipboard) {
  owner_->stop();
  SyncService service(client_, *owner_, *identity_);
  auto started = service.start();
  ASSERT_TRUE(started.is_error());
  EXPECT_EQ(started.error().code, ErrorCode::ClipboardUnavailable);
  EXPECT_FALSE(service.is_running());
}

TEST_F(SyncTest, EmptyClipboardSendsNothing) {
  start_service();
  settle();
  EXPECT_TRUE(client_.sent().empty());
  EXPECT_EQ(service_->stats().captured, 0u);
}

TEST_F(SyncTest, LocalChangeUploadedOnce) {
  state_->set({make_text_item(formats_, "first copy")});
  start_service();

  ASSERT_TRUE(eventually([&] { return client_.sent().size() == 1; }));
  settle();

  auto sent = client_.sent();
  ASSERT_EQ(sent.size(), 1u);
  EXPECT_EQ(sent[0].origin, "local01");
  EXPECT_EQ(sent[0].qkey, quick_key(state_->get()));
  EXPECT_GT(sent[0].ts, 0);

  state_->set({make_text_item(formats_, "second copy")});
  ASSERT_TRUE(eventually([&] { return client_.sent().size() == 2; }));
  EXPECT_EQ(client_.sent()[1].qkey, quick_key(state_->get()));

  SyncStats stats = service_->stats();
  EXPECT_EQ(stats.captured, 2u);
  EXPECT_TRUE(eventually([&] { return service_->stats().uploaded == 2; }));
}

TEST_F(SyncTest, RemoteSnapshotAppliedWithoutEcho) {
  start_service();
  Snapshot snap = remote("from the other desk");
  client_.deliver(snap);

  ASSERT_TRUE(eventually([&] { return state_->write_count() == 1; }));
  EXPECT_EQ(state_->get(), snap.items);
  EXPECT_TRUE(eventually([&] { return service_->stats().applied == 1; }));

  settle();
  EXPECT_TRUE(client_.sent().empty());
}

TEST_F(SyncTest, DuplicateRemoteSkipped) {
  start_service();
  Snapshot snap = remote("same twice");
  client_.deliver(snap);
  client_.deliver(snap);
  ASSERT_TRUE(client_.wait_delivered(2));

  ASSERT_TRUE(
      eventually([&] { return service_->stats().duplicates_skipped == 1; }));
  EXPECT_EQ(state_->write_count(), 1u);
}

TEST_F(SyncTest, RemoteMatchingLocalClipboardSkipped) {
  std::vector<Item> local = {make_text_item(formats_, "already here")};
  state_->set(local);
  start_service();
  ASSERT_TRUE(eventually([&] { return client_.sent().size() == 1; }));

  client_.deliver(remote("already here"));
  ASSERT_TRUE(client_.wait_delivered(1));
  ASSERT_TRUE(
      eventually([&] { return service_->stats().duplicates_skipped == 1; }));
  EXPECT_EQ(state_->write_count(), 0u);
}

TEST_F(SyncTest, EmptyRemoteNeverApplied) {
  start_service();
  Snapshot empty;
  empty.origin = "peer02";
  empty.stamp_quick_key();
  client_.deliver(empty);
  client_.deliver(remote("after the sentinel"));

  ASSERT_TRUE(eventually([&] { return state_->write_count() == 1; }));
  EXPECT_EQ(state_->get()[0], make_text_item(formats_, "after the sentinel"));
}

TEST_F(SyncTest, RemoteWithoutKeyGetsStamped) {
  start_service();
  Snapshot snap = remote("unkeyed");
  snap.qkey.clear();
  client_.deliver(snap);
  client_.deliver(snap);

  ASSERT_TRUE(
      eventually([&] { return service_->stats().duplicates_skipped == 1; }));
  EXPECT_EQ(state_->write_count(), 1u);
}

TEST_F(SyncTest, ApplyFailureCounted) {
  state_->fail_writes = true;
  start_service();
  client_.deliver(remote("refused"));

  ASSERT_TRUE(
      eventually([&] { return service_->stats().apply_failures == 1; }));
  EXPECT_EQ(service_->stats().applied, 0u);
}

TEST_F(SyncTest, StopIsIdempotent) {
  start_service();
  EXPECT_TRUE(service_->is_running());
  EXPECT_EQ(service_->start().error().code, ErrorCode::InvalidState);

  service_->stop();
  EXPECT_FALSE(service_->is_running());
  service_->stop();
}
