/**
 * @file sync.cpp
 * @brief Clipboard synchronization service implementation
 */

#include "clipsync/sync.h"
#include "clipsync/channel.h"
#include "clipsync/log.h"
#include <atomic>
#include <mutex>
#include <thread>

namespace clipsync {

// ============================================================================
// SyncService::Impl
// ============================================================================

class SyncService::Impl {
public:
  Impl(Client &c, ClipboardOwner &cb, Identity id, SyncOptions opts)
      : client(c), clipboard(cb), identity(std::move(id)), options(opts),
        outgoing(opts.queue_capacity), incoming(opts.queue_capacity) {}

  void watch();
  void upload();
  void receive();
  void apply();

  /// True when key matches what was last sent or applied
  bool seen(const std::string &key) const;
  void remember(const std::string &key);

  Client &client;
  ClipboardOwner &clipboard;
  Identity identity;
  SyncOptions options;

  Channel<Snapshot> outgoing;
  Channel<Snapshot> incoming;

  std::unique_ptr<CancellationSource> cancel;
  std::thread watcher;
  std::thread uploader;
  std::thread receiver;
  std::thread applier;
  bool running = false;

  // Held over a sample and its key check, and over an apply and its readback
  std::mutex clipboard_mutex;

  mutable std::mutex key_mutex;
  std::string last_key;        // Last sent or applied, as seen locally
  std::string last_remote_key; // Last remote snapshot applied

  std::atomic<uint64_t> captured{0};
  std::atomic<uint64_t> uploaded{0};
  std::atomic<uint64_t> upload_failures{0};
  std::atomic<uint64_t> applied{0};
  std::atomic<uint64_t> apply_failures{0};
  std::atomic<uint64_t> duplicates_skipped{0};
};

bool SyncService::Impl::seen(const std::string &key) const {
  std::lock_guard<std::mutex> lock(key_mutex);
  return key == last_key;
}

void SyncService::Impl::remember(const std::string &key) {
  std::lock_guard<std::mutex> lock(key_mutex);
  last_key = key;
}

void SyncService::Impl::watch() {
  CancellationToken token = cancel->token();
  bool reported_error = false;

  while (!token.is_cancelled()) {
    std::unique_lock<std::mutex> sampling(clipboard_mutex);
    auto items = clipboard.read();
    if (items.is_error()) {
      // Log the first failure of a run of failures only
      if (!reported_error && items.error().code != ErrorCode::Cancelled) {
        logger()->warn("clipboard read failed: {}", items.error().to_string());
        reported_error = true;
      }
    } else {
      reported_error = false;
      if (!items.value().empty()) {
        std::string key = quick_key(items.value());
        if (!seen(key)) {
          remember(key);

          Snapshot snap;
          snap.origin = identity.client_id();
          snap.ts = unix_now();
          snap.items = std::move(items.value());
          snap.qkey = key;

          captured++;
          logger()->debug("local clipboard changed ({} items, key {})",
                          snap.items.size(), key);
          outgoing.push(std::move(snap));
        }
      }
    }
    sampling.unlock();

    if (token.wait_for(options.watch_interval)) {
      break;
    }
  }
}

void SyncService::Impl::upload() {
  CancellationToken token = cancel->token();
  while (auto snap = outgoing.pop()) {
    if (token.is_cancelled()) {
      break;
    }
    auto sent = client.send(*snap);
    if (sent.is_ok()) {
      uploaded++;
      logger()->info("sent snapshot {} ({} items)", snap->qkey,
                     snap->items.size());
    } else {
      upload_failures++;
      logger()->warn("send failed: {}", sent.error().to_string());
    }
  }
}

void SyncService::Impl::receive() {
  client.poll(cancel->token(), [this](Snapshot snap) {
    if (snap.qkey.empty()) {
      snap.stamp_quick_key();
    }
    incoming.push(std::move(snap));
  });
}

void SyncService::Impl::apply() {
  while (auto snap = incoming.pop()) {
    if (snap->empty()) {
      continue;
    }

    {
      std::lock_guard<std::mutex> lock(key_mutex);
      if (snap->qkey == last_remote_key || snap->qkey == last_key) {
        duplicates_skipped++;
        continue;
      }
    }

    std::lock_guard<std::mutex> applying(clipboard_mutex);
    auto written = clipboard.write(snap->items);
    if (written.is_error()) {
      apply_failures++;
      logger()->warn("applying snapshot from {} failed: {}", snap->origin,
                     written.error().to_string());
      continue;
    }

    // The clipboard may hold a different rendition than what was written
    // (one item out of several); key the watcher on what it will read back.
    std::string local_key = snap->qkey;
    auto readback = clipboard.read();
    if (readback.is_ok() && !readback.value().empty()) {
      local_key = quick_key(readback.value());
    }

    {
      std::lock_guard<std::mutex> lock(key_mutex);
      last_remote_key = snap->qkey;
      last_key = local_key;
    }

    applied++;
    logger()->info("received snapshot {} from {} ({} items)", snap->qkey,
                   snap->origin, snap->items.size());
  }
}

// ============================================================================
// SyncService
// ============================================================================

SyncService::SyncService(Client &client, ClipboardOwner &clipboard,
                         Identity identity, SyncOptions options)
    : impl_(std::make_unique<Impl>(client, clipboard, std::move(identity),
                                   options)) {}

SyncService::~SyncService() { stop(); }

Result<void> SyncService::start() {
  if (impl_->running) {
    return Error(ErrorCode::InvalidState, "sync service already running");
  }
  if (!impl_->clipboard.is_running()) {
    return Error(ErrorCode::ClipboardUnavailable,
                 "clipboard owner not running");
  }

  impl_->cancel = std::make_unique<CancellationSource>();
  impl_->running = true;

  impl_->applier = std::thread([this] { impl_->apply(); });
  impl_->uploader = std::thread([this] { impl_->upload(); });
  impl_->receiver = std::thread([this] { impl_->receive(); });
  impl_->watcher = std::thread([this] { impl_->watch(); });

  logger()->info("sync started: id {}, transport {}",
                 impl_->identity.client_id(),
                 transport_kind_name(impl_->client.kind()));
  return Result<void>::ok();
}

void SyncService::stop() {
  if (!impl_->running) {
    return;
  }

  impl_->cancel->cancel();

  // Producers first, then let the consumers drain and exit
  if (impl_->watcher.joinable()) {
    impl_->watcher.join();
  }
  if (impl_->receiver.joinable()) {
    impl_->receiver.join();
  }
  impl_->outgoing.close();
  impl_->incoming.close();
  if (impl_->uploader.joinable()) {
    impl_->uploader.join();
  }
  if (impl_->applier.joinable()) {
    impl_->applier.join();
  }

  impl_->running = false;
  logger()->info("sync stopped");
}

bool SyncService::is_running() const { return impl_->running; }

SyncStats SyncService::stats() const {
  SyncStats s;
  s.captured = impl_->captured.load();
  s.uploaded = impl_->uploaded.load();
  s.upload_failures = impl_->upload_failures.load();
  s.applied = impl_->applied.load();
  s.apply_failures = impl_->apply_failures.load();
  s.duplicates_skipped = impl_->duplicates_skipped.load();
  s.dropped = impl_->outgoing.dropped() + impl_->incoming.dropped();
  return s;
}

} // namespace clipsync
