/**
 * @file sync.h
 * @brief Clipboard synchronization service
 *
 * Ties a Client to the local clipboard:
 *
 *   watcher  -> [send queue]  -> uploader -> Client::send
 *   Client::poll -> [apply queue] -> applier  -> clipboard
 *
 * Both queues are bounded and drop their oldest entry when full. Quick keys
 * suppress re-uploading what was just applied and re-applying what is
 * already on the clipboard.
 */

#ifndef CLIPSYNC_SYNC_H
#define CLIPSYNC_SYNC_H

#include "auth.h"
#include "clipboard.h"
#include "platform.h"
#include "transport.h"
#include "types.h"
#include <cstdint>
#include <memory>

namespace clipsync {

/**
 * @brief Tunables of the sync service
 */
struct SyncOptions {
  /// How often the watcher samples the clipboard
  Milliseconds watch_interval{200};

  /// Capacity of each queue
  size_t queue_capacity = 8;
};

/**
 * @brief Counters of the sync service
 */
struct SyncStats {
  uint64_t captured = 0;         // Local changes queued for upload
  uint64_t uploaded = 0;
  uint64_t upload_failures = 0;
  uint64_t applied = 0;          // Remote snapshots written locally
  uint64_t apply_failures = 0;
  uint64_t duplicates_skipped = 0;
  uint64_t dropped = 0;          // Evicted from a full queue
};

/**
 * @brief Runs the watcher, uploader, receive and applier threads
 */
class CLIPSYNC_API SyncService {
public:
  /**
   * @param client Transport; must outlive the service
   * @param clipboard Running clipboard owner; must outlive the service
   * @param identity Local identity (origin of captured snapshots)
   * @param options Tunables
   */
  SyncService(Client &client, ClipboardOwner &clipboard, Identity identity,
              SyncOptions options = SyncOptions());
  ~SyncService();

  SyncService(const SyncService &) = delete;
  SyncService &operator=(const SyncService &) = delete;

  /// Spawn the threads
  Result<void> start();

  /// Cancel and join every thread
  void stop();

  bool is_running() const;

  SyncStats stats() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace clipsync

#endif // CLIPSYNC_SYNC_H
