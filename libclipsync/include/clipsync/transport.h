/**
 * @file transport.h
 * @brief Transport-agnostic client interface
 *
 * Both wire transports (chunked HTTP polling and the WebSocket stream)
 * implement Client. Retry, reconnect and backoff policy live inside the
 * implementations; callers only send snapshots and consume received ones.
 */

#ifndef CLIPSYNC_TRANSPORT_H
#define CLIPSYNC_TRANSPORT_H

#include "auth.h"
#include "cancel.h"
#include "config.h"
#include "error.h"
#include "platform.h"
#include "snapshot.h"
#include "types.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>

namespace clipsync {

// ============================================================================
// Callbacks and Counters
// ============================================================================

/// Receives snapshots from other clients, called on the poll thread
using SnapshotSink = std::function<void(Snapshot)>;

/**
 * @brief Counters exposed by a transport
 */
struct TransportStats {
  uint64_t snapshots_sent = 0;
  uint64_t send_failures = 0;
  uint64_t parts_uploaded = 0;
  uint64_t upload_retries = 0;
  uint64_t snapshots_received = 0;
  uint64_t self_filtered = 0;
  uint64_t malformed_discarded = 0;
  uint64_t discover_failures = 0;
  uint64_t fetch_failures = 0;
  uint64_t sessions_reset = 0;
  uint64_t connects = 0;
  uint64_t reconnects = 0;
};

namespace detail {
/// Thread-safe backing store of TransportStats
struct StatsCounters {
  std::atomic<uint64_t> snapshots_sent{0};
  std::atomic<uint64_t> send_failures{0};
  std::atomic<uint64_t> parts_uploaded{0};
  std::atomic<uint64_t> upload_retries{0};
  std::atomic<uint64_t> snapshots_received{0};
  std::atomic<uint64_t> self_filtered{0};
  std::atomic<uint64_t> malformed_discarded{0};
  std::atomic<uint64_t> discover_failures{0};
  std::atomic<uint64_t> fetch_failures{0};
  std::atomic<uint64_t> sessions_reset{0};
  std::atomic<uint64_t> connects{0};
  std::atomic<uint64_t> reconnects{0};

  TransportStats load() const;
};
} // namespace detail

// ============================================================================
// Client Interface
// ============================================================================

/**
 * @brief Sends local snapshots to the relay and streams remote ones back
 */
class CLIPSYNC_API Client {
public:
  virtual ~Client() = default;

  /**
   * @brief Publish a snapshot
   *
   * Stamps the quick key and enforces the 32 MiB cap before any network
   * activity. May block on I/O. Safe to call while poll() runs on another
   * thread.
   */
  virtual Result<void> send(const Snapshot &snapshot) = 0;

  /**
   * @brief Receive loop
   *
   * Runs until cancel fires. Snapshots produced by other clients are passed
   * to sink; snapshots carrying this client's own origin are dropped.
   * Transient failures are retried internally and never end the loop.
   */
  virtual void poll(const CancellationToken &cancel,
                    const SnapshotSink &sink) = 0;

  /// Counter snapshot
  virtual TransportStats stats() const = 0;

  virtual TransportKind kind() const = 0;
};

/**
 * @brief Build the client selected by config.transport
 *
 * @return Client, or the configuration error (InvalidUrl, NotSupported)
 */
CLIPSYNC_API Result<std::unique_ptr<Client>>
make_client(const ClientConfig &config, const Identity &identity);

/**
 * @brief Map a non-2xx relay status onto an error
 *
 * 401 AuthenticationFailed, 413 PayloadTooLarge, 400 InconsistentChunkTotal,
 * 404 ChunkNotAvailable, 410 SessionGone, anything else HttpError.
 */
CLIPSYNC_API Error status_error(int status, const std::string &body = "");

} // namespace clipsync

#endif // CLIPSYNC_TRANSPORT_H
