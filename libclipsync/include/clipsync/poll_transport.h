/**
 * @file poll_transport.h
 * @brief Client over chunked HTTP POST and discover/fetch polling
 *
 * Sending: the serialized snapshot is cut into parts which are POSTed in
 * order, each carrying X-Chunk-Id / X-Chunk-Idx / X-Chunk-Total. Each POST
 * is retried with backoff.
 *
 * Receiving: a plain GET (discover) reports the relay's current session as
 * {"cid":..., "total":..., "have":[...]}. Missing parts are fetched one by
 * one with GET + X-Chunk-Id / X-Chunk-Idx, and once all are held the
 * snapshot is assembled and handed on.
 */

#ifndef CLIPSYNC_POLL_TRANSPORT_H
#define CLIPSYNC_POLL_TRANSPORT_H

#include "backoff.h"
#include "chunk_codec.h"
#include "http.h"
#include "transport.h"
#include <memory>
#include <string>
#include <vector>

namespace clipsync {

/// Relay request headers
constexpr const char *DEVICE_ID_HEADER = "X-Device-Id";
constexpr const char *CHUNK_ID_HEADER = "X-Chunk-Id";
constexpr const char *CHUNK_IDX_HEADER = "X-Chunk-Idx";
constexpr const char *CHUNK_TOTAL_HEADER = "X-Chunk-Total";

/// Attempts per part, the first included
constexpr int DEFAULT_UPLOAD_ATTEMPTS = 5;

/**
 * @brief Tunables of the poll transport
 */
struct PollOptions {
  size_t part_size = DEFAULT_PART_SIZE;
  Milliseconds idle{200};
  int max_attempts = DEFAULT_UPLOAD_ATTEMPTS;
  BackoffPolicy retry = BackoffPolicy::upload();
};

/**
 * @brief Parsed discover response
 */
struct DiscoverInfo {
  std::string cid; // Empty when no session is active
  size_t total = 0;
  std::vector<size_t> have;

  static Result<DiscoverInfo> from_json(const std::string &text);
};

/**
 * @brief Client over the relay's HTTP interface
 */
class CLIPSYNC_API PollClient : public Client {
public:
  PollClient(Identity identity, std::shared_ptr<HttpTransport> http,
             PollOptions options = PollOptions());
  ~PollClient() override;

  PollClient(const PollClient &) = delete;
  PollClient &operator=(const PollClient &) = delete;

  /// Build with a Boost.Beast transport from config
  static Result<std::unique_ptr<PollClient>> create(const ClientConfig &config,
                                                    const Identity &identity);

  Result<void> send(const Snapshot &snapshot) override;

  void poll(const CancellationToken &cancel, const SnapshotSink &sink) override;

  /**
   * @brief One discover/fetch/assemble round without the idle pause
   */
  void poll_once(const CancellationToken &cancel, const SnapshotSink &sink);

  TransportStats stats() const override;

  TransportKind kind() const override { return TransportKind::Poll; }

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace clipsync

#endif // CLIPSYNC_POLL_TRANSPORT_H
