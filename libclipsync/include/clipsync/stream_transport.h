/**
 * @file stream_transport.h
 * @brief Client over a persistent WebSocket connection
 *
 * One logical connection at a time. Every message is one complete JSON
 * snapshot in a text frame. The handshake carries X-Auth-Token. The
 * connection is re-established with exponential backoff whenever it drops,
 * and a ping every 25 s detects dead peers.
 */

#ifndef CLIPSYNC_STREAM_TRANSPORT_H
#define CLIPSYNC_STREAM_TRANSPORT_H

#include "backoff.h"
#include "http.h"
#include "transport.h"
#include <memory>

namespace clipsync {

/**
 * @brief Tunables of the stream transport
 */
struct StreamOptions {
  BackoffPolicy reconnect = BackoffPolicy::reconnect();

  /// Interval between keepalive pings
  Milliseconds ping_interval{25000};

  /// Unanswered pings after which the connection is considered dead
  int max_missed_pongs = 2;

  /// Deadline for writing one message
  Milliseconds write_timeout{5000};

  /// Time allowed for the close handshake on shutdown
  Milliseconds close_grace{500};

  /// Deadline for TCP connect and for the upgrade handshake
  Milliseconds handshake_timeout{15000};
};

/**
 * @brief Client over the relay's WebSocket interface
 *
 * The connection lives inside poll(): it is opened when poll() starts and
 * closed with code 1000 when the cancellation token fires. send() returns
 * NotConnected while no connection is open.
 */
class CLIPSYNC_API StreamClient : public Client {
public:
  /**
   * @param identity Client id and key
   * @param endpoint Relay URL; an http:// endpoint is dialed as ws://
   * @param options Tunables
   */
  StreamClient(Identity identity, Url endpoint,
               StreamOptions options = StreamOptions());
  ~StreamClient() override;

  StreamClient(const StreamClient &) = delete;
  StreamClient &operator=(const StreamClient &) = delete;

  static Result<std::unique_ptr<StreamClient>>
  create(const ClientConfig &config, const Identity &identity);

  Result<void> send(const Snapshot &snapshot) override;

  void poll(const CancellationToken &cancel, const SnapshotSink &sink) override;

  TransportStats stats() const override;

  TransportKind kind() const override { return TransportKind::Stream; }

  /// True while a connection is open
  bool connected() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace clipsync

#endif // CLIPSYNC_STREAM_TRANSPORT_H
