/**
 * @file transport.cpp
 * @brief Client factory and shared transport helpers
 */

#include "clipsync/transport.h"
#include "clipsync/log.h"
#include "clipsync/poll_transport.h"
#include "clipsync/stream_transport.h"

namespace clipsync {

TransportStats detail::StatsCounters::load() const {
  TransportStats s;
  s.snapshots_sent = snapshots_sent.load();
  s.send_failures = send_failures.load();
  s.parts_uploaded = parts_uploaded.load();
  s.upload_retries = upload_retries.load();
  s.snapshots_received = snapshots_received.load();
  s.self_filtered = self_filtered.load();
  s.malformed_discarded = malformed_discarded.load();
  s.discover_failures = discover_failures.load();
  s.fetch_failures = fetch_failures.load();
  s.sessions_reset = sessions_reset.load();
  s.connects = connects.load();
  s.reconnects = reconnects.load();
  return s;
}

Error status_error(int status, const std::string &body) {
  std::string details = "HTTP " + std::to_string(status);
  if (!body.empty()) {
    // Relay error bodies are short plain text; keep a bounded excerpt
    details += ": " + body.substr(0, 200);
  }

  switch (status) {
  case 401:
    return Error(ErrorCode::AuthenticationFailed, "relay rejected token",
                 details);
  case 413:
    return Error(ErrorCode::PayloadTooLarge, "relay rejected part size",
                 details);
  case 400:
    return Error(ErrorCode::InconsistentChunkTotal,
                 "relay rejected chunk headers", details);
  case 404:
    return Error(ErrorCode::ChunkNotAvailable, "part not available", details);
  case 410:
    return Error(ErrorCode::SessionGone, "session no longer held", details);
  default:
    return Error(ErrorCode::HttpError, "unexpected relay status", details);
  }
}

Result<std::unique_ptr<Client>> make_client(const ClientConfig &config,
                                            const Identity &identity) {
  switch (config.transport) {
  case TransportKind::Poll: {
    auto client = PollClient::create(config, identity);
    CLIPSYNC_TRY(client);
    logger()->debug("using poll transport against {}", config.endpoint);
    return std::unique_ptr<Client>(std::move(client.value()));
  }
  case TransportKind::Stream: {
    auto client = StreamClient::create(config, identity);
    CLIPSYNC_TRY(client);
    logger()->debug("using stream transport against {}", config.endpoint);
    return std::unique_ptr<Client>(std::move(client.value()));
  }
  }
  return Error(ErrorCode::NotSupported, "unknown transport");
}

} // namespace clipsync
