/**
 * @file poll_transport.cpp
 * @brief HTTP chunked-poll transport implementation
 */

#include "clipsync/poll_transport.h"
#include "clipsync/log.h"
#include <thread>

#include <nlohmann/json.hpp>

namespace clipsync {

using json = nlohmann::json;

// ============================================================================
// DiscoverInfo
// ============================================================================

Result<DiscoverInfo> DiscoverInfo::from_json(const std::string &text) {
  try {
    auto j = json::parse(text);
    if (!j.is_object()) {
      return Error(ErrorCode::MalformedMessage, "discover reply not an object");
    }

    DiscoverInfo info;
    auto cid = j.find("cid");
    if (cid != j.end() && !cid->is_null()) {
      info.cid = cid->get<std::string>();
    }
    auto total = j.find("total");
    if (total != j.end() && !total->is_null()) {
      if (!total->is_number_unsigned()) {
        return Error(ErrorCode::MalformedMessage,
                     "discover total is not a part count");
      }
      info.total = total->get<size_t>();
    }
    auto have = j.find("have");
    if (have != j.end() && !have->is_null()) {
      if (!have->is_array()) {
        return Error(ErrorCode::MalformedMessage, "discover have not a list");
      }
      for (const auto &index : *have) {
        if (!index.is_number_unsigned()) {
          return Error(ErrorCode::MalformedMessage,
                       "discover have holds a non-index entry");
        }
        info.have.push_back(index.get<size_t>());
      }
    }
    return info;
  } catch (const json::exception &e) {
    return Error(ErrorCode::MalformedMessage, "invalid discover reply",
                 e.what());
  }
}

// ============================================================================
// PollClient::Impl
// ============================================================================

class PollClient::Impl {
public:
  Impl(Identity id, std::shared_ptr<HttpTransport> transport, PollOptions opts)
      : identity(std::move(id)), http(std::move(transport)),
        options(std::move(opts)) {}

  Identity identity;
  std::shared_ptr<HttpTransport> http;
  PollOptions options;
  detail::StatsCounters counters;

  // Receive state, touched only by the poll thread
  ChunkSet current;
  std::string last_completed_cid;

  HttpRequest base_request(HttpMethod method) const {
    HttpRequest req;
    req.method = method;
    req.set_header(AUTH_HEADER, identity.build_auth_token());
    req.set_header(DEVICE_ID_HEADER, identity.client_id());
    return req;
  }

  Result<void> post_part(const Bytes &part, const std::string &cid, size_t idx,
                         size_t total);
  Result<DiscoverInfo> discover(const CancellationToken &cancel);
  Result<Bytes> fetch(const std::string &cid, size_t idx,
                      const CancellationToken &cancel);
  void finish_session(const SnapshotSink &sink);
};

Result<void> PollClient::Impl::post_part(const Bytes &part,
                                         const std::string &cid, size_t idx,
                                         size_t total) {
  Backoff backoff(options.retry);
  Error last(ErrorCode::Unknown, "no attempt made");

  for (int attempt = 1; attempt <= options.max_attempts; ++attempt) {
    // Fresh token per attempt so a slow retry series stays inside the
    // relay's skew window
    HttpRequest req = base_request(HttpMethod::Post);
    req.set_header(CHUNK_ID_HEADER, cid);
    req.set_header(CHUNK_IDX_HEADER, std::to_string(idx));
    req.set_header(CHUNK_TOTAL_HEADER, std::to_string(total));
    req.set_header("Content-Type", "application/octet-stream");
    req.body.assign(part.begin(), part.end());

    auto resp = http->perform(req);
    if (resp.is_ok() && resp.value().ok()) {
      counters.parts_uploaded++;
      return Result<void>::ok();
    }

    last = resp.is_ok() ? status_error(resp.value().status, resp.value().body)
                        : resp.error();
    last.message = "chunk " + std::to_string(idx) + ": " + last.message;

    if (attempt < options.max_attempts) {
      auto delay = backoff.next_delay();
      counters.upload_retries++;
      logger()->debug("POST chunk {}/{} attempt {} failed: {}; retry in {} ms",
                      idx, total, attempt, last.to_string(), delay.count());
      std::this_thread::sleep_for(delay);
    }
  }

  return last;
}

Result<DiscoverInfo> PollClient::Impl::discover(const CancellationToken &cancel) {
  HttpRequest req = base_request(HttpMethod::Get);

  auto resp = http->perform(req, cancel);
  CLIPSYNC_TRY(resp);
  if (!resp.value().ok()) {
    return status_error(resp.value().status, resp.value().body);
  }
  return DiscoverInfo::from_json(resp.value().body);
}

Result<Bytes> PollClient::Impl::fetch(const std::string &cid, size_t idx,
                                      const CancellationToken &cancel) {
  HttpRequest req = base_request(HttpMethod::Get);
  req.set_header(CHUNK_ID_HEADER, cid);
  req.set_header(CHUNK_IDX_HEADER, std::to_string(idx));
  req.response_limit = options.part_size + PART_READ_SLACK;

  auto resp = http->perform(req, cancel);
  CLIPSYNC_TRY(resp);
  if (resp.value().status != 200) {
    return status_error(resp.value().status, resp.value().body);
  }

  const std::string &body = resp.value().body;
  return Bytes(body.begin(), body.end());
}

void PollClient::Impl::finish_session(const SnapshotSink &sink) {
  auto decoded = current.decode();
  std::string cid = current.cid();

  last_completed_cid = cid;
  current.reset();

  if (decoded.is_error()) {
    counters.malformed_discarded++;
    logger()->warn("discarding session {}: {}", cid,
                   decoded.error().to_string());
    return;
  }

  Snapshot &snap = decoded.value();
  if (snap.origin == identity.client_id()) {
    counters.self_filtered++;
    logger()->trace("session {} is our own snapshot, skipped", cid);
    return;
  }
  if (snap.empty()) {
    logger()->debug("session {} carries no items, skipped", cid);
    return;
  }

  counters.snapshots_received++;
  logger()->debug("received snapshot from {} ({} items) via session {}",
                  snap.origin, snap.items.size(), cid);
  sink(std::move(snap));
}

// ============================================================================
// PollClient
// ============================================================================

PollClient::PollClient(Identity identity, std::shared_ptr<HttpTransport> http,
                       PollOptions options)
    : impl_(std::make_unique<Impl>(std::move(identity), std::move(http),
                                   std::move(options))) {}

PollClient::~PollClient() = default;

Result<std::unique_ptr<PollClient>>
PollClient::create(const ClientConfig &config, const Identity &identity) {
  auto url = Url::parse(config.endpoint);
  CLIPSYNC_TRY(url);

  PollOptions options;
  options.part_size = config.part_size;
  options.idle = config.poll_idle;

  // Discover replies are small; fetches set their own limit
  auto http = std::make_shared<BeastHttpTransport>(
      url.value(), config.request_timeout, 64 * 1024);

  return std::make_unique<PollClient>(identity, std::move(http), options);
}

Result<void> PollClient::send(const Snapshot &snapshot) {
  Snapshot snap = snapshot;
  snap.stamp_quick_key();
  std::string body = snap.to_json();

  if (body.size() > MAX_SNAPSHOT_SIZE) {
    impl_->counters.send_failures++;
    logger()->warn("snapshot of {} bytes exceeds 32 MiB, dropped",
                   body.size());
    return Error(ErrorCode::SnapshotTooLarge, "snapshot >32 MiB, dropped",
                 std::to_string(body.size()) + " bytes");
  }

  auto parts = split(body, impl_->options.part_size);
  if (parts.is_error()) {
    impl_->counters.send_failures++;
    return parts.error();
  }

  const std::string cid = generate_session_id();
  const size_t total = parts.value().size();

  for (size_t idx = 0; idx < total; ++idx) {
    auto posted = impl_->post_part(parts.value()[idx], cid, idx, total);
    if (posted.is_error()) {
      impl_->counters.send_failures++;
      logger()->warn("send of session {} failed at part {}/{}: {}", cid, idx,
                     total, posted.error().to_string());
      return posted;
    }
  }

  impl_->counters.snapshots_sent++;
  logger()->debug("sent session {} ({} parts, {} bytes)", cid, total,
                  body.size());
  return Result<void>::ok();
}

void PollClient::poll(const CancellationToken &cancel,
                      const SnapshotSink &sink) {
  while (!cancel.is_cancelled()) {
    poll_once(cancel, sink);
    if (cancel.wait_for(impl_->options.idle)) {
      break;
    }
  }
}

void PollClient::poll_once(const CancellationToken &cancel,
                           const SnapshotSink &sink) {
  Impl &s = *impl_;

  auto meta = s.discover(cancel);
  if (meta.is_error()) {
    if (meta.error().code != ErrorCode::Cancelled) {
      s.counters.discover_failures++;
      logger()->debug("discover failed: {}", meta.error().to_string());
    }
    return;
  }

  const DiscoverInfo &info = meta.value();
  if (info.cid.empty() || info.cid == s.last_completed_cid) {
    return;
  }

  if (info.cid != s.current.cid()) {
    // A newer session replaces one still in progress
    if (s.current.active()) {
      s.counters.sessions_reset++;
      logger()->debug("session {} superseded by {} ({}/{} parts held)",
                      s.current.cid(), info.cid, s.current.received(),
                      s.current.total());
    }
    s.current.begin(info.cid, info.total);
  } else if (info.total != s.current.total()) {
    s.counters.sessions_reset++;
    logger()->warn("session {} changed total {} -> {}, restarting",
                   info.cid, s.current.total(), info.total);
    s.current.begin(info.cid, info.total);
  }

  if (s.current.total() == 0) {
    return;
  }

  for (size_t idx : info.have) {
    if (cancel.is_cancelled()) {
      return;
    }
    if (idx >= s.current.total()) {
      logger()->warn("session {} advertises part {} beyond total {}",
                     info.cid, idx, s.current.total());
      continue;
    }
    if (s.current.has(idx)) {
      continue;
    }

    auto part = s.fetch(info.cid, idx, cancel);
    if (part.is_error()) {
      if (part.error().code == ErrorCode::SessionGone) {
        s.counters.sessions_reset++;
        logger()->debug("session {} flushed by relay", info.cid);
        s.current.reset();
        return;
      }
      if (part.error().code != ErrorCode::Cancelled) {
        s.counters.fetch_failures++;
        logger()->debug("fetch {}#{} failed: {}", info.cid, idx,
                        part.error().to_string());
      }
      continue;
    }

    auto added = s.current.add(idx, std::move(part.value()));
    if (added.is_error()) {
      s.counters.malformed_discarded++;
      logger()->warn("session {} abandoned: {}", info.cid,
                     added.error().to_string());
      s.last_completed_cid = info.cid;
      s.current.reset();
      return;
    }
  }

  if (s.current.complete()) {
    s.finish_session(sink);
  }
}

TransportStats PollClient::stats() const { return impl_->counters.load(); }

} // namespace clipsync
