/**
 * @file stream_transport.cpp
 * @brief WebSocket stream transport implementation
 *
 * All connection state lives on a private io_context that poll() runs on
 * the calling thread. send() reaches that thread by posting to it and
 * waiting for the write to complete.
 */

#include "clipsync/stream_transport.h"
#include "clipsync/chunk_codec.h"
#include "clipsync/log.h"
#include <deque>
#include <future>
#include <mutex>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

namespace clipsync {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using WriteReply = std::shared_ptr<std::promise<Result<void>>>;

// ============================================================================
// StreamClient::Impl
// ============================================================================

class StreamClient::Impl {
public:
  class Session;
  class Loop;

  Impl(Identity id, Url endpoint, StreamOptions opts)
      : identity(std::move(id)), url(std::move(endpoint)),
        options(std::move(opts)) {}

  Identity identity;
  Url url;
  StreamOptions options;
  detail::StatsCounters counters;

  std::atomic<bool> connected{false};

  // The open session, if any; send() posts writes to it
  std::mutex mutex;
  std::shared_ptr<Session> open_session;
};

// ============================================================================
// Session: one connection attempt and, if it succeeds, its lifetime
// ============================================================================

class StreamClient::Impl::Session
    : public std::enable_shared_from_this<StreamClient::Impl::Session> {
public:
  using OpenHandler = std::function<void()>;
  using DownHandler = std::function<void(bool was_open)>;

  Session(net::io_context &ioc, Impl &owner, const SnapshotSink &sink,
          OpenHandler on_open, DownHandler on_down)
      : owner_(owner), sink_(sink), on_open_(std::move(on_open)),
        on_down_(std::move(on_down)), resolver_(ioc), ws_(ioc),
        ping_timer_(ioc), write_timer_(ioc), close_timer_(ioc) {}

  net::any_io_executor executor() { return ws_.get_executor(); }

  void run() {
    auto self = shared_from_this();
    resolver_.async_resolve(
        owner_.url.host, owner_.url.port,
        [self](beast::error_code ec, tcp::resolver::results_type results) {
          self->on_resolve(ec, std::move(results));
        });
  }

  /// Queue one text message; reply is fulfilled when it is written or lost
  void enqueue(std::string text, WriteReply reply) {
    if (!open_ || closing_ || down_) {
      reply->set_value(Error(ErrorCode::NotConnected, "connection not open"));
      return;
    }
    queue_.push_back(Pending{std::move(text), std::move(reply)});
    if (queue_.size() == 1) {
      do_write();
    }
  }

  /// Close handshake with code 1000, bounded by the grace period
  void close() {
    if (down_) {
      return;
    }
    closing_ = true;
    if (!open_) {
      teardown(Error(ErrorCode::Cancelled, "shutdown while connecting"));
      return;
    }

    auto self = shared_from_this();
    ping_timer_.cancel();

    close_timer_.expires_after(owner_.options.close_grace);
    close_timer_.async_wait([self](beast::error_code ec) {
      if (!ec) {
        self->teardown(Error(ErrorCode::Timeout, "close handshake timed out"));
      }
    });

    ws_.async_close(websocket::close_code::normal,
                    [self](beast::error_code ec) {
                      self->teardown(Error(ErrorCode::Cancelled,
                                           ec ? "close failed: " + ec.message()
                                              : "closed"));
                    });
  }

private:
  struct Pending {
    std::string text;
    WriteReply reply;
  };

  // ==========================================================================
  // Connect
  // ==========================================================================

  void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) {
      return fail(ErrorCode::ConnectionFailed, "resolve", ec);
    }
    if (closing_) {
      return teardown(Error(ErrorCode::Cancelled, "shutdown while connecting"));
    }

    auto self = shared_from_this();
    beast::get_lowest_layer(ws_).expires_after(owner_.options.handshake_timeout);
    beast::get_lowest_layer(ws_).async_connect(
        results, [self](beast::error_code ec, const tcp::endpoint &) {
          self->on_connect(ec);
        });
  }

  void on_connect(beast::error_code ec) {
    if (ec) {
      return fail(ec == beast::error::timeout ? ErrorCode::ConnectionTimeout
                  : ec == net::error::connection_refused
                      ? ErrorCode::ConnectionRefused
                      : ErrorCode::ConnectionFailed,
                  "connect", ec);
    }

    // The websocket stream keeps its own timers from here on
    beast::get_lowest_layer(ws_).expires_never();

    auto opt =
        websocket::stream_base::timeout::suggested(beast::role_type::client);
    opt.handshake_timeout = owner_.options.handshake_timeout;
    opt.idle_timeout = websocket::stream_base::none();
    opt.keep_alive_pings = false;
    ws_.set_option(opt);

    std::string token = owner_.identity.build_auth_token();
    ws_.set_option(websocket::stream_base::decorator(
        [token](websocket::request_type &req) {
          req.set(AUTH_HEADER, token);
          req.set(http::field::user_agent, "clipsync");
        }));

    ws_.read_message_max(MAX_SNAPSHOT_SIZE + PART_READ_SLACK);
    ws_.control_callback(
        [this](websocket::frame_type kind, beast::string_view) {
          if (kind == websocket::frame_type::pong) {
            unacked_pings_ = 0;
          }
        });

    auto self = shared_from_this();
    ws_.async_handshake(owner_.url.host_header(), owner_.url.target,
                        [self](beast::error_code ec) {
                          self->on_handshake(ec);
                        });
  }

  void on_handshake(beast::error_code ec) {
    if (ec) {
      ErrorCode code = ErrorCode::ConnectionFailed;
      if (ec == websocket::error::upgrade_declined) {
        code = ErrorCode::AuthenticationFailed;
      } else if (ec == beast::error::timeout) {
        code = ErrorCode::ConnectionTimeout;
      }
      return fail(code, "handshake", ec);
    }
    if (closing_) {
      // Shutdown raced the handshake; the connection is open, so close it
      // properly
      open_ = true;
      closing_ = false;
      close();
      return;
    }

    open_ = true;
    owner_.connected = true;
    owner_.counters.connects++;
    {
      std::lock_guard<std::mutex> lock(owner_.mutex);
      owner_.open_session = shared_from_this();
    }
    logger()->info("stream connected to {}", owner_.url.to_string());

    if (on_open_) {
      on_open_();
    }

    do_read();
    arm_ping();
  }

  // ==========================================================================
  // Read
  // ==========================================================================

  void do_read() {
    auto self = shared_from_this();
    ws_.async_read(buffer_, [self](beast::error_code ec, std::size_t) {
      self->on_read(ec);
    });
  }

  void on_read(beast::error_code ec) {
    if (ec) {
      if (closing_) {
        return teardown(Error(ErrorCode::Cancelled, "closed"));
      }
      if (ec == websocket::error::closed) {
        logger()->info("stream closed by relay (code {})",
                       static_cast<int>(ws_.reason().code));
        return teardown(Error(ErrorCode::ConnectionLost, "closed by relay"));
      }
      return fail(ErrorCode::ConnectionLost, "read", ec);
    }

    std::string text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    handle_message(text);

    if (open_ && !down_) {
      do_read();
    }
  }

  void handle_message(const std::string &text) {
    auto decoded = Snapshot::from_json(text);
    if (decoded.is_error()) {
      owner_.counters.malformed_discarded++;
      logger()->warn("discarding stream message: {}",
                     decoded.error().to_string());
      return;
    }

    Snapshot &snap = decoded.value();
    if (snap.origin == owner_.identity.client_id()) {
      owner_.counters.self_filtered++;
      return;
    }
    if (snap.empty()) {
      return;
    }

    owner_.counters.snapshots_received++;
    logger()->debug("received snapshot from {} ({} items)", snap.origin,
                    snap.items.size());
    sink_(std::move(snap));
  }

  // ==========================================================================
  // Write
  // ==========================================================================

  void do_write() {
    auto self = shared_from_this();
    writing_ = true;
    uint64_t gen = ++write_gen_;

    write_timer_.expires_after(owner_.options.write_timeout);
    write_timer_.async_wait([self, gen](beast::error_code ec) {
      if (ec || !self->writing_ || gen != self->write_gen_) {
        return;
      }
      logger()->warn("stream write exceeded {} ms",
                     self->owner_.options.write_timeout.count());
      self->teardown(Error(ErrorCode::ConnectionTimeout, "write timed out"));
    });

    ws_.text(true);
    ws_.async_write(net::buffer(queue_.front().text),
                    [self](beast::error_code ec, std::size_t) {
                      self->on_write(ec);
                    });
  }

  void on_write(beast::error_code ec) {
    writing_ = false;
    write_timer_.cancel();
    if (down_ || queue_.empty()) {
      return;
    }

    Pending done = std::move(queue_.front());
    queue_.pop_front();

    if (ec) {
      done.reply->set_value(
          Error(ErrorCode::WriteFailed, "stream write failed", ec.message()));
      return fail(ErrorCode::ConnectionLost, "write", ec);
    }

    done.reply->set_value(Result<void>::ok());
    if (!queue_.empty()) {
      do_write();
    }
  }

  // ==========================================================================
  // Keepalive
  // ==========================================================================

  void arm_ping() {
    auto self = shared_from_this();
    ping_timer_.expires_after(owner_.options.ping_interval);
    ping_timer_.async_wait([self](beast::error_code ec) {
      if (!ec) {
        self->on_ping_timer();
      }
    });
  }

  void on_ping_timer() {
    if (!open_ || closing_ || down_) {
      return;
    }

    if (unacked_pings_ >= owner_.options.max_missed_pongs) {
      logger()->warn("no pong for {} pings, connection dead", unacked_pings_);
      return teardown(Error(ErrorCode::ConnectionLost, "keepalive timeout"));
    }

    ++unacked_pings_;
    if (!ping_in_flight_) {
      auto self = shared_from_this();
      ping_in_flight_ = true;
      ws_.async_ping({}, [self](beast::error_code ec) {
        self->ping_in_flight_ = false;
        if (ec) {
          self->fail(ErrorCode::ConnectionLost, "ping", ec);
        }
      });
    }
    arm_ping();
  }

  // ==========================================================================
  // Teardown
  // ==========================================================================

  void fail(ErrorCode code, const char *what, beast::error_code ec) {
    if (down_) {
      return;
    }
    if (ec == net::error::operation_aborted && closing_) {
      code = ErrorCode::Cancelled;
    }
    teardown(Error(code, std::string(what) + " failed", ec.message()));
  }

  /// Release the connection once; reports to the owner exactly once
  void teardown(const Error &why) {
    if (down_) {
      return;
    }
    down_ = true;
    bool was_open = open_;
    open_ = false;

    owner_.connected = false;
    {
      std::lock_guard<std::mutex> lock(owner_.mutex);
      if (owner_.open_session.get() == this) {
        owner_.open_session.reset();
      }
    }

    resolver_.cancel();
    ping_timer_.cancel();
    write_timer_.cancel();
    close_timer_.cancel();

    beast::error_code ignored;
    beast::get_lowest_layer(ws_).socket().close(ignored);

    for (auto &pending : queue_) {
      pending.reply->set_value(
          Error(ErrorCode::ConnectionLost, "connection dropped", why.message));
    }
    queue_.clear();

    if (was_open) {
      logger()->log(why.code == ErrorCode::Cancelled ? spdlog::level::debug
                                                     : spdlog::level::warn,
                    "stream connection down: {}", why.to_string());
    } else {
      logger()->debug("stream connect failed: {}", why.to_string());
    }

    if (on_down_) {
      DownHandler cb = std::move(on_down_);
      on_down_ = nullptr;
      cb(was_open);
    }
  }

  Impl &owner_;
  const SnapshotSink &sink_;
  OpenHandler on_open_;
  DownHandler on_down_;

  tcp::resolver resolver_;
  websocket::stream<beast::tcp_stream> ws_;
  beast::flat_buffer buffer_;
  net::steady_timer ping_timer_;
  net::steady_timer write_timer_;
  net::steady_timer close_timer_;

  std::deque<Pending> queue_;
  bool writing_ = false;
  uint64_t write_gen_ = 0;

  int unacked_pings_ = 0;
  bool ping_in_flight_ = false;

  bool open_ = false;
  bool closing_ = false;
  bool down_ = false;
};

// ============================================================================
// Loop: keeps one session alive until shutdown
// ============================================================================

class StreamClient::Impl::Loop {
public:
  Loop(net::io_context &ioc, Impl &owner, const SnapshotSink &sink)
      : ioc_(ioc), owner_(owner), sink_(sink), timer_(ioc),
        backoff_(owner.options.reconnect) {}

  void start() { connect(); }

  void shutdown() {
    stopping_ = true;
    timer_.cancel();
    auto session = session_;
    if (session) {
      session->close();
    }
  }

private:
  void connect() {
    if (stopping_) {
      return;
    }
    session_ = std::make_shared<Session>(
        ioc_, owner_, sink_, [this] { backoff_.reset(); },
        [this](bool was_open) { on_down(was_open); });
    session_->run();
  }

  void on_down(bool was_open) {
    session_.reset();
    if (stopping_) {
      return;
    }

    owner_.counters.reconnects++;
    Milliseconds delay = backoff_.next_delay();
    logger()->info("stream {}, reconnecting in {} ms",
                   was_open ? "lost" : "unavailable", delay.count());

    timer_.expires_after(delay);
    timer_.async_wait([this](beast::error_code ec) {
      if (!ec && !stopping_) {
        connect();
      }
    });
  }

  net::io_context &ioc_;
  Impl &owner_;
  const SnapshotSink &sink_;
  net::steady_timer timer_;
  Backoff backoff_;
  std::shared_ptr<Session> session_;
  bool stopping_ = false;
};

// ============================================================================
// StreamClient
// ============================================================================

StreamClient::StreamClient(Identity identity, Url endpoint,
                           StreamOptions options)
    : impl_(std::make_unique<Impl>(
          std::move(identity),
          endpoint.scheme == "http" ? endpoint.with_scheme("ws") : endpoint,
          std::move(options))) {}

StreamClient::~StreamClient() = default;

Result<std::unique_ptr<StreamClient>>
StreamClient::create(const ClientConfig &config, const Identity &identity) {
  auto url = Url::parse(config.endpoint);
  CLIPSYNC_TRY(url);

  StreamOptions options;
  options.handshake_timeout = config.request_timeout;

  return std::make_unique<StreamClient>(identity, url.value(), options);
}

bool StreamClient::connected() const { return impl_->connected.load(); }

Result<void> StreamClient::send(const Snapshot &snapshot) {
  Snapshot snap = snapshot;
  snap.stamp_quick_key();
  std::string text = snap.to_json();

  if (text.size() > MAX_SNAPSHOT_SIZE) {
    impl_->counters.send_failures++;
    logger()->warn("snapshot of {} bytes exceeds 32 MiB, dropped",
                   text.size());
    return Error(ErrorCode::SnapshotTooLarge, "snapshot >32 MiB, dropped",
                 std::to_string(text.size()) + " bytes");
  }

  if (!impl_->connected.load()) {
    impl_->counters.send_failures++;
    return Error(ErrorCode::NotConnected, "stream not connected");
  }

  auto reply = std::make_shared<std::promise<Result<void>>>();
  auto future = reply->get_future();
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto session = impl_->open_session;
    if (!session) {
      impl_->counters.send_failures++;
      return Error(ErrorCode::NotConnected, "stream not connected");
    }
    net::post(session->executor(),
              [session, text = std::move(text), reply]() mutable {
                session->enqueue(std::move(text), std::move(reply));
              });
  }

  // The session enforces the write deadline; this wait only guards against
  // a loop that stops before running the posted write
  auto limit = impl_->options.write_timeout + impl_->options.close_grace;
  if (future.wait_for(limit) != std::future_status::ready) {
    impl_->counters.send_failures++;
    return Error(ErrorCode::Timeout, "stream write did not complete");
  }

  Result<void> result;
  try {
    result = future.get();
  } catch (const std::future_error &) {
    result = Error(ErrorCode::NotConnected, "connection closed before write");
  }

  if (result.is_ok()) {
    impl_->counters.snapshots_sent++;
  } else {
    impl_->counters.send_failures++;
  }
  return result;
}

void StreamClient::poll(const CancellationToken &cancel,
                        const SnapshotSink &sink) {
  if (cancel.is_cancelled()) {
    return;
  }

  net::io_context ioc;
  Impl::Loop loop(ioc, *impl_, sink);
  net::post(ioc, [&loop] { loop.start(); });

  auto registration = cancel.on_cancel(
      [&ioc, &loop] { net::post(ioc, [&loop] { loop.shutdown(); }); });

  ioc.run();
  registration.reset();

  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->open_session.reset();
  }
  impl_->connected = false;
}

TransportStats StreamClient::stats() const { return impl_->counters.load(); }

} // namespace clipsync
