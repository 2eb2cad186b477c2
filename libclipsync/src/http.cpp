/**
 * @file http.cpp
 * @brief URL parsing and the Boost.Beast HTTP transport
 */

#include "clipsync/http.h"
#include "clipsync/log.h"
#include <algorithm>
#include <cctype>
#include <optional>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace clipsync {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// ============================================================================
// Url
// ============================================================================

Result<Url> Url::parse(const std::string &text) {
  auto sep = text.find("://");
  if (sep == std::string::npos || sep == 0) {
    return Error(ErrorCode::InvalidUrl, "missing scheme", text);
  }

  Url url;
  url.scheme = text.substr(0, sep);
  std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (url.scheme == "https" || url.scheme == "wss") {
    return Error(ErrorCode::NotSupported, "TLS endpoints are not supported",
                 text);
  }
  if (url.scheme != "http" && url.scheme != "ws") {
    return Error(ErrorCode::InvalidUrl, "unsupported scheme", url.scheme);
  }

  std::string rest = text.substr(sep + 3);
  auto path_pos = rest.find_first_of("/?");
  std::string authority = rest.substr(0, path_pos);
  url.target = path_pos == std::string::npos ? "/" : rest.substr(path_pos);
  if (url.target[0] == '?') {
    url.target = "/" + url.target;
  }

  if (authority.find('@') != std::string::npos) {
    return Error(ErrorCode::InvalidUrl, "credentials in URL", text);
  }

  // [v6addr]:port
  if (!authority.empty() && authority[0] == '[') {
    auto close = authority.find(']');
    if (close == std::string::npos) {
      return Error(ErrorCode::InvalidUrl, "unterminated IPv6 literal", text);
    }
    url.host = authority.substr(1, close - 1);
    std::string tail = authority.substr(close + 1);
    if (!tail.empty()) {
      if (tail[0] != ':') {
        return Error(ErrorCode::InvalidUrl, "garbage after host", text);
      }
      url.port = tail.substr(1);
    }
  } else {
    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
      url.host = authority.substr(0, colon);
      url.port = authority.substr(colon + 1);
    } else {
      url.host = authority;
    }
  }

  if (url.host.empty()) {
    return Error(ErrorCode::InvalidUrl, "missing host", text);
  }

  if (url.port.empty()) {
    url.port = "80";
  } else {
    bool digits = std::all_of(url.port.begin(), url.port.end(),
                              [](unsigned char c) { return std::isdigit(c); });
    if (!digits || url.port.size() > 5 || std::stoi(url.port) == 0 ||
        std::stoi(url.port) > 65535) {
      return Error(ErrorCode::InvalidUrl, "invalid port", url.port);
    }
  }

  return url;
}

std::string Url::host_header() const {
  std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  if (port != "80") {
    h += ":" + port;
  }
  return h;
}

Url Url::with_scheme(const std::string &new_scheme) const {
  Url copy = *this;
  copy.scheme = new_scheme;
  return copy;
}

std::string Url::to_string() const {
  return scheme + "://" + host_header() + target;
}

std::string HttpRequest::header(const std::string &name) const {
  auto it = headers.find(name);
  return it == headers.end() ? std::string() : it->second;
}

// ============================================================================
// Exchange
// ============================================================================

namespace {

/**
 * One request/response on a private io_context.
 *
 * resolve -> connect -> write -> read, each step with the remaining deadline.
 */
class Exchange {
public:
  Exchange(net::io_context &ioc, const Url &url, Milliseconds timeout,
           size_t body_limit)
      : resolver_(ioc), stream_(ioc), resolve_timer_(ioc), url_(url),
        timeout_(timeout) {
    parser_.emplace();
    parser_->body_limit(body_limit);
  }

  void start(http::request<http::string_body> req) {
    req_ = std::move(req);

    // tcp_stream deadlines do not cover name resolution
    resolve_timer_.expires_after(timeout_);
    resolve_timer_.async_wait([this](beast::error_code ec) {
      if (!ec) {
        timed_out_ = true;
        resolver_.cancel();
      }
    });

    resolver_.async_resolve(
        url_.host, url_.port,
        [this](beast::error_code ec, tcp::resolver::results_type results) {
          on_resolve(ec, std::move(results));
        });
  }

  bool done() const { return done_; }

  Result<HttpResponse> result() {
    if (error_) {
      return *error_;
    }
    HttpResponse response;
    auto &msg = parser_->get();
    response.status = static_cast<int>(msg.result_int());
    response.body = std::move(msg.body());
    return response;
  }

private:
  void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
    resolve_timer_.cancel();
    if (ec) {
      if (timed_out_) {
        return fail(ErrorCode::ConnectionTimeout, "resolve", ec);
      }
      return fail(ErrorCode::ConnectionFailed, "resolve", ec);
    }

    stream_.expires_after(timeout_);
    stream_.async_connect(
        results, [this](beast::error_code ec, const tcp::endpoint &) {
          on_connect(ec);
        });
  }

  void on_connect(beast::error_code ec) {
    if (ec) {
      return fail(classify(ec), "connect", ec);
    }

    http::async_write(stream_, req_,
                      [this](beast::error_code ec, std::size_t) {
                        on_write(ec);
                      });
  }

  void on_write(beast::error_code ec) {
    if (ec) {
      return fail(classify(ec), "write", ec);
    }

    http::async_read(stream_, buffer_, *parser_,
                     [this](beast::error_code ec, std::size_t) {
                       on_read(ec);
                     });
  }

  void on_read(beast::error_code ec) {
    if (ec == http::error::body_limit) {
      return fail(ErrorCode::MalformedMessage, "response body too large", ec);
    }
    if (ec) {
      return fail(classify(ec), "read", ec);
    }

    beast::error_code ignored;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
    done_ = true;
  }

  static ErrorCode classify(beast::error_code ec) {
    if (ec == beast::error::timeout) {
      return ErrorCode::ConnectionTimeout;
    }
    if (ec == net::error::connection_refused) {
      return ErrorCode::ConnectionRefused;
    }
    return ErrorCode::ConnectionFailed;
  }

  void fail(ErrorCode code, const char *what, beast::error_code ec) {
    error_ = Error(code, std::string(what) + " failed", ec.message());
    done_ = true;
  }

  tcp::resolver resolver_;
  beast::tcp_stream stream_;
  net::steady_timer resolve_timer_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  std::optional<http::response_parser<http::string_body>> parser_;
  const Url &url_;
  Milliseconds timeout_;
  bool timed_out_ = false;
  bool done_ = false;
  std::optional<Error> error_;
};

} // namespace

// ============================================================================
// BeastHttpTransport
// ============================================================================

class BeastHttpTransport::Impl {
public:
  Url endpoint;
  Milliseconds timeout;
  size_t default_limit;
};

BeastHttpTransport::BeastHttpTransport(Url endpoint, Milliseconds timeout,
                                       size_t default_response_limit)
    : impl_(std::make_unique<Impl>()) {
  impl_->endpoint = std::move(endpoint);
  impl_->timeout = timeout;
  impl_->default_limit = default_response_limit;
}

BeastHttpTransport::~BeastHttpTransport() = default;

const Url &BeastHttpTransport::endpoint() const { return impl_->endpoint; }

Result<HttpResponse>
BeastHttpTransport::perform(const HttpRequest &request,
                            const CancellationToken &cancel) {
  if (cancel.is_cancelled()) {
    return Error(ErrorCode::Cancelled, "request cancelled");
  }

  const Url &url = impl_->endpoint;

  http::request<http::string_body> req;
  req.method(request.method == HttpMethod::Post ? http::verb::post
                                                : http::verb::get);
  req.target(url.target);
  req.version(11);
  req.set(http::field::host, url.host_header());
  req.set(http::field::user_agent, "clipsync");
  for (const auto &kv : request.headers) {
    req.set(kv.first, kv.second);
  }
  if (request.method == HttpMethod::Post || !request.body.empty()) {
    req.body() = request.body;
  }
  req.prepare_payload();

  size_t limit = request.response_limit ? request.response_limit
                                        : impl_->default_limit;

  net::io_context ioc;
  Exchange exchange(ioc, url, impl_->timeout, limit);
  exchange.start(std::move(req));

  // Stopping the context abandons the exchange; its handlers are
  // destroyed with the context
  auto registration = cancel.on_cancel([&ioc] { ioc.stop(); });
  ioc.run();
  registration.reset();

  if (!exchange.done()) {
    if (cancel.is_cancelled()) {
      return Error(ErrorCode::Cancelled, "request cancelled");
    }
    return Error(ErrorCode::Unknown, "exchange did not complete");
  }

  return exchange.result();
}

} // namespace clipsync
