/**
 * @file http.h
 * @brief Endpoint URLs and blocking HTTP/1.1 exchanges with the relay
 *
 * The poll transport talks to the relay through the abstract HttpTransport,
 * so its state machine can be driven by a scripted transport in tests. The
 * production implementation runs each exchange on a private Boost.Asio
 * io_context with Boost.Beast doing the HTTP framing.
 */

#ifndef CLIPSYNC_HTTP_H
#define CLIPSYNC_HTTP_H

#include "cancel.h"
#include "error.h"
#include "platform.h"
#include "types.h"
#include <map>
#include <memory>
#include <string>

namespace clipsync {

// ============================================================================
// URL
// ============================================================================

/**
 * @brief Parsed relay endpoint
 *
 * Only plain http:// and ws:// endpoints are supported.
 */
struct Url {
  std::string scheme; // "http" or "ws"
  std::string host;
  std::string port;   // Defaults to "80"
  std::string target; // Path plus query, at least "/"

  /**
   * @brief Parse an endpoint URL
   * @return Url, InvalidUrl for malformed input, NotSupported for https/wss
   */
  static Result<Url> parse(const std::string &text);

  /// Value for the Host header ("host" or "host:port")
  std::string host_header() const;

  /// Same endpoint under another scheme
  Url with_scheme(const std::string &new_scheme) const;

  std::string to_string() const;
};

// ============================================================================
// Request / Response
// ============================================================================

/// HTTP method
enum class HttpMethod : uint8_t { Get = 0, Post = 1 };

/**
 * @brief Request against the configured endpoint
 */
struct HttpRequest {
  HttpMethod method = HttpMethod::Get;
  std::map<std::string, std::string> headers;
  std::string body;

  /// Upper bound on the response body; 0 means the transport default
  size_t response_limit = 0;

  void set_header(const std::string &name, const std::string &value) {
    headers[name] = value;
  }

  /// Header value or empty string
  std::string header(const std::string &name) const;
};

/**
 * @brief Response status and body
 */
struct HttpResponse {
  int status = 0;
  std::string body;

  bool ok() const { return status >= 200 && status < 300; }
};

// ============================================================================
// Transport Interface
// ============================================================================

/**
 * @brief One blocking request/response exchange with the relay
 *
 * Implementations must be safe to call from several threads at once.
 */
class CLIPSYNC_API HttpTransport {
public:
  virtual ~HttpTransport() = default;

  /**
   * @brief Perform one exchange
   *
   * Any status code is a successful exchange; errors are reserved for
   * failures to obtain a response (ConnectionFailed, ConnectionRefused,
   * ConnectionTimeout, Cancelled, MalformedMessage for unreadable or
   * oversized responses).
   */
  virtual Result<HttpResponse>
  perform(const HttpRequest &request,
          const CancellationToken &cancel = CancellationToken()) = 0;
};

/**
 * @brief HttpTransport over Boost.Beast, one TCP connection per exchange
 */
class CLIPSYNC_API BeastHttpTransport : public HttpTransport {
public:
  /**
   * @param endpoint Relay URL
   * @param timeout Deadline for the whole exchange
   * @param default_response_limit Response body cap when a request sets none
   */
  BeastHttpTransport(Url endpoint, Milliseconds timeout,
                     size_t default_response_limit);
  ~BeastHttpTransport() override;

  BeastHttpTransport(const BeastHttpTransport &) = delete;
  BeastHttpTransport &operator=(const BeastHttpTransport &) = delete;

  Result<HttpResponse>
  perform(const HttpRequest &request,
          const CancellationToken &cancel = CancellationToken()) override;

  const Url &endpoint() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace clipsync

#endif // CLIPSYNC_HTTP_H
