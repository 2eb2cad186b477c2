/**
 * @file test_relay.h
 * @brief In-process relay for integration tests
 *
 * Serves both relay interfaces on one loopback port:
 * - HTTP: chunk POST, discover GET and fetch GET, one session at a time
 * - WebSocket: every text message is relayed to all open connections,
 *   the sender included
 *
 * Every request must carry a valid X-Auth-Token for the configured key.
 */

#ifndef CLIPSYNC_TESTS_TEST_RELAY_H
#define CLIPSYNC_TESTS_TEST_RELAY_H

#include <clipsync/types.h>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace clipsync {
namespace testing {

/**
 * @brief One HTTP request as the relay saw it
 */
struct RecordedRequest {
  std::string method;
  std::map<std::string, std::string> headers; // Lowercase names
  size_t body_size = 0;

  std::string header(const std::string &name) const;
};

class TestRelay {
public:
  explicit TestRelay(uint64_t key);
  ~TestRelay();

  TestRelay(const TestRelay &) = delete;
  TestRelay &operator=(const TestRelay &) = delete;

  /// Bind 127.0.0.1 on an ephemeral port and start serving
  void start();
  void stop();

  uint16_t port() const;

  /// http://127.0.0.1:<port>/clip
  std::string http_endpoint() const;

  /// ws://127.0.0.1:<port>/clip
  std::string ws_endpoint() const;

  // ==========================================================================
  // HTTP side
  // ==========================================================================

  /// Answer the next n POSTs with 500
  void fail_next_posts(int n);

  /// Largest accepted POST body; larger ones get 413
  void set_max_part_size(size_t bytes);

  /// Install a complete session as if another client had uploaded it
  void publish_session(const std::string &cid, const std::vector<Bytes> &parts);

  /// Drop the current session; fetches of it answer 410
  void flush_session();

  /// Parts held for cid, concatenated in index order
  std::string assembled(const std::string &cid) const;

  std::vector<RecordedRequest> requests() const;
  size_t post_count() const;
  size_t rejected_auth_count() const;

  // ==========================================================================
  // WebSocket side
  // ==========================================================================

  /// Connections accepted since start
  size_t stream_connections() const;

  /// Connections currently open
  size_t open_streams() const;

  /// Block until at least n connections were accepted or timeout expires
  bool wait_for_stream_connections(size_t n, Milliseconds timeout) const;

  /// Block until at least n text messages were received or timeout expires
  bool wait_for_stream_messages(size_t n, Milliseconds timeout) const;

  /// Text messages received from clients
  std::vector<std::string> stream_messages() const;

  /// Send a text message to every open connection
  void broadcast(const std::string &text);

  /// Abort every open connection without a close handshake
  void drop_streams();

  /// Never read from the next accepted connection, so its pings go unanswered
  void stall_next_stream();

  /// Close code of the last client-initiated close, -1 if none
  int last_close_code() const;

  /// X-Auth-Token of the last upgrade request
  std::string last_upgrade_token() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace testing
} // namespace clipsync

#endif // CLIPSYNC_TESTS_TEST_RELAY_H
