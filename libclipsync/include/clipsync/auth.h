/**
 * @file auth.h
 * @brief Client identity and relay auth tokens
 *
 * Every request to the relay carries an `X-Auth-Token` header. The token is
 * the JSON object {"ts": <unix seconds>, "ts_enc": ts XOR key} encoded with
 * standard base64, where key is the 8-byte pre-shared key read big-endian.
 *
 * The token proves possession of the key and freshness of the request only.
 * XOR with a static key is trivially reversible by anyone who observes one
 * token; it is kept for compatibility with deployed relays.
 */

#ifndef CLIPSYNC_AUTH_H
#define CLIPSYNC_AUTH_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <array>
#include <cstdint>
#include <string>

namespace clipsync {

// ============================================================================
// Constants
// ============================================================================

/// Size of the pre-shared key in bytes
constexpr size_t SHARED_KEY_SIZE = 8;

/// Clock skew a relay tolerates by default, in seconds
constexpr int64_t DEFAULT_TOKEN_SKEW = 30;

/// HTTP header / handshake header carrying the token
constexpr const char *AUTH_HEADER = "X-Auth-Token";

// ============================================================================
// Shared Key
// ============================================================================

/**
 * @brief Decode a 16-character hex key into its big-endian 64-bit value
 * @return Key value or InvalidKey
 */
CLIPSYNC_API Result<uint64_t> parse_shared_key(const std::string &key_hex);

// ============================================================================
// Tokens
// ============================================================================

/// Decoded token contents
struct AuthToken {
  int64_t ts = 0;
  int64_t ts_enc = 0;

  /// Build the token for a timestamp
  static AuthToken make(uint64_t key, int64_t ts);

  /// JSON + base64 wire form
  std::string encode() const;

  /// Parse the wire form
  static Result<AuthToken> decode(const std::string &token);

  /// True if ts_enc matches ts under key
  bool matches(uint64_t key) const;
};

/**
 * @brief Relay-side check of a token
 *
 * @param token Wire form from the request header
 * @param key Shared key value
 * @param now Relay's current Unix time
 * @param max_skew Accepted distance between ts and now, in seconds
 * @return Success, InvalidToken for undecodable input, AuthenticationFailed
 *         for a wrong key or stale timestamp
 */
CLIPSYNC_API Result<void> verify_token(const std::string &token, uint64_t key,
                                       int64_t now,
                                       int64_t max_skew = DEFAULT_TOKEN_SKEW);

// ============================================================================
// Identity
// ============================================================================

/**
 * @brief Client id plus shared key, immutable after construction
 *
 * Shared by both transports without locking.
 */
class CLIPSYNC_API Identity {
public:
  /**
   * @brief Validate the key and build an identity
   *
   * @param client_id Origin id stamped on outgoing snapshots; a fresh random
   *        id is generated when empty
   * @param key_hex 16 hex characters
   * @return Identity or InvalidKey
   */
  static Result<Identity> create(const std::string &client_id,
                                 const std::string &key_hex);

  const std::string &client_id() const { return client_id_; }
  uint64_t key() const { return key_; }

  /// Token for the current time
  std::string build_auth_token() const;

  /// Token for an explicit timestamp
  std::string build_auth_token(int64_t ts) const;

private:
  Identity(std::string client_id, uint64_t key)
      : client_id_(std::move(client_id)), key_(key) {}

  std::string client_id_;
  uint64_t key_ = 0;
};

} // namespace clipsync

#endif // CLIPSYNC_AUTH_H
