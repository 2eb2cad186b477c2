/**
 * @file security.h
 * @brief Hashing, encoding and randomness primitives for clipsync
 *
 * clipsync uses libsodium for:
 * - SHA-256 for snapshot fingerprints (quick key)
 * - Base64 (standard alphabet, padded) for item payloads and auth tokens
 * - randombytes for session ids, client ids and backoff jitter
 *
 * None of this provides confidentiality; payloads travel in clear text.
 */

#ifndef CLIPSYNC_SECURITY_H
#define CLIPSYNC_SECURITY_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <array>
#include <memory>
#include <string>

namespace clipsync {

// ============================================================================
// Constants
// ============================================================================

/// Size of a SHA-256 digest
constexpr size_t SHA256_SIZE = 32;

using Sha256Digest = std::array<Byte, SHA256_SIZE>;

// ============================================================================
// Hashing
// ============================================================================

/**
 * @brief Compute SHA-256 over a byte range
 */
CLIPSYNC_API Sha256Digest sha256(const Byte *data, size_t length);

/**
 * @brief Incremental SHA-256
 */
class CLIPSYNC_API Sha256Stream {
public:
  Sha256Stream();
  ~Sha256Stream();

  Sha256Stream(const Sha256Stream &) = delete;
  Sha256Stream &operator=(const Sha256Stream &) = delete;

  void update(const std::string &data);
  void update(const Byte *data, size_t length);

  Sha256Digest finalize();

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Base64
// ============================================================================

/**
 * @brief Standard (RFC 4648, padded) base64 encoding
 */
CLIPSYNC_API std::string base64_encode(const Byte *data, size_t length);
CLIPSYNC_API std::string base64_encode(const Bytes &data);
CLIPSYNC_API std::string base64_encode(const std::string &data);

/**
 * @brief Decode standard base64
 * @return Decoded bytes or MalformedMessage
 */
CLIPSYNC_API Result<Bytes> base64_decode(const std::string &encoded);

// ============================================================================
// Random Number Generation
// ============================================================================

/**
 * @brief Generate random bytes
 */
CLIPSYNC_API Bytes random_bytes(size_t count);

/**
 * @brief Random double in [0, 1)
 */
CLIPSYNC_API double random_unit();

// ============================================================================
// Initialization
// ============================================================================

/**
 * @brief Initialize libsodium (called automatically on first use)
 * @return Success or error
 */
CLIPSYNC_API Result<void> security_init();

} // namespace clipsync

#endif // CLIPSYNC_SECURITY_H
