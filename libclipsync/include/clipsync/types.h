/**
 * @file types.h
 * @brief Core type definitions for clipsync
 */

#ifndef CLIPSYNC_TYPES_H
#define CLIPSYNC_TYPES_H

#include "platform.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace clipsync {

// ============================================================================
// Basic Types
// ============================================================================

using Byte = uint8_t;
using Bytes = std::vector<Byte>;

using Milliseconds = std::chrono::milliseconds;
using Seconds = std::chrono::seconds;

// ============================================================================
// Identifiers
// ============================================================================

/// Length of a client id in hex characters (4 random bytes)
constexpr size_t CLIENT_ID_LENGTH = 8;

/// Length of a transfer session id in hex characters (8 random bytes)
constexpr size_t SESSION_ID_LENGTH = 16;

/**
 * @brief Generate a fresh client id (8 lowercase hex characters)
 */
CLIPSYNC_API std::string generate_client_id();

/**
 * @brief Generate a fresh transfer session id (16 lowercase hex characters)
 *
 * A new id is drawn for every outbound snapshot; the relay groups chunks
 * by it.
 */
CLIPSYNC_API std::string generate_session_id();

// ============================================================================
// Transport Selection
// ============================================================================

/// Wire transport used to reach the relay
enum class TransportKind : uint8_t {
  Poll = 0,  // Chunked HTTP POST + discover/fetch polling
  Stream = 1 // Persistent WebSocket
};

/// Get name of a transport kind ("poll" or "ws")
CLIPSYNC_API const char *transport_kind_name(TransportKind kind);

/// Parse "poll" / "ws" (also accepts "http" and "websocket")
CLIPSYNC_API std::optional<TransportKind>
parse_transport_kind(const std::string &name);

// ============================================================================
// Hex Helpers
// ============================================================================

/// Lowercase hex rendering of a byte range
CLIPSYNC_API std::string to_hex(const Byte *data, size_t length);
CLIPSYNC_API std::string to_hex(const Bytes &data);

/// Decode an even-length hex string; nullopt on any invalid character
CLIPSYNC_API std::optional<Bytes> from_hex(const std::string &hex);

/// Current Unix time in whole seconds
CLIPSYNC_API int64_t unix_now();

} // namespace clipsync

#endif // CLIPSYNC_TYPES_H
