/**
 * @file types.cpp
 * @brief Core type implementations
 */

#include "clipsync/types.h"
#include "clipsync/security.h"
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace clipsync {

// ============================================================================
// Identifiers
// ============================================================================

std::string generate_client_id() {
  return to_hex(random_bytes(CLIENT_ID_LENGTH / 2));
}

std::string generate_session_id() {
  return to_hex(random_bytes(SESSION_ID_LENGTH / 2));
}

// ============================================================================
// TransportKind
// ============================================================================

const char *transport_kind_name(TransportKind kind) {
  switch (kind) {
  case TransportKind::Poll:
    return "poll";
  case TransportKind::Stream:
    return "ws";
  default:
    return "unknown";
  }
}

std::optional<TransportKind> parse_transport_kind(const std::string &name) {
  if (name == "poll" || name == "http") {
    return TransportKind::Poll;
  }
  if (name == "ws" || name == "websocket") {
    return TransportKind::Stream;
  }
  return std::nullopt;
}

// ============================================================================
// Hex
// ============================================================================

std::string to_hex(const Byte *data, size_t length) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (size_t i = 0; i < length; ++i) {
    oss << std::setw(2) << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::string to_hex(const Bytes &data) { return to_hex(data.data(), data.size()); }

std::optional<Bytes> from_hex(const std::string &hex) {
  if (hex.length() % 2 != 0) {
    return std::nullopt;
  }

  Bytes out;
  out.reserve(hex.length() / 2);
  for (size_t i = 0; i < hex.length(); i += 2) {
    std::string byte_str = hex.substr(i, 2);
    char *end;
    unsigned long val = std::strtoul(byte_str.c_str(), &end, 16);
    // strtoul accepts a leading sign or space; reject those explicitly
    if (end != byte_str.c_str() + 2 || !std::isxdigit(static_cast<unsigned char>(byte_str[0])) ||
        !std::isxdigit(static_cast<unsigned char>(byte_str[1]))) {
      return std::nullopt;
    }
    out.push_back(static_cast<Byte>(val));
  }

  return out;
}

int64_t unix_now() {
  return std::chrono::duration_cast<Seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace clipsync
