/**
 * @file error.cpp
 * @brief Error handling implementation
 */

#include "clipsync/error.h"
#include <sstream>

namespace clipsync {

// ============================================================================
// Error Code Names
// ============================================================================

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Success";
  case ErrorCode::Unknown:
    return "Unknown";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::NotSupported:
    return "NotSupported";
  case ErrorCode::Timeout:
    return "Timeout";
  case ErrorCode::Cancelled:
    return "Cancelled";

  case ErrorCode::ConfigError:
    return "ConfigError";
  case ErrorCode::InvalidKey:
    return "InvalidKey";
  case ErrorCode::InvalidUrl:
    return "InvalidUrl";
  case ErrorCode::ConfigFileError:
    return "ConfigFileError";

  case ErrorCode::ConnectionFailed:
    return "ConnectionFailed";
  case ErrorCode::ConnectionLost:
    return "ConnectionLost";
  case ErrorCode::ConnectionRefused:
    return "ConnectionRefused";
  case ErrorCode::ConnectionTimeout:
    return "ConnectionTimeout";
  case ErrorCode::NotConnected:
    return "NotConnected";
  case ErrorCode::WriteFailed:
    return "WriteFailed";

  case ErrorCode::HttpError:
    return "HttpError";
  case ErrorCode::AuthenticationFailed:
    return "AuthenticationFailed";
  case ErrorCode::PayloadTooLarge:
    return "PayloadTooLarge";
  case ErrorCode::InconsistentChunkTotal:
    return "InconsistentChunkTotal";
  case ErrorCode::ChunkNotAvailable:
    return "ChunkNotAvailable";
  case ErrorCode::SessionGone:
    return "SessionGone";

  case ErrorCode::SnapshotTooLarge:
    return "SnapshotTooLarge";
  case ErrorCode::MalformedMessage:
    return "MalformedMessage";
  case ErrorCode::IncompleteChunkSet:
    return "IncompleteChunkSet";
  case ErrorCode::ChunkOutOfRange:
    return "ChunkOutOfRange";
  case ErrorCode::InvalidToken:
    return "InvalidToken";

  case ErrorCode::SecurityError:
    return "SecurityError";

  case ErrorCode::PlatformError:
    return "PlatformError";
  case ErrorCode::ClipboardUnavailable:
    return "ClipboardUnavailable";
  case ErrorCode::UnsupportedFormat:
    return "UnsupportedFormat";

  default:
    return "UnknownError";
  }
}

// ============================================================================
// Recoverability
// ============================================================================

bool is_recoverable(ErrorCode code) {
  switch (code) {
  // Configuration problems never heal by retrying
  case ErrorCode::ConfigError:
  case ErrorCode::InvalidKey:
  case ErrorCode::InvalidUrl:
  case ErrorCode::ConfigFileError:
  case ErrorCode::NotSupported:
  case ErrorCode::SnapshotTooLarge:
    return false;

  default:
    return true;
  }
}

// ============================================================================
// Error::to_string
// ============================================================================

std::string Error::to_string() const {
  std::ostringstream oss;

  oss << error_code_name(code);

  if (!message.empty()) {
    oss << ": " << message;
  }

  if (!details.empty()) {
    oss << " (" << details << ")";
  }

  return oss.str();
}

} // namespace clipsync
