/**
 * @file error.h
 * @brief Error codes and result types for clipsync
 *
 * clipsync uses a Result type pattern for error handling. Exceptions thrown
 * by third-party code (JSON parsing, Boost system errors) are caught where
 * they occur and converted into an Error.
 */

#ifndef CLIPSYNC_ERROR_H
#define CLIPSYNC_ERROR_H

#include "platform.h"
#include <optional>
#include <string>
#include <variant>

namespace clipsync {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode : int {
  // Success (0)
  Success = 0,

  // General errors (1-99)
  Unknown = 1,
  InvalidArgument = 2,
  InvalidState = 3,
  NotSupported = 4,
  Timeout = 5,
  Cancelled = 6,

  // Configuration errors (100-199)
  ConfigError = 100,
  InvalidKey = 101,
  InvalidUrl = 102,
  ConfigFileError = 103,

  // Network errors (200-299)
  ConnectionFailed = 200,
  ConnectionLost = 201,
  ConnectionRefused = 202,
  ConnectionTimeout = 203,
  NotConnected = 204,
  WriteFailed = 205,

  // Relay (HTTP) errors (300-399)
  HttpError = 300,
  AuthenticationFailed = 301,
  PayloadTooLarge = 302,
  InconsistentChunkTotal = 303,
  ChunkNotAvailable = 304,
  SessionGone = 305,

  // Protocol errors (400-499)
  SnapshotTooLarge = 400,
  MalformedMessage = 401,
  IncompleteChunkSet = 402,
  ChunkOutOfRange = 403,
  InvalidToken = 404,

  // Security errors (500-599)
  SecurityError = 500,

  // Platform errors (600-699)
  PlatformError = 600,
  ClipboardUnavailable = 601,
  UnsupportedFormat = 602
};

// ============================================================================
// Error Information
// ============================================================================

/**
 * @brief Detailed error information
 */
struct Error {
  ErrorCode code = ErrorCode::Success;
  std::string message;
  std::string details; // Additional context

  Error() = default;

  explicit Error(ErrorCode c, std::string msg = "", std::string det = "")
      : code(c), message(std::move(msg)), details(std::move(det)) {}

  /// Check if this represents an error
  bool is_error() const { return code != ErrorCode::Success; }

  /// Check if this represents success
  bool is_ok() const { return code == ErrorCode::Success; }

  /// Get human-readable error string
  std::string to_string() const;

  /// Create success result
  static Error ok() { return Error(ErrorCode::Success); }
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type that holds either a value or an error
 *
 * Usage:
 *   Result<Snapshot> result = decode_snapshot(bytes);
 *   if (result) {
 *       Snapshot snap = result.value();
 *   } else {
 *       Error err = result.error();
 *   }
 */
template <typename T> class Result {
public:
  /// Construct with success value
  Result(T value) : data_(std::move(value)) {}

  /// Construct with error
  Result(Error error) : data_(std::move(error)) {}

  /// Construct with error code
  Result(ErrorCode code, std::string message = "")
      : data_(Error(code, std::move(message))) {}

  /// Check if result is success
  bool is_ok() const { return std::holds_alternative<T>(data_); }

  /// Check if result is error
  bool is_error() const { return std::holds_alternative<Error>(data_); }

  /// Boolean conversion (true = success)
  explicit operator bool() const { return is_ok(); }

  /// Get the value (undefined behavior if error)
  T &value() & { return std::get<T>(data_); }
  const T &value() const & { return std::get<T>(data_); }
  T &&value() && { return std::get<T>(std::move(data_)); }

  /// Get the error (undefined behavior if success)
  Error &error() & { return std::get<Error>(data_); }
  const Error &error() const & { return std::get<Error>(data_); }

  /// Get value or default
  T value_or(T default_value) const {
    return is_ok() ? std::get<T>(data_) : std::move(default_value);
  }

  /// Get optional value
  std::optional<T> to_optional() const {
    return is_ok() ? std::optional<T>(std::get<T>(data_)) : std::nullopt;
  }

private:
  std::variant<T, Error> data_;
};

/**
 * @brief Specialization for void result (success or error, no value)
 */
template <> class Result<void> {
public:
  /// Construct success
  Result() : error_(std::nullopt) {}

  /// Construct with error
  Result(Error error) : error_(std::move(error)) {}

  /// Construct with error code
  Result(ErrorCode code, std::string message = "")
      : error_(Error(code, std::move(message))) {}

  bool is_ok() const { return !error_.has_value(); }
  bool is_error() const { return error_.has_value(); }

  /// Boolean conversion (true = success)
  explicit operator bool() const { return is_ok(); }

  Error &error() { return error_.value(); }
  const Error &error() const { return error_.value(); }

  /// Create success result
  static Result ok() { return Result(); }

private:
  std::optional<Error> error_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

/// Return early if result is error
#define CLIPSYNC_TRY(result)                                                   \
  do {                                                                         \
    auto &&_result = (result);                                                 \
    if (_result.is_error()) {                                                  \
      return _result.error();                                                  \
    }                                                                          \
  } while (0)

/// Return early with error if condition is false
#define CLIPSYNC_REQUIRE(condition, error_code, message)                       \
  do {                                                                         \
    if (!(condition)) {                                                        \
      return ::clipsync::Error(error_code, message);                           \
    }                                                                          \
  } while (0)

// ============================================================================
// Error Code Helpers
// ============================================================================

/// Get human-readable name for error code
CLIPSYNC_API const char *error_code_name(ErrorCode code);

/// Check if error code is recoverable (worth retrying)
CLIPSYNC_API bool is_recoverable(ErrorCode code);

} // namespace clipsync

#endif // CLIPSYNC_ERROR_H
