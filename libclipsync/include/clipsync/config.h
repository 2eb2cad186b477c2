/**
 * @file config.h
 * @brief Client configuration, config file and command line
 *
 * Settings come from three layers, later ones winning: built-in defaults,
 * an optional JSON config file, and command-line flags. The JSON keys mirror
 * the flag names:
 *
 *   {"http": "http://relay:5002/clip", "key": "0011223344556677",
 *    "transport": "ws", "interval": 200, "timeout": "15s"}
 */

#ifndef CLIPSYNC_CONFIG_H
#define CLIPSYNC_CONFIG_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <filesystem>
#include <string>
#include <vector>

namespace clipsync {

// ============================================================================
// Client Configuration
// ============================================================================

/**
 * @brief Complete configuration of one clipsync client
 */
struct ClientConfig {
  // ========================================================================
  // Relay
  // ========================================================================

  /// Relay endpoint (http:// for both transports, or ws://)
  std::string endpoint = "http://localhost:5002/clip";

  /// Pre-shared key, 16 hex characters
  std::string key;

  /// Wire transport
  TransportKind transport = TransportKind::Poll;

  /// Deadline for one HTTP exchange (connect + send + receive)
  Milliseconds request_timeout{15000};

  /// Pause between discover rounds of the poll transport
  Milliseconds poll_idle{200};

  /// Largest body per uploaded part
  size_t part_size = 300 * 1024;

  // ========================================================================
  // Identity
  // ========================================================================

  /// Origin id; generated at startup when empty
  std::string client_id;

  // ========================================================================
  // Clipboard
  // ========================================================================

  /// How often the local clipboard is sampled
  Milliseconds watch_interval{200};

  /// Capacity of the send and apply queues
  size_t queue_capacity = 8;

  // ========================================================================
  // Logging
  // ========================================================================

  /// trace, debug, info, warn, error, critical or off
  std::string log_level = "info";

  /// Optional log file (appended to)
  std::string log_file;

  // ========================================================================
  // Methods
  // ========================================================================

  /// Check every field; InvalidKey, InvalidUrl or ConfigError
  Result<void> validate() const;

  /// Default config file location ($XDG_CONFIG_HOME/clipsync/config.json)
  static std::filesystem::path get_default_config_path();
};

// ============================================================================
// Config File
// ============================================================================

/**
 * @brief Apply the keys of a JSON config file on top of config
 *
 * Unknown keys are ignored. Missing file, unreadable JSON or a value of the
 * wrong type is a ConfigFileError.
 */
CLIPSYNC_API Result<void> load_config_file(const std::filesystem::path &path,
                                           ClientConfig &config);

/**
 * @brief Apply a JSON document (same keys as the config file)
 */
CLIPSYNC_API Result<void> apply_config_json(const std::string &text,
                                            ClientConfig &config);

// ============================================================================
// Command Line
// ============================================================================

/**
 * @brief Outcome of command-line parsing
 */
struct CommandLine {
  ClientConfig config;
  bool show_help = false;
  std::string config_path; // Empty when no file was loaded
};

/**
 * @brief Parse flags, loading --config (or the default file if present)
 *
 * Flags: --http URL, --key HEX, --interval MS, --transport poll|ws,
 * --timeout DURATION, --poll-idle MS, --id ID, --config PATH,
 * --log-level LEVEL, --log-file PATH, --help. A single leading dash and the
 * --flag=value form are accepted too.
 *
 * The returned config is not validated; call validate().
 */
CLIPSYNC_API Result<CommandLine> parse_command_line(int argc,
                                                    const char *const argv[]);

/// Usage text for --help
CLIPSYNC_API std::string usage(const std::string &program);

/**
 * @brief Parse a duration such as "15s", "250ms", "2m" or a bare number
 *
 * @param text Duration text
 * @param bare_unit Unit applied to a bare number
 */
CLIPSYNC_API Result<Milliseconds> parse_duration(const std::string &text,
                                                 Milliseconds bare_unit);

} // namespace clipsync

#endif // CLIPSYNC_CONFIG_H
