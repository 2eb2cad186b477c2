/**
 * @file config.cpp
 * @brief Configuration management implementation
 */

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

#include <pwd.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "clipsync/auth.h"
#include "clipsync/chunk_codec.h"
#include "clipsync/config.h"
#include "clipsync/http.h"
#include "clipsync/log.h"

namespace fs = ::std::filesystem;

namespace clipsync {

using json = nlohmann::json;

// ============================================================================
// ClientConfig Methods
// ============================================================================

Result<void> ClientConfig::validate() const {
  CLIPSYNC_TRY(parse_shared_key(key));
  CLIPSYNC_TRY(Url::parse(endpoint));

  if (client_id.length() > 64) {
    return Error(ErrorCode::ConfigError, "Client id too long (max 64 chars)");
  }
  for (char c : client_id) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      return Error(ErrorCode::ConfigError, "Client id contains whitespace");
    }
  }

  if (request_timeout.count() <= 0) {
    return Error(ErrorCode::ConfigError, "Timeout must be positive");
  }
  if (watch_interval.count() <= 0) {
    return Error(ErrorCode::ConfigError, "Interval must be positive");
  }
  if (poll_idle.count() <= 0) {
    return Error(ErrorCode::ConfigError, "Poll idle delay must be positive");
  }
  if (part_size == 0 || part_size > MAX_SNAPSHOT_SIZE) {
    return Error(ErrorCode::ConfigError, "Part size out of range");
  }
  if (queue_capacity == 0) {
    return Error(ErrorCode::ConfigError, "Queue capacity must be positive");
  }

  auto level = parse_log_level(log_level);
  if (level.is_error()) {
    return level.error();
  }

  return Result<void>::ok();
}

fs::path ClientConfig::get_default_config_path() {
  // Linux: Use XDG_CONFIG_HOME or ~/.config
  const char *xdg_config = std::getenv("XDG_CONFIG_HOME");
  if (xdg_config && *xdg_config) {
    return fs::path(xdg_config) / "clipsync" / "config.json";
  }

  const char *home = std::getenv("HOME");
  if (!home) {
    struct passwd *pw = getpwuid(getuid());
    if (pw) {
      home = pw->pw_dir;
    }
  }
  if (home) {
    return fs::path(home) / ".config" / "clipsync" / "config.json";
  }

  return fs::path("/tmp/clipsync/config.json");
}

// ============================================================================
// Durations
// ============================================================================

Result<Milliseconds> parse_duration(const std::string &text,
                                    Milliseconds bare_unit) {
  size_t pos = 0;
  while (pos < text.size() &&
         (std::isdigit(static_cast<unsigned char>(text[pos])) ||
          text[pos] == '.')) {
    ++pos;
  }
  if (pos == 0) {
    return Error(ErrorCode::ConfigError, "invalid duration", text);
  }

  double value = 0;
  try {
    value = std::stod(text.substr(0, pos));
  } catch (const std::exception &) {
    return Error(ErrorCode::ConfigError, "invalid duration", text);
  }

  std::string unit = text.substr(pos);
  double ms_per_unit;
  if (unit.empty()) {
    ms_per_unit = static_cast<double>(bare_unit.count());
  } else if (unit == "ms") {
    ms_per_unit = 1;
  } else if (unit == "s") {
    ms_per_unit = 1000;
  } else if (unit == "m") {
    ms_per_unit = 60 * 1000;
  } else {
    return Error(ErrorCode::ConfigError, "invalid duration unit", text);
  }

  return Milliseconds(static_cast<Milliseconds::rep>(value * ms_per_unit));
}

// ============================================================================
// Setting by Name
// ============================================================================

namespace {

/// Apply one named setting given as text (flag value or JSON string)
Result<void> apply_setting(const std::string &name, const std::string &value,
                           ClientConfig &config) {
  if (name == "http") {
    config.endpoint = value;
  } else if (name == "key") {
    config.key = value;
  } else if (name == "id") {
    config.client_id = value;
  } else if (name == "transport") {
    auto kind = parse_transport_kind(value);
    if (!kind) {
      return Error(ErrorCode::ConfigError, "transport must be poll or ws",
                   value);
    }
    config.transport = *kind;
  } else if (name == "interval") {
    auto d = parse_duration(value, Milliseconds(1));
    CLIPSYNC_TRY(d);
    config.watch_interval = d.value();
  } else if (name == "poll-idle" || name == "poll_idle") {
    auto d = parse_duration(value, Milliseconds(1));
    CLIPSYNC_TRY(d);
    config.poll_idle = d.value();
  } else if (name == "timeout") {
    auto d = parse_duration(value, Milliseconds(1000));
    CLIPSYNC_TRY(d);
    config.request_timeout = d.value();
  } else if (name == "log-level" || name == "log_level") {
    config.log_level = value;
  } else if (name == "log-file" || name == "log_file") {
    config.log_file = value;
  } else {
    return Error(ErrorCode::ConfigError, "unknown option", name);
  }
  return Result<void>::ok();
}

/// Keys of the config file that map onto apply_setting()
bool is_config_key(const std::string &name) {
  static const char *const keys[] = {"http",     "key",       "id",
                                     "transport", "interval", "poll_idle",
                                     "timeout",  "log_level", "log_file"};
  for (const char *key : keys) {
    if (name == key) {
      return true;
    }
  }
  return false;
}

} // namespace

// ============================================================================
// Config File
// ============================================================================

Result<void> apply_config_json(const std::string &text, ClientConfig &config) {
  json doc;
  try {
    doc = json::parse(text);
  } catch (const json::exception &e) {
    return Error(ErrorCode::ConfigFileError, "invalid JSON", e.what());
  }

  if (!doc.is_object()) {
    return Error(ErrorCode::ConfigFileError, "config must be a JSON object");
  }

  ClientConfig updated = config;
  for (auto it = doc.begin(); it != doc.end(); ++it) {
    const std::string &name = it.key();
    const json &value = it.value();

    if (name == "part_size" || name == "queue_capacity") {
      if (!value.is_number_unsigned()) {
        return Error(ErrorCode::ConfigFileError, "expected a positive number",
                     name);
      }
      (name == "part_size" ? updated.part_size : updated.queue_capacity) =
          value.get<size_t>();
      continue;
    }

    if (!is_config_key(name)) {
      continue;
    }

    std::string text_value;
    if (value.is_string()) {
      text_value = value.get<std::string>();
    } else if (value.is_number() && (name == "interval" ||
                                     name == "poll_idle" ||
                                     name == "timeout")) {
      text_value = value.dump();
    } else {
      return Error(ErrorCode::ConfigFileError, "wrong type for key", name);
    }

    auto applied = apply_setting(name, text_value, updated);
    if (applied.is_error()) {
      return Error(ErrorCode::ConfigFileError, applied.error().message,
                   name + ": " + applied.error().details);
    }
  }

  config = std::move(updated);
  return Result<void>::ok();
}

Result<void> load_config_file(const fs::path &path, ClientConfig &config) {
  std::ifstream in(path);
  if (!in) {
    return Error(ErrorCode::ConfigFileError, "cannot open config file",
                 path.string());
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();

  auto result = apply_config_json(buffer.str(), config);
  if (result.is_error()) {
    result.error().details = path.string() + ": " + result.error().details;
  }
  return result;
}

// ============================================================================
// Command Line
// ============================================================================

Result<CommandLine> parse_command_line(int argc, const char *const argv[]) {
  CommandLine cl;
  std::vector<std::pair<std::string, std::string>> flags;

  for (int index = 1; index < argc; ++index) {
    std::string arg = argv[index];
    if (arg.size() < 2 || arg[0] != '-') {
      return Error(ErrorCode::ConfigError, "unexpected argument", arg);
    }

    std::string name = arg.substr(arg[1] == '-' ? 2 : 1);
    std::string value;
    bool has_value = false;

    auto eq = name.find('=');
    if (eq != std::string::npos) {
      value = name.substr(eq + 1);
      name = name.substr(0, eq);
      has_value = true;
    }

    if (name == "help" || name == "h") {
      cl.show_help = true;
      continue;
    }

    if (!has_value) {
      if (index + 1 >= argc) {
        return Error(ErrorCode::ConfigError, "missing value for option",
                     name);
      }
      value = argv[++index];
    }

    if (name == "config") {
      cl.config_path = value;
    } else {
      flags.emplace_back(name, value);
    }
  }

  if (cl.show_help) {
    return cl;
  }

  if (!cl.config_path.empty()) {
    CLIPSYNC_TRY(load_config_file(cl.config_path, cl.config));
  } else {
    auto default_path = ClientConfig::get_default_config_path();
    std::error_code ec;
    if (fs::exists(default_path, ec)) {
      CLIPSYNC_TRY(load_config_file(default_path, cl.config));
      cl.config_path = default_path.string();
    }
  }

  for (const auto &flag : flags) {
    CLIPSYNC_TRY(apply_setting(flag.first, flag.second, cl.config));
  }

  return cl;
}

std::string usage(const std::string &program) {
  std::ostringstream oss;
  oss << "Usage: " << program << " --key HEX [options]\n"
      << "\n"
      << "Keeps the clipboard in sync with other machines through a relay.\n"
      << "\n"
      << "Options:\n"
      << "  --http URL          relay endpoint (default "
         "http://localhost:5002/clip)\n"
      << "  --key HEX           shared secret, 16 hex characters\n"
      << "  --transport KIND    poll or ws (default poll)\n"
      << "  --interval MS       clipboard sampling interval (default 200)\n"
      << "  --timeout DURATION  HTTP request timeout (default 15s)\n"
      << "  --poll-idle MS      pause between discover rounds (default 200)\n"
      << "  --id ID             client id (default: random)\n"
      << "  --config PATH       JSON config file\n"
      << "  --log-level LEVEL   trace|debug|info|warn|error|off (default "
         "info)\n"
      << "  --log-file PATH     also log to this file\n"
      << "  --help              show this text\n";
  return oss.str();
}

} // namespace clipsync
