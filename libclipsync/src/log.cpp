/**
 * @file log.cpp
 * @brief spdlog setup
 */

#include "clipsync/log.h"
#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace clipsync {

namespace {
std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

constexpr const char *LOG_PATTERN = "%H:%M:%S.%e [%^%l%$] %v";

std::shared_ptr<spdlog::logger> make_logger(std::vector<spdlog::sink_ptr> sinks,
                                            spdlog::level::level_enum level) {
  auto lg = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(),
                                             sinks.end());
  lg->set_pattern(LOG_PATTERN);
  lg->set_level(level);
  lg->flush_on(spdlog::level::warn);
  return lg;
}
} // namespace

Result<spdlog::level::level_enum> parse_log_level(const std::string &name) {
  if (name == "trace")
    return spdlog::level::trace;
  if (name == "debug")
    return spdlog::level::debug;
  if (name == "info")
    return spdlog::level::info;
  if (name == "warn" || name == "warning")
    return spdlog::level::warn;
  if (name == "error")
    return spdlog::level::err;
  if (name == "critical")
    return spdlog::level::critical;
  if (name == "off")
    return spdlog::level::off;

  return Error(ErrorCode::ConfigError, "unknown log level", name);
}

Result<void> init_logging(const std::string &level, const std::string &file) {
  auto lvl = parse_log_level(level);
  CLIPSYNC_TRY(lvl);

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  if (!file.empty()) {
    try {
      sinks.push_back(
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, false));
    } catch (const spdlog::spdlog_ex &e) {
      return Error(ErrorCode::ConfigFileError, "cannot open log file",
                   e.what());
    }
  }

  auto lg = make_logger(std::move(sinks), lvl.value());

  std::lock_guard<std::mutex> lock(g_logger_mutex);
  g_logger = std::move(lg);
  return Result<void>::ok();
}

std::shared_ptr<spdlog::logger> logger() {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  if (!g_logger) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    g_logger = make_logger(std::move(sinks), spdlog::level::info);
  }
  return g_logger;
}

} // namespace clipsync
