/**
 * @file log.h
 * @brief Logging setup for clipsync
 *
 * All library code logs through one named spdlog logger ("clipsync"). Until
 * init_logging() is called, logger() returns a colored stderr logger at
 * info level.
 */

#ifndef CLIPSYNC_LOG_H
#define CLIPSYNC_LOG_H

#include "error.h"
#include "platform.h"
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace clipsync {

/// Name of the library logger
constexpr const char *LOGGER_NAME = "clipsync";

/**
 * @brief Parse a level name (trace, debug, info, warn, error, critical, off)
 * @return Level or ConfigError
 */
CLIPSYNC_API Result<spdlog::level::level_enum>
parse_log_level(const std::string &name);

/**
 * @brief Build the library logger
 *
 * @param level Level name, see parse_log_level()
 * @param file Optional log file, appended to; stderr is always a sink
 * @return Success, ConfigError for a bad level, ConfigFileError when the
 *         file cannot be opened
 */
CLIPSYNC_API Result<void> init_logging(const std::string &level,
                                       const std::string &file = "");

/**
 * @brief The library logger
 */
CLIPSYNC_API std::shared_ptr<spdlog::logger> logger();

} // namespace clipsync

#endif // CLIPSYNC_LOG_H
