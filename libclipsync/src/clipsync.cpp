/**
 * @file clipsync.cpp
 * @brief Library-wide entry points
 */

#include "clipsync/clipsync.h"

namespace clipsync {

VersionInfo get_version() { return VersionInfo{}; }

} // namespace clipsync
