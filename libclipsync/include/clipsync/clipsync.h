/**
 * @file clipsync.h
 * @brief Main clipsync API header
 *
 * clipsync keeps the clipboards of several machines in step through a
 * shared relay. This header pulls in the whole public API:
 * - Snapshot model and quick keys
 * - Relay authentication
 * - Poll (chunked HTTP) and stream (WebSocket) transports
 * - Clipboard access and the sync service
 *
 * Quick Start:
 * @code
 *   #include <clipsync/clipsync.h>
 *
 *   auto identity = clipsync::Identity::create("", "0011223344556677");
 *   auto client = clipsync::make_client(config, identity.value());
 *
 *   clipsync::CancellationSource stop;
 *   client.value()->poll(stop.token(), [](clipsync::Snapshot s) {
 *       std::cout << "From " << s.origin << std::endl;
 *   });
 * @endcode
 */

#ifndef CLIPSYNC_CLIPSYNC_H
#define CLIPSYNC_CLIPSYNC_H

// Core headers (in dependency order)
#include "error.h"
#include "platform.h"
#include "types.h"

// Feature modules (in dependency order)
#include "auth.h"
#include "backoff.h"
#include "cancel.h"
#include "chunk_codec.h"
#include "clipboard.h"
#include "config.h"
#include "log.h"
#include "poll_transport.h"
#include "security.h"
#include "snapshot.h"
#include "stream_transport.h"
#include "sync.h"
#include "transport.h"

namespace clipsync {

// ============================================================================
// Version Information
// ============================================================================

/// clipsync major version
constexpr int VERSION_MAJOR = 0;

/// clipsync minor version
constexpr int VERSION_MINOR = 1;

/// clipsync patch version
constexpr int VERSION_PATCH = 0;

/// clipsync version string
constexpr const char *VERSION_STRING = "0.1.0";

/**
 * @brief Get version information
 */
struct VersionInfo {
  int major = VERSION_MAJOR;
  int minor = VERSION_MINOR;
  int patch = VERSION_PATCH;
  const char *version_string = VERSION_STRING;
  const char *build_date = __DATE__;
  const char *build_time = __TIME__;
};

CLIPSYNC_API VersionInfo get_version();

} // namespace clipsync

#endif // CLIPSYNC_CLIPSYNC_H
