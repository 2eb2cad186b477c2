/**
 * @file platform.h
 * @brief Platform guard and export macros for clipsync
 *
 * The network core is portable POSIX code; only the clipboard backend
 * is Linux specific.
 */

#ifndef CLIPSYNC_PLATFORM_H
#define CLIPSYNC_PLATFORM_H

#if !defined(__linux__)
#error "Unsupported platform. clipsync only supports Linux and Android."
#endif

// ============================================================================
// Export/Import Macros
// ============================================================================

#ifdef CLIPSYNC_BUILDING_SHARED
#define CLIPSYNC_API __attribute__((visibility("default")))
#else
#define CLIPSYNC_API
#endif

#endif // CLIPSYNC_PLATFORM_H
