/**
 * @file clipboard.h
 * @brief Clipboard formats, backends and the clipboard owner thread
 *
 * The OS clipboard is touched by exactly one thread: the one run by
 * ClipboardOwner. Other threads submit read and write requests and block on
 * the reply.
 */

#ifndef CLIPSYNC_CLIPBOARD_H
#define CLIPSYNC_CLIPBOARD_H

#include "error.h"
#include "platform.h"
#include "snapshot.h"
#include "types.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace clipsync {

// ============================================================================
// Formats
// ============================================================================

/// Well-known numeric format ids shared with the other clients
constexpr uint32_t FORMAT_UNICODE_TEXT = 13;
constexpr uint32_t FORMAT_DIB = 8;

constexpr const char *MIME_TEXT = "text/plain";
constexpr const char *MIME_PNG = "image/png";

/**
 * @brief Format ids in use by this process
 *
 * Obtained once from register_formats() and passed to whatever needs them.
 */
struct ClipboardFormats {
  uint32_t text = FORMAT_UNICODE_TEXT;
  uint32_t dib = FORMAT_DIB;
  uint32_t png = 0;       // "PNG"
  uint32_t image_png = 0; // "image/png"

  /// Text is fmt == text or a text/plain MIME type
  bool is_text(const Item &item) const;

  /// PNG is one of the PNG ids, fmt_name "PNG" or MIME type image/png
  bool is_png(const Item &item) const;
};

/**
 * @brief Register the custom formats and return their ids
 */
CLIPSYNC_API ClipboardFormats register_formats();

/// Text item (UTF-8 bytes, CF_UNICODETEXT id)
CLIPSYNC_API Item make_text_item(const ClipboardFormats &formats,
                                 const std::string &text);

/// PNG item carrying the raw PNG file bytes
CLIPSYNC_API Item make_png_item(const ClipboardFormats &formats,
                                const Bytes &png);

// ============================================================================
// Backend
// ============================================================================

/**
 * @brief Access to one clipboard implementation
 *
 * Not thread-safe; ClipboardOwner serializes all calls.
 */
class CLIPSYNC_API ClipboardBackend {
public:
  virtual ~ClipboardBackend() = default;

  /**
   * @brief Read the current contents
   *
   * PNG first when available, then text. An empty clipboard yields an empty
   * vector.
   */
  virtual Result<std::vector<Item>> read() = 0;

  /**
   * @brief Replace the contents
   *
   * Items of unknown format are skipped.
   */
  virtual Result<void> write(const std::vector<Item> &items) = 0;

  /// Short description for logs
  virtual std::string name() const = 0;
};

/**
 * @brief Backend for the running desktop session
 *
 * @return Backend, or NotSupported when no display server or tool is found
 */
CLIPSYNC_API Result<std::unique_ptr<ClipboardBackend>>
create_clipboard_backend(const ClipboardFormats &formats);

// ============================================================================
// Clipboard Owner
// ============================================================================

/**
 * @brief Single thread owning a ClipboardBackend
 *
 * read() and write() may be called from any thread; they queue a request
 * and wait for the owner thread to answer it.
 */
class CLIPSYNC_API ClipboardOwner {
public:
  explicit ClipboardOwner(std::unique_ptr<ClipboardBackend> backend);
  ~ClipboardOwner();

  ClipboardOwner(const ClipboardOwner &) = delete;
  ClipboardOwner &operator=(const ClipboardOwner &) = delete;

  /// Start the owner thread
  Result<void> start();

  /// Fail queued requests with Cancelled and join the thread
  void stop();

  bool is_running() const;

  /// Read the clipboard on the owner thread
  Result<std::vector<Item>> read();

  /// Write to the clipboard on the owner thread
  Result<void> write(const std::vector<Item> &items);

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace clipsync

#endif // CLIPSYNC_CLIPBOARD_H
