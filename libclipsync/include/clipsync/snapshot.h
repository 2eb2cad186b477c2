/**
 * @file snapshot.h
 * @brief Clipboard snapshot model and its JSON wire form
 *
 * A Snapshot is one clipboard capture: the producing client's id, a Unix
 * timestamp and an ordered list of Items (the first item is the primary
 * representation). Snapshots travel as JSON:
 *
 *   {"origin":"1a2b3c4d","ts":1700000000,"qkey":"...",
 *    "items":[{"fmt":13,"payload":"aGk=","byte_len":2,
 *              "fmt_name":"CF_UNICODETEXT","mime_type":"text/plain"}]}
 *
 * fmt_name and mime_type are omitted when empty and tolerated when absent.
 */

#ifndef CLIPSYNC_SNAPSHOT_H
#define CLIPSYNC_SNAPSHOT_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace clipsync {

// ============================================================================
// Constants
// ============================================================================

/// Quick key of a snapshot without items
constexpr const char *EMPTY_QUICK_KEY = "empty";

/// Number of SHA-256 bytes kept in a quick key
constexpr size_t QUICK_KEY_BYTES = 8;

// ============================================================================
// Item
// ============================================================================

/**
 * @brief One typed clipboard representation
 *
 * The payload is the base64 form of the raw bytes; byte_len is the length
 * of the decoded bytes.
 */
struct Item {
  uint32_t fmt = 0;       // Numeric format id, defined by the origin
  std::string payload;    // Base64 encoded data
  size_t byte_len = 0;    // Decoded length
  std::string fmt_name;   // Optional (e.g. "PNG")
  std::string mime_type;  // Optional (e.g. "image/png")

  /// Build an item from raw bytes
  static Item from_bytes(uint32_t fmt, const Bytes &data,
                         std::string fmt_name = "",
                         std::string mime_type = "");

  /// Decode the payload back into raw bytes
  Result<Bytes> decode_payload() const;

  bool operator==(const Item &other) const;
  bool operator!=(const Item &other) const { return !(*this == other); }
};

// ============================================================================
// Snapshot
// ============================================================================

/**
 * @brief One clipboard capture
 *
 * A snapshot with zero items is a sentinel and is never applied.
 */
struct Snapshot {
  std::string origin;        // Producing client id
  int64_t ts = 0;            // Unix seconds
  std::vector<Item> items;   // Ordered, primary first
  std::string qkey;          // Dedup fingerprint

  /// True when the snapshot carries no items
  bool empty() const { return items.empty(); }

  /// Recompute qkey from items
  void stamp_quick_key();

  /// Serialize to JSON
  std::string to_json() const;

  /// Parse JSON; MalformedMessage on any syntax or type error
  static Result<Snapshot> from_json(const std::string &text);
  static Result<Snapshot> from_json(const Bytes &data);
};

// ============================================================================
// Quick Key
// ============================================================================

/**
 * @brief Content fingerprint used for deduplication
 *
 * SHA-256 over the concatenated base64 payloads, truncated to 8 bytes and
 * rendered as 16 lowercase hex characters. "empty" when there are no items.
 * Not a security primitive.
 */
CLIPSYNC_API std::string quick_key(const std::vector<Item> &items);

} // namespace clipsync

#endif // CLIPSYNC_SNAPSHOT_H
