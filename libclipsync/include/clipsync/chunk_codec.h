/**
 * @file chunk_codec.h
 * @brief Splitting snapshots into relay-sized parts and reassembling them
 *
 * The relay accepts bodies of at most DEFAULT_PART_SIZE bytes. An outbound
 * serialized snapshot is cut into consecutive parts that all carry the same
 * session id and total; the receiving side collects parts by index and merges
 * them in index order once every index 0..total-1 is present.
 */

#ifndef CLIPSYNC_CHUNK_CODEC_H
#define CLIPSYNC_CHUNK_CODEC_H

#include "error.h"
#include "platform.h"
#include "snapshot.h"
#include "types.h"
#include <map>
#include <string>
#include <vector>

namespace clipsync {

// ============================================================================
// Constants
// ============================================================================

/// Largest body the relay accepts for one part (300 KiB)
constexpr size_t DEFAULT_PART_SIZE = 300 * 1024;

/// Largest serialized snapshot sent or accepted (32 MiB)
constexpr size_t MAX_SNAPSHOT_SIZE = 32 * 1024 * 1024;

/// Slack allowed on top of the part size when reading a fetched part
constexpr size_t PART_READ_SLACK = 1024;

// ============================================================================
// Split / Assemble
// ============================================================================

/**
 * @brief Cut a payload into consecutive parts of at most max_part_size bytes
 *
 * @return Parts in order; SnapshotTooLarge above MAX_SNAPSHOT_SIZE,
 *         InvalidArgument when max_part_size is zero. An empty payload yields
 *         no parts.
 */
CLIPSYNC_API Result<std::vector<Bytes>>
split(const std::string &payload, size_t max_part_size = DEFAULT_PART_SIZE);

/**
 * @brief Concatenate parts in index order
 *
 * @return The payload when the held indices are exactly 0..declared_total-1,
 *         IncompleteChunkSet otherwise
 */
CLIPSYNC_API Result<Bytes> assemble(const std::map<size_t, Bytes> &parts,
                                    size_t declared_total);

// ============================================================================
// Chunk Set
// ============================================================================

/**
 * @brief Receive-side state of one transfer session
 *
 * Owned by a single receiving transport; not thread safe.
 */
class CLIPSYNC_API ChunkSet {
public:
  ChunkSet() = default;

  /// Start tracking a session, dropping any held parts
  void begin(const std::string &cid, size_t total);

  /// Forget the session
  void reset();

  /**
   * @brief Store one part
   *
   * A second copy of an index already held is ignored.
   * @return ChunkOutOfRange for idx >= total, InvalidState without a session
   */
  Result<void> add(size_t idx, Bytes data);

  bool has(size_t idx) const { return parts_.count(idx) != 0; }

  /// True once every index is held
  bool complete() const { return total_ > 0 && parts_.size() == total_; }

  /// Merge the parts in index order
  Result<Bytes> assemble() const;

  /// Merge and decode into a snapshot
  Result<Snapshot> decode() const;

  bool active() const { return !cid_.empty(); }
  const std::string &cid() const { return cid_; }
  size_t total() const { return total_; }
  size_t received() const { return parts_.size(); }
  size_t received_bytes() const { return bytes_; }

private:
  std::string cid_;
  size_t total_ = 0;
  size_t bytes_ = 0;
  std::map<size_t, Bytes> parts_;
};

} // namespace clipsync

#endif // CLIPSYNC_CHUNK_CODEC_H
