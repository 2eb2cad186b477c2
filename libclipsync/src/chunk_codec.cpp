/**
 * @file chunk_codec.cpp
 * @brief Chunk split/assemble implementation
 */

#include "clipsync/chunk_codec.h"
#include <algorithm>

namespace clipsync {

// ============================================================================
// Split / Assemble
// ============================================================================

Result<std::vector<Bytes>> split(const std::string &payload,
                                 size_t max_part_size) {
  CLIPSYNC_REQUIRE(max_part_size > 0, ErrorCode::InvalidArgument,
                   "part size must be positive");

  if (payload.size() > MAX_SNAPSHOT_SIZE) {
    return Error(ErrorCode::SnapshotTooLarge, "snapshot >32 MiB, dropped",
                 std::to_string(payload.size()) + " bytes");
  }

  std::vector<Bytes> parts;
  parts.reserve((payload.size() + max_part_size - 1) / max_part_size);

  for (size_t offset = 0; offset < payload.size(); offset += max_part_size) {
    size_t end = std::min(offset + max_part_size, payload.size());
    parts.emplace_back(payload.begin() + offset, payload.begin() + end);
  }

  return std::move(parts);
}

Result<Bytes> assemble(const std::map<size_t, Bytes> &parts,
                       size_t declared_total) {
  if (declared_total == 0 || parts.size() != declared_total) {
    return Error(ErrorCode::IncompleteChunkSet, "missing parts",
                 std::to_string(parts.size()) + "/" +
                     std::to_string(declared_total));
  }

  // Keys are ordered; with size == total, the last key tells whether the
  // index set is exactly 0..total-1
  if (parts.rbegin()->first != declared_total - 1) {
    return Error(ErrorCode::IncompleteChunkSet, "part index outside total");
  }

  size_t size = 0;
  for (const auto &kv : parts) {
    size += kv.second.size();
  }

  Bytes out;
  out.reserve(size);
  for (const auto &kv : parts) {
    out.insert(out.end(), kv.second.begin(), kv.second.end());
  }
  return std::move(out);
}

// ============================================================================
// ChunkSet
// ============================================================================

void ChunkSet::begin(const std::string &cid, size_t total) {
  cid_ = cid;
  total_ = total;
  bytes_ = 0;
  parts_.clear();
}

void ChunkSet::reset() { begin("", 0); }

Result<void> ChunkSet::add(size_t idx, Bytes data) {
  CLIPSYNC_REQUIRE(active(), ErrorCode::InvalidState, "no active session");

  if (idx >= total_) {
    return Error(ErrorCode::ChunkOutOfRange, "chunk index out of range",
                 std::to_string(idx) + " >= " + std::to_string(total_));
  }

  if (parts_.count(idx) != 0) {
    return Result<void>::ok();
  }

  if (bytes_ + data.size() > MAX_SNAPSHOT_SIZE) {
    return Error(ErrorCode::SnapshotTooLarge, "session exceeds 32 MiB");
  }

  bytes_ += data.size();
  parts_.emplace(idx, std::move(data));
  return Result<void>::ok();
}

Result<Bytes> ChunkSet::assemble() const {
  return clipsync::assemble(parts_, total_);
}

Result<Snapshot> ChunkSet::decode() const {
  auto payload = assemble();
  CLIPSYNC_TRY(payload);
  return Snapshot::from_json(payload.value());
}

} // namespace clipsync
