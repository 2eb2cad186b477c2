/**
 * @file snapshot.cpp
 * @brief Snapshot model and JSON codec implementation
 */

#include "clipsync/snapshot.h"
#include "clipsync/security.h"
#include <nlohmann/json.hpp>

namespace clipsync {

using json = nlohmann::json;

// ============================================================================
// JSON Mapping
// ============================================================================

void to_json(json &j, const Item &item) {
  j = json{{"fmt", item.fmt},
           {"payload", item.payload},
           {"byte_len", item.byte_len}};
  if (!item.fmt_name.empty()) {
    j["fmt_name"] = item.fmt_name;
  }
  if (!item.mime_type.empty()) {
    j["mime_type"] = item.mime_type;
  }
}

void from_json(const json &j, Item &item) {
  item.fmt = j.value("fmt", static_cast<uint32_t>(0));
  item.payload = j.value("payload", std::string());
  item.byte_len = j.value("byte_len", static_cast<size_t>(0));
  item.fmt_name = j.value("fmt_name", std::string());
  item.mime_type = j.value("mime_type", std::string());
}

void to_json(json &j, const Snapshot &snap) {
  j = json{{"origin", snap.origin},
           {"ts", snap.ts},
           {"items", snap.items},
           {"qkey", snap.qkey}};
}

void from_json(const json &j, Snapshot &snap) {
  snap.origin = j.value("origin", std::string());
  snap.ts = j.value("ts", static_cast<int64_t>(0));
  snap.qkey = j.value("qkey", std::string());

  // Peers may send "items": null for an empty capture
  auto it = j.find("items");
  if (it != j.end() && !it->is_null()) {
    snap.items = it->get<std::vector<Item>>();
  } else {
    snap.items.clear();
  }
}

// ============================================================================
// Item
// ============================================================================

Item Item::from_bytes(uint32_t fmt, const Bytes &data, std::string fmt_name,
                      std::string mime_type) {
  Item item;
  item.fmt = fmt;
  item.payload = base64_encode(data);
  item.byte_len = data.size();
  item.fmt_name = std::move(fmt_name);
  item.mime_type = std::move(mime_type);
  return item;
}

Result<Bytes> Item::decode_payload() const { return base64_decode(payload); }

bool Item::operator==(const Item &other) const {
  return fmt == other.fmt && payload == other.payload &&
         byte_len == other.byte_len && fmt_name == other.fmt_name &&
         mime_type == other.mime_type;
}

// ============================================================================
// Snapshot
// ============================================================================

void Snapshot::stamp_quick_key() { qkey = quick_key(items); }

std::string Snapshot::to_json() const {
  json j = *this;
  return j.dump();
}

Result<Snapshot> Snapshot::from_json(const std::string &text) {
  try {
    auto j = json::parse(text);
    if (!j.is_object()) {
      return Error(ErrorCode::MalformedMessage, "snapshot is not an object");
    }
    return j.get<Snapshot>();
  } catch (const json::exception &e) {
    return Error(ErrorCode::MalformedMessage, "invalid snapshot JSON",
                 e.what());
  }
}

Result<Snapshot> Snapshot::from_json(const Bytes &data) {
  return from_json(std::string(data.begin(), data.end()));
}

// ============================================================================
// Quick Key
// ============================================================================

std::string quick_key(const std::vector<Item> &items) {
  if (items.empty()) {
    return EMPTY_QUICK_KEY;
  }

  Sha256Stream hasher;
  for (const auto &item : items) {
    hasher.update(item.payload);
  }
  Sha256Digest digest = hasher.finalize();
  return to_hex(digest.data(), QUICK_KEY_BYTES);
}

} // namespace clipsync
