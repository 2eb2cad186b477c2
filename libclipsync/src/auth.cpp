/**
 * @file auth.cpp
 * @brief Identity and auth token implementation
 */

#include "clipsync/auth.h"
#include "clipsync/security.h"
#include <nlohmann/json.hpp>

namespace clipsync {

using json = nlohmann::json;

// ============================================================================
// Shared Key
// ============================================================================

Result<uint64_t> parse_shared_key(const std::string &key_hex) {
  auto bytes = from_hex(key_hex);
  if (!bytes || bytes->size() != SHARED_KEY_SIZE) {
    return Error(ErrorCode::InvalidKey,
                 "key must be 16 hex chars (8 bytes)");
  }

  uint64_t value = 0;
  for (Byte b : *bytes) {
    value = (value << 8) | b;
  }
  return value;
}

// ============================================================================
// AuthToken
// ============================================================================

AuthToken AuthToken::make(uint64_t key, int64_t ts) {
  AuthToken token;
  token.ts = ts;
  token.ts_enc = static_cast<int64_t>(static_cast<uint64_t>(ts) ^ key);
  return token;
}

std::string AuthToken::encode() const {
  json j;
  j["ts"] = ts;
  j["ts_enc"] = ts_enc;
  return base64_encode(j.dump());
}

Result<AuthToken> AuthToken::decode(const std::string &token) {
  auto raw = base64_decode(token);
  if (raw.is_error()) {
    return Error(ErrorCode::InvalidToken, "token is not base64");
  }

  try {
    auto j = json::parse(raw.value().begin(), raw.value().end());
    AuthToken out;
    out.ts = j.at("ts").get<int64_t>();
    out.ts_enc = j.at("ts_enc").get<int64_t>();
    return out;
  } catch (const json::exception &e) {
    return Error(ErrorCode::InvalidToken, "token is not valid JSON", e.what());
  }
}

bool AuthToken::matches(uint64_t key) const {
  return (static_cast<uint64_t>(ts_enc) ^ key) == static_cast<uint64_t>(ts);
}

Result<void> verify_token(const std::string &token, uint64_t key, int64_t now,
                          int64_t max_skew) {
  auto decoded = AuthToken::decode(token);
  CLIPSYNC_TRY(decoded);

  const AuthToken &t = decoded.value();
  if (!t.matches(key)) {
    return Error(ErrorCode::AuthenticationFailed, "token key mismatch");
  }

  int64_t skew = now > t.ts ? now - t.ts : t.ts - now;
  if (skew > max_skew) {
    return Error(ErrorCode::AuthenticationFailed, "token outside skew window",
                 std::to_string(skew) + "s");
  }

  return Result<void>::ok();
}

// ============================================================================
// Identity
// ============================================================================

Result<Identity> Identity::create(const std::string &client_id,
                                  const std::string &key_hex) {
  auto key = parse_shared_key(key_hex);
  CLIPSYNC_TRY(key);

  std::string id = client_id.empty() ? generate_client_id() : client_id;
  return Identity(std::move(id), key.value());
}

std::string Identity::build_auth_token() const {
  return build_auth_token(unix_now());
}

std::string Identity::build_auth_token(int64_t ts) const {
  return AuthToken::make(key_, ts).encode();
}

} // namespace clipsync
