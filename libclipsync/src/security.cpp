/**
 * @file security.cpp
 * @brief libsodium wrapper implementation for clipsync
 */

#include "clipsync/security.h"
#include <atomic>
#include <memory>
#include <sodium.h>

namespace clipsync {

namespace {
std::atomic<bool> g_initialized{false};

void ensure_initialized() {
  if (!g_initialized.load()) {
    // On failure randombytes stays on its fallback implementation
    (void)security_init();
  }
}
} // namespace

// ============================================================================
// Initialization
// ============================================================================

Result<void> security_init() {
  if (g_initialized.load()) {
    return Result<void>::ok();
  }

  if (sodium_init() < 0) {
    return Error(ErrorCode::SecurityError, "Failed to initialize libsodium");
  }

  g_initialized.store(true);
  return Result<void>::ok();
}

// ============================================================================
// SHA-256
// ============================================================================

Sha256Digest sha256(const Byte *data, size_t length) {
  ensure_initialized();

  Sha256Digest out;
  crypto_hash_sha256(out.data(), data, length);
  return out;
}

class Sha256Stream::Impl {
public:
  crypto_hash_sha256_state state;
};

Sha256Stream::Sha256Stream() : impl_(std::make_unique<Impl>()) {
  ensure_initialized();
  crypto_hash_sha256_init(&impl_->state);
}

Sha256Stream::~Sha256Stream() = default;

void Sha256Stream::update(const std::string &data) {
  update(reinterpret_cast<const Byte *>(data.data()), data.size());
}

void Sha256Stream::update(const Byte *data, size_t length) {
  crypto_hash_sha256_update(&impl_->state, data, length);
}

Sha256Digest Sha256Stream::finalize() {
  Sha256Digest out;
  crypto_hash_sha256_final(&impl_->state, out.data());
  return out;
}

// ============================================================================
// Base64
// ============================================================================

std::string base64_encode(const Byte *data, size_t length) {
  ensure_initialized();

  const size_t encoded_len =
      sodium_base64_ENCODED_LEN(length, sodium_base64_VARIANT_ORIGINAL);
  std::string out(encoded_len, '\0');
  sodium_bin2base64(&out[0], encoded_len, data, length,
                    sodium_base64_VARIANT_ORIGINAL);

  // encoded_len counts the terminating NUL
  out.resize(encoded_len - 1);
  return out;
}

std::string base64_encode(const Bytes &data) {
  return base64_encode(data.data(), data.size());
}

std::string base64_encode(const std::string &data) {
  return base64_encode(reinterpret_cast<const Byte *>(data.data()),
                       data.size());
}

Result<Bytes> base64_decode(const std::string &encoded) {
  ensure_initialized();

  if (encoded.empty()) {
    return Bytes{};
  }

  Bytes out(encoded.size() / 4 * 3 + 3);
  size_t out_len = 0;
  const char *end = nullptr;
  if (sodium_base642bin(out.data(), out.size(), encoded.data(), encoded.size(),
                        nullptr, &out_len, &end,
                        sodium_base64_VARIANT_ORIGINAL) != 0 ||
      end != encoded.data() + encoded.size()) {
    return Error(ErrorCode::MalformedMessage, "Invalid base64");
  }

  out.resize(out_len);
  return out;
}

// ============================================================================
// Random Number Generation
// ============================================================================

Bytes random_bytes(size_t count) {
  ensure_initialized();

  Bytes result(count);
  randombytes_buf(result.data(), count);
  return result;
}

double random_unit() {
  ensure_initialized();

  // 53 random bits mapped onto [0, 1)
  uint64_t bits = 0;
  randombytes_buf(&bits, sizeof(bits));
  return static_cast<double>(bits >> 11) * (1.0 / 9007199254740992.0);
}

} // namespace clipsync
