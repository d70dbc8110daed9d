#include "crypto/hash.hpp"

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/kdf.h>
#include <openssl/sha.h>

namespace mostrix::crypto {

namespace {

struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

PkeyCtxPtr NewHkdfContext(int mode) {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
  if (!ctx || EVP_PKEY_derive_init(ctx.get()) <= 0 ||
      EVP_PKEY_CTX_set_hkdf_mode(ctx.get(), mode) <= 0 ||
      EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) <= 0) {
    throw std::runtime_error("HKDF context setup failed");
  }
  return ctx;
}

}  // namespace

Sha256Hash Sha256(std::span<const std::uint8_t> data) {
  Sha256Hash out{};
  SHA256(data.data(), data.size(), out.data());
  return out;
}

Sha256Hash TaggedHash(std::string_view tag, std::span<const std::uint8_t> data) {
  const auto tag_hash = Sha256(AsBytes(tag));
  std::vector<std::uint8_t> buffer;
  buffer.reserve(tag_hash.size() * 2 + data.size());
  buffer.insert(buffer.end(), tag_hash.begin(), tag_hash.end());
  buffer.insert(buffer.end(), tag_hash.begin(), tag_hash.end());
  buffer.insert(buffer.end(), data.begin(), data.end());
  return Sha256(buffer);
}

Sha256Hash HmacSha256(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data) {
  Sha256Hash out{};
  unsigned int len = 0;
  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), data.data(), data.size(),
           out.data(), &len) == nullptr ||
      len != out.size()) {
    throw std::runtime_error("HMAC-SHA256 failed");
  }
  return out;
}

Sha512Hash HmacSha512(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data) {
  Sha512Hash out{};
  unsigned int len = 0;
  if (HMAC(EVP_sha512(), key.data(), static_cast<int>(key.size()), data.data(), data.size(),
           out.data(), &len) == nullptr ||
      len != out.size()) {
    throw std::runtime_error("HMAC-SHA512 failed");
  }
  return out;
}

Sha256Hash HkdfExtractSha256(std::span<const std::uint8_t> salt,
                             std::span<const std::uint8_t> ikm) {
  auto ctx = NewHkdfContext(EVP_PKEY_HKDEF_MODE_EXTRACT_ONLY);
  if (EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), salt.data(), static_cast<int>(salt.size())) <= 0 ||
      EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), ikm.data(), static_cast<int>(ikm.size())) <= 0) {
    throw std::runtime_error("HKDF extract setup failed");
  }
  Sha256Hash prk{};
  std::size_t len = prk.size();
  if (EVP_PKEY_derive(ctx.get(), prk.data(), &len) <= 0 || len != prk.size()) {
    throw std::runtime_error("HKDF extract failed");
  }
  return prk;
}

std::vector<std::uint8_t> HkdfExpandSha256(std::span<const std::uint8_t> prk,
                                           std::span<const std::uint8_t> info,
                                           std::size_t length) {
  auto ctx = NewHkdfContext(EVP_PKEY_HKDEF_MODE_EXPAND_ONLY);
  if (EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), prk.data(), static_cast<int>(prk.size())) <= 0 ||
      EVP_PKEY_CTX_add1_hkdf_info(ctx.get(), info.data(), static_cast<int>(info.size())) <= 0) {
    throw std::runtime_error("HKDF expand setup failed");
  }
  std::vector<std::uint8_t> out(length);
  std::size_t len = out.size();
  if (EVP_PKEY_derive(ctx.get(), out.data(), &len) <= 0 || len != length) {
    throw std::runtime_error("HKDF expand failed");
  }
  return out;
}

}  // namespace mostrix::crypto
