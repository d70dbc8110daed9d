#include "util/aead.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace mostrix::util {

namespace {

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

CipherCtxPtr NewCipherCtx() {
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    throw std::runtime_error("EVP_CIPHER_CTX_new failed");
  }
  return ctx;
}

void CheckKeyAndNonce(std::span<const std::uint8_t> key, std::span<const std::uint8_t> nonce) {
  if (key.size() != kChaCha20Poly1305KeySize) {
    throw std::invalid_argument("chacha20 key must be 32 bytes");
  }
  if (nonce.size() != kChaCha20Poly1305NonceSize) {
    throw std::invalid_argument("chacha20 nonce must be 12 bytes");
  }
}

}  // namespace

std::vector<std::uint8_t> ChaCha20Poly1305Encrypt(std::span<const std::uint8_t> key,
                                                  std::span<const std::uint8_t> nonce,
                                                  std::span<const std::uint8_t> aad,
                                                  std::span<const std::uint8_t> plaintext) {
  CheckKeyAndNonce(key, nonce);
  auto ctx = NewCipherCtx();
  if (EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN,
                          static_cast<int>(nonce.size()), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    throw std::runtime_error("chacha20-poly1305 init failed");
  }
  int len = 0;
  if (!aad.empty() &&
      EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
    throw std::runtime_error("chacha20-poly1305 aad failed");
  }
  std::vector<std::uint8_t> out(plaintext.size() + kChaCha20Poly1305TagSize);
  int written = 0;
  if (!plaintext.empty()) {
    if (EVP_EncryptUpdate(ctx.get(), out.data(), &len, plaintext.data(),
                          static_cast<int>(plaintext.size())) != 1) {
      throw std::runtime_error("chacha20-poly1305 encrypt failed");
    }
    written = len;
  }
  if (EVP_EncryptFinal_ex(ctx.get(), out.data() + written, &len) != 1) {
    throw std::runtime_error("chacha20-poly1305 finalize failed");
  }
  written += len;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG,
                          static_cast<int>(kChaCha20Poly1305TagSize),
                          out.data() + written) != 1) {
    throw std::runtime_error("chacha20-poly1305 tag failed");
  }
  out.resize(static_cast<std::size_t>(written) + kChaCha20Poly1305TagSize);
  return out;
}

bool ChaCha20Poly1305Decrypt(std::span<const std::uint8_t> key,
                             std::span<const std::uint8_t> nonce,
                             std::span<const std::uint8_t> aad,
                             std::span<const std::uint8_t> ciphertext,
                             std::vector<std::uint8_t>* plaintext) {
  plaintext->clear();
  if (key.size() != kChaCha20Poly1305KeySize || nonce.size() != kChaCha20Poly1305NonceSize ||
      ciphertext.size() < kChaCha20Poly1305TagSize) {
    return false;
  }
  const std::size_t body_len = ciphertext.size() - kChaCha20Poly1305TagSize;
  auto ctx = NewCipherCtx();
  if (EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN,
                          static_cast<int>(nonce.size()), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    return false;
  }
  int len = 0;
  if (!aad.empty() &&
      EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
    return false;
  }
  std::vector<std::uint8_t> out(body_len + kChaCha20Poly1305TagSize);
  int written = 0;
  if (body_len > 0) {
    if (EVP_DecryptUpdate(ctx.get(), out.data(), &len, ciphertext.data(),
                          static_cast<int>(body_len)) != 1) {
      return false;
    }
    written = len;
  }
  std::uint8_t tag[kChaCha20Poly1305TagSize];
  std::copy(ciphertext.begin() + static_cast<std::ptrdiff_t>(body_len), ciphertext.end(), tag);
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG,
                          static_cast<int>(kChaCha20Poly1305TagSize), tag) != 1) {
    return false;
  }
  if (EVP_DecryptFinal_ex(ctx.get(), out.data() + written, &len) != 1) {
    return false;
  }
  written += len;
  out.resize(static_cast<std::size_t>(written));
  *plaintext = std::move(out);
  return true;
}

std::vector<std::uint8_t> ChaCha20Xor(std::span<const std::uint8_t> key,
                                      std::span<const std::uint8_t> nonce,
                                      std::span<const std::uint8_t> input) {
  CheckKeyAndNonce(key, nonce);
  // OpenSSL takes a 16-byte IV: 32-bit little-endian counter then the nonce.
  std::uint8_t iv[16] = {0};
  std::copy(nonce.begin(), nonce.end(), iv + 4);
  auto ctx = NewCipherCtx();
  if (EVP_EncryptInit_ex(ctx.get(), EVP_chacha20(), nullptr, key.data(), iv) != 1) {
    throw std::runtime_error("chacha20 init failed");
  }
  std::vector<std::uint8_t> out(input.size());
  int len = 0;
  if (!input.empty() && EVP_EncryptUpdate(ctx.get(), out.data(), &len, input.data(),
                                          static_cast<int>(input.size())) != 1) {
    throw std::runtime_error("chacha20 update failed");
  }
  return out;
}

}  // namespace mostrix::util
