#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace mostrix::util {

constexpr std::size_t kChaCha20Poly1305KeySize = 32;
constexpr std::size_t kChaCha20Poly1305NonceSize = 12;
constexpr std::size_t kChaCha20Poly1305TagSize = 16;

// RFC 8439 AEAD. The returned buffer is ciphertext || tag.
std::vector<std::uint8_t> ChaCha20Poly1305Encrypt(std::span<const std::uint8_t> key,
                                                  std::span<const std::uint8_t> nonce,
                                                  std::span<const std::uint8_t> aad,
                                                  std::span<const std::uint8_t> plaintext);

// `ciphertext` carries the trailing 16-byte tag. Returns false on tag
// mismatch; `plaintext` is left empty in that case.
bool ChaCha20Poly1305Decrypt(std::span<const std::uint8_t> key,
                             std::span<const std::uint8_t> nonce,
                             std::span<const std::uint8_t> aad,
                             std::span<const std::uint8_t> ciphertext,
                             std::vector<std::uint8_t>* plaintext);

// Unauthenticated RFC 8439 ChaCha20 keystream XOR with a zero initial block
// counter. Encryption and decryption are the same operation.
std::vector<std::uint8_t> ChaCha20Xor(std::span<const std::uint8_t> key,
                                      std::span<const std::uint8_t> nonce,
                                      std::span<const std::uint8_t> input);

}  // namespace mostrix::util
