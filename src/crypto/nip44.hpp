#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "crypto/secp256k1.hpp"

namespace mostrix::crypto {

// NIP-44 version 2 payload encryption.
using ConversationKey = std::array<std::uint8_t, 32>;
using Nip44Nonce = std::array<std::uint8_t, 32>;

constexpr std::size_t kNip44MinPlaintextSize = 1;
constexpr std::size_t kNip44MaxPlaintextSize = 65535;

// HKDF-extract(salt = "nip44-v2", ikm = ECDH x). nullopt when the remote key
// is not a curve point.
std::optional<ConversationKey> GetConversationKey(const SecretKey& secret,
                                                  const XOnlyPublicKey& remote);

std::size_t Nip44PaddedLength(std::size_t unpadded_length);

// Throws std::invalid_argument for plaintext outside 1..65535 bytes. A random
// nonce is drawn unless one is supplied.
std::string Nip44Encrypt(const ConversationKey& key, std::string_view plaintext,
                         const std::optional<Nip44Nonce>& nonce = std::nullopt);

bool Nip44Decrypt(const ConversationKey& key, std::string_view payload, std::string* plaintext,
                  std::string* error = nullptr);

// Convenience wrappers computing the conversation key on the fly.
std::string Nip44EncryptTo(const SecretKey& sender, const XOnlyPublicKey& recipient,
                           std::string_view plaintext);
bool Nip44DecryptFrom(const SecretKey& recipient, const XOnlyPublicKey& sender,
                      std::string_view payload, std::string* plaintext,
                      std::string* error = nullptr);

}  // namespace mostrix::crypto
