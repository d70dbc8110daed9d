#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "crypto/secp256k1.hpp"

namespace mostrix::crypto {

// A secp256k1 key pair with the Nostr encodings layered on top.
class Keys {
 public:
  // Throws std::invalid_argument when `secret` is zero or not below n.
  explicit Keys(const SecretKey& secret);
  ~Keys();

  Keys(const Keys&) = default;
  Keys& operator=(const Keys&) = default;

  static Keys Generate();
  // Accepts 64 hex characters or an "nsec1..." string.
  static std::optional<Keys> Parse(std::string_view text);

  const SecretKey& Secret() const { return secret_; }
  const XOnlyPublicKey& PublicKey() const { return public_key_; }

  std::string PublicKeyHex() const;
  std::string SecretHex() const;
  std::string Npub() const;
  std::string Nsec() const;

  // BIP-340 signature over a 32-byte digest with fresh auxiliary randomness.
  SchnorrSignature Sign(std::span<const std::uint8_t, 32> digest) const;

 private:
  SecretKey secret_{};
  XOnlyPublicKey public_key_{};
};

bool operator==(const Keys& a, const Keys& b);

// Accepts 64 hex characters or an "npub1..." string; the key must lift to a
// curve point.
std::optional<XOnlyPublicKey> ParsePublicKey(std::string_view text);
std::string PublicKeyHex(const XOnlyPublicKey& key);
std::string EncodeNpub(const XOnlyPublicKey& key);
std::string EncodeNsec(const SecretKey& key);

}  // namespace mostrix::crypto
