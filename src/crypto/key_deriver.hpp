#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "crypto/keys.hpp"

namespace mostrix::crypto {

// Mostro account under the Nostr coin type (NIP-06 purpose/coin 44'/1237').
constexpr std::uint32_t kMostroAccount = 38383;

// Derives every key a client holds from one mnemonic:
//   identity   m/44'/1237'/38383'/0/0
//   trade N    m/44'/1237'/38383'/N/0   (N >= 1)
// The seed is kept in memory and wiped on destruction.
class KeyDeriver {
 public:
  // Throws std::invalid_argument for a mnemonic that fails BIP-39 validation.
  explicit KeyDeriver(const std::string& mnemonic, const std::string& passphrase = "");
  ~KeyDeriver();

  KeyDeriver(const KeyDeriver&) = delete;
  KeyDeriver& operator=(const KeyDeriver&) = delete;

  Keys DeriveIdentityKey() const;

  // Throws std::invalid_argument for index 0, which is reserved for identity.
  Keys DeriveTradeKey(std::int64_t index) const;

  // Symmetric per-peer key: x coordinate of local_secret * lift_x(remote).
  // Both sides compute the same value. Throws std::invalid_argument for a
  // remote key off the curve.
  static Keys DeriveSharedKey(const SecretKey& local_secret, const XOnlyPublicKey& remote_public);
  static std::array<std::uint8_t, 32> DeriveSharedSecret(const SecretKey& local_secret,
                                                         const XOnlyPublicKey& remote_public);

 private:
  Keys DeriveAt(std::uint32_t change_index) const;

  std::array<std::uint8_t, 64> seed_{};
};

}  // namespace mostrix::crypto
