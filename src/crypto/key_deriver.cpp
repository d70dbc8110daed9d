#include "crypto/key_deriver.hpp"

#include <limits>
#include <stdexcept>

#include "crypto/bip32.hpp"
#include "crypto/mnemonic.hpp"
#include "util/secure_wipe.hpp"

namespace mostrix::crypto {

KeyDeriver::KeyDeriver(const std::string& mnemonic, const std::string& passphrase) {
  std::string error;
  if (!ValidateMnemonic(mnemonic, &error)) {
    throw std::invalid_argument("invalid mnemonic: " + error);
  }
  seed_ = MnemonicSeedFromSentence(mnemonic, passphrase);
}

KeyDeriver::~KeyDeriver() { util::SecureWipe(seed_); }

Keys KeyDeriver::DeriveAt(std::uint32_t change_index) const {
  const std::string path =
      "m/44'/1237'/" + std::to_string(kMostroAccount) + "'/" + std::to_string(change_index) + "/0";
  auto node = DerivePath(seed_, path);
  Keys keys(node.key);
  util::SecureWipe(node.key);
  util::SecureWipe(node.chain_code);
  return keys;
}

Keys KeyDeriver::DeriveIdentityKey() const { return DeriveAt(0); }

Keys KeyDeriver::DeriveTradeKey(std::int64_t index) const {
  if (index < 1 || index >= static_cast<std::int64_t>(kHardenedIndex)) {
    throw std::invalid_argument("trade index must be in [1, 2^31)");
  }
  return DeriveAt(static_cast<std::uint32_t>(index));
}

std::array<std::uint8_t, 32> KeyDeriver::DeriveSharedSecret(const SecretKey& local_secret,
                                                            const XOnlyPublicKey& remote_public) {
  auto shared_x = EcdhXCoordinate(local_secret, remote_public);
  if (!shared_x) {
    throw std::invalid_argument("invalid counterparty public key");
  }
  return *shared_x;
}

Keys KeyDeriver::DeriveSharedKey(const SecretKey& local_secret,
                                 const XOnlyPublicKey& remote_public) {
  auto shared_x = DeriveSharedSecret(local_secret, remote_public);
  Keys keys(shared_x);
  util::SecureWipe(shared_x);
  return keys;
}

}  // namespace mostrix::crypto
