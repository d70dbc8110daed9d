#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>

#include "crypto/bip32.hpp"
#include "crypto/key_deriver.hpp"
#include "crypto/keys.hpp"
#include "crypto/mnemonic.hpp"
#include "util/hex.hpp"

using namespace mostrix;

namespace {

const std::string kAbandonMnemonic =
    "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon about";

crypto::SecretKey SecretFromHex(const std::string& hex) {
  crypto::SecretKey key{};
  if (!util::HexDecode32(hex, &key)) {
    throw std::runtime_error("bad secret hex in test: " + hex);
  }
  return key;
}

crypto::SecretKey SmallSecret(std::uint8_t value) {
  crypto::SecretKey key{};
  key[31] = value;
  return key;
}

bool TestMnemonicSeed() {
  std::string error;
  if (!crypto::ValidateMnemonic(kAbandonMnemonic, &error)) {
    std::cerr << "abandon mnemonic rejected: " << error << "\n";
    return false;
  }
  const auto seed = crypto::MnemonicSeedFromSentence(kAbandonMnemonic, "");
  const std::string expected =
      "5eb00bbddcf069084889a8ab9155568165f5c453ccb85e70811aaed6f6da5fc19a5ac40b389cd370d086206dec"
      "8aa6c43daea6690f20ad3d8d48b2d2ce9e38e4";
  if (util::HexEncode(seed) != expected) {
    std::cerr << "BIP-39 seed mismatch: " << util::HexEncode(seed) << "\n";
    return false;
  }
  const std::string bad_checksum =
      "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon "
      "abandon";
  if (crypto::ValidateMnemonic(bad_checksum, &error)) {
    std::cerr << "mnemonic with bad checksum accepted\n";
    return false;
  }
  if (crypto::ValidateMnemonic("abandon abandon notaword", &error)) {
    std::cerr << "mnemonic with unknown word accepted\n";
    return false;
  }
  const auto generated = crypto::GenerateMnemonic();
  if (!crypto::ValidateMnemonic(generated, &error)) {
    std::cerr << "generated mnemonic does not validate: " << error << "\n";
    return false;
  }
  return true;
}

bool TestNip06Vector() {
  const std::string mnemonic =
      "leader monkey parrot ring guide accident before fence cannon height naive bean";
  const auto seed = crypto::MnemonicSeedFromSentence(mnemonic, "");
  const auto node = crypto::DerivePath(seed, "m/44'/1237'/0'/0/0");
  const crypto::Keys keys(node.key);
  if (keys.SecretHex() != "7f7ff03d123792d6ac594bfa67bf6d0c0ab55b6b1fdb6249303fe861f1ccba9a" ||
      keys.PublicKeyHex() != "17162c921dc4d2518f9a101db33695df1afb56ab82f5ff3e5da6eec3ca5cd917") {
    std::cerr << "NIP-06 vector mismatch: " << keys.SecretHex() << "\n";
    return false;
  }
  return true;
}

bool TestMostroPath() {
  const crypto::KeyDeriver deriver(kAbandonMnemonic);
  const auto identity = deriver.DeriveIdentityKey();
  if (identity.SecretHex() != "5b3aa1a51bcc7758ef9025bfb249d52a9fcdb88a63eb9d7a7595c95f89ed32ff" ||
      identity.PublicKeyHex() !=
          "faa27ea81c85e00798598b46d1f36c1700221a1242b563861fa536dc2314f1df") {
    std::cerr << "identity key mismatch: " << identity.PublicKeyHex() << "\n";
    return false;
  }

  const auto trade1 = deriver.DeriveTradeKey(1);
  const auto trade2 = deriver.DeriveTradeKey(2);
  if (trade1.SecretHex() != "7000d7e992e5874c7d647c6d363757ea73bdaac1cc47dc78287d47294951666d" ||
      trade1.PublicKeyHex() != "687ccf003b049be5f59a099350465a227b64c25425bacdfe42d953b408f4265a") {
    std::cerr << "trade key 1 mismatch: " << trade1.PublicKeyHex() << "\n";
    return false;
  }
  if (trade2.SecretHex() != "18f78ca8f6beef4e4c165b4b7520808c5127f907cb641f496dd15acb3f942683" ||
      trade2.PublicKeyHex() != "a6ae44ed9357257a65070bffeb4752d619e9becd8e942521302f472a714a3d00") {
    std::cerr << "trade key 2 mismatch: " << trade2.PublicKeyHex() << "\n";
    return false;
  }

  // Same (seed, index) gives the same key, also from a fresh deriver.
  const crypto::KeyDeriver again(kAbandonMnemonic);
  if (!(again.DeriveTradeKey(1) == trade1) || !(deriver.DeriveTradeKey(2) == trade2)) {
    std::cerr << "trade key derivation is not deterministic\n";
    return false;
  }

  std::set<std::string> seen{identity.PublicKeyHex()};
  for (std::int64_t index = 1; index <= 16; ++index) {
    if (!seen.insert(deriver.DeriveTradeKey(index).PublicKeyHex()).second) {
      std::cerr << "trade key " << index << " collides with an earlier key\n";
      return false;
    }
  }

  bool threw = false;
  try {
    deriver.DeriveTradeKey(0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw) {
    std::cerr << "index 0 must be reserved for the identity key\n";
    return false;
  }

  // A passphrase changes every derived key.
  const crypto::KeyDeriver with_passphrase(kAbandonMnemonic, "TREZOR");
  if (with_passphrase.DeriveTradeKey(1) == trade1) {
    std::cerr << "passphrase did not change the derived key\n";
    return false;
  }

  threw = false;
  try {
    crypto::KeyDeriver broken("abandon abandon abandon");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw) {
    std::cerr << "malformed mnemonic accepted\n";
    return false;
  }
  return true;
}

bool TestSharedKey() {
  const auto one = SmallSecret(1);
  const auto two = SmallSecret(2);
  const auto pub_one = crypto::XOnlyPublicKeyFromSecret(one);
  const auto pub_two = crypto::XOnlyPublicKeyFromSecret(two);

  const auto shared = crypto::KeyDeriver::DeriveSharedKey(one, pub_two);
  if (shared.SecretHex() != "c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5") {
    std::cerr << "shared key vector mismatch: " << shared.SecretHex() << "\n";
    return false;
  }
  const auto reverse = crypto::KeyDeriver::DeriveSharedKey(two, pub_one);
  if (!(reverse == shared)) {
    std::cerr << "shared key is not symmetric\n";
    return false;
  }

  const crypto::KeyDeriver deriver(kAbandonMnemonic);
  const auto admin = deriver.DeriveIdentityKey();
  const auto buyer = deriver.DeriveTradeKey(1);
  const auto seller = deriver.DeriveTradeKey(2);
  const auto with_buyer = crypto::KeyDeriver::DeriveSharedKey(admin.Secret(), buyer.PublicKey());
  const auto with_seller = crypto::KeyDeriver::DeriveSharedKey(admin.Secret(), seller.PublicKey());
  if (with_buyer == with_seller) {
    std::cerr << "distinct parties produced the same shared key\n";
    return false;
  }
  const auto buyer_side = crypto::KeyDeriver::DeriveSharedKey(buyer.Secret(), admin.PublicKey());
  if (!(buyer_side == with_buyer)) {
    std::cerr << "buyer and admin disagree on the shared key\n";
    return false;
  }

  crypto::XOnlyPublicKey off_curve{};
  off_curve.fill(0xff);
  bool threw = false;
  try {
    crypto::KeyDeriver::DeriveSharedKey(admin.Secret(), off_curve);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw) {
    std::cerr << "off-curve counterparty key accepted\n";
    return false;
  }
  return true;
}

bool TestNostrEncodings() {
  const auto pub = crypto::ParsePublicKey(
      "npub10elfcs4fr0l0r8af98jlmgdh9c8tcxjvz9qkw038js35mp4dma8qzvjptg");
  if (!pub || crypto::PublicKeyHex(*pub) !=
                  "7e7e9c42a91bfef19fa929e5fda1b72e0ebc1a4c1141673e2794234d86addf4e") {
    std::cerr << "npub decoding mismatch\n";
    return false;
  }
  if (crypto::EncodeNpub(*pub) !=
      "npub10elfcs4fr0l0r8af98jlmgdh9c8tcxjvz9qkw038js35mp4dma8qzvjptg") {
    std::cerr << "npub encoding mismatch\n";
    return false;
  }
  const auto keys =
      crypto::Keys::Parse("nsec1vl029mgpspedva04g90vltkh6fvh240zqtv9k0t9af8935ke9laqsnlfe5");
  if (!keys ||
      keys->SecretHex() != "67dea2ed018072d675f5415ecfaed7d2597555e202d85b3d65ea4e58d2d92ffa") {
    std::cerr << "nsec decoding mismatch\n";
    return false;
  }
  if (crypto::Keys::Parse(keys->SecretHex())->Nsec() != keys->Nsec()) {
    std::cerr << "hex and nsec forms disagree\n";
    return false;
  }
  if (crypto::ParsePublicKey("npub10elfcs4fr0l0r8af98jlmgdh9c8tcxjvz9qkw038js35mp4dma8qzvjpth")) {
    std::cerr << "npub with bad checksum accepted\n";
    return false;
  }
  if (crypto::Keys::Parse(std::string(64, '0'))) {
    std::cerr << "zero secret accepted\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!TestMnemonicSeed() || !TestNip06Vector() || !TestMostroPath() || !TestSharedKey() ||
        !TestNostrEncodings()) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "key_deriver_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  std::cout << "key_deriver_tests: OK\n";
  return EXIT_SUCCESS;
}
