#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "crypto/hash.hpp"
#include "crypto/keys.hpp"
#include "crypto/nip44.hpp"
#include "crypto/secp256k1.hpp"
#include "util/hex.hpp"

using namespace mostrix;

namespace {

crypto::SecretKey SmallSecret(std::uint8_t value) {
  crypto::SecretKey key{};
  key[31] = value;
  return key;
}

template <std::size_t N>
std::array<std::uint8_t, N> HexArray(const std::string& hex) {
  std::vector<std::uint8_t> bytes;
  if (!util::HexDecode(hex, &bytes) || bytes.size() != N) {
    throw std::runtime_error("bad test vector hex: " + hex);
  }
  std::array<std::uint8_t, N> out{};
  std::copy(bytes.begin(), bytes.end(), out.begin());
  return out;
}

struct Bip340Vector {
  std::string secret;
  std::string pubkey;
  std::string aux;
  std::string message;
  std::string signature;
};

bool TestBip340Vectors() {
  // BIP-340 test vectors 0 and 1.
  const Bip340Vector vectors[] = {
      {"0000000000000000000000000000000000000000000000000000000000000003",
       "f9308a019258c31049344f85f89d5229b531c845836f99b08601f113bce036f9",
       "0000000000000000000000000000000000000000000000000000000000000000",
       "0000000000000000000000000000000000000000000000000000000000000000",
       "e907831f80848d1069a5371b402410364bdf1c5f8307b0084c55f1ce2dca8215"
       "25f66a4a85ea8b71e482a74f382d2ce5ebeee8fdb2172f477df4900d310536c0"},
      {"b7e151628aed2a6abf7158809cf4f3c762e7160f38b4da56a784d9045190cfef",
       "dff1d77f2a671c5f36183726db2341be58feae1da2deced843240f7b502ba659",
       "0000000000000000000000000000000000000000000000000000000000000001",
       "243f6a8885a308d313198a2e03707344a4093822299f31d0082efa98ec4e6c89",
       "6896bd60eeae296db48a229ff71dfe071bde413e6d43f917dc8dcf8c78de3341"
       "8906d11ac976abccb20b091292bff4ea897efcb639ea871cfa95f6de339e4b0a"},
  };
  for (const auto& vector : vectors) {
    const auto secret = HexArray<32>(vector.secret);
    const auto pub = crypto::XOnlyPublicKeyFromSecret(secret);
    if (crypto::PublicKeyHex(pub) != vector.pubkey) {
      std::cerr << "BIP-340 public key mismatch: " << crypto::PublicKeyHex(pub) << "\n";
      return false;
    }
    const auto aux = HexArray<32>(vector.aux);
    const auto message = HexArray<32>(vector.message);
    const auto signature = crypto::SchnorrSign(secret, message, aux);
    if (util::HexEncode(signature) != vector.signature) {
      std::cerr << "BIP-340 signature mismatch: " << util::HexEncode(signature) << "\n";
      return false;
    }
    if (!crypto::SchnorrVerify(pub, message, signature)) {
      std::cerr << "BIP-340 vector does not verify\n";
      return false;
    }
    auto tampered = signature;
    tampered[63] ^= 0x01;
    if (crypto::SchnorrVerify(pub, message, tampered)) {
      std::cerr << "tampered signature verified\n";
      return false;
    }
  }
  return true;
}

bool TestKeysSign() {
  const auto keys = crypto::Keys::Generate();
  const auto digest = crypto::Sha256(crypto::AsBytes("mostro order"));
  const auto signature = keys.Sign(digest);
  if (!crypto::SchnorrVerify(keys.PublicKey(), digest, signature)) {
    std::cerr << "signature from Keys::Sign did not verify\n";
    return false;
  }
  const auto other = crypto::Keys::Generate();
  if (crypto::SchnorrVerify(other.PublicKey(), digest, signature)) {
    std::cerr << "signature verified under another key\n";
    return false;
  }
  return true;
}

bool TestNip44Vector() {
  const auto key =
      crypto::GetConversationKey(SmallSecret(1), crypto::XOnlyPublicKeyFromSecret(SmallSecret(2)));
  if (!key || util::HexEncode(*key) !=
                  "c41c775356fd92eadc63ff5a0dc1da211b268cbea22316767095b2871ea1412d") {
    std::cerr << "NIP-44 conversation key mismatch\n";
    return false;
  }
  crypto::Nip44Nonce nonce{};
  nonce[31] = 0x01;
  const auto payload = crypto::Nip44Encrypt(*key, "a", nonce);
  const std::string expected =
      "AgAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAABee0G5VSK0/9YypIObAtDKfYEAjD35uVkHyB0F4DwrcNaCXlC"
      "WZKaArsGrY6M9wnuTMxWfp1RTN9Xga8no+kF5Vsb";
  if (payload != expected) {
    std::cerr << "NIP-44 payload mismatch: " << payload << "\n";
    return false;
  }
  std::string plaintext;
  std::string error;
  if (!crypto::Nip44Decrypt(*key, payload, &plaintext, &error) || plaintext != "a") {
    std::cerr << "NIP-44 decrypt of vector failed: " << error << "\n";
    return false;
  }

  const auto reverse =
      crypto::GetConversationKey(SmallSecret(2), crypto::XOnlyPublicKeyFromSecret(SmallSecret(1)));
  if (!reverse || *reverse != *key) {
    std::cerr << "conversation key is not symmetric\n";
    return false;
  }
  return true;
}

bool TestNip44Failures() {
  const auto alice = crypto::Keys::Generate();
  const auto bob = crypto::Keys::Generate();
  const auto mallory = crypto::Keys::Generate();
  const auto payload =
      crypto::Nip44EncryptTo(alice.Secret(), bob.PublicKey(), "{\"order\":{\"version\":1}}");

  std::string plaintext;
  std::string error;
  if (!crypto::Nip44DecryptFrom(bob.Secret(), alice.PublicKey(), payload, &plaintext, &error)) {
    std::cerr << "NIP-44 round trip failed: " << error << "\n";
    return false;
  }
  if (crypto::Nip44DecryptFrom(mallory.Secret(), alice.PublicKey(), payload, &plaintext, &error)) {
    std::cerr << "NIP-44 decrypted with the wrong key\n";
    return false;
  }
  auto corrupted = payload;
  corrupted[corrupted.size() / 2] = corrupted[corrupted.size() / 2] == 'A' ? 'B' : 'A';
  if (crypto::Nip44DecryptFrom(bob.Secret(), alice.PublicKey(), corrupted, &plaintext, &error)) {
    std::cerr << "corrupted NIP-44 payload decrypted\n";
    return false;
  }
  if (crypto::Nip44DecryptFrom(bob.Secret(), alice.PublicKey(), "#not base64", &plaintext,
                               &error)) {
    std::cerr << "malformed NIP-44 payload decrypted\n";
    return false;
  }

  if (crypto::Nip44PaddedLength(1) != 32 || crypto::Nip44PaddedLength(32) != 32 ||
      crypto::Nip44PaddedLength(33) != 64 || crypto::Nip44PaddedLength(257) != 320) {
    std::cerr << "unexpected NIP-44 padding\n";
    return false;
  }

  bool threw = false;
  try {
    crypto::Nip44EncryptTo(alice.Secret(), bob.PublicKey(), "");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw) {
    std::cerr << "empty NIP-44 plaintext accepted\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!TestBip340Vectors() || !TestKeysSign() || !TestNip44Vector() || !TestNip44Failures()) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "nip44_schnorr_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  std::cout << "nip44_schnorr_tests: OK\n";
  return EXIT_SUCCESS;
}
