#include <array>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "util/aead.hpp"
#include "util/atomic_file.hpp"
#include "util/base64.hpp"
#include "util/csprng.hpp"
#include "util/hex.hpp"
#include "util/pbkdf2.hpp"
#include "util/secure_wipe.hpp"
#include "util/time.hpp"

using namespace mostrix;

namespace {

std::filesystem::path MakeTempPath(const std::string& name) {
  const auto suffix = static_cast<std::uint64_t>(std::random_device{}());
  return std::filesystem::temp_directory_path() /
         ("mostrix_encoding_tests_" + std::to_string(suffix) + "_" + name);
}

std::vector<std::uint8_t> Bytes(const std::string& text) {
  return std::vector<std::uint8_t>(text.begin(), text.end());
}

bool TestHex() {
  const std::vector<std::uint8_t> data{0x00, 0x01, 0xab, 0xff};
  if (util::HexEncode(data) != "0001abff") {
    std::cerr << "unexpected hex encoding\n";
    return false;
  }
  std::vector<std::uint8_t> decoded;
  if (!util::HexDecode("0001ABff", &decoded) || decoded != data) {
    std::cerr << "mixed-case hex did not decode\n";
    return false;
  }
  if (util::HexDecode("abc", &decoded) || util::HexDecode("zz", &decoded)) {
    std::cerr << "malformed hex accepted\n";
    return false;
  }
  std::array<std::uint8_t, 32> key{};
  if (util::HexDecode32(std::string(62, 'a'), &key)) {
    std::cerr << "HexDecode32 accepted 31 bytes\n";
    return false;
  }
  if (!util::HexDecode32(std::string(64, 'f'), &key) || key[31] != 0xff) {
    std::cerr << "HexDecode32 rejected 32 bytes\n";
    return false;
  }
  return true;
}

bool TestBase64() {
  const std::vector<std::pair<std::string, std::string>> vectors = {
      {"", ""},         {"f", "Zg=="},        {"fo", "Zm8="},         {"foo", "Zm9v"},
      {"foob", "Zm9vYg=="}, {"fooba", "Zm9vYmE="}, {"foobar", "Zm9vYmFy"},
  };
  for (const auto& [plain, encoded] : vectors) {
    if (util::Base64Encode(Bytes(plain)) != encoded) {
      std::cerr << "base64 encode mismatch for '" << plain << "'\n";
      return false;
    }
    std::vector<std::uint8_t> decoded;
    if (!util::Base64Decode(encoded, &decoded) || decoded != Bytes(plain)) {
      std::cerr << "base64 decode mismatch for '" << encoded << "'\n";
      return false;
    }
  }
  std::vector<std::uint8_t> decoded;
  if (util::Base64Decode("Zg==Zg", &decoded)) {
    std::cerr << "data after padding accepted\n";
    return false;
  }
  if (util::Base64Decode("Z$==", &decoded)) {
    std::cerr << "invalid base64 character accepted\n";
    return false;
  }
  // The block decoder reads '=' as a zero digit, so misplaced padding must be
  // caught before it.
  for (const std::string bad : {"Zg==Zg==", "Z=g=", "Zg=A", "Zg", "Zm9v\n", " Zm9v", "Zm9-"}) {
    if (util::Base64Decode(bad, &decoded)) {
      std::cerr << "malformed base64 accepted: '" << bad << "'\n";
      return false;
    }
  }
  if (!decoded.empty()) {
    std::cerr << "rejected input left output behind\n";
    return false;
  }
  const std::vector<std::uint8_t> binary = {0x00, 0xff, 0x10, 0x80, 0x00};
  if (util::Base64Encode(binary) != "AP8QgAA=" || !util::Base64Decode("AP8QgAA=", &decoded) ||
      decoded != binary) {
    std::cerr << "binary data with trailing zero mismatch\n";
    return false;
  }
  return true;
}

bool TestSecureWipe() {
  std::array<std::uint8_t, 4> fixed = {1, 2, 3, 4};
  util::SecureWipe(fixed);
  if (fixed != std::array<std::uint8_t, 4>{}) {
    std::cerr << "array not zeroed\n";
    return false;
  }
  std::vector<std::uint8_t> buffer(64, 0xaa);
  util::SecureWipe(buffer);
  if (!buffer.empty() || buffer.capacity() != 0) {
    std::cerr << "vector not released after wiping\n";
    return false;
  }
  std::string word = "abandon abandon abandon abandon abandon abandon";
  util::SecureWipe(word);
  std::string empty;
  util::SecureWipe(empty);
  if (!word.empty() || !empty.empty()) {
    std::cerr << "string not cleared after wiping\n";
    return false;
  }
  return true;
}

bool TestAeadVector() {
  // RFC 8439 section 2.8.2.
  std::vector<std::uint8_t> key(32);
  for (std::size_t i = 0; i < key.size(); ++i) {
    key[i] = static_cast<std::uint8_t>(0x80 + i);
  }
  std::vector<std::uint8_t> nonce;
  std::vector<std::uint8_t> aad;
  if (!util::HexDecode("070000004041424344454647", &nonce) ||
      !util::HexDecode("50515253c0c1c2c3c4c5c6c7", &aad)) {
    return false;
  }
  const auto plaintext = Bytes(
      "Ladies and Gentlemen of the class of '99: If I could offer you only one tip for the "
      "future, sunscreen would be it.");
  const std::string expected =
      "d31a8d34648e60db7b86afbc53ef7ec2a4aded51296e08fea9e2b5a736ee62d63dbea45e8ca9671282fafb69"
      "da92728b1a71de0a9e060b2905d6a5b67ecd3b3692ddbd7f2d778b8c9803aee328091b58fab324e4fad67594"
      "5585808b4831d7bc3ff4def08e4b7a9de576d26586cec64b61161ae10b594f09e26a7e902ecbd0600691";
  const auto sealed = util::ChaCha20Poly1305Encrypt(key, nonce, aad, plaintext);
  if (util::HexEncode(sealed) != expected) {
    std::cerr << "AEAD vector mismatch: " << util::HexEncode(sealed) << "\n";
    return false;
  }
  return true;
}

bool TestAead() {
  const auto key = util::SecureRandomBytes(util::kChaCha20Poly1305KeySize);
  const auto nonce = util::SecureRandomBytes(util::kChaCha20Poly1305NonceSize);
  const auto plaintext = Bytes("attachment bytes");
  auto sealed = util::ChaCha20Poly1305Encrypt(key, nonce, {}, plaintext);
  if (sealed.size() != plaintext.size() + util::kChaCha20Poly1305TagSize) {
    std::cerr << "unexpected sealed size " << sealed.size() << "\n";
    return false;
  }
  std::vector<std::uint8_t> opened;
  if (!util::ChaCha20Poly1305Decrypt(key, nonce, {}, sealed, &opened) || opened != plaintext) {
    std::cerr << "AEAD round trip failed\n";
    return false;
  }
  sealed.back() ^= 0x01;
  opened.assign(4, 0xaa);
  if (util::ChaCha20Poly1305Decrypt(key, nonce, {}, sealed, &opened)) {
    std::cerr << "tampered tag accepted\n";
    return false;
  }
  if (!opened.empty()) {
    std::cerr << "plaintext returned after tag mismatch\n";
    return false;
  }
  const auto stream = util::ChaCha20Xor(key, nonce, plaintext);
  if (util::ChaCha20Xor(key, nonce, stream) != plaintext) {
    std::cerr << "ChaCha20 xor is not an involution\n";
    return false;
  }
  return true;
}

bool TestPbkdf2() {
  // BIP-39 seed for "abandon x11 about" with passphrase TREZOR.
  const std::string sentence =
      "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon "
      "about";
  const auto salt = Bytes("mnemonicTREZOR");
  const auto seed = util::Pbkdf2HmacSha512(sentence, salt, 2048, 64);
  const std::string expected =
      "c55257c360c07c72029aebc1b53c05ed0362ada38ead3e3e9efa3708e53495531f09a6987599d18264c1e1c92f"
      "2cf141630c7a3c4ab7c81b2f001698e7463b04";
  if (util::HexEncode(seed) != expected) {
    std::cerr << "PBKDF2 seed mismatch: " << util::HexEncode(seed) << "\n";
    return false;
  }
  return true;
}

bool TestRandom() {
  if (util::RandomU64() == util::RandomU64() && util::RandomU64() == util::RandomU64()) {
    std::cerr << "RandomU64 repeated itself\n";
    return false;
  }
  const auto uuid = util::RandomUuid();
  if (uuid.size() != 36 || uuid[8] != '-' || uuid[13] != '-' || uuid[14] != '4' ||
      uuid[18] != '-' || uuid[23] != '-') {
    std::cerr << "malformed uuid " << uuid << "\n";
    return false;
  }
  const char variant = uuid[19];
  if (variant != '8' && variant != '9' && variant != 'a' && variant != 'b') {
    std::cerr << "uuid variant nibble wrong: " << uuid << "\n";
    return false;
  }
  return true;
}

bool TestUtcTime() {
  const auto formatted = util::FormatUtc(1'700'000'000, "%d-%m-%Y %H:%M:%S");
  if (!formatted || *formatted != "14-11-2023 22:13:20") {
    std::cerr << "unexpected UTC formatting: " << formatted.value_or("<none>") << "\n";
    return false;
  }
  const auto parsed = util::ParseUtc("14-11-2023 22:13:20", "%d-%m-%Y %H:%M:%S");
  if (!parsed || *parsed != 1'700'000'000) {
    std::cerr << "UTC parse did not invert formatting\n";
    return false;
  }
  if (util::ParseUtc("??-??-???? ??:??:??", "%d-%m-%Y %H:%M:%S")) {
    std::cerr << "placeholder timestamp parsed\n";
    return false;
  }
  return true;
}

bool TestAtomicFile() {
  const auto path = MakeTempPath("blob.bin");
  const auto payload = Bytes("first");
  std::string error;
  if (!util::AtomicWriteFileBytes(path, payload, &error)) {
    std::cerr << "atomic write failed: " << error << "\n";
    return false;
  }
  const auto replacement = Bytes("second version");
  if (!util::AtomicWriteFileBytes(path, replacement, &error)) {
    std::cerr << "atomic rewrite failed: " << error << "\n";
    return false;
  }
  std::vector<std::uint8_t> read;
  if (!util::ReadFileBytes(path, &read, &error) || read != replacement) {
    std::cerr << "read back mismatch\n";
    return false;
  }
  std::filesystem::remove(path);
  if (util::ReadFileBytes(path, &read, &error)) {
    std::cerr << "reading a missing file succeeded\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!TestHex() || !TestBase64() || !TestSecureWipe() || !TestAeadVector() || !TestAead() || !TestPbkdf2() ||
        !TestRandom() || !TestUtcTime() || !TestAtomicFile()) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "encoding_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  std::cout << "encoding_tests: OK\n";
  return EXIT_SUCCESS;
}
