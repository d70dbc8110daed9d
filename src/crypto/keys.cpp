#include "crypto/keys.hpp"

#include <array>
#include <stdexcept>
#include <vector>

#include "crypto/bech32.hpp"
#include "util/csprng.hpp"
#include "util/hex.hpp"
#include "util/secure_wipe.hpp"

namespace mostrix::crypto {

namespace {

constexpr std::string_view kNpubHrp = "npub";
constexpr std::string_view kNsecHrp = "nsec";

bool DecodeKeyText(std::string_view text, std::string_view hrp, std::array<std::uint8_t, 32>* out) {
  if (text.size() == 64) {
    return util::HexDecode32(text, out);
  }
  std::vector<std::uint8_t> payload;
  if (!DecodeBech32(text, hrp, &payload) || payload.size() != out->size()) {
    util::SecureWipe(payload);
    return false;
  }
  std::copy(payload.begin(), payload.end(), out->begin());
  util::SecureWipe(payload);
  return true;
}

}  // namespace

Keys::Keys(const SecretKey& secret) : secret_(secret) {
  public_key_ = XOnlyPublicKeyFromSecret(secret_);
}

Keys::~Keys() { util::SecureWipe(secret_); }

Keys Keys::Generate() {
  SecretKey secret{};
  do {
    util::FillSecureRandomBytesOrThrow(secret);
  } while (!IsValidSecretKey(secret));
  Keys keys(secret);
  util::SecureWipe(secret);
  return keys;
}

std::optional<Keys> Keys::Parse(std::string_view text) {
  SecretKey secret{};
  if (!DecodeKeyText(text, kNsecHrp, &secret) || !IsValidSecretKey(secret)) {
    util::SecureWipe(secret);
    return std::nullopt;
  }
  Keys keys(secret);
  util::SecureWipe(secret);
  return keys;
}

std::string Keys::PublicKeyHex() const { return util::HexEncode(public_key_); }

std::string Keys::SecretHex() const { return util::HexEncode(secret_); }

std::string Keys::Npub() const { return EncodeNpub(public_key_); }

std::string Keys::Nsec() const { return EncodeNsec(secret_); }

SchnorrSignature Keys::Sign(std::span<const std::uint8_t, 32> digest) const {
  std::array<std::uint8_t, 32> aux{};
  util::FillSecureRandomBytesOrThrow(aux);
  return SchnorrSign(secret_, digest, aux);
}

bool operator==(const Keys& a, const Keys& b) { return a.Secret() == b.Secret(); }

std::optional<XOnlyPublicKey> ParsePublicKey(std::string_view text) {
  XOnlyPublicKey key{};
  if (!DecodeKeyText(text, kNpubHrp, &key) || !IsValidXOnlyPublicKey(key)) {
    return std::nullopt;
  }
  return key;
}

std::string PublicKeyHex(const XOnlyPublicKey& key) { return util::HexEncode(key); }

std::string EncodeNpub(const XOnlyPublicKey& key) { return EncodeBech32(kNpubHrp, key); }

std::string EncodeNsec(const SecretKey& key) { return EncodeBech32(kNsecHrp, key); }

}  // namespace mostrix::crypto
