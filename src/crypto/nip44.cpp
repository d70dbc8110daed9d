#include "crypto/nip44.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include <openssl/crypto.h>

#include "crypto/hash.hpp"
#include "util/aead.hpp"
#include "util/base64.hpp"
#include "util/csprng.hpp"
#include "util/secure_wipe.hpp"

namespace mostrix::crypto {

namespace {

constexpr std::uint8_t kVersion = 2;
constexpr std::size_t kMacSize = 32;

struct MessageKeys {
  std::array<std::uint8_t, 32> chacha_key{};
  std::array<std::uint8_t, 12> chacha_nonce{};
  std::array<std::uint8_t, 32> hmac_key{};

  ~MessageKeys() {
    util::SecureWipe(chacha_key);
    util::SecureWipe(chacha_nonce);
    util::SecureWipe(hmac_key);
  }
};

void DeriveMessageKeys(const ConversationKey& key, const Nip44Nonce& nonce, MessageKeys* out) {
  auto expanded = HkdfExpandSha256(key, nonce, 76);
  std::copy_n(expanded.begin(), 32, out->chacha_key.begin());
  std::copy_n(expanded.begin() + 32, 12, out->chacha_nonce.begin());
  std::copy_n(expanded.begin() + 44, 32, out->hmac_key.begin());
  util::SecureWipe(expanded);
}

Sha256Hash ComputeMac(const MessageKeys& keys, std::span<const std::uint8_t> nonce,
                      std::span<const std::uint8_t> ciphertext) {
  std::vector<std::uint8_t> aad(nonce.begin(), nonce.end());
  aad.insert(aad.end(), ciphertext.begin(), ciphertext.end());
  return HmacSha256(keys.hmac_key, aad);
}

void SetError(std::string* error, const char* message) {
  if (error) {
    *error = message;
  }
}

}  // namespace

std::optional<ConversationKey> GetConversationKey(const SecretKey& secret,
                                                  const XOnlyPublicKey& remote) {
  auto shared_x = EcdhXCoordinate(secret, remote);
  if (!shared_x) {
    return std::nullopt;
  }
  const auto key = HkdfExtractSha256(AsBytes("nip44-v2"), *shared_x);
  util::SecureWipe(*shared_x);
  return key;
}

std::size_t Nip44PaddedLength(std::size_t unpadded_length) {
  if (unpadded_length <= 32) {
    return 32;
  }
  std::size_t next_power = 1;
  while (next_power < unpadded_length) {
    next_power <<= 1;
  }
  const std::size_t chunk = next_power <= 256 ? 32 : next_power / 8;
  return chunk * ((unpadded_length - 1) / chunk + 1);
}

std::string Nip44Encrypt(const ConversationKey& key, std::string_view plaintext,
                         const std::optional<Nip44Nonce>& nonce) {
  if (plaintext.size() < kNip44MinPlaintextSize || plaintext.size() > kNip44MaxPlaintextSize) {
    throw std::invalid_argument("nip44 plaintext must be 1..65535 bytes");
  }
  Nip44Nonce message_nonce{};
  if (nonce) {
    message_nonce = *nonce;
  } else {
    util::FillSecureRandomBytesOrThrow(message_nonce);
  }
  MessageKeys keys;
  DeriveMessageKeys(key, message_nonce, &keys);

  const std::size_t padded_len = Nip44PaddedLength(plaintext.size());
  std::vector<std::uint8_t> padded(2 + padded_len, 0);
  padded[0] = static_cast<std::uint8_t>(plaintext.size() >> 8);
  padded[1] = static_cast<std::uint8_t>(plaintext.size() & 0xFF);
  std::copy(plaintext.begin(), plaintext.end(), padded.begin() + 2);

  const auto ciphertext = util::ChaCha20Xor(keys.chacha_key, keys.chacha_nonce, padded);
  util::SecureWipe(padded);
  const auto mac = ComputeMac(keys, message_nonce, ciphertext);

  std::vector<std::uint8_t> payload;
  payload.reserve(1 + message_nonce.size() + ciphertext.size() + mac.size());
  payload.push_back(kVersion);
  payload.insert(payload.end(), message_nonce.begin(), message_nonce.end());
  payload.insert(payload.end(), ciphertext.begin(), ciphertext.end());
  payload.insert(payload.end(), mac.begin(), mac.end());
  return util::Base64Encode(payload);
}

bool Nip44Decrypt(const ConversationKey& key, std::string_view payload, std::string* plaintext,
                  std::string* error) {
  plaintext->clear();
  if (payload.empty() || payload.front() == '#') {
    SetError(error, "unknown nip44 encryption version");
    return false;
  }
  if (payload.size() < 132 || payload.size() > 87472) {
    SetError(error, "invalid nip44 payload size");
    return false;
  }
  std::vector<std::uint8_t> data;
  if (!util::Base64Decode(payload, &data)) {
    SetError(error, "invalid base64 in nip44 payload");
    return false;
  }
  if (data.size() < 99 || data.size() > 65603) {
    SetError(error, "invalid nip44 data size");
    return false;
  }
  if (data[0] != kVersion) {
    SetError(error, "unknown nip44 encryption version");
    return false;
  }
  Nip44Nonce nonce{};
  std::copy_n(data.begin() + 1, nonce.size(), nonce.begin());
  const std::span<const std::uint8_t> ciphertext(data.data() + 33, data.size() - 33 - kMacSize);
  const std::span<const std::uint8_t> mac(data.data() + data.size() - kMacSize, kMacSize);

  MessageKeys keys;
  DeriveMessageKeys(key, nonce, &keys);
  const auto expected_mac = ComputeMac(keys, nonce, ciphertext);
  if (CRYPTO_memcmp(expected_mac.data(), mac.data(), kMacSize) != 0) {
    SetError(error, "invalid nip44 mac");
    return false;
  }

  auto padded = util::ChaCha20Xor(keys.chacha_key, keys.chacha_nonce, ciphertext);
  if (padded.size() < 2) {
    SetError(error, "invalid nip44 padding");
    return false;
  }
  const std::size_t unpadded_len = (static_cast<std::size_t>(padded[0]) << 8) | padded[1];
  if (unpadded_len < kNip44MinPlaintextSize ||
      padded.size() != 2 + Nip44PaddedLength(unpadded_len)) {
    util::SecureWipe(padded);
    SetError(error, "invalid nip44 padding");
    return false;
  }
  plaintext->assign(reinterpret_cast<const char*>(padded.data() + 2), unpadded_len);
  util::SecureWipe(padded);
  return true;
}

std::string Nip44EncryptTo(const SecretKey& sender, const XOnlyPublicKey& recipient,
                           std::string_view plaintext) {
  auto key = GetConversationKey(sender, recipient);
  if (!key) {
    throw std::invalid_argument("invalid nip44 recipient public key");
  }
  auto payload = Nip44Encrypt(*key, plaintext);
  util::SecureWipe(*key);
  return payload;
}

bool Nip44DecryptFrom(const SecretKey& recipient, const XOnlyPublicKey& sender,
                      std::string_view payload, std::string* plaintext, std::string* error) {
  auto key = GetConversationKey(recipient, sender);
  if (!key) {
    SetError(error, "invalid nip44 sender public key");
    return false;
  }
  const bool ok = Nip44Decrypt(*key, payload, plaintext, error);
  util::SecureWipe(*key);
  return ok;
}

}  // namespace mostrix::crypto
