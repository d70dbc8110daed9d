#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace mostrix::crypto {

using Sha256Hash = std::array<std::uint8_t, 32>;
using Sha512Hash = std::array<std::uint8_t, 64>;

inline std::span<const std::uint8_t> AsBytes(std::string_view text) {
  return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

Sha256Hash Sha256(std::span<const std::uint8_t> data);

// BIP-340 tagged hash: SHA256(SHA256(tag) || SHA256(tag) || data).
Sha256Hash TaggedHash(std::string_view tag, std::span<const std::uint8_t> data);

Sha256Hash HmacSha256(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data);
Sha512Hash HmacSha512(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data);

// RFC 5869 with SHA-256, split into its two stages so callers can cache the
// pseudorandom key.
Sha256Hash HkdfExtractSha256(std::span<const std::uint8_t> salt,
                             std::span<const std::uint8_t> ikm);
std::vector<std::uint8_t> HkdfExpandSha256(std::span<const std::uint8_t> prk,
                                           std::span<const std::uint8_t> info,
                                           std::size_t length);

}  // namespace mostrix::crypto
