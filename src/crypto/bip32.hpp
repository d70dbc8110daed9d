#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "crypto/secp256k1.hpp"

namespace mostrix::crypto {

constexpr std::uint32_t kHardenedIndex = 0x80000000u;

struct ExtendedSecretKey {
  SecretKey key{};
  std::array<std::uint8_t, 32> chain_code{};
};

ExtendedSecretKey MasterKeyFromSeed(std::span<const std::uint8_t> seed);

// CKDpriv. nullopt for the (astronomically rare) invalid child.
std::optional<ExtendedSecretKey> DeriveChild(const ExtendedSecretKey& parent, std::uint32_t index);

// Walks a textual path such as "m/44'/1237'/38383'/1/0". Throws
// std::invalid_argument on a malformed path or an invalid child.
ExtendedSecretKey DerivePath(std::span<const std::uint8_t> seed, std::string_view path);

}  // namespace mostrix::crypto
