#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>

namespace mostrix::crypto {

using SecretKey = std::array<std::uint8_t, 32>;
// BIP-340 x-only public key: the x coordinate of the point with even y.
using XOnlyPublicKey = std::array<std::uint8_t, 32>;
using CompressedPublicKey = std::array<std::uint8_t, 33>;
using SchnorrSignature = std::array<std::uint8_t, 64>;

// True when 0 < key < n.
bool IsValidSecretKey(const SecretKey& key);

// True when the value lifts to a curve point.
bool IsValidXOnlyPublicKey(const XOnlyPublicKey& key);

// Throw std::invalid_argument for an out-of-range secret.
XOnlyPublicKey XOnlyPublicKeyFromSecret(const SecretKey& key);
CompressedPublicKey CompressedPublicKeyFromSecret(const SecretKey& key);

// (key + tweak) mod n. nullopt when tweak >= n or the sum is zero, which
// BIP-32 treats as an invalid child.
std::optional<SecretKey> AddTweak(const SecretKey& key, std::span<const std::uint8_t, 32> tweak);

// x coordinate of secret * lift_x(remote). The remote key is interpreted with
// even y, so the result is the same from either side of the exchange.
// nullopt for an invalid secret or a remote key that is not on the curve.
std::optional<std::array<std::uint8_t, 32>> EcdhXCoordinate(const SecretKey& secret,
                                                            const XOnlyPublicKey& remote);

SchnorrSignature SchnorrSign(const SecretKey& key, std::span<const std::uint8_t, 32> message,
                             std::span<const std::uint8_t, 32> aux_rand);
bool SchnorrVerify(const XOnlyPublicKey& key, std::span<const std::uint8_t, 32> message,
                   const SchnorrSignature& signature);

}  // namespace mostrix::crypto
