#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace mostrix::util {

// Fills `out` with cryptographically secure random bytes.
bool FillSecureRandomBytes(std::span<std::uint8_t> out, std::string* error = nullptr);

// Throws std::runtime_error when the system RNG is unavailable.
void FillSecureRandomBytesOrThrow(std::span<std::uint8_t> out);

std::vector<std::uint8_t> SecureRandomBytes(std::size_t size);

// Uniform 64-bit value, used for request correlation ids.
std::uint64_t RandomU64();

// Random RFC 4122 version 4 UUID in canonical lowercase form.
std::string RandomUuid();

}  // namespace mostrix::util
