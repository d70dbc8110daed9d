#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace mostrix::util {

// PBKDF2-HMAC-SHA512 (RFC 8018). Returns dk_len bytes of key material.
std::vector<std::uint8_t> Pbkdf2HmacSha512(const std::string& password,
                                           std::span<const std::uint8_t> salt,
                                           std::uint32_t iterations,
                                           std::size_t dk_len);

}  // namespace mostrix::util
