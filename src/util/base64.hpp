#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mostrix::util {

// Standard alphabet with padding, as NIP-44 payloads carry it.
std::string Base64Encode(std::span<const std::uint8_t> input);

// Accepts only padded standard-alphabet input: no whitespace, a length that
// is a multiple of four, and '=' only at the end.
bool Base64Decode(std::string_view input, std::vector<std::uint8_t>* out);

}  // namespace mostrix::util
