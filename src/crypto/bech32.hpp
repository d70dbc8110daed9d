#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mostrix::crypto {

// BIP-173 bech32 over 8-bit payload bytes, as used by NIP-19 (npub/nsec).
std::string EncodeBech32(std::string_view hrp, std::span<const std::uint8_t> payload);
bool DecodeBech32(std::string_view text, std::string_view expected_hrp,
                  std::vector<std::uint8_t>* payload);

}  // namespace mostrix::crypto
