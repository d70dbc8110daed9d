#include "crypto/bech32.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace mostrix::crypto {

namespace {

constexpr std::array<char, 32> kCharset = {
    'q', 'p', 'z', 'r', 'y', '9', 'x', '8', 'g', 'f', '2', 't', 'v', 'd', 'w', '0',
    's', '3', 'j', 'n', '5', '4', 'k', 'h', 'c', 'e', '6', 'm', 'u', 'a', '7', 'l'};

constexpr std::array<int, 128> CreateDecodeMap() {
  std::array<int, 128> map{};
  map.fill(-1);
  for (std::size_t i = 0; i < kCharset.size(); ++i) {
    map[static_cast<unsigned>(kCharset[i])] = static_cast<int>(i);
  }
  return map;
}

constexpr auto kDecodeMap = CreateDecodeMap();
constexpr std::uint32_t kBech32Constant = 1;

std::uint32_t Polymod(const std::vector<std::uint8_t>& values) {
  std::uint32_t chk = 1;
  for (std::uint8_t v : values) {
    std::uint8_t top = chk >> 25;
    chk = (chk & 0x1ffffff) << 5 ^ v;
    if (top & 0x01) chk ^= 0x3b6a57b2;
    if (top & 0x02) chk ^= 0x26508e6d;
    if (top & 0x04) chk ^= 0x1ea119fa;
    if (top & 0x08) chk ^= 0x3d4233dd;
    if (top & 0x10) chk ^= 0x2a1462b3;
  }
  return chk;
}

std::vector<std::uint8_t> HrpExpand(std::string_view hrp) {
  std::vector<std::uint8_t> ret;
  ret.reserve(hrp.size() * 2 + 1);
  for (char c : hrp) {
    ret.push_back(static_cast<std::uint8_t>(std::tolower(static_cast<unsigned char>(c)) >> 5));
  }
  ret.push_back(0);
  for (char c : hrp) {
    ret.push_back(static_cast<std::uint8_t>(std::tolower(static_cast<unsigned char>(c)) & 0x1F));
  }
  return ret;
}

bool ConvertBits(std::vector<std::uint8_t>* out, int from_bits, int to_bits, bool pad,
                 std::span<const std::uint8_t> data) {
  std::uint32_t acc = 0;
  int bits = 0;
  const std::uint32_t maxv = (1u << to_bits) - 1;
  for (std::uint8_t value : data) {
    if (value >> from_bits) {
      return false;
    }
    acc = (acc << from_bits) | value;
    bits += from_bits;
    while (bits >= to_bits) {
      bits -= to_bits;
      out->push_back(static_cast<std::uint8_t>((acc >> bits) & maxv));
    }
  }
  if (pad) {
    if (bits) {
      out->push_back(static_cast<std::uint8_t>((acc << (to_bits - bits)) & maxv));
    }
  } else if (bits >= from_bits || ((acc << (to_bits - bits)) & maxv)) {
    return false;
  }
  return true;
}

bool IsValidHrp(std::string_view hrp) {
  if (hrp.empty() || hrp.size() > 83) {
    return false;
  }
  return std::all_of(hrp.begin(), hrp.end(), [](char c) { return c >= 0x21 && c <= 0x7E; });
}

}  // namespace

std::string EncodeBech32(std::string_view hrp, std::span<const std::uint8_t> payload) {
  if (!IsValidHrp(hrp)) {
    throw std::invalid_argument("invalid bech32 hrp");
  }
  std::vector<std::uint8_t> data;
  if (!ConvertBits(&data, 8, 5, true, payload)) {
    throw std::invalid_argument("invalid bech32 payload");
  }
  std::vector<std::uint8_t> values = HrpExpand(hrp);
  values.insert(values.end(), data.begin(), data.end());
  values.insert(values.end(), 6, 0);
  const std::uint32_t polymod = Polymod(values) ^ kBech32Constant;

  std::string ret;
  ret.reserve(hrp.size() + data.size() + 7);
  for (char c : hrp) {
    ret.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  ret.push_back('1');
  for (std::uint8_t v : data) {
    ret.push_back(kCharset[v]);
  }
  for (int i = 0; i < 6; ++i) {
    ret.push_back(kCharset[(polymod >> (5 * (5 - i))) & 31]);
  }
  return ret;
}

bool DecodeBech32(std::string_view text, std::string_view expected_hrp,
                  std::vector<std::uint8_t>* payload) {
  if (text.size() < 8 || text.size() > 90) {
    return false;
  }
  bool lower = false;
  bool upper = false;
  for (char c : text) {
    if (std::isupper(static_cast<unsigned char>(c))) upper = true;
    if (std::islower(static_cast<unsigned char>(c))) lower = true;
  }
  if (upper && lower) {
    return false;
  }
  const auto pos = text.rfind('1');
  if (pos == std::string_view::npos || pos == 0 || pos + 7 > text.size()) {
    return false;
  }
  const std::string_view hrp = text.substr(0, pos);
  if (!IsValidHrp(hrp)) {
    return false;
  }
  if (!expected_hrp.empty() &&
      !std::equal(hrp.begin(), hrp.end(), expected_hrp.begin(), expected_hrp.end(),
                  [](char a, char b) {
                    return std::tolower(static_cast<unsigned char>(a)) ==
                           std::tolower(static_cast<unsigned char>(b));
                  })) {
    return false;
  }
  std::vector<std::uint8_t> data;
  data.reserve(text.size() - pos - 1);
  for (char c : text.substr(pos + 1)) {
    const auto lowered = static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(c)));
    if (lowered > 127 || kDecodeMap[lowered] == -1) {
      return false;
    }
    data.push_back(static_cast<std::uint8_t>(kDecodeMap[lowered]));
  }
  std::vector<std::uint8_t> verify_values = HrpExpand(hrp);
  verify_values.insert(verify_values.end(), data.begin(), data.end());
  if (Polymod(verify_values) != kBech32Constant) {
    return false;
  }
  data.resize(data.size() - 6);
  std::vector<std::uint8_t> decoded;
  if (!ConvertBits(&decoded, 5, 8, false, data)) {
    return false;
  }
  *payload = std::move(decoded);
  return true;
}

}  // namespace mostrix::crypto
