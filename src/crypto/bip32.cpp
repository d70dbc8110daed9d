#include "crypto/bip32.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "crypto/hash.hpp"
#include "util/secure_wipe.hpp"

namespace mostrix::crypto {

namespace {

ExtendedSecretKey SplitHmacOutput(const Sha512Hash& digest) {
  ExtendedSecretKey out;
  std::copy_n(digest.begin(), 32, out.key.begin());
  std::copy_n(digest.begin() + 32, 32, out.chain_code.begin());
  return out;
}

std::uint32_t ParseIndexComponent(std::string_view component) {
  bool hardened = false;
  if (!component.empty() && (component.back() == '\'' || component.back() == 'h')) {
    hardened = true;
    component.remove_suffix(1);
  }
  if (component.empty() || component.size() > 10) {
    throw std::invalid_argument("invalid derivation path component");
  }
  std::uint64_t value = 0;
  for (char c : component) {
    if (c < '0' || c > '9') {
      throw std::invalid_argument("invalid derivation path component");
    }
    value = value * 10 + static_cast<std::uint64_t>(c - '0');
  }
  if (value >= kHardenedIndex) {
    throw std::invalid_argument("derivation index out of range");
  }
  return static_cast<std::uint32_t>(value) | (hardened ? kHardenedIndex : 0u);
}

}  // namespace

ExtendedSecretKey MasterKeyFromSeed(std::span<const std::uint8_t> seed) {
  auto digest = HmacSha512(AsBytes("Bitcoin seed"), seed);
  auto master = SplitHmacOutput(digest);
  util::SecureWipe(digest);
  if (!IsValidSecretKey(master.key)) {
    throw std::invalid_argument("seed produces an invalid master key");
  }
  return master;
}

std::optional<ExtendedSecretKey> DeriveChild(const ExtendedSecretKey& parent,
                                             std::uint32_t index) {
  std::vector<std::uint8_t> data;
  data.reserve(37);
  if (index & kHardenedIndex) {
    data.push_back(0x00);
    data.insert(data.end(), parent.key.begin(), parent.key.end());
  } else {
    const auto pub = CompressedPublicKeyFromSecret(parent.key);
    data.insert(data.end(), pub.begin(), pub.end());
  }
  data.push_back(static_cast<std::uint8_t>(index >> 24));
  data.push_back(static_cast<std::uint8_t>(index >> 16));
  data.push_back(static_cast<std::uint8_t>(index >> 8));
  data.push_back(static_cast<std::uint8_t>(index));

  auto digest = HmacSha512(parent.chain_code, data);
  util::SecureWipe(data);
  auto split = SplitHmacOutput(digest);
  util::SecureWipe(digest);
  auto child_key = AddTweak(parent.key, split.key);
  util::SecureWipe(split.key);
  if (!child_key) {
    return std::nullopt;
  }
  ExtendedSecretKey child;
  child.key = *child_key;
  child.chain_code = split.chain_code;
  return child;
}

ExtendedSecretKey DerivePath(std::span<const std::uint8_t> seed, std::string_view path) {
  if (path.empty() || path.front() != 'm') {
    throw std::invalid_argument("derivation path must start with 'm'");
  }
  ExtendedSecretKey current = MasterKeyFromSeed(seed);
  std::size_t pos = 1;
  while (pos < path.size()) {
    if (path[pos] != '/') {
      throw std::invalid_argument("invalid derivation path: " + std::string(path));
    }
    const std::size_t start = pos + 1;
    std::size_t end = path.find('/', start);
    if (end == std::string_view::npos) {
      end = path.size();
    }
    const std::uint32_t index = ParseIndexComponent(path.substr(start, end - start));
    auto child = DeriveChild(current, index);
    util::SecureWipe(current.key);
    if (!child) {
      throw std::invalid_argument("derivation produced an invalid child key");
    }
    current = *child;
    pos = end;
  }
  return current;
}

}  // namespace mostrix::crypto
