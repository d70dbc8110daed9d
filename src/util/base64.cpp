#include "util/base64.hpp"

#include <openssl/evp.h>

#include <limits>
#include <stdexcept>

namespace mostrix::util {

namespace {

// EVP block calls take an int length.
constexpr std::size_t kMaxEncodedSize = std::numeric_limits<int>::max() / 4 * 4;

bool IsAlphabetSymbol(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
         c == '+' || c == '/';
}

// Number of '=' characters, or nullopt when padding sits anywhere but the
// end of the last quantum or a character is outside the alphabet.
std::optional<std::size_t> CountPadding(std::string_view input) {
  std::size_t padding = 0;
  if (input.back() == '=') {
    padding = input[input.size() - 2] == '=' ? 2 : 1;
  }
  const auto body = input.substr(0, input.size() - padding);
  for (const char c : body) {
    if (!IsAlphabetSymbol(c)) {
      return std::nullopt;
    }
  }
  return padding;
}

}  // namespace

std::string Base64Encode(std::span<const std::uint8_t> input) {
  if (input.size() > kMaxEncodedSize / 4 * 3) {
    throw std::length_error("base64 input too large");
  }
  // EVP_EncodeBlock appends a NUL after the last quantum.
  std::vector<unsigned char> encoded(4 * ((input.size() + 2) / 3) + 1);
  const int written =
      EVP_EncodeBlock(encoded.data(), input.data(), static_cast<int>(input.size()));
  return std::string(reinterpret_cast<const char*>(encoded.data()),
                     static_cast<std::size_t>(written));
}

bool Base64Decode(std::string_view input, std::vector<std::uint8_t>* out) {
  if (!out) {
    return false;
  }
  out->clear();
  if (input.empty()) {
    return true;
  }
  if (input.size() % 4 != 0 || input.size() > kMaxEncodedSize) {
    return false;
  }
  const auto padding = CountPadding(input);
  if (!padding) {
    return false;
  }
  std::vector<std::uint8_t> decoded(input.size() / 4 * 3);
  const int length = EVP_DecodeBlock(decoded.data(),
                                     reinterpret_cast<const unsigned char*>(input.data()),
                                     static_cast<int>(input.size()));
  if (length < 0 || static_cast<std::size_t>(length) != decoded.size()) {
    return false;
  }
  // Padding decodes as trailing zero bytes.
  decoded.resize(decoded.size() - *padding);
  *out = std::move(decoded);
  return true;
}

}  // namespace mostrix::util
