#pragma once

#include <openssl/crypto.h>

#include <cstddef>
#include <iterator>
#include <type_traits>
#include <utility>

namespace mostrix::util {

namespace detail {

template <typename Buffer, typename = void>
struct IsResizable : std::false_type {};

template <typename Buffer>
struct IsResizable<Buffer, std::void_t<decltype(std::declval<Buffer&>().clear())>>
    : std::true_type {};

}  // namespace detail

// Zeroes a contiguous buffer of secret material (std::array, std::vector or
// std::string) with OPENSSL_cleanse, which is not removed as a dead store.
// Resizable buffers are released afterwards and left empty.
template <typename Buffer>
void SecureWipe(Buffer& secret) noexcept {
  const auto count = std::size(secret);
  if (count != 0) {
    OPENSSL_cleanse(std::data(secret), count * sizeof(*std::data(secret)));
  }
  if constexpr (detail::IsResizable<Buffer>::value) {
    Buffer().swap(secret);
  }
}

}  // namespace mostrix::util
