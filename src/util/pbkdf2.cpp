#include "util/pbkdf2.hpp"

#include <stdexcept>

#include <openssl/evp.h>

namespace mostrix::util {

std::vector<std::uint8_t> Pbkdf2HmacSha512(const std::string& password,
                                           std::span<const std::uint8_t> salt,
                                           std::uint32_t iterations,
                                           std::size_t dk_len) {
  if (iterations == 0) {
    throw std::invalid_argument("PBKDF2 iterations must be >= 1");
  }
  std::vector<std::uint8_t> out(dk_len);
  if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()), salt.data(),
                        static_cast<int>(salt.size()), static_cast<int>(iterations),
                        EVP_sha512(), static_cast<int>(dk_len), out.data()) != 1) {
    throw std::runtime_error("PKCS5_PBKDF2_HMAC failed");
  }
  return out;
}

}  // namespace mostrix::util
