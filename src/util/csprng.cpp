#include "util/csprng.hpp"

#include <array>
#include <cstring>
#include <stdexcept>

#include <errno.h>
#include <fcntl.h>
#include <sys/random.h>
#include <unistd.h>

#include "util/hex.hpp"

namespace mostrix::util {

bool FillSecureRandomBytes(std::span<std::uint8_t> out, std::string* error) {
  if (out.empty()) {
    return true;
  }
  std::size_t filled = 0;
  while (filled < out.size()) {
    const ssize_t n = getrandom(out.data() + filled, out.size() - filled, 0);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    filled += static_cast<std::size_t>(n);
  }
  if (filled == out.size()) {
    return true;
  }

  const int fd = ::open("/dev/urandom", O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    if (error) {
      *error = std::string("open(/dev/urandom) failed: ") + std::strerror(errno);
    }
    return false;
  }
  while (filled < out.size()) {
    const ssize_t n = ::read(fd, out.data() + filled, out.size() - filled);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      ::close(fd);
      if (error) {
        *error = std::string("read(/dev/urandom) failed: ") + std::strerror(errno);
      }
      return false;
    }
    if (n == 0) {
      ::close(fd);
      if (error) {
        *error = "read(/dev/urandom) returned EOF";
      }
      return false;
    }
    filled += static_cast<std::size_t>(n);
  }
  ::close(fd);
  return true;
}

void FillSecureRandomBytesOrThrow(std::span<std::uint8_t> out) {
  std::string err;
  if (!FillSecureRandomBytes(out, &err)) {
    throw std::runtime_error("secure randomness unavailable: " + err);
  }
}

std::vector<std::uint8_t> SecureRandomBytes(std::size_t size) {
  std::vector<std::uint8_t> out(size);
  FillSecureRandomBytesOrThrow(out);
  return out;
}

std::uint64_t RandomU64() {
  std::array<std::uint8_t, 8> bytes{};
  FillSecureRandomBytesOrThrow(bytes);
  std::uint64_t value = 0;
  for (std::uint8_t b : bytes) {
    value = (value << 8) | b;
  }
  return value;
}

std::string RandomUuid() {
  std::array<std::uint8_t, 16> bytes{};
  FillSecureRandomBytesOrThrow(bytes);
  bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);
  const std::string hex = HexEncode(bytes);
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
         hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

}  // namespace mostrix::util
