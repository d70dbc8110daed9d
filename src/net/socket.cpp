#include "net/socket.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include "util/logging.hpp"

namespace mostrix::net {

namespace {

void CloseHandle(int handle) {
  if (handle >= 0) {
    ::close(handle);
  }
}

bool ConnectWithTimeout(int socket_fd, const sockaddr* addr, socklen_t addr_len, int timeout_ms,
                        bool quiet, const std::string& host, std::uint16_t port) {
  const int original_flags = fcntl(socket_fd, F_GETFL, 0);
  if (original_flags >= 0) {
    (void)fcntl(socket_fd, F_SETFL, original_flags | O_NONBLOCK);
  }

  const int connect_rc = ::connect(socket_fd, addr, addr_len);
  const int connect_err = errno;
  if (connect_rc != 0 && connect_err != EINPROGRESS) {
    if (original_flags >= 0) {
      (void)fcntl(socket_fd, F_SETFL, original_flags);
    }
    if (!quiet) {
      util::LogWarn("[socket] connect(" + host + ":" + std::to_string(port) + ") failed: " +
                    std::strerror(connect_err));
    }
    return false;
  }

  int ready = 1;
  if (connect_rc != 0) {
    fd_set write_fds;
    FD_ZERO(&write_fds);
    FD_SET(socket_fd, &write_fds);
    timeval tv{timeout_ms / 1000, (timeout_ms % 1000) * 1000};
    ready = ::select(socket_fd + 1, nullptr, &write_fds, nullptr, &tv);
  }

  int so_error = 0;
  socklen_t so_error_len = sizeof(so_error);
  const int so_rc = ::getsockopt(socket_fd, SOL_SOCKET, SO_ERROR, &so_error, &so_error_len);
  if (original_flags >= 0) {
    (void)fcntl(socket_fd, F_SETFL, original_flags);
  }
  if (ready <= 0 || so_rc != 0 || so_error != 0) {
    if (!quiet) {
      util::LogWarn("[socket] connect(" + host + ":" + std::to_string(port) +
                    ") timed out or failed, errno " +
                    std::to_string(so_error != 0 ? so_error : connect_err));
    }
    return false;
  }
  return true;
}

}  // namespace

TcpSocket::TcpSocket(TcpSocket&& other) noexcept : handle_(other.handle_) { other.handle_ = -1; }

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
  if (this != &other) {
    Close();
    handle_ = other.handle_;
    other.handle_ = -1;
  }
  return *this;
}

TcpSocket::~TcpSocket() { Close(); }

bool TcpSocket::Connect(const std::string& host, std::uint16_t port, int timeout_ms, bool quiet) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;

  addrinfo* result = nullptr;
  const std::string port_str = std::to_string(port);
  if (getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result) != 0 || result == nullptr) {
    if (!quiet) {
      util::LogWarn("[socket] resolve(" + host + ":" + port_str + ") failed");
    }
    if (result) {
      freeaddrinfo(result);
    }
    return false;
  }

  for (auto* entry = result; entry != nullptr; entry = entry->ai_next) {
    const int sock = ::socket(entry->ai_family, SOCK_STREAM, IPPROTO_TCP);
    if (sock < 0) {
      continue;
    }
    if (ConnectWithTimeout(sock, entry->ai_addr, static_cast<socklen_t>(entry->ai_addrlen),
                           timeout_ms, quiet, host, port)) {
      Close();
      handle_ = sock;
      freeaddrinfo(result);
      return true;
    }
    CloseHandle(sock);
  }

  freeaddrinfo(result);
  return false;
}

std::ptrdiff_t TcpSocket::Send(const std::uint8_t* data, std::size_t length) const {
  if (!IsValid()) return -1;
  return ::send(handle_, data, length, MSG_NOSIGNAL);
}

std::ptrdiff_t TcpSocket::Recv(std::uint8_t* data, std::size_t length) const {
  if (!IsValid()) return -1;
  return ::recv(handle_, data, length, 0);
}

bool TcpSocket::SetTimeout(int milliseconds) {
  if (!IsValid()) return false;
  struct timeval tv {
    milliseconds / 1000, (milliseconds % 1000) * 1000
  };
  return ::setsockopt(handle_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
         ::setsockopt(handle_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

void TcpSocket::Close() {
  CloseHandle(handle_);
  handle_ = -1;
}

bool TcpSocket::IsValid() const noexcept { return handle_ >= 0; }

}  // namespace mostrix::net
