#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace mostrix::net {

// Blocking client-side TCP stream.
class TcpSocket {
 public:
  TcpSocket() = default;
  TcpSocket(const TcpSocket&) = delete;
  TcpSocket& operator=(const TcpSocket&) = delete;
  TcpSocket(TcpSocket&& other) noexcept;
  TcpSocket& operator=(TcpSocket&& other) noexcept;
  ~TcpSocket();

  // Tries every resolved address with a bounded connect.
  bool Connect(const std::string& host, std::uint16_t port, int timeout_ms = 5000,
               bool quiet = false);
  std::ptrdiff_t Send(const std::uint8_t* data, std::size_t length) const;
  std::ptrdiff_t Recv(std::uint8_t* data, std::size_t length) const;
  // Applies to both directions.
  bool SetTimeout(int milliseconds);
  void Close();
  bool IsValid() const noexcept;
  int Handle() const noexcept { return handle_; }

 private:
  int handle_{-1};
};

}  // namespace mostrix::net
