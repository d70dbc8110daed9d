#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace mostrix::net {

// Blob download collaborator.
class Transfer {
 public:
  virtual ~Transfer() = default;

  // GET `url`. Fails on a non-2xx status, on timeout, and when the body is
  // larger than `max_bytes` either by declared length or while streaming.
  virtual bool Get(const std::string& url, std::size_t max_bytes, std::chrono::seconds timeout,
                   std::vector<std::uint8_t>* body, std::string* error = nullptr) = 0;
};

}  // namespace mostrix::net
