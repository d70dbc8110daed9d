#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "net/transfer.hpp"

namespace mostrix::net {

struct HttpsUrl {
  std::string host;
  std::uint16_t port{443};
  std::string path{"/"};
};

// Accepts only https:// URLs.
std::optional<HttpsUrl> ParseHttpsUrl(std::string_view url);

// HTTP/1.1 over OpenSSL with peer verification against the system CA store.
class HttpsTransfer : public Transfer {
 public:
  bool Get(const std::string& url, std::size_t max_bytes, std::chrono::seconds timeout,
           std::vector<std::uint8_t>* body, std::string* error = nullptr) override;
};

// Response framing helpers, exposed for tests.
std::optional<std::size_t> FindHeaderEnd(std::string_view data);
std::optional<int> ParseStatusCode(std::string_view headers);
std::optional<std::size_t> ParseContentLength(std::string_view headers);
bool IsChunked(std::string_view headers);
// Fails on malformed framing and once the decoded body would pass `max_bytes`.
bool DecodeChunkedBody(std::string_view raw, std::size_t max_bytes, std::string* body,
                       std::string* error = nullptr);

enum class StreamEnd {
  // TLS close_notify received.
  kCleanClose,
  // Peer dropped the connection without close_notify.
  kAbruptClose,
};

// Whether a response read that ended with `end` may be used. A body without
// Content-Length or chunked framing needs a clean close to be trusted.
bool AcceptStreamEnd(StreamEnd end, bool headers_seen, bool framed);

}  // namespace mostrix::net
