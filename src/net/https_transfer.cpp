#include "net/https_transfer.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <chrono>
#include <filesystem>
#include <memory>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "net/socket.hpp"
#include "util/logging.hpp"

namespace mostrix::net {

namespace {

struct SslCtxDeleter {
  void operator()(SSL_CTX* ctx) const { SSL_CTX_free(ctx); }
};
struct SslDeleter {
  void operator()(SSL* ssl) const {
    SSL_shutdown(ssl);
    SSL_free(ssl);
  }
};
using SslCtxPtr = std::unique_ptr<SSL_CTX, SslCtxDeleter>;
using SslPtr = std::unique_ptr<SSL, SslDeleter>;

constexpr std::size_t kMaxHeaderSize = 16 * 1024;
// Chunk size lines and CRLFs counted on top of the payload cap.
constexpr std::size_t kChunkFramingAllowance = 64 * 1024;

void SetError(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
}

std::string LastSslError() {
  const unsigned long code = ERR_get_error();
  if (code == 0) {
    return "unknown TLS error";
  }
  std::array<char, 256> buffer{};
  ERR_error_string_n(code, buffer.data(), buffer.size());
  return buffer.data();
}

bool LoadDefaultCaBundle(SSL_CTX* ctx) {
  if (SSL_CTX_set_default_verify_paths(ctx) == 1) {
    return true;
  }
  const char* const candidates[] = {
      "/etc/ssl/certs/ca-certificates.crt",
      "/etc/pki/tls/certs/ca-bundle.crt",
      "/etc/ssl/ca-bundle.pem",
      "/etc/ssl/cert.pem",
  };
  for (const char* path : candidates) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec) && !ec &&
        SSL_CTX_load_verify_locations(ctx, path, nullptr) == 1) {
      return true;
    }
  }
  return false;
}

std::string_view TrimView(std::string_view value) {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
    value.remove_prefix(1);
  }
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
    value.remove_suffix(1);
  }
  return value;
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

std::optional<std::string_view> FindHeader(std::string_view headers, std::string_view name) {
  std::size_t offset = 0;
  while (offset < headers.size()) {
    auto end = headers.find("\r\n", offset);
    if (end == std::string_view::npos) {
      end = headers.size();
    }
    const auto line = headers.substr(offset, end - offset);
    const auto colon = line.find(':');
    if (colon != std::string_view::npos && EqualsIgnoreCase(TrimView(line.substr(0, colon)), name)) {
      return TrimView(line.substr(colon + 1));
    }
    if (end >= headers.size()) {
      break;
    }
    offset = end + 2;
  }
  return std::nullopt;
}

std::string BuildHttpRequest(const HttpsUrl& url) {
  std::string request = "GET " + url.path + " HTTP/1.1\r\n";
  request += "Host: " + url.host;
  if (url.port != 443) {
    request += ":" + std::to_string(url.port);
  }
  request += "\r\n";
  request += "User-Agent: mostrix\r\n";
  request += "Accept: */*\r\n";
  request += "Connection: close\r\n\r\n";
  return request;
}

}  // namespace

std::optional<HttpsUrl> ParseHttpsUrl(std::string_view url) {
  constexpr std::string_view kScheme = "https://";
  if (url.substr(0, kScheme.size()) != kScheme) {
    return std::nullopt;
  }
  url.remove_prefix(kScheme.size());
  HttpsUrl parsed;
  const auto slash = url.find('/');
  std::string_view authority = url.substr(0, slash);
  if (slash != std::string_view::npos) {
    parsed.path = std::string(url.substr(slash));
  }
  const auto colon = authority.rfind(':');
  if (colon != std::string_view::npos) {
    unsigned port = 0;
    const auto port_text = authority.substr(colon + 1);
    const auto result =
        std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (result.ec != std::errc() || result.ptr != port_text.data() + port_text.size() ||
        port == 0 || port > 65535) {
      return std::nullopt;
    }
    parsed.port = static_cast<std::uint16_t>(port);
    authority = authority.substr(0, colon);
  }
  if (authority.empty()) {
    return std::nullopt;
  }
  parsed.host = std::string(authority);
  return parsed;
}

std::optional<std::size_t> FindHeaderEnd(std::string_view data) {
  const auto pos = data.find("\r\n\r\n");
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  return pos + 4;
}

std::optional<int> ParseStatusCode(std::string_view headers) {
  // "HTTP/1.1 200 OK"
  const auto space = headers.find(' ');
  if (headers.substr(0, 5) != "HTTP/" || space == std::string_view::npos ||
      space + 4 > headers.size()) {
    return std::nullopt;
  }
  int code = 0;
  const auto* begin = headers.data() + space + 1;
  const auto result = std::from_chars(begin, begin + 3, code);
  if (result.ec != std::errc() || result.ptr != begin + 3) {
    return std::nullopt;
  }
  return code;
}

std::optional<std::size_t> ParseContentLength(std::string_view headers) {
  const auto value = FindHeader(headers, "Content-Length");
  if (!value) {
    return std::nullopt;
  }
  std::size_t length = 0;
  const auto result = std::from_chars(value->data(), value->data() + value->size(), length);
  if (result.ec != std::errc() || result.ptr != value->data() + value->size()) {
    return std::nullopt;
  }
  return length;
}

bool IsChunked(std::string_view headers) {
  const auto value = FindHeader(headers, "Transfer-Encoding");
  return value && EqualsIgnoreCase(*value, "chunked");
}

bool DecodeChunkedBody(std::string_view raw, std::size_t max_bytes, std::string* body,
                       std::string* error) {
  body->clear();
  std::size_t offset = 0;
  while (true) {
    const auto line_end = raw.find("\r\n", offset);
    if (line_end == std::string_view::npos) {
      SetError(error, "truncated chunk header");
      return false;
    }
    auto size_text = raw.substr(offset, line_end - offset);
    if (const auto semi = size_text.find(';'); semi != std::string_view::npos) {
      size_text = size_text.substr(0, semi);
    }
    size_text = TrimView(size_text);
    std::size_t size = 0;
    const auto result =
        std::from_chars(size_text.data(), size_text.data() + size_text.size(), size, 16);
    if (size_text.empty() || result.ec != std::errc() ||
        result.ptr != size_text.data() + size_text.size()) {
      SetError(error, "malformed chunk size");
      return false;
    }
    offset = line_end + 2;
    if (size == 0) {
      return true;
    }
    // body->size() <= max_bytes and offset <= raw.size() hold here, so
    // neither subtraction can wrap.
    if (size > max_bytes - body->size()) {
      SetError(error, "chunked body exceeds " + std::to_string(max_bytes) + " bytes");
      return false;
    }
    const std::size_t remaining = raw.size() - offset;
    if (size > remaining || remaining - size < 2 || raw.substr(offset + size, 2) != "\r\n") {
      SetError(error, "truncated chunk");
      return false;
    }
    body->append(raw.substr(offset, size));
    offset += size + 2;
  }
}

bool AcceptStreamEnd(StreamEnd end, bool headers_seen, bool framed) {
  if (!headers_seen) {
    return false;
  }
  return end == StreamEnd::kCleanClose || framed;
}

bool HttpsTransfer::Get(const std::string& url, std::size_t max_bytes,
                        std::chrono::seconds timeout, std::vector<std::uint8_t>* body,
                        std::string* error) {
  const auto target = ParseHttpsUrl(url);
  if (!target) {
    SetError(error, "unsupported URL: " + url);
    return false;
  }
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  const int timeout_ms = static_cast<int>(
      std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count());

  TcpSocket socket;
  if (!socket.Connect(target->host, target->port, timeout_ms)) {
    SetError(error, "failed to connect to " + target->host);
    return false;
  }
  if (!socket.SetTimeout(timeout_ms)) {
    util::LogWarn("failed to set socket timeout for " + target->host);
    SetError(error, "failed to set socket timeout for " + target->host);
    return false;
  }

  SslCtxPtr ctx(SSL_CTX_new(TLS_client_method()));
  if (!ctx) {
    SetError(error, "tls context: " + LastSslError());
    return false;
  }
  SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);
  if (!LoadDefaultCaBundle(ctx.get())) {
    SetError(error, "tls ca bundle missing");
    return false;
  }
  SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);

  SslPtr ssl(SSL_new(ctx.get()));
  if (!ssl || SSL_set_fd(ssl.get(), socket.Handle()) != 1 ||
      SSL_set_tlsext_host_name(ssl.get(), target->host.c_str()) != 1 ||
      SSL_set1_host(ssl.get(), target->host.c_str()) != 1) {
    SetError(error, "tls setup: " + LastSslError());
    return false;
  }
  if (SSL_connect(ssl.get()) != 1) {
    SetError(error, "tls handshake with " + target->host + " failed: " + LastSslError());
    return false;
  }

  const auto request = BuildHttpRequest(*target);
  if (SSL_write(ssl.get(), request.data(), static_cast<int>(request.size())) <= 0) {
    SetError(error, "failed to send request: " + LastSslError());
    return false;
  }

  std::string response;
  std::optional<std::size_t> body_offset;
  std::optional<std::size_t> content_length;
  bool chunked = false;
  std::array<char, 16 * 1024> chunk{};
  while (true) {
    if (std::chrono::steady_clock::now() >= deadline) {
      SetError(error, "timed out fetching " + url);
      return false;
    }
    const int bytes = SSL_read(ssl.get(), chunk.data(), static_cast<int>(chunk.size()));
    if (bytes <= 0) {
      const int reason = SSL_get_error(ssl.get(), bytes);
      if (reason == SSL_ERROR_ZERO_RETURN || reason == SSL_ERROR_SYSCALL) {
        const auto end =
            reason == SSL_ERROR_ZERO_RETURN ? StreamEnd::kCleanClose : StreamEnd::kAbruptClose;
        // Chunked and sized bodies are checked for completeness below.
        if (AcceptStreamEnd(end, body_offset.has_value(), chunked || content_length.has_value())) {
          break;
        }
        SetError(error, body_offset ? "connection closed without TLS close_notify"
                                    : "connection closed before response headers");
        return false;
      }
      SetError(error, "read failed: " + LastSslError());
      return false;
    }
    response.append(chunk.data(), static_cast<std::size_t>(bytes));
    if (!body_offset) {
      body_offset = FindHeaderEnd(response);
      if (!body_offset) {
        if (response.size() > kMaxHeaderSize) {
          SetError(error, "response headers too large");
          return false;
        }
        continue;
      }
      const std::string_view headers(response.data(), *body_offset - 4);
      const auto status = ParseStatusCode(headers);
      if (!status) {
        SetError(error, "malformed HTTP response");
        return false;
      }
      if (*status < 200 || *status >= 300) {
        SetError(error, "Blossom fetch returned status: " + std::to_string(*status));
        return false;
      }
      content_length = ParseContentLength(headers);
      chunked = IsChunked(headers);
      if (content_length && *content_length > max_bytes) {
        SetError(error, "Blossom blob too large: " + std::to_string(*content_length) +
                            " bytes (max " + std::to_string(max_bytes) + ")");
        return false;
      }
    }
    const std::size_t received = response.size() - *body_offset;
    const std::size_t allowance = chunked ? kChunkFramingAllowance : 0;
    if (received > max_bytes + allowance) {
      SetError(error, "Blossom blob too large while streaming: " + std::to_string(received) +
                          " bytes (max " + std::to_string(max_bytes) + ")");
      return false;
    }
    if (content_length && received >= *content_length) {
      break;
    }
  }
  if (!body_offset) {
    SetError(error, "connection closed before response headers");
    return false;
  }

  std::string payload = response.substr(*body_offset);
  if (chunked) {
    std::string decoded;
    std::string chunk_error;
    if (!DecodeChunkedBody(payload, max_bytes, &decoded, &chunk_error)) {
      SetError(error, "malformed chunked response: " + chunk_error);
      return false;
    }
    payload = std::move(decoded);
  } else if (content_length) {
    if (payload.size() < *content_length) {
      SetError(error, "connection closed before the full body arrived");
      return false;
    }
    payload.resize(*content_length);
  }
  if (payload.size() > max_bytes) {
    SetError(error, "Blossom blob too large while streaming: " +
                        std::to_string(payload.size()) + " bytes (max " +
                        std::to_string(max_bytes) + ")");
    return false;
  }
  body->assign(payload.begin(), payload.end());
  util::LogDebug("fetched " + std::to_string(body->size()) + " bytes from " + target->host);
  return true;
}

}  // namespace mostrix::net
