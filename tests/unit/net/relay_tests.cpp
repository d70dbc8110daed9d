#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "crypto/keys.hpp"
#include "net/https_transfer.hpp"
#include "net/memory_relay.hpp"
#include "net/socket.hpp"
#include "protocol/event.hpp"
#include "protocol/filter.hpp"

using namespace mostrix;

namespace {

protocol::Event SignedNote(const crypto::Keys& keys, std::int64_t created_at,
                           const std::string& recipient) {
  protocol::Event event;
  event.kind = protocol::kKindGiftWrap;
  event.created_at = created_at;
  event.tags.push_back({"p", recipient});
  event.content = "payload " + std::to_string(created_at);
  protocol::SignEvent(&event, keys);
  return event;
}

bool TestMemoryRelay() {
  net::MemoryRelay relay;
  const auto author = crypto::Keys::Generate();
  const std::string alice(64, 'a');
  const std::string bob(64, 'b');

  auto subscription = relay.Subscribe(protocol::Filter().Kind(protocol::kKindGiftWrap).Pubkey(bob));

  protocol::Event unsigned_event;
  unsigned_event.kind = protocol::kKindGiftWrap;
  std::string error;
  if (relay.Publish(unsigned_event, &error)) {
    std::cerr << "unsigned event accepted\n";
    return false;
  }

  for (std::int64_t ts : {100, 300, 200}) {
    if (!relay.Publish(SignedNote(author, ts, alice), &error)) {
      std::cerr << "publish failed: " << error << "\n";
      return false;
    }
  }
  const auto to_bob = SignedNote(author, 400, bob);
  if (!relay.Publish(to_bob) || !relay.Publish(to_bob) || relay.Events().size() != 4) {
    std::cerr << "duplicate publish was stored twice\n";
    return false;
  }

  std::vector<protocol::Event> events;
  if (!relay.Fetch(protocol::Filter().Pubkey(alice).Limit(2), std::chrono::seconds(1), &events,
                   &error)) {
    std::cerr << "fetch failed: " << error << "\n";
    return false;
  }
  if (events.size() != 2 || events[0].created_at != 300 || events[1].created_at != 200) {
    std::cerr << "fetch did not return the newest events first\n";
    return false;
  }

  const auto live = subscription->Next(std::chrono::milliseconds(100));
  if (!live || live->id != to_bob.id) {
    std::cerr << "subscription missed a matching event\n";
    return false;
  }
  if (subscription->Next(std::chrono::milliseconds(10))) {
    std::cerr << "subscription delivered a non-matching event\n";
    return false;
  }

  relay.SetFetchFailure(std::string("relay offline"));
  if (relay.Fetch(protocol::Filter(), std::chrono::seconds(1), &events, &error) ||
      error != "relay offline") {
    std::cerr << "fetch failure not reported\n";
    return false;
  }
  relay.SetFetchFailure(std::nullopt);
  if (relay.FetchCount() != 2) {
    std::cerr << "unexpected fetch count " << relay.FetchCount() << "\n";
    return false;
  }
  return true;
}

bool TestParseHttpsUrl() {
  const auto url = net::ParseHttpsUrl("https://blossom.example.com:8443/ab/cd?x=1");
  if (!url || url->host != "blossom.example.com" || url->port != 8443 ||
      url->path != "/ab/cd?x=1") {
    std::cerr << "https url parsed incorrectly\n";
    return false;
  }
  const auto bare = net::ParseHttpsUrl("https://cdn.example.org");
  if (!bare || bare->port != 443 || bare->path != "/") {
    std::cerr << "bare https url parsed incorrectly\n";
    return false;
  }
  if (net::ParseHttpsUrl("http://cdn.example.org/x") || net::ParseHttpsUrl("https://:443/") ||
      net::ParseHttpsUrl("https://host:99999/")) {
    std::cerr << "invalid url accepted\n";
    return false;
  }
  return true;
}

bool TestResponseFraming() {
  const std::string response =
      "HTTP/1.1 200 OK\r\nContent-Type: application/octet-stream\r\ncontent-length:  12\r\n\r\n"
      "hello world!";
  const auto header_end = net::FindHeaderEnd(response);
  if (!header_end || response.substr(*header_end) != "hello world!") {
    std::cerr << "header end not found\n";
    return false;
  }
  const std::string_view headers(response.data(), *header_end);
  if (net::ParseStatusCode(headers) != 200 || net::ParseContentLength(headers) != 12u ||
      net::IsChunked(headers)) {
    std::cerr << "response headers parsed incorrectly\n";
    return false;
  }
  if (net::ParseStatusCode("HTTP/1.1 404 Not Found\r\n") != 404 ||
      net::ParseStatusCode("SIP/2.0 200 OK\r\n")) {
    std::cerr << "status line parsed incorrectly\n";
    return false;
  }

  if (!net::IsChunked("HTTP/1.1 200 OK\r\nTransfer-Encoding: Chunked\r\n")) {
    std::cerr << "chunked encoding not detected\n";
    return false;
  }
  std::string body;
  if (!net::DecodeChunkedBody("5\r\nhello\r\n7;ext=1\r\n, world\r\n0\r\n\r\n", 64, &body) ||
      body != "hello, world") {
    std::cerr << "chunked body decoded incorrectly: " << body << "\n";
    return false;
  }
  if (net::DecodeChunkedBody("a\r\nshort\r\n", 64, &body) ||
      net::DecodeChunkedBody("zz\r\nhello\r\n0\r\n\r\n", 64, &body) ||
      net::DecodeChunkedBody("5\r\nhelloXX0\r\n\r\n", 64, &body)) {
    std::cerr << "truncated or malformed chunked body accepted\n";
    return false;
  }
  std::string error;
  if (net::DecodeChunkedBody("5\r\nhello\r\n7\r\n, world\r\n0\r\n\r\n", 8, &body, &error) ||
      error.find("exceeds 8 bytes") == std::string::npos) {
    std::cerr << "chunked body over the cap accepted\n";
    return false;
  }
  return true;
}

bool TestChunkSizeOverflow() {
  // Sizes near SIZE_MAX must not wrap the bounds check.
  std::string hostile;
  while (hostile.size() < 3000) {
    hostile += "ffffffffffffffff\r\n";
  }
  std::string body;
  std::string error;
  if (net::DecodeChunkedBody(hostile, 25 * 1024 * 1024, &body, &error) || !body.empty()) {
    std::cerr << "overflowing chunk size accepted, decoded " << body.size() << " bytes\n";
    return false;
  }
  const std::string near_max = "fffffffffffffffe\r\nab\r\n0\r\n\r\n";
  if (net::DecodeChunkedBody(near_max, SIZE_MAX, &body, &error) || !body.empty()) {
    std::cerr << "chunk larger than the input accepted\n";
    return false;
  }
  return true;
}

bool TestStreamEnd() {
  using net::StreamEnd;
  if (!net::AcceptStreamEnd(StreamEnd::kCleanClose, true, false) ||
      !net::AcceptStreamEnd(StreamEnd::kAbruptClose, true, true) ||
      net::AcceptStreamEnd(StreamEnd::kAbruptClose, true, false) ||
      net::AcceptStreamEnd(StreamEnd::kCleanClose, false, true)) {
    std::cerr << "unframed body accepted after an abrupt close\n";
    return false;
  }
  net::TcpSocket unconnected;
  if (unconnected.SetTimeout(1000)) {
    std::cerr << "timeout reported as set on a closed socket\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!TestMemoryRelay() || !TestParseHttpsUrl() || !TestResponseFraming() ||
        !TestChunkSizeOverflow() || !TestStreamEnd()) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "relay_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  std::cout << "relay_tests: OK\n";
  return EXIT_SUCCESS;
}
