#include "protocol/event.hpp"

#include <algorithm>
#include <bit>

#include "crypto/secp256k1.hpp"
#include "util/csprng.hpp"
#include "util/hex.hpp"

namespace mostrix::protocol {

namespace {

void SetError(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
}

}  // namespace

std::string SerializeForId(const Event& event) {
  nlohmann::json array = nlohmann::json::array();
  array.push_back(0);
  array.push_back(event.pubkey);
  array.push_back(event.created_at);
  array.push_back(event.kind);
  array.push_back(event.tags);
  array.push_back(event.content);
  return array.dump();
}

crypto::Sha256Hash ComputeEventId(const Event& event) {
  return crypto::Sha256(crypto::AsBytes(SerializeForId(event)));
}

void FinalizeUnsigned(Event* event, const crypto::XOnlyPublicKey& author) {
  event->pubkey = crypto::PublicKeyHex(author);
  event->id = util::HexEncode(ComputeEventId(*event));
  event->sig.clear();
}

void SignEvent(Event* event, const crypto::Keys& keys) {
  event->pubkey = keys.PublicKeyHex();
  const auto id = ComputeEventId(*event);
  event->id = util::HexEncode(id);
  event->sig = util::HexEncode(keys.Sign(id));
}

bool VerifyEvent(const Event& event, std::string* error) {
  crypto::XOnlyPublicKey pubkey{};
  if (!util::HexDecode32(event.pubkey, &pubkey)) {
    SetError(error, "event pubkey is not 32-byte hex");
    return false;
  }
  const auto id = ComputeEventId(event);
  if (util::HexEncode(id) != event.id) {
    SetError(error, "event id does not match contents");
    return false;
  }
  std::vector<std::uint8_t> sig_bytes;
  if (!util::HexDecode(event.sig, &sig_bytes) || sig_bytes.size() != 64) {
    SetError(error, "event signature is not 64-byte hex");
    return false;
  }
  crypto::SchnorrSignature sig{};
  std::copy(sig_bytes.begin(), sig_bytes.end(), sig.begin());
  if (!crypto::SchnorrVerify(pubkey, id, sig)) {
    SetError(error, "invalid event signature");
    return false;
  }
  return true;
}

nlohmann::json EventToJson(const Event& event) {
  nlohmann::json json;
  json["id"] = event.id;
  json["pubkey"] = event.pubkey;
  json["created_at"] = event.created_at;
  json["kind"] = event.kind;
  json["tags"] = event.tags;
  json["content"] = event.content;
  if (!event.sig.empty()) {
    json["sig"] = event.sig;
  }
  return json;
}

std::string EventToJsonString(const Event& event) { return EventToJson(event).dump(); }

bool EventFromJson(const nlohmann::json& json, Event* event, std::string* error) {
  if (!json.is_object()) {
    SetError(error, "event is not a JSON object");
    return false;
  }
  try {
    Event parsed;
    parsed.id = json.value("id", std::string{});
    parsed.pubkey = json.at("pubkey").get<std::string>();
    parsed.created_at = json.at("created_at").get<std::int64_t>();
    parsed.kind = json.at("kind").get<std::uint32_t>();
    parsed.tags = json.value("tags", Tags{});
    parsed.content = json.at("content").get<std::string>();
    if (json.contains("sig") && !json["sig"].is_null()) {
      parsed.sig = json["sig"].get<std::string>();
    }
    *event = std::move(parsed);
  } catch (const nlohmann::json::exception& ex) {
    SetError(error, std::string("malformed event: ") + ex.what());
    return false;
  }
  return true;
}

bool ParseEventJson(std::string_view text, Event* event, std::string* error) {
  auto json = nlohmann::json::parse(text, nullptr, false);
  if (json.is_discarded()) {
    SetError(error, "event is not valid JSON");
    return false;
  }
  return EventFromJson(json, event, error);
}

std::optional<std::string> FirstTagValue(const Event& event, std::string_view name) {
  for (const auto& tag : event.tags) {
    if (tag.size() >= 2 && tag[0] == name) {
      return tag[1];
    }
  }
  return std::nullopt;
}

Tag ExpirationTag(std::int64_t unix_seconds) {
  return {"expiration", std::to_string(unix_seconds)};
}

int LeadingZeroBits(const crypto::Sha256Hash& id) {
  int bits = 0;
  for (std::uint8_t byte : id) {
    if (byte == 0) {
      bits += 8;
      continue;
    }
    bits += std::countl_zero(byte);
    break;
  }
  return bits;
}

void MineAndSign(Event* event, const crypto::Keys& keys, std::uint8_t difficulty) {
  if (difficulty == 0) {
    SignEvent(event, keys);
    return;
  }
  event->pubkey = keys.PublicKeyHex();
  event->tags.push_back({"nonce", "0", std::to_string(difficulty)});
  auto& nonce_tag = event->tags.back();
  for (std::uint64_t counter = 0;; ++counter) {
    nonce_tag[1] = std::to_string(counter);
    if (LeadingZeroBits(ComputeEventId(*event)) >= difficulty) {
      break;
    }
  }
  SignEvent(event, keys);
}

std::int64_t TweakedTimestamp(std::int64_t now) {
  const auto offset =
      static_cast<std::int64_t>(util::RandomU64() % static_cast<std::uint64_t>(kMaxTimestampTweakSeconds));
  return now - offset;
}

}  // namespace mostrix::protocol
