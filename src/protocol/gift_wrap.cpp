#include "protocol/gift_wrap.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

#include "crypto/nip44.hpp"
#include "util/hex.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace mostrix::protocol {

namespace {

void SetError(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
}

// Decrypts `content` that `sender_hex` encrypted for `receiver` and parses the
// result as an event.
bool OpenLayer(const std::string& content, const std::string& sender_hex,
               const crypto::Keys& receiver, Event* out, const char* layer, std::string* error) {
  crypto::XOnlyPublicKey sender{};
  if (!util::HexDecode32(sender_hex, &sender)) {
    SetError(error, std::string(layer) + " author is not a valid public key");
    return false;
  }
  std::string plaintext;
  std::string decrypt_error;
  if (!crypto::Nip44DecryptFrom(receiver.Secret(), sender, content, &plaintext, &decrypt_error)) {
    SetError(error, std::string("failed to decrypt ") + layer + ": " + decrypt_error);
    return false;
  }
  std::string parse_error;
  if (!ParseEventJson(plaintext, out, &parse_error)) {
    SetError(error, std::string("invalid ") + layer + ": " + parse_error);
    return false;
  }
  return true;
}

}  // namespace

Event EncodeEnvelope(const Message& message, const crypto::Keys& trade_keys,
                     const crypto::Keys* identity_keys, const crypto::XOnlyPublicKey& recipient,
                     const EnvelopeOptions& options) {
  const crypto::Keys* seal_signer = &trade_keys;
  nlohmann::json signature = nullptr;
  const std::string message_json = MessageToJsonString(message);
  if (options.mode == PrivacyMode::kReputation) {
    if (identity_keys == nullptr) {
      throw std::invalid_argument("identity keys are required for reputation mode");
    }
    seal_signer = identity_keys;
    signature = util::HexEncode(SignMessageJson(message_json, trade_keys));
  }
  const std::int64_t now = util::NowSeconds();

  Event rumor;
  rumor.kind = kKindTextNote;
  rumor.created_at = now;
  rumor.content = nlohmann::json::array({MessageToJson(message), signature}).dump();
  FinalizeUnsigned(&rumor, trade_keys.PublicKey());

  Event seal;
  seal.kind = kKindSeal;
  seal.created_at = TweakedTimestamp(now);
  seal.content = crypto::Nip44EncryptTo(seal_signer->Secret(), recipient, EventToJsonString(rumor));
  SignEvent(&seal, *seal_signer);

  const auto ephemeral = crypto::Keys::Generate();
  Event wrap;
  wrap.kind = kKindGiftWrap;
  wrap.created_at = TweakedTimestamp(now);
  wrap.tags.push_back({"p", crypto::PublicKeyHex(recipient)});
  if (options.expiration) {
    wrap.tags.push_back(ExpirationTag(*options.expiration));
  }
  wrap.content = crypto::Nip44EncryptTo(ephemeral.Secret(), recipient, EventToJsonString(seal));
  MineAndSign(&wrap, ephemeral, options.pow);
  return wrap;
}

bool DecodeEnvelope(const Event& wrap, const crypto::Keys& receiver, DecodedEnvelope* out,
                    std::string* error) {
  if (wrap.kind != kKindGiftWrap) {
    SetError(error, "event is not a gift wrap");
    return false;
  }
  Event seal;
  if (!OpenLayer(wrap.content, wrap.pubkey, receiver, &seal, "seal", error)) {
    return false;
  }
  std::string verify_error;
  if (seal.kind != kKindSeal || !VerifyEvent(seal, &verify_error)) {
    SetError(error, "invalid seal: " + (verify_error.empty() ? "unexpected kind" : verify_error));
    return false;
  }
  Event rumor;
  if (!OpenLayer(seal.content, seal.pubkey, receiver, &rumor, "rumor", error)) {
    return false;
  }
  if (util::HexEncode(ComputeEventId(rumor)) != rumor.id) {
    SetError(error, "rumor id does not match contents");
    return false;
  }

  DecodedEnvelope decoded;
  if (!util::HexDecode32(rumor.pubkey, &decoded.sender) ||
      !util::HexDecode32(seal.pubkey, &decoded.seal_signer)) {
    SetError(error, "rumor author is not a valid public key");
    return false;
  }
  auto content = nlohmann::json::parse(rumor.content, nullptr, false);
  if (content.is_discarded() || !content.is_array() || content.size() != 2) {
    SetError(error, "rumor content is not a [message, signature] pair");
    return false;
  }
  std::string parse_error;
  if (!MessageFromJson(content[0], &decoded.message, &parse_error)) {
    SetError(error, parse_error);
    return false;
  }
  if (!content[1].is_null()) {
    std::vector<std::uint8_t> sig_bytes;
    if (!content[1].is_string() || !util::HexDecode(content[1].get<std::string>(), &sig_bytes) ||
        sig_bytes.size() != 64) {
      SetError(error, "message signature is not 64-byte hex");
      return false;
    }
    crypto::SchnorrSignature sig{};
    std::copy(sig_bytes.begin(), sig_bytes.end(), sig.begin());
    if (!VerifyMessageJson(MessageToJsonString(decoded.message), decoded.sender, sig)) {
      SetError(error, "invalid message signature");
      return false;
    }
    decoded.signature_present = true;
  }
  decoded.created_at = rumor.created_at;
  decoded.event_id = wrap.id;
  *out = std::move(decoded);
  return true;
}

Event EncodePrivateDm(const Message& message, const crypto::Keys& trade_keys,
                      const crypto::XOnlyPublicKey& recipient) {
  Event event;
  event.kind = kKindPrivateDirectMessage;
  event.created_at = util::NowSeconds();
  event.tags.push_back({"p", crypto::PublicKeyHex(recipient)});
  event.content =
      crypto::Nip44EncryptTo(trade_keys.Secret(), recipient, MessageToJsonString(message));
  SignEvent(&event, trade_keys);
  return event;
}

bool DecodePrivateDm(const Event& event, const crypto::Keys& receiver, DecodedEnvelope* out,
                     std::string* error) {
  if (event.kind != kKindPrivateDirectMessage) {
    SetError(error, "event is not a private direct message");
    return false;
  }
  DecodedEnvelope decoded;
  if (!util::HexDecode32(event.pubkey, &decoded.sender)) {
    SetError(error, "event author is not a valid public key");
    return false;
  }
  std::string plaintext;
  std::string decrypt_error;
  if (!crypto::Nip44DecryptFrom(receiver.Secret(), decoded.sender, event.content, &plaintext,
                                &decrypt_error)) {
    SetError(error, "failed to decrypt direct message: " + decrypt_error);
    return false;
  }
  if (!ParseMessageJson(plaintext, &decoded.message, error)) {
    return false;
  }
  decoded.seal_signer = decoded.sender;
  decoded.created_at = event.created_at;
  decoded.event_id = event.id;
  *out = std::move(decoded);
  return true;
}

Event WrapChatMessage(const crypto::Keys& author, const crypto::XOnlyPublicKey& shared_pubkey,
                      const std::string& content, std::uint8_t pow,
                      std::optional<std::int64_t> created_at) {
  const std::int64_t now = created_at.value_or(util::NowSeconds());
  Event inner;
  inner.kind = kKindTextNote;
  inner.created_at = now;
  inner.content = content;
  SignEvent(&inner, author);

  const auto ephemeral = crypto::Keys::Generate();
  Event wrap;
  wrap.kind = kKindGiftWrap;
  wrap.created_at = TweakedTimestamp(now);
  wrap.tags.push_back({"p", crypto::PublicKeyHex(shared_pubkey)});
  wrap.content = crypto::Nip44EncryptTo(ephemeral.Secret(), shared_pubkey, EventToJsonString(inner));
  MineAndSign(&wrap, ephemeral, pow);
  return wrap;
}

bool UnwrapChatMessage(const Event& wrap, const crypto::Keys& shared_keys, Event* inner,
                       std::string* error) {
  if (wrap.kind != kKindGiftWrap) {
    SetError(error, "event is not a gift wrap");
    return false;
  }
  Event note;
  if (!OpenLayer(wrap.content, wrap.pubkey, shared_keys, &note, "chat event", error)) {
    return false;
  }
  std::string verify_error;
  if (!VerifyEvent(note, &verify_error)) {
    SetError(error, "invalid inner chat event signature: " + verify_error);
    return false;
  }
  *inner = std::move(note);
  return true;
}

std::vector<DirectMessage> ParseDirectMessages(const std::vector<Event>& events,
                                               const crypto::Keys& receiver,
                                               std::optional<std::int64_t> since) {
  std::unordered_set<std::string> seen;
  std::vector<DirectMessage> messages;
  for (const auto& event : events) {
    if (!seen.insert(event.id).second) {
      continue;
    }
    DecodedEnvelope decoded;
    std::string error;
    bool ok = false;
    if (event.kind == kKindGiftWrap) {
      ok = DecodeEnvelope(event, receiver, &decoded, &error);
      // The seal signer is the party the exchange daemon knows.
      decoded.sender = decoded.seal_signer;
    } else if (event.kind == kKindPrivateDirectMessage) {
      ok = DecodePrivateDm(event, receiver, &decoded, &error);
    } else {
      continue;
    }
    if (!ok) {
      util::LogWarn("Could not decode direct message (event " + event.id + "): " + error);
      continue;
    }
    if (since && decoded.created_at < *since) {
      continue;
    }
    messages.push_back({std::move(decoded.message), decoded.created_at, decoded.sender});
  }
  std::stable_sort(messages.begin(), messages.end(),
                   [](const DirectMessage& a, const DirectMessage& b) {
                     return a.created_at < b.created_at;
                   });
  return messages;
}

}  // namespace mostrix::protocol
