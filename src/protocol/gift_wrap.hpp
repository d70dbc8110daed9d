#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "crypto/keys.hpp"
#include "protocol/event.hpp"
#include "protocol/message.hpp"

namespace mostrix::protocol {

// How the seal of an outgoing envelope is signed.
//   kReputation:  seal by the identity key, rumor by the trade key; the
//                 message carries a trade-key signature.
//   kFullPrivacy: seal and rumor by the trade key; no message signature, so
//                 nothing links the trade to the long-term identity.
enum class PrivacyMode { kReputation, kFullPrivacy };

struct EnvelopeOptions {
  PrivacyMode mode{PrivacyMode::kReputation};
  // NIP-13 difficulty applied to the outer wrap.
  std::uint8_t pow{0};
  std::optional<std::int64_t> expiration;
};

struct DecodedEnvelope {
  Message message;
  // Rumor author (the sender's trade key).
  crypto::XOnlyPublicKey sender{};
  // Seal signer: identity key in reputation mode, trade key otherwise.
  crypto::XOnlyPublicKey seal_signer{};
  std::int64_t created_at{0};
  std::string event_id;
  bool signature_present{false};
};

// Three-layer NIP-59 envelope addressed to `recipient`. `identity_keys` is
// required in reputation mode; throws std::invalid_argument without it.
Event EncodeEnvelope(const Message& message, const crypto::Keys& trade_keys,
                     const crypto::Keys* identity_keys, const crypto::XOnlyPublicKey& recipient,
                     const EnvelopeOptions& options = {});

// Any failure (wrong key, bad ciphertext, bad signature, malformed payload)
// returns false with a reason; callers in listener loops log and skip.
bool DecodeEnvelope(const Event& wrap, const crypto::Keys& receiver, DecodedEnvelope* out,
                    std::string* error = nullptr);

// Kind 14 event carrying the NIP-44 encrypted message JSON directly, signed
// by the trade key. Used between trading peers.
Event EncodePrivateDm(const Message& message, const crypto::Keys& trade_keys,
                      const crypto::XOnlyPublicKey& recipient);
bool DecodePrivateDm(const Event& event, const crypto::Keys& receiver, DecodedEnvelope* out,
                     std::string* error = nullptr);

// Dispute chat: a kind-1 note signed by `author`, NIP-44 encrypted from a
// one-time key to the shared chat key, wrapped as kind 1059. The note is
// stamped with `created_at` when given, the current time otherwise.
Event WrapChatMessage(const crypto::Keys& author, const crypto::XOnlyPublicKey& shared_pubkey,
                      const std::string& content, std::uint8_t pow = 0,
                      std::optional<std::int64_t> created_at = std::nullopt);
// Returns the verified inner note.
bool UnwrapChatMessage(const Event& wrap, const crypto::Keys& shared_keys, Event* inner,
                       std::string* error = nullptr);

struct DirectMessage {
  Message message;
  std::int64_t created_at{0};
  crypto::XOnlyPublicKey sender{};
};

// Decodes a batch of gift wraps and kind-14 events addressed to `receiver`.
// Undecodable events are skipped with a warning, repeated ids are dropped,
// events older than `since` are filtered when it is given, and the result is
// sorted by timestamp.
std::vector<DirectMessage> ParseDirectMessages(const std::vector<Event>& events,
                                               const crypto::Keys& receiver,
                                               std::optional<std::int64_t> since = std::nullopt);

}  // namespace mostrix::protocol
