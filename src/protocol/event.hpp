#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "crypto/hash.hpp"
#include "crypto/keys.hpp"
#include "nlohmann/json.hpp"

namespace mostrix::protocol {

using Tag = std::vector<std::string>;
using Tags = std::vector<Tag>;

constexpr std::uint32_t kKindTextNote = 1;
constexpr std::uint32_t kKindSeal = 13;
constexpr std::uint32_t kKindPrivateDirectMessage = 14;
constexpr std::uint32_t kKindGiftWrap = 1059;
// Parameterized replaceable kind carrying public orders and disputes.
constexpr std::uint32_t kKindMostroOrder = 38383;

// Upper bound for the randomized created_at of seals and wraps.
constexpr std::int64_t kMaxTimestampTweakSeconds = 2 * 24 * 60 * 60;

// NIP-01 event. Keys, ids and signatures are carried as lowercase hex exactly
// as they appear on the wire; an unsigned rumor has an empty `sig`.
struct Event {
  std::string id;
  std::string pubkey;
  std::int64_t created_at{0};
  std::uint32_t kind{0};
  Tags tags;
  std::string content;
  std::string sig;
};

// [0, pubkey, created_at, kind, tags, content] in compact JSON.
std::string SerializeForId(const Event& event);
crypto::Sha256Hash ComputeEventId(const Event& event);

// Fill pubkey and id, leaving the signature empty (NIP-59 rumor).
void FinalizeUnsigned(Event* event, const crypto::XOnlyPublicKey& author);
// Fill pubkey, id and sig.
void SignEvent(Event* event, const crypto::Keys& keys);
// Checks the id commits to the contents and the signature is valid.
bool VerifyEvent(const Event& event, std::string* error = nullptr);

nlohmann::json EventToJson(const Event& event);
std::string EventToJsonString(const Event& event);
bool EventFromJson(const nlohmann::json& json, Event* event, std::string* error = nullptr);
bool ParseEventJson(std::string_view text, Event* event, std::string* error = nullptr);

// Value at position 1 of the first tag named `name`.
std::optional<std::string> FirstTagValue(const Event& event, std::string_view name);

// NIP-40.
Tag ExpirationTag(std::int64_t unix_seconds);

// NIP-13: number of leading zero bits of the event id.
int LeadingZeroBits(const crypto::Sha256Hash& id);

// Appends a ["nonce", counter, difficulty] tag and searches for a counter
// whose id has at least `difficulty` leading zero bits, then signs. A
// difficulty of zero signs immediately without a nonce tag.
void MineAndSign(Event* event, const crypto::Keys& keys, std::uint8_t difficulty);

// `now` moved back by a random amount below kMaxTimestampTweakSeconds.
std::int64_t TweakedTimestamp(std::int64_t now);

}  // namespace mostrix::protocol
