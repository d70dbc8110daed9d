#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mostrix::client {

// Counterparty side of a dispute chat channel.
enum class ChatParty { kBuyer, kSeller };

enum class ChatSender { kAdmin, kBuyer, kSeller };

// "buyer" / "seller".
const char* ChatPartyName(ChatParty party);
std::optional<ChatParty> ParseChatParty(std::string_view name);

// "Admin" / "Buyer" / "Seller", as written to transcripts.
const char* ChatSenderName(ChatSender sender);
std::optional<ChatSender> ParseChatSender(std::string_view name);

ChatSender SenderForParty(ChatParty party);

struct DisputeChatMessage {
  ChatSender sender{ChatSender::kAdmin};
  std::string content;
  std::int64_t timestamp{0};
  // Set for admin messages: the party the message was addressed to.
  std::optional<ChatParty> target_party;

  bool operator==(const DisputeChatMessage&) const = default;
};

}  // namespace mostrix::client
