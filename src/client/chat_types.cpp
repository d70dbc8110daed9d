#include "client/chat_types.hpp"

namespace mostrix::client {

const char* ChatPartyName(ChatParty party) {
  switch (party) {
    case ChatParty::kBuyer:
      return "buyer";
    case ChatParty::kSeller:
      return "seller";
  }
  return "buyer";
}

std::optional<ChatParty> ParseChatParty(std::string_view name) {
  if (name == "buyer") {
    return ChatParty::kBuyer;
  }
  if (name == "seller") {
    return ChatParty::kSeller;
  }
  return std::nullopt;
}

const char* ChatSenderName(ChatSender sender) {
  switch (sender) {
    case ChatSender::kAdmin:
      return "Admin";
    case ChatSender::kBuyer:
      return "Buyer";
    case ChatSender::kSeller:
      return "Seller";
  }
  return "Admin";
}

std::optional<ChatSender> ParseChatSender(std::string_view name) {
  if (name == "Admin") {
    return ChatSender::kAdmin;
  }
  if (name == "Buyer") {
    return ChatSender::kBuyer;
  }
  if (name == "Seller") {
    return ChatSender::kSeller;
  }
  return std::nullopt;
}

ChatSender SenderForParty(ChatParty party) {
  return party == ChatParty::kBuyer ? ChatSender::kBuyer : ChatSender::kSeller;
}

}  // namespace mostrix::client
