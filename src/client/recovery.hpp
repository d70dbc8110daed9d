#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "client/store.hpp"
#include "crypto/key_deriver.hpp"
#include "net/relay.hpp"
#include "protocol/gift_wrap.hpp"
#include "protocol/message.hpp"

namespace mostrix::client {

// Trade state as reconstructed from the daemon's messages.
struct TradeState {
  std::string order_id;
  std::int64_t trade_index{0};
  std::optional<protocol::Action> last_action;
  std::optional<protocol::Status> status;
  std::optional<std::string> counterpart_pubkey;
  // Pending artifacts: an invoice to pay (pay-invoice) or the sat amount an
  // invoice must be created for (add-invoice).
  std::optional<std::string> invoice;
  std::optional<std::int64_t> sat_amount;
  std::optional<std::string> dispute_id;
  std::int64_t last_update{0};

  bool operator==(const TradeState&) const = default;
};

// Status an order is in after the daemon sends `action`; nullopt for
// actions that do not move the order.
std::optional<protocol::Status> StatusAfterAction(protocol::Action action);

// Reducer: folds one decoded message into the state. Messages older than the
// last applied one and cant-do replies leave the state unchanged.
TradeState ApplyTradeMessage(TradeState state, const protocol::DirectMessage& message);
TradeState FoldTradeMessages(TradeState initial,
                             const std::vector<protocol::DirectMessage>& messages);

struct RecoveredTrade {
  enum class Status {
    kRecovered,
    kNoMessages,
    kFetchFailed,
    // Events arrived but none could be decoded.
    kDecodeFailed,
    // Another stored trade claims the same index.
    kDuplicateIndex,
    kKeyError,
  };

  std::string order_id;
  std::int64_t trade_index{0};
  Status status{Status::kNoMessages};
  TradeState state;
  std::string error;
};

const char* RecoveredTradeStatusName(RecoveredTrade::Status status);

// Startup reconstruction of every active trade from the relays. Each trade is
// recovered independently; a failure in one never blocks the others.
class RecoveryEngine {
 public:
  static constexpr std::size_t kFetchLimit = 20;

  RecoveryEngine(const crypto::KeyDeriver& deriver, net::RelayClient& relay, Store& store,
                 std::chrono::milliseconds timeout = net::kFetchEventsTimeout);

  std::vector<RecoveredTrade> Recover();

  // Single trade; does not check for duplicate indices.
  RecoveredTrade RecoverTrade(const ActiveTrade& trade);

 private:
  const crypto::KeyDeriver& deriver_;
  net::RelayClient& relay_;
  Store& store_;
  std::chrono::milliseconds timeout_;
};

}  // namespace mostrix::client
