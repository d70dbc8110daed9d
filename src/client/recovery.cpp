#include "client/recovery.hpp"

#include <map>
#include <utility>

#include "util/logging.hpp"

namespace mostrix::client {

using protocol::Action;

std::optional<protocol::Status> StatusAfterAction(Action action) {
  switch (action) {
    case Action::kNewOrder:
      return protocol::Status::kPending;
    case Action::kPayInvoice:
    case Action::kWaitingSellerToPay:
      return protocol::Status::kWaitingPayment;
    case Action::kAddInvoice:
    case Action::kWaitingBuyerInvoice:
      return protocol::Status::kWaitingBuyerInvoice;
    case Action::kBuyerTookOrder:
    case Action::kBuyerInvoiceAccepted:
    case Action::kHoldInvoicePaymentAccepted:
      return protocol::Status::kActive;
    case Action::kFiatSent:
    case Action::kFiatSentOk:
      return protocol::Status::kFiatSent;
    case Action::kReleased:
    case Action::kHoldInvoicePaymentSettled:
      return protocol::Status::kSettledHoldInvoice;
    case Action::kPurchaseCompleted:
    case Action::kRate:
    case Action::kRateReceived:
      return protocol::Status::kSuccess;
    case Action::kCanceled:
    case Action::kHoldInvoicePaymentCanceled:
      return protocol::Status::kCanceled;
    case Action::kCooperativeCancelAccepted:
      return protocol::Status::kCooperativelyCanceled;
    case Action::kDisputeInitiatedByYou:
    case Action::kDisputeInitiatedByPeer:
      return protocol::Status::kDispute;
    case Action::kAdminCanceled:
      return protocol::Status::kCanceledByAdmin;
    case Action::kAdminSettled:
      return protocol::Status::kSettledByAdmin;
    default:
      return std::nullopt;
  }
}

TradeState ApplyTradeMessage(TradeState state, const protocol::DirectMessage& message) {
  const auto& kind = message.message.kind;
  if (message.created_at < state.last_update) {
    return state;
  }
  if (kind.action == Action::kCantDo || protocol::PayloadAs<protocol::CantDo>(kind)) {
    return state;
  }
  state.last_update = message.created_at;
  state.last_action = kind.action;
  if (const auto status = StatusAfterAction(kind.action)) {
    state.status = *status;
  }
  state.invoice.reset();
  state.sat_amount.reset();
  if (const auto* order = protocol::PayloadAs<protocol::SmallOrder>(kind)) {
    if (order->status) {
      state.status = *order->status;
    }
    if (kind.action == Action::kAddInvoice) {
      state.sat_amount = order->amount;
    }
  } else if (const auto* request = protocol::PayloadAs<protocol::PaymentRequest>(kind)) {
    if (kind.action == Action::kPayInvoice) {
      state.invoice = request->invoice;
    }
    if (kind.action == Action::kAddInvoice && request->order) {
      state.sat_amount = request->order->amount;
    }
  } else if (const auto* peer = protocol::PayloadAs<protocol::Peer>(kind)) {
    state.counterpart_pubkey = peer->pubkey;
  } else if (const auto* dispute = protocol::PayloadAs<protocol::DisputePayload>(kind)) {
    state.dispute_id = dispute->dispute_id;
  }
  return state;
}

TradeState FoldTradeMessages(TradeState initial,
                             const std::vector<protocol::DirectMessage>& messages) {
  TradeState state = std::move(initial);
  for (const auto& message : messages) {
    state = ApplyTradeMessage(std::move(state), message);
  }
  return state;
}

const char* RecoveredTradeStatusName(RecoveredTrade::Status status) {
  switch (status) {
    case RecoveredTrade::Status::kRecovered:
      return "recovered";
    case RecoveredTrade::Status::kNoMessages:
      return "no-messages";
    case RecoveredTrade::Status::kFetchFailed:
      return "fetch-failed";
    case RecoveredTrade::Status::kDecodeFailed:
      return "decode-failed";
    case RecoveredTrade::Status::kDuplicateIndex:
      return "duplicate-index";
    case RecoveredTrade::Status::kKeyError:
      return "key-error";
  }
  return "unknown";
}

RecoveryEngine::RecoveryEngine(const crypto::KeyDeriver& deriver, net::RelayClient& relay,
                               Store& store, std::chrono::milliseconds timeout)
    : deriver_(deriver), relay_(relay), store_(store), timeout_(timeout) {}

std::vector<RecoveredTrade> RecoveryEngine::Recover() {
  std::map<std::int64_t, std::size_t> index_counts;
  for (const auto& order : store_.Orders()) {
    if (order.trade_index > 0) {
      ++index_counts[order.trade_index];
    }
  }

  std::vector<RecoveredTrade> results;
  for (const auto& trade : store_.GetActiveTrades()) {
    if (index_counts[trade.trade_index] > 1) {
      util::LogError("trade index " + std::to_string(trade.trade_index) +
                     " is shared by several orders; skipping recovery of " + trade.order_id);
      RecoveredTrade flagged;
      flagged.order_id = trade.order_id;
      flagged.trade_index = trade.trade_index;
      flagged.status = RecoveredTrade::Status::kDuplicateIndex;
      flagged.error = "duplicate trade index " + std::to_string(trade.trade_index);
      results.push_back(std::move(flagged));
      continue;
    }
    try {
      results.push_back(RecoverTrade(trade));
    } catch (const std::exception& ex) {
      util::LogWarn("recovery of " + trade.order_id + " failed: " + ex.what());
      RecoveredTrade failed;
      failed.order_id = trade.order_id;
      failed.trade_index = trade.trade_index;
      failed.status = RecoveredTrade::Status::kFetchFailed;
      failed.error = ex.what();
      results.push_back(std::move(failed));
    }
  }

  std::size_t recovered = 0;
  for (const auto& result : results) {
    if (result.status == RecoveredTrade::Status::kRecovered) {
      ++recovered;
    }
  }
  util::LogInfo("recovered " + std::to_string(recovered) + " of " +
                std::to_string(results.size()) + " active trades");
  return results;
}

RecoveredTrade RecoveryEngine::RecoverTrade(const ActiveTrade& trade) {
  RecoveredTrade result;
  result.order_id = trade.order_id;
  result.trade_index = trade.trade_index;
  result.state.order_id = trade.order_id;
  result.state.trade_index = trade.trade_index;

  std::optional<crypto::Keys> trade_keys;
  try {
    trade_keys.emplace(deriver_.DeriveTradeKey(trade.trade_index));
  } catch (const std::exception& ex) {
    result.status = RecoveredTrade::Status::kKeyError;
    result.error = ex.what();
    util::LogError("failed to derive trade keys for index " + std::to_string(trade.trade_index) +
                   ": " + ex.what());
    return result;
  }

  const auto filter = protocol::Filter()
                          .Kind(protocol::kKindGiftWrap)
                          .Pubkey(trade_keys->PublicKeyHex())
                          .Limit(kFetchLimit);
  std::vector<protocol::Event> events;
  std::string error;
  if (!relay_.Fetch(filter, timeout_, &events, &error)) {
    result.status = RecoveredTrade::Status::kFetchFailed;
    result.error = error;
    util::LogWarn("failed to fetch messages for trade index " +
                  std::to_string(trade.trade_index) + ": " + error);
    return result;
  }
  if (events.empty()) {
    result.status = RecoveredTrade::Status::kNoMessages;
    return result;
  }
  const auto messages = protocol::ParseDirectMessages(events, *trade_keys);
  if (messages.empty()) {
    result.status = RecoveredTrade::Status::kDecodeFailed;
    result.error = "no decodable messages";
    return result;
  }

  result.state = FoldTradeMessages(std::move(result.state), messages);
  result.status = RecoveredTrade::Status::kRecovered;

  if (result.state.status) {
    const auto stored = store_.GetOrder(trade.order_id);
    if (stored && stored->status != result.state.status) {
      if (!store_.UpdateOrderStatus(trade.order_id, *result.state.status, &error)) {
        util::LogWarn("failed to store recovered status for " + trade.order_id + ": " + error);
      }
    }
  }
  return result;
}

}  // namespace mostrix::client
