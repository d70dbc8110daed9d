#include "client/order_listener.hpp"

#include <algorithm>
#include <utility>

#include "protocol/filter.hpp"
#include "protocol/gift_wrap.hpp"
#include "util/logging.hpp"

namespace mostrix::client {

using protocol::Action;

const char* ActionLabel(Action action) {
  switch (action) {
    case Action::kAddInvoice:
      return "Invoice Request";
    case Action::kPayInvoice:
      return "Payment Request";
    case Action::kTakeSell:
      return "Take Sell";
    case Action::kTakeBuy:
      return "Take Buy";
    case Action::kFiatSent:
      return "Fiat Sent";
    case Action::kFiatSentOk:
      return "Fiat Received";
    case Action::kRelease:
    case Action::kReleased:
      return "Release";
    case Action::kDispute:
    case Action::kDisputeInitiatedByYou:
      return "Dispute";
    case Action::kWaitingSellerToPay:
      return "Waiting for Seller to Pay";
    case Action::kRate:
      return "Rate Counterparty";
    case Action::kRateReceived:
      return "Rate Counterparty received";
    default:
      return "New Message";
  }
}

OrderListener::OrderListener(const crypto::KeyDeriver& deriver, net::RelayClient& relay,
                             std::chrono::milliseconds fetch_timeout)
    : deriver_(deriver),
      relay_(relay),
      fetch_timeout_(fetch_timeout),
      notifications_(kNotificationBacklog) {}

void OrderListener::Track(const std::string& order_id, std::int64_t trade_index) {
  std::lock_guard<std::mutex> lock(mutex_);
  tracked_[order_id] = trade_index;
}

void OrderListener::Untrack(const std::string& order_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  tracked_.erase(order_id);
  messages_.erase(order_id);
}

std::size_t OrderListener::TrackActive(const Store& store) {
  const auto active = store.GetActiveTrades();
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& trade : active) {
    tracked_[trade.order_id] = trade.trade_index;
  }
  return tracked_.size();
}

std::optional<OrderMessage> OrderListener::Latest(const std::string& order_id,
                                                  std::int64_t trade_index) {
  const auto trade_keys = deriver_.DeriveTradeKey(trade_index);
  std::vector<protocol::Event> events;
  std::string error;
  const auto filter = protocol::Filter()
                          .Kind(protocol::kKindGiftWrap)
                          .Pubkey(trade_keys.PublicKeyHex())
                          .Limit(kOrderFetchLimit);
  if (!relay_.Fetch(filter, fetch_timeout_, &events, &error)) {
    util::LogWarn("order " + order_id + ": fetch failed: " + error);
    return std::nullopt;
  }
  const auto direct = protocol::ParseDirectMessages(events, trade_keys);
  if (direct.empty()) {
    return std::nullopt;
  }
  const auto& newest = direct.back();
  OrderMessage message;
  message.order_id = order_id;
  message.trade_index = trade_index;
  message.message = newest.message;
  message.timestamp = newest.created_at;
  message.sender = newest.sender;
  const auto& kind = newest.message.kind;
  if (kind.action == Action::kPayInvoice) {
    if (const auto* request = protocol::PayloadAs<protocol::PaymentRequest>(kind)) {
      message.invoice = request->invoice;
      if (request->amount) {
        message.sat_amount = request->amount;
      } else if (request->order) {
        message.sat_amount = request->order->amount;
      }
    }
  } else if (kind.action == Action::kAddInvoice) {
    if (const auto* order = protocol::PayloadAs<protocol::SmallOrder>(kind)) {
      message.sat_amount = order->amount;
    }
  }
  return message;
}

std::vector<MessageNotification> OrderListener::PollOnce() {
  std::map<std::string, std::int64_t> tracked;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    tracked = tracked_;
  }

  std::vector<MessageNotification> fresh;
  for (const auto& [order_id, trade_index] : tracked) {
    std::optional<OrderMessage> latest;
    try {
      latest = Latest(order_id, trade_index);
    } catch (const std::exception& e) {
      util::LogWarn("order " + order_id + ": poll failed: " + e.what());
      continue;
    }
    if (!latest) {
      continue;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (tracked_.find(order_id) == tracked_.end()) {
      continue;
    }
    const auto existing = messages_.find(order_id);
    const bool is_new =
        existing == messages_.end() || latest->timestamp > existing->second.timestamp ||
        (latest->timestamp == existing->second.timestamp &&
         latest->message.kind.action != existing->second.message.kind.action);
    if (!is_new) {
      continue;
    }
    ++pending_;
    MessageNotification notification;
    notification.order_id = order_id;
    notification.action = latest->message.kind.action;
    notification.label = ActionLabel(notification.action);
    notification.timestamp = latest->timestamp;
    notification.sat_amount = latest->sat_amount;
    notification.invoice = latest->invoice;
    messages_[order_id] = std::move(*latest);
    util::LogDebug("order " + order_id + ": " + notification.label);
    if (!notifications_.Push(notification)) {
      util::LogDebug("notification backlog full; dropped the oldest entry");
    }
    fresh.push_back(std::move(notification));
  }
  return fresh;
}

std::size_t OrderListener::PendingNotifications() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_;
}

void OrderListener::MarkAllRead() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& entry : messages_) {
    entry.second.read = true;
  }
  pending_ = 0;
}

std::vector<OrderMessage> OrderListener::Messages() const {
  std::vector<OrderMessage> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    out.reserve(messages_.size());
    for (const auto& entry : messages_) {
      out.push_back(entry.second);
    }
  }
  std::stable_sort(out.begin(), out.end(), [](const OrderMessage& a, const OrderMessage& b) {
    return a.timestamp > b.timestamp;
  });
  return out;
}

}  // namespace mostrix::client
