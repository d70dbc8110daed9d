#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "client/scheduler.hpp"
#include "client/store.hpp"
#include "crypto/key_deriver.hpp"
#include "net/relay.hpp"
#include "protocol/message.hpp"

namespace mostrix::client {

constexpr std::chrono::seconds kOrderPollInterval{5};
constexpr std::size_t kOrderFetchLimit = 5;
// Undrained notifications kept before the oldest is dropped.
constexpr std::size_t kNotificationBacklog = 256;

// Short label shown to the user for a daemon message.
const char* ActionLabel(protocol::Action action);

// Latest daemon message seen on one trade key.
struct OrderMessage {
  std::string order_id;
  std::int64_t trade_index{0};
  protocol::Message message;
  std::int64_t timestamp{0};
  crypto::XOnlyPublicKey sender{};
  bool read{false};
  std::optional<std::int64_t> sat_amount;
  std::optional<std::string> invoice;
};

struct MessageNotification {
  std::string order_id;
  protocol::Action action{protocol::Action::kNewOrder};
  std::string label;
  std::int64_t timestamp{0};
  std::optional<std::int64_t> sat_amount;
  std::optional<std::string> invoice;
};

// Polls the gift-wrap inbox of every tracked trade key and keeps the newest
// message per order. A message counts as new when its order had none yet,
// when it is newer, or when it has the same timestamp but another action.
class OrderListener {
 public:
  OrderListener(const crypto::KeyDeriver& deriver, net::RelayClient& relay,
                std::chrono::milliseconds fetch_timeout = net::kFetchEventsTimeout);

  void Track(const std::string& order_id, std::int64_t trade_index);
  void Untrack(const std::string& order_id);
  // Tracks every active trade in `store`; returns how many are tracked.
  std::size_t TrackActive(const Store& store);

  // One poll over all tracked trades. Per-trade failures are logged and do
  // not affect the others.
  std::vector<MessageNotification> PollOnce();

  std::size_t PendingNotifications() const;
  // Marks every message read and clears the counter.
  void MarkAllRead();

  // Newest first.
  std::vector<OrderMessage> Messages() const;

  ResultChannel<MessageNotification>& notifications() { return notifications_; }

 private:
  std::optional<OrderMessage> Latest(const std::string& order_id, std::int64_t trade_index);

  const crypto::KeyDeriver& deriver_;
  net::RelayClient& relay_;
  std::chrono::milliseconds fetch_timeout_;
  ResultChannel<MessageNotification> notifications_;

  mutable std::mutex mutex_;
  std::map<std::string, std::int64_t> tracked_;
  std::map<std::string, OrderMessage> messages_;
  std::size_t pending_{0};
};

}  // namespace mostrix::client
