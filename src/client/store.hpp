#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "client/chat_types.hpp"
#include "protocol/message.hpp"

namespace mostrix::client {

struct UserRecord {
  std::string mnemonic;
  std::string identity_pubkey;
  std::int64_t created_at{0};
};

// A trade this client takes part in. The trade key is re-derived from the
// mnemonic and `trade_index`; `trade_keys` caches its secret hex.
struct OrderRecord {
  std::string id;
  std::optional<protocol::OrderKind> kind;
  std::optional<protocol::Status> status;
  std::int64_t amount{0};
  std::optional<std::int64_t> min_amount;
  std::optional<std::int64_t> max_amount;
  std::string fiat_code;
  std::int64_t fiat_amount{0};
  std::string payment_method;
  std::int64_t premium{0};
  std::int64_t trade_index{0};
  std::string trade_keys;
  std::optional<std::uint64_t> request_id;
  std::optional<std::string> buyer_invoice;
  bool is_mine{false};
  std::int64_t created_at{0};
  std::int64_t expires_at{0};

  bool operator==(const OrderRecord&) const = default;
};

struct ActiveTrade {
  std::string order_id;
  std::int64_t trade_index{0};

  bool operator==(const ActiveTrade&) const = default;
};

// Dispute taken by this client in arbitrator mode.
struct AdminDispute {
  std::string id;
  std::string dispute_id;
  protocol::DisputeStatus status{protocol::DisputeStatus::kInProgress};
  std::string initiator_pubkey;
  std::string buyer_pubkey;
  std::string seller_pubkey;
  bool initiator_full_privacy{false};
  bool counterpart_full_privacy{false};
  std::int64_t premium{0};
  std::string payment_method;
  std::int64_t amount{0};
  std::int64_t fiat_amount{0};
  std::string fiat_code{"USD"};
  std::int64_t fee{0};
  std::int64_t routing_fee{0};
  std::optional<std::string> buyer_invoice;
  std::optional<std::int64_t> invoice_held_at;
  std::int64_t taken_at{0};
  std::int64_t created_at{0};
  std::optional<std::int64_t> buyer_chat_last_seen;
  std::optional<std::int64_t> seller_chat_last_seen;
  std::optional<std::string> buyer_shared_key;
  std::optional<std::string> seller_shared_key;

  bool operator==(const AdminDispute&) const = default;
};

// Statuses after which a trade no longer needs listening.
bool IsTerminalStatus(protocol::Status status);
// settled, seller-refunded and released.
bool IsFinalizedDisputeStatus(protocol::DisputeStatus status);

// Keyed-record persistence used by the client core. Writes are
// read-modify-write under the store's own lock; mutators return false with a
// reason when the backing storage cannot be updated.
class Store {
 public:
  virtual ~Store() = default;

  virtual std::optional<UserRecord> GetUser() const = 0;
  virtual bool PutUser(const UserRecord& user, std::string* error = nullptr) = 0;

  // Highest trade index handed out so far; nullopt before the first trade.
  virtual std::optional<std::int64_t> GetTradeIndex() const = 0;
  virtual bool SetTradeIndex(std::int64_t index, std::string* error = nullptr) = 0;

  // Orders with a trade key whose status is not terminal.
  virtual std::vector<ActiveTrade> GetActiveTrades() const = 0;
  virtual std::optional<OrderRecord> GetOrder(const std::string& id) const = 0;
  virtual std::vector<OrderRecord> Orders() const = 0;
  virtual bool PutOrder(const OrderRecord& order, std::string* error = nullptr) = 0;
  virtual bool UpdateOrderStatus(const std::string& id, protocol::Status status,
                                 std::string* error = nullptr) = 0;
  virtual bool DeleteOrder(const std::string& id, std::string* error = nullptr) = 0;

  virtual std::optional<AdminDispute> GetDispute(const std::string& dispute_id) const = 0;
  virtual std::vector<AdminDispute> Disputes() const = 0;
  virtual bool PutDispute(const AdminDispute& dispute, std::string* error = nullptr) = 0;
  virtual bool UpdateDisputeStatus(const std::string& dispute_id, protocol::DisputeStatus status,
                                   std::string* error = nullptr) = 0;

  virtual std::optional<std::int64_t> GetChatCursor(const std::string& dispute_id,
                                                    ChatParty party) const = 0;
  // Returns the number of records updated: 0 for an unknown dispute or a
  // failed write (`error` set). A cursor never moves backwards; a lower
  // timestamp leaves the stored value untouched but still counts the row.
  virtual std::size_t SetChatCursor(const std::string& dispute_id, ChatParty party,
                                    std::int64_t timestamp, std::string* error = nullptr) = 0;

  virtual std::optional<std::string> GetSharedKey(const std::string& dispute_id,
                                                  ChatParty party) const = 0;
  virtual bool SetSharedKey(const std::string& dispute_id, ChatParty party,
                            const std::string& secret_hex, std::string* error = nullptr) = 0;
};

}  // namespace mostrix::client
