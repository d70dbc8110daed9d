#include "client/memory_store.hpp"

#include <utility>

namespace mostrix::client {

namespace {

void SetError(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
}

std::optional<std::int64_t>& CursorSlot(AdminDispute& dispute, ChatParty party) {
  return party == ChatParty::kBuyer ? dispute.buyer_chat_last_seen
                                    : dispute.seller_chat_last_seen;
}

std::optional<std::string>& SharedKeySlot(AdminDispute& dispute, ChatParty party) {
  return party == ChatParty::kBuyer ? dispute.buyer_shared_key : dispute.seller_shared_key;
}

}  // namespace

bool MemoryStore::Commit(const State&, std::string*) {
  return true;
}

void MemoryStore::ResetState(State state) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = std::move(state);
}

bool MemoryStore::Mutate(const std::function<bool(State&, std::string*)>& mutation,
                         std::string* error) {
  std::lock_guard<std::mutex> lock(mutex_);
  State candidate = state_;
  if (!mutation(candidate, error)) {
    return false;
  }
  if (!Commit(candidate, error)) {
    return false;
  }
  state_ = std::move(candidate);
  return true;
}

std::optional<UserRecord> MemoryStore::GetUser() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.user;
}

bool MemoryStore::PutUser(const UserRecord& user, std::string* error) {
  return Mutate(
      [&](State& state, std::string*) {
        state.user = user;
        return true;
      },
      error);
}

std::optional<std::int64_t> MemoryStore::GetTradeIndex() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.last_trade_index;
}

bool MemoryStore::SetTradeIndex(std::int64_t index, std::string* error) {
  return Mutate(
      [&](State& state, std::string* err) {
        if (index < 0) {
          SetError(err, "trade index must be non-negative");
          return false;
        }
        state.last_trade_index = index;
        return true;
      },
      error);
}

std::vector<ActiveTrade> MemoryStore::GetActiveTrades() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ActiveTrade> trades;
  for (const auto& [id, order] : state_.orders) {
    if (order.trade_index <= 0) {
      continue;
    }
    if (order.status && IsTerminalStatus(*order.status)) {
      continue;
    }
    trades.push_back(ActiveTrade{id, order.trade_index});
  }
  return trades;
}

std::optional<OrderRecord> MemoryStore::GetOrder(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = state_.orders.find(id);
  if (it == state_.orders.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<OrderRecord> MemoryStore::Orders() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<OrderRecord> orders;
  orders.reserve(state_.orders.size());
  for (const auto& [id, order] : state_.orders) {
    orders.push_back(order);
  }
  return orders;
}

bool MemoryStore::PutOrder(const OrderRecord& order, std::string* error) {
  return Mutate(
      [&](State& state, std::string* err) {
        if (order.id.empty()) {
          SetError(err, "order id is required");
          return false;
        }
        state.orders[order.id] = order;
        return true;
      },
      error);
}

bool MemoryStore::UpdateOrderStatus(const std::string& id, protocol::Status status,
                                    std::string* error) {
  return Mutate(
      [&](State& state, std::string* err) {
        const auto it = state.orders.find(id);
        if (it == state.orders.end()) {
          SetError(err, "unknown order: " + id);
          return false;
        }
        it->second.status = status;
        return true;
      },
      error);
}

bool MemoryStore::DeleteOrder(const std::string& id, std::string* error) {
  return Mutate(
      [&](State& state, std::string* err) {
        if (state.orders.erase(id) == 0) {
          SetError(err, "unknown order: " + id);
          return false;
        }
        return true;
      },
      error);
}

std::optional<AdminDispute> MemoryStore::GetDispute(const std::string& dispute_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = state_.disputes.find(dispute_id);
  if (it == state_.disputes.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<AdminDispute> MemoryStore::Disputes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<AdminDispute> disputes;
  disputes.reserve(state_.disputes.size());
  for (const auto& [id, dispute] : state_.disputes) {
    disputes.push_back(dispute);
  }
  return disputes;
}

bool MemoryStore::PutDispute(const AdminDispute& dispute, std::string* error) {
  return Mutate(
      [&](State& state, std::string* err) {
        if (dispute.dispute_id.empty()) {
          SetError(err, "dispute id is required");
          return false;
        }
        state.disputes[dispute.dispute_id] = dispute;
        return true;
      },
      error);
}

bool MemoryStore::UpdateDisputeStatus(const std::string& dispute_id,
                                      protocol::DisputeStatus status, std::string* error) {
  return Mutate(
      [&](State& state, std::string* err) {
        const auto it = state.disputes.find(dispute_id);
        if (it == state.disputes.end()) {
          SetError(err, "unknown dispute: " + dispute_id);
          return false;
        }
        it->second.status = status;
        return true;
      },
      error);
}

std::optional<std::int64_t> MemoryStore::GetChatCursor(const std::string& dispute_id,
                                                       ChatParty party) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = state_.disputes.find(dispute_id);
  if (it == state_.disputes.end()) {
    return std::nullopt;
  }
  return party == ChatParty::kBuyer ? it->second.buyer_chat_last_seen
                                    : it->second.seller_chat_last_seen;
}

std::size_t MemoryStore::SetChatCursor(const std::string& dispute_id, ChatParty party,
                                       std::int64_t timestamp, std::string* error) {
  std::size_t affected = 0;
  const bool ok = Mutate(
      [&](State& state, std::string*) {
        const auto it = state.disputes.find(dispute_id);
        if (it == state.disputes.end()) {
          return false;
        }
        auto& slot = CursorSlot(it->second, party);
        if (!slot || *slot < timestamp) {
          slot = timestamp;
        }
        affected = 1;
        return true;
      },
      error);
  return ok ? affected : 0;
}

std::optional<std::string> MemoryStore::GetSharedKey(const std::string& dispute_id,
                                                     ChatParty party) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = state_.disputes.find(dispute_id);
  if (it == state_.disputes.end()) {
    return std::nullopt;
  }
  return party == ChatParty::kBuyer ? it->second.buyer_shared_key : it->second.seller_shared_key;
}

bool MemoryStore::SetSharedKey(const std::string& dispute_id, ChatParty party,
                               const std::string& secret_hex, std::string* error) {
  return Mutate(
      [&](State& state, std::string* err) {
        const auto it = state.disputes.find(dispute_id);
        if (it == state.disputes.end()) {
          SetError(err, "unknown dispute: " + dispute_id);
          return false;
        }
        SharedKeySlot(it->second, party) = secret_hex;
        return true;
      },
      error);
}

}  // namespace mostrix::client
