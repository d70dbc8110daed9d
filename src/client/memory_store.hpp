#pragma once

#include <functional>
#include <map>
#include <mutex>

#include "client/store.hpp"

namespace mostrix::client {

// Store kept entirely in memory. FileStore layers persistence on top by
// overriding Commit.
class MemoryStore : public Store {
 public:
  std::optional<UserRecord> GetUser() const override;
  bool PutUser(const UserRecord& user, std::string* error = nullptr) override;

  std::optional<std::int64_t> GetTradeIndex() const override;
  bool SetTradeIndex(std::int64_t index, std::string* error = nullptr) override;

  std::vector<ActiveTrade> GetActiveTrades() const override;
  std::optional<OrderRecord> GetOrder(const std::string& id) const override;
  std::vector<OrderRecord> Orders() const override;
  bool PutOrder(const OrderRecord& order, std::string* error = nullptr) override;
  bool UpdateOrderStatus(const std::string& id, protocol::Status status,
                         std::string* error = nullptr) override;
  bool DeleteOrder(const std::string& id, std::string* error = nullptr) override;

  std::optional<AdminDispute> GetDispute(const std::string& dispute_id) const override;
  std::vector<AdminDispute> Disputes() const override;
  bool PutDispute(const AdminDispute& dispute, std::string* error = nullptr) override;
  bool UpdateDisputeStatus(const std::string& dispute_id, protocol::DisputeStatus status,
                           std::string* error = nullptr) override;

  std::optional<std::int64_t> GetChatCursor(const std::string& dispute_id,
                                            ChatParty party) const override;
  std::size_t SetChatCursor(const std::string& dispute_id, ChatParty party,
                            std::int64_t timestamp, std::string* error = nullptr) override;

  std::optional<std::string> GetSharedKey(const std::string& dispute_id,
                                          ChatParty party) const override;
  bool SetSharedKey(const std::string& dispute_id, ChatParty party, const std::string& secret_hex,
                    std::string* error = nullptr) override;

 protected:
  struct State {
    std::optional<UserRecord> user;
    std::optional<std::int64_t> last_trade_index;
    std::map<std::string, OrderRecord> orders;
    std::map<std::string, AdminDispute> disputes;
  };

  // Called with the candidate state after every mutation, under the store
  // lock. Returning false discards the mutation.
  virtual bool Commit(const State& state, std::string* error);

  // Replaces the whole state without committing; used when loading.
  void ResetState(State state);

 private:
  // Applies `mutation` to a copy of the state and keeps it only if the
  // mutation and the commit both succeed.
  bool Mutate(const std::function<bool(State&, std::string*)>& mutation, std::string* error);

  mutable std::mutex mutex_;
  State state_;
};

}  // namespace mostrix::client
