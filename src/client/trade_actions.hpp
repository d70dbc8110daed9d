#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "client/correlator.hpp"
#include "client/store.hpp"
#include "client/trade_index.hpp"
#include "crypto/key_deriver.hpp"
#include "net/relay.hpp"
#include "protocol/gift_wrap.hpp"
#include "protocol/message.hpp"

namespace mostrix::client {

constexpr std::int64_t kSecondsPerDay = 86'400;

struct NewOrderRequest {
  protocol::OrderKind kind{protocol::OrderKind::kBuy};
  std::string fiat_code{"USD"};
  // 0 lets the daemon price the order from the market rate.
  std::int64_t amount{0};
  std::int64_t fiat_amount{0};
  // When set, the order is a range from `fiat_amount` to this value.
  std::optional<std::int64_t> max_fiat_amount;
  std::string payment_method;
  std::int64_t premium{0};
  std::optional<std::string> invoice;
  std::int64_t expiration_days{1};
};

struct TradeOutcome {
  enum class Kind {
    kOrderAccepted,
    // Take-sell without an invoice: the daemon asks for one covering
    // `sat_amount`.
    kPaymentRequestRequired,
    // Take-buy: the daemon returned a hold invoice for the seller to pay.
    kPayInvoice,
  };
  Kind kind{Kind::kOrderAccepted};
  protocol::SmallOrder order;
  std::int64_t trade_index{0};
  std::optional<std::string> invoice;
  std::optional<std::int64_t> sat_amount;
};

// Shallow syntax check for a BOLT-11 invoice or a lightning address.
bool IsPlausibleInvoice(const std::string& invoice);

// Builds the payload sent with a new order; fiat codes are upper-cased and
// range orders carry fiat_amount 0 with min/max set. Throws
// std::invalid_argument for an expiration under one day.
protocol::SmallOrder BuildNewOrder(const NewOrderRequest& request, std::int64_t now);

// Range orders announce the key of the follow-up order once the remaining
// fiat can still cover the minimum.
bool NeedsNextTrade(const OrderRecord& order);

// User-mode trade flow. Every request goes out on a freshly derived or the
// order's own trade key and waits for the daemon's correlated reply; failures
// throw std::runtime_error with the operator-facing reason.
class TradeClient {
 public:
  TradeClient(const crypto::KeyDeriver& deriver, net::RelayClient& relay, Store& store,
              TradeIndexAllocator& allocator, RequestCorrelator& correlator,
              const crypto::XOnlyPublicKey& mostro_pubkey, protocol::EnvelopeOptions options = {});

  TradeOutcome NewOrder(const NewOrderRequest& request);

  // Takes someone else's order. `amount` is the fiat amount for range orders.
  TradeOutcome TakeOrder(const protocol::SmallOrder& order,
                         std::optional<std::int64_t> amount = std::nullopt,
                         std::optional<std::string> invoice = std::nullopt);

  // Sends the buyer invoice for an order that is waiting for one.
  void AddInvoice(const std::string& order_id, const std::string& invoice);

  // fiat-sent, release, cancel or dispute on an order this client trades.
  // Returns the daemon's reply action.
  protocol::Action SendAction(const std::string& order_id, protocol::Action action);

 private:
  protocol::DecodedEnvelope Exchange(const protocol::Message& message,
                                     const crypto::Keys& trade_keys, std::uint64_t request_id);
  OrderRecord RequireOrder(const std::string& order_id) const;
  void SaveOrder(const protocol::SmallOrder& order, std::int64_t trade_index,
                 const crypto::Keys& trade_keys, std::uint64_t request_id, bool is_mine);

  const crypto::KeyDeriver& deriver_;
  net::RelayClient& relay_;
  Store& store_;
  TradeIndexAllocator& allocator_;
  RequestCorrelator& correlator_;
  crypto::XOnlyPublicKey mostro_pubkey_;
  protocol::EnvelopeOptions options_;
  crypto::Keys identity_keys_;
};

}  // namespace mostrix::client
