#include "client/trade_actions.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include "client/recovery.hpp"
#include "util/csprng.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace mostrix::client {

using protocol::Action;

namespace {

constexpr std::string_view kBech32Charset = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";
constexpr std::string_view kLightningScheme = "lightning:";

std::string ToLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::string ToUpper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return text;
}

bool OneOf(Action action, const std::vector<Action>& allowed) {
  return std::find(allowed.begin(), allowed.end(), action) != allowed.end();
}

std::string UnexpectedAction(Action action) {
  return std::string("Unexpected action: ") + protocol::ActionName(action);
}

}  // namespace

bool IsPlausibleInvoice(const std::string& invoice) {
  auto text = ToLower(invoice);
  if (text.rfind(kLightningScheme, 0) == 0) {
    text.erase(0, kLightningScheme.size());
  }
  if (text.empty()) {
    return false;
  }
  const auto at = text.find('@');
  if (at != std::string::npos) {
    const auto domain = text.substr(at + 1);
    return at > 0 && domain.find('@') == std::string::npos &&
           domain.find('.') != std::string::npos && domain.front() != '.' &&
           domain.back() != '.';
  }
  if (text.rfind("ln", 0) != 0) {
    return false;
  }
  const auto separator = text.rfind('1');
  if (separator == std::string::npos || separator < 4 || text.size() - separator < 8) {
    return false;
  }
  return std::all_of(text.begin() + static_cast<std::ptrdiff_t>(separator) + 1, text.end(),
                     [](char c) { return kBech32Charset.find(c) != std::string_view::npos; });
}

protocol::SmallOrder BuildNewOrder(const NewOrderRequest& request, std::int64_t now) {
  if (request.expiration_days < 1) {
    throw std::invalid_argument("Minimum expiration time is 1 day");
  }
  if (request.amount < 0 || request.fiat_amount < 0) {
    throw std::invalid_argument("order amounts must not be negative");
  }
  protocol::SmallOrder order;
  order.kind = request.kind;
  order.status = protocol::Status::kPending;
  order.amount = request.amount;
  order.fiat_code = ToUpper(request.fiat_code.empty() ? "USD" : request.fiat_code);
  if (request.max_fiat_amount) {
    if (*request.max_fiat_amount <= request.fiat_amount) {
      throw std::invalid_argument("range maximum must be above the minimum fiat amount");
    }
    order.min_amount = request.fiat_amount;
    order.max_amount = *request.max_fiat_amount;
    order.fiat_amount = 0;
  } else {
    order.fiat_amount = request.fiat_amount;
  }
  order.payment_method = request.payment_method;
  order.premium = request.premium;
  order.buyer_invoice = request.invoice;
  order.created_at = 0;
  order.expires_at = now + request.expiration_days * kSecondsPerDay;
  return order;
}

bool NeedsNextTrade(const OrderRecord& order) {
  return order.min_amount && order.max_amount &&
         *order.max_amount - order.fiat_amount >= *order.min_amount;
}

TradeClient::TradeClient(const crypto::KeyDeriver& deriver, net::RelayClient& relay, Store& store,
                         TradeIndexAllocator& allocator, RequestCorrelator& correlator,
                         const crypto::XOnlyPublicKey& mostro_pubkey,
                         protocol::EnvelopeOptions options)
    : deriver_(deriver),
      relay_(relay),
      store_(store),
      allocator_(allocator),
      correlator_(correlator),
      mostro_pubkey_(mostro_pubkey),
      options_(options),
      identity_keys_(deriver.DeriveIdentityKey()) {}

protocol::DecodedEnvelope TradeClient::Exchange(const protocol::Message& message,
                                                const crypto::Keys& trade_keys,
                                                std::uint64_t request_id) {
  const auto* identity =
      options_.mode == protocol::PrivacyMode::kReputation ? &identity_keys_ : nullptr;
  const auto request =
      protocol::EncodeEnvelope(message, trade_keys, identity, mostro_pubkey_, options_);
  auto result = correlator_.SendAndWait(relay_, request, request_id, message.kind.action,
                                        trade_keys, mostro_pubkey_);
  if (result.outcome == CorrelationOutcome::kTimedOut) {
    throw std::runtime_error("No response received from Mostro");
  }
  if (!result.ok()) {
    throw std::runtime_error(result.error);
  }
  return std::move(*result.response);
}

OrderRecord TradeClient::RequireOrder(const std::string& order_id) const {
  auto order = store_.GetOrder(order_id);
  if (!order) {
    throw std::runtime_error("unknown order " + order_id);
  }
  if (order->trade_index <= 0) {
    throw std::runtime_error("order " + order_id + " has no trade key");
  }
  return *order;
}

void TradeClient::SaveOrder(const protocol::SmallOrder& order, std::int64_t trade_index,
                            const crypto::Keys& trade_keys, std::uint64_t request_id,
                            bool is_mine) {
  if (!order.id) {
    throw std::runtime_error("Order details are missing from payload");
  }
  OrderRecord record;
  if (const auto existing = store_.GetOrder(*order.id)) {
    record = *existing;
  }
  record.id = *order.id;
  record.kind = order.kind;
  if (order.status) {
    record.status = order.status;
  }
  record.amount = order.amount;
  record.min_amount = order.min_amount;
  record.max_amount = order.max_amount;
  record.fiat_code = order.fiat_code;
  record.fiat_amount = order.fiat_amount;
  record.payment_method = order.payment_method;
  record.premium = order.premium;
  record.trade_index = trade_index;
  record.trade_keys = trade_keys.SecretHex();
  record.request_id = request_id;
  if (order.buyer_invoice) {
    record.buyer_invoice = order.buyer_invoice;
  }
  record.is_mine = is_mine;
  record.created_at = order.created_at.value_or(0) > 0 ? *order.created_at : util::NowSeconds();
  record.expires_at = order.expires_at.value_or(0);
  std::string error;
  if (!store_.PutOrder(record, &error)) {
    throw std::runtime_error("failed to save order " + record.id + ": " + error);
  }
}

TradeOutcome TradeClient::NewOrder(const NewOrderRequest& request) {
  if (request.invoice && !IsPlausibleInvoice(*request.invoice)) {
    throw std::invalid_argument("Invalid invoice");
  }
  const auto order = BuildNewOrder(request, util::NowSeconds());
  const auto trade_index = allocator_.Next();
  const auto trade_keys = deriver_.DeriveTradeKey(trade_index);
  const auto request_id = util::RandomU64();

  const auto message =
      protocol::Message::Order(std::nullopt, request_id, trade_index, Action::kNewOrder, order);
  const auto reply = Exchange(message, trade_keys, request_id);
  if (reply.message.kind.action != Action::kNewOrder) {
    throw std::runtime_error(UnexpectedAction(reply.message.kind.action));
  }
  const auto* created = protocol::PayloadAs<protocol::SmallOrder>(reply.message.kind);
  if (!created || !created->id) {
    throw std::runtime_error("Order details are missing from payload");
  }
  SaveOrder(*created, trade_index, trade_keys, request_id, true);
  util::LogInfo("order " + *created->id + " created with trade index " +
                std::to_string(trade_index));

  TradeOutcome outcome;
  outcome.order = *created;
  outcome.trade_index = trade_index;
  return outcome;
}

TradeOutcome TradeClient::TakeOrder(const protocol::SmallOrder& order,
                                    std::optional<std::int64_t> amount,
                                    std::optional<std::string> invoice) {
  if (!order.id) {
    throw std::invalid_argument("Order ID is missing");
  }
  if (!order.kind) {
    throw std::invalid_argument("Order kind is not specified");
  }
  if (invoice && !IsPlausibleInvoice(*invoice)) {
    throw std::invalid_argument("Invalid invoice");
  }

  Action action = Action::kTakeBuy;
  std::optional<protocol::Payload> payload;
  if (*order.kind == protocol::OrderKind::kBuy) {
    if (amount) {
      payload = protocol::Amount{*amount};
    }
  } else {
    action = Action::kTakeSell;
    if (invoice) {
      payload = protocol::PaymentRequest{std::nullopt, *invoice, amount};
    } else {
      payload = protocol::Amount{amount.value_or(0)};
    }
  }

  const auto trade_index = allocator_.Next();
  const auto trade_keys = deriver_.DeriveTradeKey(trade_index);
  const auto request_id = util::RandomU64();
  const auto message =
      protocol::Message::Order(order.id, request_id, trade_index, action, std::move(payload));
  const auto reply = Exchange(message, trade_keys, request_id);
  const auto& kind = reply.message.kind;

  TradeOutcome outcome;
  outcome.trade_index = trade_index;
  if (const auto* request = protocol::PayloadAs<protocol::PaymentRequest>(kind)) {
    if (!request->order) {
      throw std::runtime_error("Order details are missing from payload");
    }
    outcome.kind = kind.action == Action::kPayInvoice ? TradeOutcome::Kind::kPayInvoice
                                                      : TradeOutcome::Kind::kPaymentRequestRequired;
    outcome.order = *request->order;
    outcome.invoice = request->invoice;
    outcome.sat_amount = request->amount ? request->amount : request->order->amount;
  } else if (const auto* accepted = protocol::PayloadAs<protocol::SmallOrder>(kind)) {
    outcome.order = *accepted;
    if (kind.action == Action::kAddInvoice) {
      outcome.kind = TradeOutcome::Kind::kPaymentRequestRequired;
      outcome.sat_amount = accepted->amount;
    }
  } else {
    throw std::runtime_error("Response without order details or payment request");
  }
  if (!outcome.order.id) {
    outcome.order.id = order.id;
  }
  if (!outcome.order.kind) {
    outcome.order.kind = order.kind;
  }
  if (!outcome.order.status) {
    outcome.order.status = StatusAfterAction(kind.action);
  }
  SaveOrder(outcome.order, trade_index, trade_keys, request_id, false);
  util::LogInfo("took order " + *order.id + " with trade index " + std::to_string(trade_index) +
                " (" + protocol::ActionName(kind.action) + ")");
  return outcome;
}

void TradeClient::AddInvoice(const std::string& order_id, const std::string& invoice) {
  if (!IsPlausibleInvoice(invoice)) {
    throw std::invalid_argument("Invalid invoice");
  }
  auto record = RequireOrder(order_id);
  const auto trade_keys = deriver_.DeriveTradeKey(record.trade_index);
  const auto request_id = util::RandomU64();
  const auto message =
      protocol::Message::Order(order_id, request_id, std::nullopt, Action::kAddInvoice,
                               protocol::PaymentRequest{std::nullopt, invoice, std::nullopt});
  const auto reply = Exchange(message, trade_keys, request_id);
  const auto action = reply.message.kind.action;
  if (!OneOf(action, {Action::kWaitingSellerToPay, Action::kBuyerTookOrder})) {
    throw std::runtime_error(UnexpectedAction(action));
  }
  record.buyer_invoice = invoice;
  record.status = StatusAfterAction(action);
  std::string error;
  if (!store_.PutOrder(record, &error)) {
    throw std::runtime_error("failed to save order " + order_id + ": " + error);
  }
}

Action TradeClient::SendAction(const std::string& order_id, Action action) {
  std::vector<Action> expected;
  switch (action) {
    case Action::kFiatSent:
      expected = {Action::kFiatSentOk, Action::kWaitingSellerToPay};
      break;
    case Action::kRelease:
      expected = {Action::kPurchaseCompleted, Action::kRate, Action::kReleased,
                  Action::kHoldInvoicePaymentSettled};
      break;
    case Action::kCancel:
      expected = {Action::kCanceled, Action::kCooperativeCancelInitiatedByYou,
                  Action::kCooperativeCancelAccepted};
      break;
    case Action::kDispute:
      expected = {Action::kDisputeInitiatedByYou};
      break;
    default:
      throw std::invalid_argument(std::string("unsupported trade action: ") +
                                  protocol::ActionName(action));
  }

  const auto record = RequireOrder(order_id);
  const auto trade_keys = deriver_.DeriveTradeKey(record.trade_index);
  std::optional<protocol::Payload> payload;
  if ((action == Action::kFiatSent || action == Action::kRelease) && NeedsNextTrade(record)) {
    const auto next_index = allocator_.Next();
    const auto next_keys = deriver_.DeriveTradeKey(next_index);
    payload = protocol::NextTrade{next_keys.PublicKeyHex(), static_cast<std::uint32_t>(next_index)};
  }
  const auto request_id = util::RandomU64();
  const auto message =
      protocol::Message::Order(order_id, request_id, std::nullopt, action, std::move(payload));
  const auto reply = Exchange(message, trade_keys, request_id);
  const auto reply_action = reply.message.kind.action;
  if (!OneOf(reply_action, expected)) {
    throw std::runtime_error(UnexpectedAction(reply_action));
  }
  if (const auto status = StatusAfterAction(reply_action)) {
    std::string error;
    if (!store_.UpdateOrderStatus(order_id, *status, &error)) {
      util::LogWarn("order " + order_id + ": failed to record status " +
                    protocol::StatusName(*status) + ": " + error);
    }
  }
  return reply_action;
}

}  // namespace mostrix::client
