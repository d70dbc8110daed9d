#include "protocol/message.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <utility>

#include "crypto/hash.hpp"
#include "util/logging.hpp"

namespace mostrix::protocol {

namespace {

template <typename Enum>
struct NameEntry {
  Enum value;
  const char* name;
};

constexpr std::array<NameEntry<Action>, 42> kActionNames = {{
    {Action::kNewOrder, "new-order"},
    {Action::kTakeSell, "take-sell"},
    {Action::kTakeBuy, "take-buy"},
    {Action::kPayInvoice, "pay-invoice"},
    {Action::kFiatSent, "fiat-sent"},
    {Action::kFiatSentOk, "fiat-sent-ok"},
    {Action::kRelease, "release"},
    {Action::kReleased, "released"},
    {Action::kCancel, "cancel"},
    {Action::kCanceled, "canceled"},
    {Action::kCooperativeCancelInitiatedByYou, "cooperative-cancel-initiated-by-you"},
    {Action::kCooperativeCancelInitiatedByPeer, "cooperative-cancel-initiated-by-peer"},
    {Action::kDisputeInitiatedByYou, "dispute-initiated-by-you"},
    {Action::kDisputeInitiatedByPeer, "dispute-initiated-by-peer"},
    {Action::kCooperativeCancelAccepted, "cooperative-cancel-accepted"},
    {Action::kBuyerInvoiceAccepted, "buyer-invoice-accepted"},
    {Action::kPurchaseCompleted, "purchase-completed"},
    {Action::kHoldInvoicePaymentAccepted, "hold-invoice-payment-accepted"},
    {Action::kHoldInvoicePaymentSettled, "hold-invoice-payment-settled"},
    {Action::kHoldInvoicePaymentCanceled, "hold-invoice-payment-canceled"},
    {Action::kWaitingSellerToPay, "waiting-seller-to-pay"},
    {Action::kWaitingBuyerInvoice, "waiting-buyer-invoice"},
    {Action::kAddInvoice, "add-invoice"},
    {Action::kBuyerTookOrder, "buyer-took-order"},
    {Action::kRate, "rate"},
    {Action::kRateUser, "rate-user"},
    {Action::kRateReceived, "rate-received"},
    {Action::kCantDo, "cant-do"},
    {Action::kDispute, "dispute"},
    {Action::kAdminCancel, "admin-cancel"},
    {Action::kAdminCanceled, "admin-canceled"},
    {Action::kAdminSettle, "admin-settle"},
    {Action::kAdminSettled, "admin-settled"},
    {Action::kAdminAddSolver, "admin-add-solver"},
    {Action::kAdminTakeDispute, "admin-take-dispute"},
    {Action::kAdminTookDispute, "admin-took-dispute"},
    {Action::kPaymentFailed, "payment-failed"},
    {Action::kInvoiceUpdated, "invoice-updated"},
    {Action::kSendDm, "send-dm"},
    {Action::kTradePubkey, "trade-pubkey"},
    {Action::kRestoreSession, "restore-session"},
    {Action::kLastTradeIndex, "last-trade-index"},
}};

constexpr std::array<NameEntry<OrderKind>, 2> kOrderKindNames = {{
    {OrderKind::kBuy, "buy"},
    {OrderKind::kSell, "sell"},
}};

constexpr std::array<NameEntry<Status>, 15> kStatusNames = {{
    {Status::kActive, "active"},
    {Status::kCanceled, "canceled"},
    {Status::kCanceledByAdmin, "canceled-by-admin"},
    {Status::kSettledByAdmin, "settled-by-admin"},
    {Status::kCompletedByAdmin, "completed-by-admin"},
    {Status::kDispute, "dispute"},
    {Status::kExpired, "expired"},
    {Status::kFiatSent, "fiat-sent"},
    {Status::kSettledHoldInvoice, "settled-hold-invoice"},
    {Status::kPending, "pending"},
    {Status::kSuccess, "success"},
    {Status::kWaitingBuyerInvoice, "waiting-buyer-invoice"},
    {Status::kWaitingPayment, "waiting-payment"},
    {Status::kCooperativelyCanceled, "cooperatively-canceled"},
    {Status::kInProgress, "in-progress"},
}};

constexpr std::array<NameEntry<DisputeStatus>, 6> kDisputeStatusNames = {{
    {DisputeStatus::kInitiated, "initiated"},
    {DisputeStatus::kInProgress, "in-progress"},
    {DisputeStatus::kCanceled, "canceled"},
    {DisputeStatus::kSettled, "settled"},
    {DisputeStatus::kSellerRefunded, "seller-refunded"},
    {DisputeStatus::kReleased, "released"},
}};

struct CantDoEntry {
  CantDoReason value;
  const char* name;
  const char* description;
};

constexpr std::array<CantDoEntry, 27> kCantDoReasons = {{
    {CantDoReason::kInvalidSignature, "invalid_signature",
     "Invalid signature - authentication failed"},
    {CantDoReason::kInvalidTradeIndex, "invalid_trade_index",
     "Invalid trade index - please try again"},
    {CantDoReason::kInvalidAmount, "invalid_amount", "Invalid amount - check your order values"},
    {CantDoReason::kInvalidInvoice, "invalid_invoice",
     "Invalid invoice - please provide a valid lightning invoice"},
    {CantDoReason::kInvalidPaymentRequest, "invalid_payment_request", "Invalid payment request"},
    {CantDoReason::kInvalidPeer, "invalid_peer", "Invalid peer information"},
    {CantDoReason::kInvalidRating, "invalid_rating", "Invalid rating value"},
    {CantDoReason::kInvalidTextMessage, "invalid_text_message", "Invalid text message"},
    {CantDoReason::kInvalidOrderKind, "invalid_order_kind",
     "Invalid order kind - must be 'buy' or 'sell'"},
    {CantDoReason::kInvalidOrderStatus, "invalid_order_status", "Invalid order status"},
    {CantDoReason::kInvalidPubkey, "invalid_pubkey", "Invalid public key"},
    {CantDoReason::kInvalidParameters, "invalid_parameters",
     "Invalid parameters - check your order details"},
    {CantDoReason::kOrderAlreadyCanceled, "order_already_canceled", "Order is already canceled"},
    {CantDoReason::kCantCreateUser, "cant_create_user",
     "Cannot create user - please contact support"},
    {CantDoReason::kIsNotYourOrder, "is_not_your_order", "This is not your order"},
    {CantDoReason::kNotAllowedByStatus, "not_allowed_by_status",
     "Action not allowed - order status prevents this operation"},
    {CantDoReason::kOutOfRangeFiatAmount, "out_of_range_fiat_amount",
     "Fiat amount is out of acceptable range"},
    {CantDoReason::kOutOfRangeSatsAmount, "out_of_range_sats_amount",
     "Satoshis amount is out of acceptable range"},
    {CantDoReason::kIsNotYourDispute, "is_not_your_dispute", "This is not your dispute"},
    {CantDoReason::kDisputeTakenByAdmin, "dispute_taken_by_admin",
     "Dispute has been taken over by an administrator"},
    {CantDoReason::kDisputeCreationError, "dispute_creation_error",
     "Cannot create dispute for this order"},
    {CantDoReason::kNotFound, "not_found", "Resource not found"},
    {CantDoReason::kInvalidDisputeStatus, "invalid_dispute_status", "Invalid dispute status"},
    {CantDoReason::kInvalidAction, "invalid_action", "Invalid action for current state"},
    {CantDoReason::kPendingOrderExists, "pending_order_exists",
     "You already have a pending order - please complete or cancel it first"},
    {CantDoReason::kInvalidFiatCurrency, "invalid_fiat_currency",
     "Invalid fiat currency - currency not supported or specify a fixed rate"},
    {CantDoReason::kTooManyRequests, "too_many_requests",
     "Too many requests - please wait and try again"},
}};

constexpr std::array<NameEntry<MessageWrapper>, 6> kWrapperNames = {{
    {MessageWrapper::kOrder, "order"},
    {MessageWrapper::kDispute, "dispute"},
    {MessageWrapper::kCantDo, "cant-do"},
    {MessageWrapper::kRate, "rate"},
    {MessageWrapper::kDm, "dm"},
    {MessageWrapper::kRestore, "restore"},
}};

template <typename Table, typename Enum>
const char* LookupName(const Table& table, Enum value) {
  for (const auto& entry : table) {
    if (entry.value == value) {
      return entry.name;
    }
  }
  return "unknown";
}

template <typename Table>
auto LookupValue(const Table& table, std::string_view name)
    -> std::optional<decltype(table[0].value)> {
  for (const auto& entry : table) {
    if (name == entry.name) {
      return entry.value;
    }
  }
  return std::nullopt;
}

template <typename T>
nlohmann::json OptionalToJson(const std::optional<T>& value) {
  if (!value) {
    return nullptr;
  }
  return *value;
}

template <typename T>
std::optional<T> OptionalField(const nlohmann::json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

template <typename T>
T FieldOr(const nlohmann::json& object, const char* key, T fallback) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return fallback;
  }
  return it->get<T>();
}

// Enum fields use the wire tables above; an unknown name is a parse error.
template <typename Parser>
auto RequiredEnum(const nlohmann::json& value, Parser parse, const char* what)
    -> decltype(parse(std::string_view{})) {
  const auto parsed = parse(value.get<std::string>());
  if (!parsed) {
    throw std::invalid_argument(std::string("unknown ") + what + " '" + value.get<std::string>() +
                                "'");
  }
  return parsed;
}

nlohmann::json SmallOrderToJson(const SmallOrder& order) {
  nlohmann::json json;
  json["id"] = OptionalToJson(order.id);
  json["kind"] = order.kind ? nlohmann::json(OrderKindName(*order.kind)) : nlohmann::json(nullptr);
  json["status"] = order.status ? nlohmann::json(StatusName(*order.status)) : nlohmann::json(nullptr);
  json["amount"] = order.amount;
  json["fiat_code"] = order.fiat_code;
  json["min_amount"] = OptionalToJson(order.min_amount);
  json["max_amount"] = OptionalToJson(order.max_amount);
  json["fiat_amount"] = order.fiat_amount;
  json["payment_method"] = order.payment_method;
  json["premium"] = order.premium;
  json["buyer_trade_pubkey"] = OptionalToJson(order.buyer_trade_pubkey);
  json["seller_trade_pubkey"] = OptionalToJson(order.seller_trade_pubkey);
  json["buyer_invoice"] = OptionalToJson(order.buyer_invoice);
  json["created_at"] = OptionalToJson(order.created_at);
  json["expires_at"] = OptionalToJson(order.expires_at);
  return json;
}

SmallOrder SmallOrderFromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    throw std::invalid_argument("order payload is not an object");
  }
  SmallOrder order;
  order.id = OptionalField<std::string>(json, "id");
  if (auto it = json.find("kind"); it != json.end() && !it->is_null()) {
    order.kind = RequiredEnum(*it, ParseOrderKind, "order kind");
  }
  if (auto it = json.find("status"); it != json.end() && !it->is_null()) {
    order.status = RequiredEnum(*it, ParseStatus, "order status");
  }
  order.amount = FieldOr<std::int64_t>(json, "amount", 0);
  order.fiat_code = FieldOr<std::string>(json, "fiat_code", {});
  order.min_amount = OptionalField<std::int64_t>(json, "min_amount");
  order.max_amount = OptionalField<std::int64_t>(json, "max_amount");
  order.fiat_amount = FieldOr<std::int64_t>(json, "fiat_amount", 0);
  order.payment_method = FieldOr<std::string>(json, "payment_method", {});
  order.premium = FieldOr<std::int64_t>(json, "premium", 0);
  order.buyer_trade_pubkey = OptionalField<std::string>(json, "buyer_trade_pubkey");
  order.seller_trade_pubkey = OptionalField<std::string>(json, "seller_trade_pubkey");
  order.buyer_invoice = OptionalField<std::string>(json, "buyer_invoice");
  order.created_at = OptionalField<std::int64_t>(json, "created_at");
  order.expires_at = OptionalField<std::int64_t>(json, "expires_at");
  return order;
}

nlohmann::json SolverDisputeInfoToJson(const SolverDisputeInfo& info) {
  nlohmann::json json;
  json["id"] = info.id;
  json["kind"] = info.kind;
  json["status"] = info.status;
  json["hash"] = OptionalToJson(info.hash);
  json["preimage"] = OptionalToJson(info.preimage);
  json["order_previous_status"] = info.order_previous_status;
  json["initiator_pubkey"] = info.initiator_pubkey;
  json["buyer_pubkey"] = OptionalToJson(info.buyer_pubkey);
  json["seller_pubkey"] = OptionalToJson(info.seller_pubkey);
  json["initiator_full_privacy"] = info.initiator_full_privacy;
  json["counterpart_full_privacy"] = info.counterpart_full_privacy;
  json["premium"] = info.premium;
  json["payment_method"] = info.payment_method;
  json["amount"] = info.amount;
  json["fiat_amount"] = info.fiat_amount;
  json["fee"] = info.fee;
  json["routing_fee"] = info.routing_fee;
  json["buyer_invoice"] = OptionalToJson(info.buyer_invoice);
  json["invoice_held_at"] = info.invoice_held_at;
  json["taken_at"] = info.taken_at;
  json["created_at"] = info.created_at;
  return json;
}

SolverDisputeInfo SolverDisputeInfoFromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    throw std::invalid_argument("dispute info is not an object");
  }
  SolverDisputeInfo info;
  info.id = json.at("id").get<std::string>();
  info.kind = FieldOr<std::string>(json, "kind", {});
  info.status = FieldOr<std::string>(json, "status", {});
  info.hash = OptionalField<std::string>(json, "hash");
  info.preimage = OptionalField<std::string>(json, "preimage");
  info.order_previous_status = FieldOr<std::string>(json, "order_previous_status", {});
  info.initiator_pubkey = FieldOr<std::string>(json, "initiator_pubkey", {});
  info.buyer_pubkey = OptionalField<std::string>(json, "buyer_pubkey");
  info.seller_pubkey = OptionalField<std::string>(json, "seller_pubkey");
  info.initiator_full_privacy = FieldOr<bool>(json, "initiator_full_privacy", false);
  info.counterpart_full_privacy = FieldOr<bool>(json, "counterpart_full_privacy", false);
  info.premium = FieldOr<std::int64_t>(json, "premium", 0);
  info.payment_method = FieldOr<std::string>(json, "payment_method", {});
  info.amount = FieldOr<std::int64_t>(json, "amount", 0);
  info.fiat_amount = FieldOr<std::int64_t>(json, "fiat_amount", 0);
  info.fee = FieldOr<std::int64_t>(json, "fee", 0);
  info.routing_fee = FieldOr<std::int64_t>(json, "routing_fee", 0);
  info.buyer_invoice = OptionalField<std::string>(json, "buyer_invoice");
  info.invoice_held_at = FieldOr<std::int64_t>(json, "invoice_held_at", 0);
  info.taken_at = FieldOr<std::int64_t>(json, "taken_at", 0);
  info.created_at = FieldOr<std::int64_t>(json, "created_at", 0);
  return info;
}

nlohmann::json PeerToJson(const Peer& peer) {
  nlohmann::json json;
  json["pubkey"] = peer.pubkey;
  if (peer.reputation) {
    json["reputation"] = {{"rating", peer.reputation->rating},
                          {"reviews", peer.reputation->reviews},
                          {"operating_days", peer.reputation->operating_days}};
  } else {
    json["reputation"] = nullptr;
  }
  return json;
}

Peer PeerFromJson(const nlohmann::json& json) {
  Peer peer;
  peer.pubkey = json.at("pubkey").get<std::string>();
  if (auto it = json.find("reputation"); it != json.end() && it->is_object()) {
    UserInfo info;
    info.rating = FieldOr<double>(*it, "rating", 0.0);
    info.reviews = FieldOr<std::int64_t>(*it, "reviews", 0);
    info.operating_days = FieldOr<std::uint64_t>(*it, "operating_days", 0);
    peer.reputation = info;
  }
  return peer;
}

Payload DecodePayload(const nlohmann::json& json) {
  if (!json.is_object() || json.size() != 1) {
    throw std::invalid_argument("payload must be an object with exactly one variant");
  }
  const auto entry = json.begin();
  const std::string& tag = entry.key();
  const nlohmann::json& value = entry.value();
  if (tag == "order") {
    return SmallOrderFromJson(value);
  }
  if (tag == "payment_request") {
    if (!value.is_array() || value.size() != 3) {
      throw std::invalid_argument("payment_request must be a 3-element array");
    }
    PaymentRequest request;
    if (!value[0].is_null()) {
      request.order = SmallOrderFromJson(value[0]);
    }
    request.invoice = value[1].get<std::string>();
    if (!value[2].is_null()) {
      request.amount = value[2].get<std::int64_t>();
    }
    return request;
  }
  if (tag == "text_message") {
    return TextMessage{value.get<std::string>()};
  }
  if (tag == "peer") {
    return PeerFromJson(value);
  }
  if (tag == "rating_user") {
    return RatingUser{value.get<std::uint8_t>()};
  }
  if (tag == "amount") {
    return Amount{value.get<std::int64_t>()};
  }
  if (tag == "dispute") {
    if (!value.is_array() || value.empty() || value.size() > 2) {
      throw std::invalid_argument("dispute payload must be [id, info?]");
    }
    DisputePayload dispute;
    dispute.dispute_id = value[0].get<std::string>();
    if (value.size() == 2 && !value[1].is_null()) {
      dispute.info = SolverDisputeInfoFromJson(value[1]);
    }
    return dispute;
  }
  if (tag == "cant_do") {
    CantDo cant_do;
    if (!value.is_null()) {
      cant_do.reason = RequiredEnum(value, ParseCantDoReason, "cant-do reason");
    }
    return cant_do;
  }
  if (tag == "next_trade") {
    if (!value.is_array() || value.size() != 2) {
      throw std::invalid_argument("next_trade must be [pubkey, index]");
    }
    return NextTrade{value[0].get<std::string>(), value[1].get<std::uint32_t>()};
  }
  throw std::invalid_argument("unknown payload variant '" + tag + "'");
}

struct PayloadEncoder {
  nlohmann::json operator()(const SmallOrder& order) const {
    return {{"order", SmallOrderToJson(order)}};
  }
  nlohmann::json operator()(const PaymentRequest& request) const {
    nlohmann::json array = nlohmann::json::array();
    array.push_back(request.order ? SmallOrderToJson(*request.order) : nlohmann::json(nullptr));
    array.push_back(request.invoice);
    array.push_back(OptionalToJson(request.amount));
    return {{"payment_request", std::move(array)}};
  }
  nlohmann::json operator()(const TextMessage& text) const {
    return {{"text_message", text.text}};
  }
  nlohmann::json operator()(const Peer& peer) const { return {{"peer", PeerToJson(peer)}}; }
  nlohmann::json operator()(const RatingUser& rating) const {
    return {{"rating_user", rating.rating}};
  }
  nlohmann::json operator()(const Amount& amount) const { return {{"amount", amount.sats}}; }
  nlohmann::json operator()(const DisputePayload& dispute) const {
    nlohmann::json array = nlohmann::json::array();
    array.push_back(dispute.dispute_id);
    array.push_back(dispute.info ? SolverDisputeInfoToJson(*dispute.info)
                                 : nlohmann::json(nullptr));
    return {{"dispute", std::move(array)}};
  }
  nlohmann::json operator()(const CantDo& cant_do) const {
    return {{"cant_do", cant_do.reason ? nlohmann::json(CantDoReasonName(*cant_do.reason))
                                       : nlohmann::json(nullptr)}};
  }
  nlohmann::json operator()(const NextTrade& next) const {
    return {{"next_trade", nlohmann::json::array({next.pubkey, next.index})}};
  }
};

void SetError(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
}

}  // namespace

const char* ActionName(Action action) { return LookupName(kActionNames, action); }
std::optional<Action> ParseAction(std::string_view name) {
  return LookupValue(kActionNames, name);
}

const char* OrderKindName(OrderKind kind) { return LookupName(kOrderKindNames, kind); }
std::optional<OrderKind> ParseOrderKind(std::string_view name) {
  return LookupValue(kOrderKindNames, name);
}

const char* StatusName(Status status) { return LookupName(kStatusNames, status); }
std::optional<Status> ParseStatus(std::string_view name) {
  return LookupValue(kStatusNames, name);
}

const char* DisputeStatusName(DisputeStatus status) {
  return LookupName(kDisputeStatusNames, status);
}
std::optional<DisputeStatus> ParseDisputeStatus(std::string_view name) {
  return LookupValue(kDisputeStatusNames, name);
}

const char* CantDoReasonName(CantDoReason reason) { return LookupName(kCantDoReasons, reason); }
std::optional<CantDoReason> ParseCantDoReason(std::string_view name) {
  return LookupValue(kCantDoReasons, name);
}

const char* MessageWrapperName(MessageWrapper wrapper) {
  return LookupName(kWrapperNames, wrapper);
}

std::string CantDoDescription(const std::optional<CantDoReason>& reason) {
  if (reason) {
    for (const auto& entry : kCantDoReasons) {
      if (entry.value == *reason) {
        return entry.description;
      }
    }
  }
  return "Unknown error - Mostro couldn't process your request";
}

Message Message::Order(std::optional<std::string> id, std::optional<std::uint64_t> request_id,
                       std::optional<std::int64_t> trade_index, Action action,
                       std::optional<Payload> payload) {
  return Message{MessageWrapper::kOrder,
                 MessageKind{kProtocolVersion, std::move(id), request_id, trade_index, action,
                             std::move(payload)}};
}

Message Message::Dispute(std::optional<std::string> id, std::optional<std::uint64_t> request_id,
                         std::optional<std::int64_t> trade_index, Action action,
                         std::optional<Payload> payload) {
  return Message{MessageWrapper::kDispute,
                 MessageKind{kProtocolVersion, std::move(id), request_id, trade_index, action,
                             std::move(payload)}};
}

Message Message::Dm(std::optional<std::string> id, std::optional<std::uint64_t> request_id,
                    Action action, std::optional<Payload> payload) {
  return Message{MessageWrapper::kDm,
                 MessageKind{kProtocolVersion, std::move(id), request_id, std::nullopt, action,
                             std::move(payload)}};
}

nlohmann::json PayloadToJson(const Payload& payload) { return std::visit(PayloadEncoder{}, payload); }

bool PayloadFromJson(const nlohmann::json& json, Payload* payload, std::string* error) {
  try {
    *payload = DecodePayload(json);
  } catch (const std::exception& ex) {
    SetError(error, std::string("malformed payload: ") + ex.what());
    return false;
  }
  return true;
}

nlohmann::json MessageToJson(const Message& message) {
  nlohmann::json kind;
  kind["version"] = message.kind.version;
  kind["id"] = OptionalToJson(message.kind.id);
  kind["request_id"] = OptionalToJson(message.kind.request_id);
  kind["trade_index"] = OptionalToJson(message.kind.trade_index);
  kind["action"] = ActionName(message.kind.action);
  kind["payload"] = message.kind.payload ? PayloadToJson(*message.kind.payload)
                                         : nlohmann::json(nullptr);
  nlohmann::json json;
  json[MessageWrapperName(message.wrapper)] = std::move(kind);
  return json;
}

std::string MessageToJsonString(const Message& message) { return MessageToJson(message).dump(); }

bool MessageFromJson(const nlohmann::json& json, Message* message, std::string* error) {
  if (!json.is_object() || json.size() != 1) {
    SetError(error, "message must be an object with exactly one wrapper");
    return false;
  }
  try {
    const auto entry = json.begin();
    const std::string& wrapper_name = entry.key();
    const nlohmann::json& body = entry.value();
    const auto wrapper = LookupValue(kWrapperNames, wrapper_name);
    if (!wrapper) {
      throw std::invalid_argument("unknown message wrapper '" + wrapper_name + "'");
    }
    if (!body.is_object()) {
      throw std::invalid_argument("message body is not an object");
    }
    Message parsed;
    parsed.wrapper = *wrapper;
    parsed.kind.version = FieldOr<std::uint8_t>(body, "version", kProtocolVersion);
    parsed.kind.id = OptionalField<std::string>(body, "id");
    parsed.kind.request_id = OptionalField<std::uint64_t>(body, "request_id");
    parsed.kind.trade_index = OptionalField<std::int64_t>(body, "trade_index");
    parsed.kind.action = *RequiredEnum(body.at("action"), ParseAction, "action");
    if (auto it = body.find("payload"); it != body.end() && !it->is_null()) {
      parsed.kind.payload = DecodePayload(*it);
    }
    *message = std::move(parsed);
  } catch (const std::exception& ex) {
    SetError(error, std::string("malformed message: ") + ex.what());
    return false;
  }
  return true;
}

bool ParseMessageJson(std::string_view text, Message* message, std::string* error) {
  auto json = nlohmann::json::parse(text, nullptr, false);
  if (json.is_discarded()) {
    SetError(error, "message is not valid JSON");
    return false;
  }
  return MessageFromJson(json, message, error);
}

crypto::SchnorrSignature SignMessageJson(std::string_view message_json, const crypto::Keys& keys) {
  return keys.Sign(crypto::Sha256(crypto::AsBytes(message_json)));
}

bool VerifyMessageJson(std::string_view message_json, const crypto::XOnlyPublicKey& pubkey,
                       const crypto::SchnorrSignature& signature) {
  return crypto::SchnorrVerify(pubkey, crypto::Sha256(crypto::AsBytes(message_json)), signature);
}

ResponseCheck CheckResponse(const Message& response, std::uint64_t expected_request_id) {
  const auto& kind = response.kind;
  if (const auto* cant_do = PayloadAs<CantDo>(kind)) {
    auto description = CantDoDescription(cant_do->reason);
    util::LogError("Received CantDo error: " + description);
    return {ResponseVerdict::kRejected, std::move(description)};
  }
  if (kind.request_id) {
    if (*kind.request_id != expected_request_id) {
      util::LogWarn("Received response with mismatched request_id. Expected: " +
                    std::to_string(expected_request_id) +
                    ", Got: " + std::to_string(*kind.request_id));
      return {ResponseVerdict::kMismatchedRequestId, "Mismatched request_id"};
    }
    return {};
  }
  switch (kind.action) {
    case Action::kRateReceived:
    case Action::kNewOrder:
    case Action::kAddInvoice:
    case Action::kPayInvoice:
      return {};
    default:
      util::LogWarn("Received response with null request_id. Expected: " +
                    std::to_string(expected_request_id));
      return {ResponseVerdict::kMissingRequestId, "Response with null request_id"};
  }
}

}  // namespace mostrix::protocol
