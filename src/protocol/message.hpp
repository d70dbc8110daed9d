#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "crypto/keys.hpp"
#include "nlohmann/json.hpp"

namespace mostrix::protocol {

constexpr std::uint8_t kProtocolVersion = 1;

enum class Action {
  kNewOrder,
  kTakeSell,
  kTakeBuy,
  kPayInvoice,
  kFiatSent,
  kFiatSentOk,
  kRelease,
  kReleased,
  kCancel,
  kCanceled,
  kCooperativeCancelInitiatedByYou,
  kCooperativeCancelInitiatedByPeer,
  kDisputeInitiatedByYou,
  kDisputeInitiatedByPeer,
  kCooperativeCancelAccepted,
  kBuyerInvoiceAccepted,
  kPurchaseCompleted,
  kHoldInvoicePaymentAccepted,
  kHoldInvoicePaymentSettled,
  kHoldInvoicePaymentCanceled,
  kWaitingSellerToPay,
  kWaitingBuyerInvoice,
  kAddInvoice,
  kBuyerTookOrder,
  kRate,
  kRateUser,
  kRateReceived,
  kCantDo,
  kDispute,
  kAdminCancel,
  kAdminCanceled,
  kAdminSettle,
  kAdminSettled,
  kAdminAddSolver,
  kAdminTakeDispute,
  kAdminTookDispute,
  kPaymentFailed,
  kInvoiceUpdated,
  kSendDm,
  kTradePubkey,
  kRestoreSession,
  kLastTradeIndex,
};

enum class OrderKind { kBuy, kSell };

enum class Status {
  kActive,
  kCanceled,
  kCanceledByAdmin,
  kSettledByAdmin,
  kCompletedByAdmin,
  kDispute,
  kExpired,
  kFiatSent,
  kSettledHoldInvoice,
  kPending,
  kSuccess,
  kWaitingBuyerInvoice,
  kWaitingPayment,
  kCooperativelyCanceled,
  kInProgress,
};

enum class DisputeStatus {
  kInitiated,
  kInProgress,
  kCanceled,
  kSettled,
  kSellerRefunded,
  kReleased,
};

enum class CantDoReason {
  kInvalidSignature,
  kInvalidTradeIndex,
  kInvalidAmount,
  kInvalidInvoice,
  kInvalidPaymentRequest,
  kInvalidPeer,
  kInvalidRating,
  kInvalidTextMessage,
  kInvalidOrderKind,
  kInvalidOrderStatus,
  kInvalidPubkey,
  kInvalidParameters,
  kOrderAlreadyCanceled,
  kCantCreateUser,
  kIsNotYourOrder,
  kNotAllowedByStatus,
  kOutOfRangeFiatAmount,
  kOutOfRangeSatsAmount,
  kIsNotYourDispute,
  kDisputeTakenByAdmin,
  kDisputeCreationError,
  kNotFound,
  kInvalidDisputeStatus,
  kInvalidAction,
  kPendingOrderExists,
  kInvalidFiatCurrency,
  kTooManyRequests,
};

// Wire names: kebab-case for actions and statuses, lowercase for order kinds,
// snake_case for cant-do reasons.
const char* ActionName(Action action);
std::optional<Action> ParseAction(std::string_view name);
const char* OrderKindName(OrderKind kind);
std::optional<OrderKind> ParseOrderKind(std::string_view name);
const char* StatusName(Status status);
std::optional<Status> ParseStatus(std::string_view name);
const char* DisputeStatusName(DisputeStatus status);
std::optional<DisputeStatus> ParseDisputeStatus(std::string_view name);
const char* CantDoReasonName(CantDoReason reason);
std::optional<CantDoReason> ParseCantDoReason(std::string_view name);

// Operator-facing explanation of a rejection.
std::string CantDoDescription(const std::optional<CantDoReason>& reason);

struct SmallOrder {
  std::optional<std::string> id;
  std::optional<OrderKind> kind;
  std::optional<Status> status;
  std::int64_t amount{0};
  std::string fiat_code;
  std::optional<std::int64_t> min_amount;
  std::optional<std::int64_t> max_amount;
  std::int64_t fiat_amount{0};
  std::string payment_method;
  std::int64_t premium{0};
  std::optional<std::string> buyer_trade_pubkey;
  std::optional<std::string> seller_trade_pubkey;
  std::optional<std::string> buyer_invoice;
  std::optional<std::int64_t> created_at;
  std::optional<std::int64_t> expires_at;

  bool operator==(const SmallOrder&) const = default;
};

struct UserInfo {
  double rating{0.0};
  std::int64_t reviews{0};
  std::uint64_t operating_days{0};

  bool operator==(const UserInfo&) const = default;
};

struct Peer {
  std::string pubkey;
  std::optional<UserInfo> reputation;

  bool operator==(const Peer&) const = default;
};

// Dispute details handed to the solver that took it.
struct SolverDisputeInfo {
  std::string id;
  std::string kind;
  std::string status;
  std::optional<std::string> hash;
  std::optional<std::string> preimage;
  std::string order_previous_status;
  std::string initiator_pubkey;
  std::optional<std::string> buyer_pubkey;
  std::optional<std::string> seller_pubkey;
  bool initiator_full_privacy{false};
  bool counterpart_full_privacy{false};
  std::int64_t premium{0};
  std::string payment_method;
  std::int64_t amount{0};
  std::int64_t fiat_amount{0};
  std::int64_t fee{0};
  std::int64_t routing_fee{0};
  std::optional<std::string> buyer_invoice;
  std::int64_t invoice_held_at{0};
  std::int64_t taken_at{0};
  std::int64_t created_at{0};

  bool operator==(const SolverDisputeInfo&) const = default;
};

struct PaymentRequest {
  std::optional<SmallOrder> order;
  std::string invoice;
  std::optional<std::int64_t> amount;

  bool operator==(const PaymentRequest&) const = default;
};

struct TextMessage {
  std::string text;

  bool operator==(const TextMessage&) const = default;
};

struct RatingUser {
  std::uint8_t rating{0};

  bool operator==(const RatingUser&) const = default;
};

struct Amount {
  std::int64_t sats{0};

  bool operator==(const Amount&) const = default;
};

struct DisputePayload {
  std::string dispute_id;
  std::optional<SolverDisputeInfo> info;

  bool operator==(const DisputePayload&) const = default;
};

struct CantDo {
  std::optional<CantDoReason> reason;

  bool operator==(const CantDo&) const = default;
};

// Announces the key the sender will use for the follow-up order of a range
// trade.
struct NextTrade {
  std::string pubkey;
  std::uint32_t index{0};

  bool operator==(const NextTrade&) const = default;
};

using Payload = std::variant<SmallOrder, PaymentRequest, TextMessage, Peer, RatingUser, Amount,
                             DisputePayload, CantDo, NextTrade>;

enum class MessageWrapper { kOrder, kDispute, kCantDo, kRate, kDm, kRestore };

const char* MessageWrapperName(MessageWrapper wrapper);

struct MessageKind {
  std::uint8_t version{kProtocolVersion};
  std::optional<std::string> id;
  std::optional<std::uint64_t> request_id;
  std::optional<std::int64_t> trade_index;
  Action action{Action::kNewOrder};
  std::optional<Payload> payload;

  bool operator==(const MessageKind&) const = default;
};

struct Message {
  MessageWrapper wrapper{MessageWrapper::kOrder};
  MessageKind kind;

  bool operator==(const Message&) const = default;

  static Message Order(std::optional<std::string> id, std::optional<std::uint64_t> request_id,
                       std::optional<std::int64_t> trade_index, Action action,
                       std::optional<Payload> payload);
  static Message Dispute(std::optional<std::string> id, std::optional<std::uint64_t> request_id,
                         std::optional<std::int64_t> trade_index, Action action,
                         std::optional<Payload> payload);
  static Message Dm(std::optional<std::string> id, std::optional<std::uint64_t> request_id,
                    Action action, std::optional<Payload> payload);
};

nlohmann::json PayloadToJson(const Payload& payload);
bool PayloadFromJson(const nlohmann::json& json, Payload* payload, std::string* error = nullptr);

nlohmann::json MessageToJson(const Message& message);
std::string MessageToJsonString(const Message& message);
bool MessageFromJson(const nlohmann::json& json, Message* message, std::string* error = nullptr);
bool ParseMessageJson(std::string_view text, Message* message, std::string* error = nullptr);

// Schnorr signature by the trade key over SHA-256 of the serialized message.
crypto::SchnorrSignature SignMessageJson(std::string_view message_json, const crypto::Keys& keys);
bool VerifyMessageJson(std::string_view message_json, const crypto::XOnlyPublicKey& pubkey,
                       const crypto::SchnorrSignature& signature);

template <typename T>
const T* PayloadAs(const MessageKind& kind) {
  if (!kind.payload) {
    return nullptr;
  }
  return std::get_if<T>(&*kind.payload);
}

enum class ResponseVerdict {
  kAccepted,
  // CantDo payload; `error` holds the description.
  kRejected,
  kMismatchedRequestId,
  kMissingRequestId,
};

struct ResponseCheck {
  ResponseVerdict verdict{ResponseVerdict::kAccepted};
  std::string error;

  bool ok() const { return verdict == ResponseVerdict::kAccepted; }
};

// Validates a reply from the exchange daemon against the request id that was
// sent. Replies without an id are only tolerated for actions the daemon emits
// unsolicited (rate-received, new-order, add-invoice, pay-invoice).
ResponseCheck CheckResponse(const Message& response, std::uint64_t expected_request_id);

}  // namespace mostrix::protocol
