#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include "crypto/keys.hpp"
#include "nlohmann/json.hpp"
#include "protocol/message.hpp"

using namespace mostrix;
using protocol::Action;
using protocol::Message;

namespace {

bool TestWireShape() {
  protocol::SmallOrder order;
  order.kind = protocol::OrderKind::kSell;
  order.status = protocol::Status::kPending;
  order.fiat_code = "VES";
  order.fiat_amount = 100;
  order.payment_method = "face to face";
  order.premium = 1;
  const auto message = Message::Order(std::nullopt, 42, 1, Action::kNewOrder, order);
  const auto json = protocol::MessageToJson(message);
  if (!json.contains("order") || json.size() != 1) {
    std::cerr << "message is not wrapped under 'order': " << json.dump() << "\n";
    return false;
  }
  const auto& body = json["order"];
  if (body["version"] != 1 || body["request_id"] != 42 || body["trade_index"] != 1 ||
      body["action"] != "new-order" || !body["id"].is_null()) {
    std::cerr << "unexpected message body: " << body.dump() << "\n";
    return false;
  }
  const auto& payload = body["payload"]["order"];
  if (payload["kind"] != "sell" || payload["status"] != "pending" || payload["fiat_code"] != "VES") {
    std::cerr << "unexpected order payload: " << payload.dump() << "\n";
    return false;
  }

  Message parsed;
  std::string error;
  if (!protocol::ParseMessageJson(json.dump(), &parsed, &error) || !(parsed == message)) {
    std::cerr << "order message did not survive a round trip: " << error << "\n";
    return false;
  }
  return true;
}

bool TestPayloadVariants() {
  const std::string text = R"({"dispute":{"version":1,"id":"0e1b7b3a-6c4e-4d7b-9a5e-1f2f3a4b5c6d",
      "request_id":7,"trade_index":null,"action":"admin-took-dispute",
      "payload":{"dispute":["0e1b7b3a-6c4e-4d7b-9a5e-1f2f3a4b5c6d",
        {"id":"0e1b7b3a-6c4e-4d7b-9a5e-1f2f3a4b5c6d","kind":"sell","status":"active",
         "initiator_pubkey":"aa","buyer_pubkey":"bb","seller_pubkey":null,"amount":5000,
         "fiat_amount":10,"taken_at":1700000000}]}}})";
  Message message;
  std::string error;
  if (!protocol::ParseMessageJson(text, &message, &error)) {
    std::cerr << "dispute message rejected: " << error << "\n";
    return false;
  }
  const auto* dispute = protocol::PayloadAs<protocol::DisputePayload>(message.kind);
  if (message.wrapper != protocol::MessageWrapper::kDispute || dispute == nullptr ||
      !dispute->info || dispute->info->buyer_pubkey != "bb" || dispute->info->seller_pubkey ||
      dispute->info->amount != 5000) {
    std::cerr << "dispute payload decoded incorrectly\n";
    return false;
  }

  const auto request = Message::Order("id-1", 9, std::nullopt, Action::kPayInvoice,
                                      protocol::PaymentRequest{std::nullopt, "lnbc1xyz", 21});
  const auto encoded = protocol::MessageToJson(request);
  const auto& array = encoded["order"]["payload"]["payment_request"];
  if (!array.is_array() || array.size() != 3 || !array[0].is_null() || array[1] != "lnbc1xyz" ||
      array[2] != 21) {
    std::cerr << "payment_request is not a 3-element array: " << array.dump() << "\n";
    return false;
  }

  const auto next = Message::Order("id-2", 3, 4, Action::kFiatSent,
                                   protocol::NextTrade{"abcdef", 5});
  if (protocol::MessageToJson(next)["order"]["payload"] !=
      nlohmann::json::parse(R"({"next_trade":["abcdef",5]})")) {
    std::cerr << "next_trade payload mismatch\n";
    return false;
  }

  if (protocol::ParseMessageJson(R"({"order":{"version":1,"action":"fly-away"}})", &message,
                                 &error)) {
    std::cerr << "unknown action accepted\n";
    return false;
  }
  if (protocol::ParseMessageJson(R"({"order":{},"dm":{}})", &message, &error)) {
    std::cerr << "two wrappers accepted\n";
    return false;
  }
  if (protocol::ParseMessageJson("not json", &message, &error)) {
    std::cerr << "garbage accepted\n";
    return false;
  }
  return true;
}

bool TestCheckResponse() {
  const auto ok = Message::Order("id", 5, 1, Action::kWaitingSellerToPay, std::nullopt);
  if (!protocol::CheckResponse(ok, 5).ok()) {
    std::cerr << "matching request id not accepted\n";
    return false;
  }
  if (protocol::CheckResponse(ok, 6).verdict != protocol::ResponseVerdict::kMismatchedRequestId) {
    std::cerr << "mismatched request id accepted\n";
    return false;
  }

  // Replies the daemon emits without an id.
  for (auto action : {Action::kRateReceived, Action::kNewOrder, Action::kAddInvoice,
                      Action::kPayInvoice}) {
    const auto unsolicited = Message::Order("id", std::nullopt, 1, action, std::nullopt);
    if (!protocol::CheckResponse(unsolicited, 5).ok()) {
      std::cerr << "null request id rejected for " << protocol::ActionName(action) << "\n";
      return false;
    }
  }
  const auto missing = Message::Order("id", std::nullopt, 1, Action::kReleased, std::nullopt);
  if (protocol::CheckResponse(missing, 5).verdict != protocol::ResponseVerdict::kMissingRequestId) {
    std::cerr << "null request id accepted for released\n";
    return false;
  }

  const auto rejected = Message::Order(std::nullopt, 5, std::nullopt, Action::kCantDo,
                                       protocol::CantDo{protocol::CantDoReason::kNotFound});
  const auto check = protocol::CheckResponse(rejected, 5);
  if (check.verdict != protocol::ResponseVerdict::kRejected ||
      check.error != "Resource not found") {
    std::cerr << "cant-do not reported: " << check.error << "\n";
    return false;
  }
  if (protocol::CantDoDescription(std::nullopt) !=
      "Unknown error - Mostro couldn't process your request") {
    std::cerr << "unexpected description for a bare cant-do\n";
    return false;
  }
  return true;
}

bool TestNames() {
  for (const char* name : {"cooperative-cancel-initiated-by-you", "admin-took-dispute",
                           "hold-invoice-payment-settled", "last-trade-index"}) {
    const auto action = protocol::ParseAction(name);
    if (!action || std::string(protocol::ActionName(*action)) != name) {
      std::cerr << "action name does not round trip: " << name << "\n";
      return false;
    }
  }
  if (protocol::ParseStatus("settled-by-admin") != protocol::Status::kSettledByAdmin ||
      protocol::ParseDisputeStatus("seller-refunded") !=
          protocol::DisputeStatus::kSellerRefunded ||
      protocol::ParseCantDoReason("too_many_requests") !=
          protocol::CantDoReason::kTooManyRequests) {
    std::cerr << "status or reason name mismatch\n";
    return false;
  }
  if (protocol::ParseOrderKind("Buy")) {
    std::cerr << "order kind names are case sensitive\n";
    return false;
  }
  return true;
}

bool TestSignature() {
  const auto keys = crypto::Keys::Generate();
  const auto message = Message::Order("id", 1, 2, Action::kRelease, std::nullopt);
  const auto json = protocol::MessageToJsonString(message);
  const auto signature = protocol::SignMessageJson(json, keys);
  if (!protocol::VerifyMessageJson(json, keys.PublicKey(), signature)) {
    std::cerr << "message signature did not verify\n";
    return false;
  }
  const auto other = protocol::MessageToJsonString(
      Message::Order("id", 1, 3, Action::kRelease, std::nullopt));
  if (protocol::VerifyMessageJson(other, keys.PublicKey(), signature)) {
    std::cerr << "signature verified for different content\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!TestWireShape() || !TestPayloadVariants() || !TestCheckResponse() || !TestNames() ||
        !TestSignature()) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "message_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  std::cout << "message_tests: OK\n";
  return EXIT_SUCCESS;
}
