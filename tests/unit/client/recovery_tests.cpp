#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "client/memory_store.hpp"
#include "client/recovery.hpp"
#include "crypto/key_deriver.hpp"
#include "net/memory_relay.hpp"
#include "protocol/gift_wrap.hpp"

using namespace mostrix;
using client::RecoveredTrade;
using protocol::Action;
using protocol::Message;

namespace {

const std::string kMnemonic =
    "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon about";

protocol::DirectMessage At(std::int64_t ts, Action action,
                           std::optional<protocol::Payload> payload = std::nullopt) {
  protocol::DirectMessage message;
  message.message = Message::Order("order", 1, 1, action, std::move(payload));
  message.created_at = ts;
  return message;
}

bool TestFold() {
  protocol::SmallOrder order;
  order.amount = 12'000;
  const std::vector<protocol::DirectMessage> messages = {
      At(100, Action::kNewOrder),
      At(200, Action::kAddInvoice, order),
      At(300, Action::kWaitingSellerToPay),
      // Stale and rejected messages do not move the state.
      At(250, Action::kCanceled),
      At(400, Action::kCantDo, protocol::CantDo{protocol::CantDoReason::kNotAllowedByStatus}),
  };
  client::TradeState initial;
  initial.order_id = "order";
  const auto state = client::FoldTradeMessages(initial, messages);
  if (state.last_action != Action::kWaitingSellerToPay ||
      state.status != protocol::Status::kWaitingPayment || state.last_update != 300) {
    std::cerr << "fold did not settle on the latest applicable message\n";
    return false;
  }
  if (state.sat_amount) {
    std::cerr << "add-invoice amount survived a later message\n";
    return false;
  }

  const auto pending = client::ApplyTradeMessage(initial, messages[1]);
  if (pending.sat_amount != 12'000 || pending.status != protocol::Status::kWaitingBuyerInvoice) {
    std::cerr << "add-invoice did not expose the sat amount\n";
    return false;
  }
  const auto pay = client::ApplyTradeMessage(
      initial, At(500, Action::kPayInvoice,
                  protocol::PaymentRequest{std::nullopt, "lnbc10u1pexample", std::nullopt}));
  if (pay.invoice != "lnbc10u1pexample" || pay.status != protocol::Status::kWaitingPayment) {
    std::cerr << "pay-invoice did not expose the invoice\n";
    return false;
  }

  if (client::StatusAfterAction(Action::kReleased) != protocol::Status::kSettledHoldInvoice ||
      client::StatusAfterAction(Action::kCooperativeCancelAccepted) !=
          protocol::Status::kCooperativelyCanceled ||
      client::StatusAfterAction(Action::kSendDm)) {
    std::cerr << "status mapping mismatch\n";
    return false;
  }
  return true;
}

client::OrderRecord StoredOrder(const std::string& id, std::int64_t index) {
  client::OrderRecord order;
  order.id = id;
  order.kind = protocol::OrderKind::kBuy;
  order.status = protocol::Status::kActive;
  order.trade_index = index;
  return order;
}

const RecoveredTrade* FindResult(const std::vector<RecoveredTrade>& results,
                                 const std::string& id) {
  for (const auto& result : results) {
    if (result.order_id == id) {
      return &result;
    }
  }
  return nullptr;
}

bool TestEngine() {
  const crypto::KeyDeriver deriver(kMnemonic);
  const auto mostro = crypto::Keys::Generate();
  net::MemoryRelay relay;
  client::MemoryStore store;

  for (const auto& order : {StoredOrder("paying", 1), StoredOrder("quiet", 2),
                            StoredOrder("twin-a", 3), StoredOrder("twin-b", 3)}) {
    if (!store.PutOrder(order)) {
      std::cerr << "failed to seed store\n";
      return false;
    }
  }

  const auto pay = Message::Order("paying", 7, 1, Action::kPayInvoice,
                                  protocol::PaymentRequest{std::nullopt, "lnbc1invoice", 5000});
  if (!relay.Publish(
          protocol::EncodeEnvelope(pay, mostro, &mostro, deriver.DeriveTradeKey(1).PublicKey()))) {
    std::cerr << "failed to publish the daemon reply\n";
    return false;
  }

  client::RecoveryEngine engine(deriver, relay, store, std::chrono::seconds(1));
  const auto results = engine.Recover();
  if (results.size() != 4) {
    std::cerr << "expected 4 recovery results, got " << results.size() << "\n";
    return false;
  }

  const auto* paying = FindResult(results, "paying");
  if (!paying || paying->status != RecoveredTrade::Status::kRecovered ||
      paying->state.invoice != "lnbc1invoice" ||
      paying->state.status != protocol::Status::kWaitingPayment) {
    std::cerr << "paying trade not recovered\n";
    return false;
  }
  if (store.GetOrder("paying")->status != protocol::Status::kWaitingPayment) {
    std::cerr << "recovered status not stored\n";
    return false;
  }

  const auto* quiet = FindResult(results, "quiet");
  if (!quiet || quiet->status != RecoveredTrade::Status::kNoMessages) {
    std::cerr << "quiet trade should have no messages\n";
    return false;
  }
  for (const char* twin : {"twin-a", "twin-b"}) {
    const auto* result = FindResult(results, twin);
    if (!result || result->status != RecoveredTrade::Status::kDuplicateIndex) {
      std::cerr << "shared trade index not flagged for " << twin << "\n";
      return false;
    }
  }

  // One failing relay query fails every trade on its own, never the whole run.
  relay.SetFetchFailure(std::string("connection refused"));
  for (const auto& result : engine.Recover()) {
    if (result.status != RecoveredTrade::Status::kFetchFailed &&
        result.status != RecoveredTrade::Status::kDuplicateIndex) {
      std::cerr << "fetch failure reported as " << client::RecoveredTradeStatusName(result.status)
                << "\n";
      return false;
    }
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!TestFold() || !TestEngine()) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "recovery_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  std::cout << "recovery_tests: OK\n";
  return EXIT_SUCCESS;
}
