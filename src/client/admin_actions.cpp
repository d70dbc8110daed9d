#include "client/admin_actions.hpp"

#include <stdexcept>
#include <utility>

#include "protocol/gift_wrap.hpp"
#include "util/csprng.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace mostrix::client {

using protocol::Action;
using protocol::DisputeStatus;

FinalizeCheck CheckFinalize(const AdminDispute& dispute) {
  if (IsFinalizedDisputeStatus(dispute.status)) {
    return FinalizeCheck::kAlreadyFinalized;
  }
  return dispute.status == DisputeStatus::kInProgress ? FinalizeCheck::kAllowed
                                                      : FinalizeCheck::kNotAllowed;
}

AdminDispute DisputeFromSolverInfo(const std::string& dispute_id,
                                   const protocol::SolverDisputeInfo& info) {
  if (!info.buyer_pubkey || info.buyer_pubkey->empty()) {
    throw std::runtime_error("dispute " + dispute_id + " has no buyer trade pubkey");
  }
  if (!info.seller_pubkey || info.seller_pubkey->empty()) {
    throw std::runtime_error("dispute " + dispute_id + " has no seller trade pubkey");
  }
  AdminDispute dispute;
  dispute.id = info.id;
  dispute.dispute_id = dispute_id;
  dispute.status = DisputeStatus::kInProgress;
  dispute.initiator_pubkey = info.initiator_pubkey;
  dispute.buyer_pubkey = *info.buyer_pubkey;
  dispute.seller_pubkey = *info.seller_pubkey;
  dispute.initiator_full_privacy = info.initiator_full_privacy;
  dispute.counterpart_full_privacy = info.counterpart_full_privacy;
  dispute.premium = info.premium;
  dispute.payment_method = info.payment_method;
  dispute.amount = info.amount;
  dispute.fiat_amount = info.fiat_amount;
  dispute.fee = info.fee;
  dispute.routing_fee = info.routing_fee;
  dispute.buyer_invoice = info.buyer_invoice;
  if (info.invoice_held_at > 0) {
    dispute.invoice_held_at = info.invoice_held_at;
  }
  dispute.taken_at = info.taken_at > 0 ? info.taken_at : util::NowSeconds();
  dispute.created_at = info.created_at;
  return dispute;
}

AdminClient::AdminClient(crypto::Keys admin_keys, net::RelayClient& relay, Store& store,
                         RequestCorrelator& correlator,
                         const crypto::XOnlyPublicKey& mostro_pubkey, std::uint8_t pow,
                         DisputeChatSync* chat)
    : admin_keys_(std::move(admin_keys)),
      relay_(relay),
      store_(store),
      correlator_(correlator),
      mostro_pubkey_(mostro_pubkey),
      pow_(pow),
      chat_(chat) {}

AdminDispute AdminClient::TakeDispute(const std::string& dispute_id) {
  const auto request_id = util::RandomU64();
  const auto message = protocol::Message::Dispute(dispute_id, request_id, std::nullopt,
                                                  Action::kAdminTakeDispute, std::nullopt);
  protocol::EnvelopeOptions options;
  options.pow = pow_;
  const auto request =
      protocol::EncodeEnvelope(message, admin_keys_, &admin_keys_, mostro_pubkey_, options);
  const auto result = correlator_.SendAndWait(relay_, request, request_id,
                                              Action::kAdminTakeDispute, admin_keys_,
                                              mostro_pubkey_);
  if (result.outcome == CorrelationOutcome::kTimedOut) {
    throw std::runtime_error("No response received from Mostro");
  }
  if (!result.ok()) {
    throw std::runtime_error(result.error);
  }
  if (result.response->seal_signer != mostro_pubkey_) {
    throw std::runtime_error("Received response from wrong sender");
  }
  const auto& kind = result.response->message.kind;
  if (kind.action != Action::kAdminTookDispute) {
    throw std::runtime_error(
        std::string("Received response with mismatched action. Expected: ") +
        protocol::ActionName(Action::kAdminTookDispute) + ", Got: " +
        protocol::ActionName(kind.action));
  }
  const auto* payload = protocol::PayloadAs<protocol::DisputePayload>(kind);
  if (!payload) {
    throw std::runtime_error("Expected Dispute payload with SolverDisputeInfo");
  }
  if (payload->dispute_id != dispute_id) {
    throw std::runtime_error("Dispute ID mismatch: expected " + dispute_id + ", got " +
                             payload->dispute_id);
  }
  if (!payload->info) {
    throw std::runtime_error("SolverDisputeInfo not found in payload");
  }

  const auto dispute = DisputeFromSolverInfo(dispute_id, *payload->info);
  std::string error;
  if (!store_.PutDispute(dispute, &error)) {
    throw std::runtime_error("failed to save dispute " + dispute_id + ": " + error);
  }
  util::LogInfo("took dispute " + dispute_id + " for order " + dispute.id);
  if (chat_ != nullptr) {
    try {
      chat_->EnsureSharedKeys(dispute_id);
    } catch (const std::exception& e) {
      util::LogWarn("dispute " + dispute_id + ": chat keys not ready: " + e.what());
    }
  }
  return dispute;
}

void AdminClient::Settle(const std::string& dispute_id) {
  Finalize(dispute_id, Action::kAdminSettle, DisputeStatus::kSettled);
}

void AdminClient::Cancel(const std::string& dispute_id) {
  Finalize(dispute_id, Action::kAdminCancel, DisputeStatus::kSellerRefunded);
}

void AdminClient::Finalize(const std::string& dispute_id, Action action,
                           DisputeStatus new_status) {
  const auto dispute = store_.GetDispute(dispute_id);
  if (!dispute) {
    throw std::runtime_error("unknown dispute " + dispute_id);
  }
  switch (CheckFinalize(*dispute)) {
    case FinalizeCheck::kAllowed:
      break;
    case FinalizeCheck::kAlreadyFinalized:
      throw std::runtime_error(std::string("Cannot execute ") + protocol::ActionName(action) +
                               ": dispute " + dispute_id + " is already finalized (status: " +
                               protocol::DisputeStatusName(dispute->status) + ")");
    case FinalizeCheck::kNotAllowed:
      throw std::runtime_error(std::string("Cannot execute ") + protocol::ActionName(action) +
                               ": dispute " + dispute_id + " is not in progress (status: " +
                               protocol::DisputeStatusName(dispute->status) + ")");
  }

  PublishFireAndForget(
      protocol::Message::Dispute(dispute->id, std::nullopt, std::nullopt, action, std::nullopt));
  std::string error;
  if (!store_.UpdateDisputeStatus(dispute_id, new_status, &error)) {
    throw std::runtime_error("dispute " + dispute_id + " finalized but status not saved: " +
                             error);
  }
  util::LogInfo(std::string(protocol::ActionName(action)) + " sent for dispute " + dispute_id);
}

void AdminClient::AddSolver(const std::string& solver) {
  const auto pubkey = crypto::ParsePublicKey(solver);
  if (!pubkey) {
    throw std::invalid_argument("invalid solver pubkey: " + solver);
  }
  PublishFireAndForget(protocol::Message::Dispute(
      util::RandomUuid(), std::nullopt, std::nullopt, Action::kAdminAddSolver,
      protocol::TextMessage{crypto::EncodeNpub(*pubkey)}));
  util::LogInfo("solver " + crypto::EncodeNpub(*pubkey) + " added");
}

void AdminClient::PublishFireAndForget(const protocol::Message& message) {
  protocol::EnvelopeOptions options;
  options.pow = pow_;
  const auto event =
      protocol::EncodeEnvelope(message, admin_keys_, &admin_keys_, mostro_pubkey_, options);
  std::string error;
  if (!relay_.Publish(event, &error)) {
    throw std::runtime_error(std::string("failed to publish ") +
                             protocol::ActionName(message.kind.action) + ": " + error);
  }
}

}  // namespace mostrix::client
