#pragma once

#include <cstdint>
#include <string>

#include "client/correlator.hpp"
#include "client/dispute_chat.hpp"
#include "client/store.hpp"
#include "crypto/keys.hpp"
#include "net/relay.hpp"
#include "protocol/message.hpp"

namespace mostrix::client {

enum class FinalizeCheck {
  kAllowed,
  // settled, seller-refunded or released.
  kAlreadyFinalized,
  // Still initiated or already canceled.
  kNotAllowed,
};

FinalizeCheck CheckFinalize(const AdminDispute& dispute);

// Maps the solver info of an admin-took-dispute reply onto a stored record.
// Throws std::runtime_error when either trade pubkey is missing.
AdminDispute DisputeFromSolverInfo(const std::string& dispute_id,
                                   const protocol::SolverDisputeInfo& info);

// Arbitrator-mode requests. The admin key signs both the seal and the rumor.
// Failures throw std::runtime_error with the operator-facing reason.
class AdminClient {
 public:
  AdminClient(crypto::Keys admin_keys, net::RelayClient& relay, Store& store,
              RequestCorrelator& correlator, const crypto::XOnlyPublicKey& mostro_pubkey,
              std::uint8_t pow = 0, DisputeChatSync* chat = nullptr);

  // Claims the dispute, stores it as in-progress and prepares both chat keys.
  AdminDispute TakeDispute(const std::string& dispute_id);

  // Pays the buyer. Refused locally once the dispute is finalized.
  void Settle(const std::string& dispute_id);
  // Refunds the seller.
  void Cancel(const std::string& dispute_id);

  // Grants solver rights to another pubkey (npub or hex).
  void AddSolver(const std::string& solver);

 private:
  void Finalize(const std::string& dispute_id, protocol::Action action,
                protocol::DisputeStatus new_status);
  void PublishFireAndForget(const protocol::Message& message);

  crypto::Keys admin_keys_;
  net::RelayClient& relay_;
  Store& store_;
  RequestCorrelator& correlator_;
  crypto::XOnlyPublicKey mostro_pubkey_;
  std::uint8_t pow_;
  DisputeChatSync* chat_;
};

}  // namespace mostrix::client
