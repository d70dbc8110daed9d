#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "crypto/keys.hpp"
#include "net/relay.hpp"
#include "protocol/gift_wrap.hpp"
#include "protocol/message.hpp"

namespace mostrix::client {

enum class CorrelationOutcome {
  kMatched,
  // A reply whose request id is not the pending one, or a reply without an
  // id for an action that must carry one.
  kMismatched,
  kTimedOut,
  // The daemon answered with cant-do.
  kRejected,
  // Nothing pending under that id any more (already resolved or expired).
  kIgnored,
  // The request never reached the relay.
  kPublishFailed,
};

const char* CorrelationOutcomeName(CorrelationOutcome outcome);

struct CorrelationResult {
  CorrelationOutcome outcome{CorrelationOutcome::kTimedOut};
  std::optional<protocol::DecodedEnvelope> response;
  std::string error;

  bool ok() const { return outcome == CorrelationOutcome::kMatched; }
};

// Tracks outstanding requests by their random 64-bit id. Each request
// resolves exactly once; later arrivals are ignored. Timed-out entries are
// dropped locally and nothing is sent on the wire.
class RequestCorrelator {
 public:
  using Clock = std::chrono::steady_clock;

  explicit RequestCorrelator(std::chrono::milliseconds window = net::kFetchEventsTimeout)
      : window_(window) {}

  // Fresh random id, already registered.
  std::uint64_t NewRequest(protocol::Action action, Clock::time_point now = Clock::now());
  // Throws std::invalid_argument when the id is already pending.
  void Register(std::uint64_t request_id, protocol::Action action,
                Clock::time_point now = Clock::now());

  // A request is late once `window` has elapsed since it was issued; Deliver
  // and Expire apply the same bound.
  // Reply received on the channel that belongs to `request_id`.
  CorrelationOutcome Deliver(std::uint64_t request_id, const protocol::Message& response,
                             Clock::time_point now = Clock::now(), std::string* error = nullptr);
  // Reply routed by its own request id; an unknown id is a mismatch.
  CorrelationOutcome Deliver(const protocol::Message& response,
                             Clock::time_point now = Clock::now(), std::string* error = nullptr);

  // Drops every request whose window has elapsed and returns how many.
  std::size_t Expire(Clock::time_point now = Clock::now());

  bool IsPending(std::uint64_t request_id) const;
  std::size_t PendingCount() const;

  // Subscribe to replies for `receiver`, publish `request`, then wait up to
  // the window for the first reply from `expected_sender` (when given).
  // Undecodable events on the channel are skipped.
  CorrelationResult SendAndWait(net::RelayClient& relay, const protocol::Event& request,
                                std::uint64_t request_id, protocol::Action action,
                                const crypto::Keys& receiver,
                                const std::optional<crypto::XOnlyPublicKey>& expected_sender =
                                    std::nullopt);

 private:
  struct Pending {
    protocol::Action action;
    Clock::time_point issued_at;
  };

  bool Elapsed(const Pending& pending, Clock::time_point now) const;
  void ResolveLocked(std::uint64_t request_id);

  std::chrono::milliseconds window_;
  mutable std::mutex mutex_;
  std::map<std::uint64_t, Pending> pending_;
  std::set<std::uint64_t> resolved_;
  std::deque<std::uint64_t> resolved_order_;
};

}  // namespace mostrix::client
