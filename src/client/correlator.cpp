#include "client/correlator.hpp"

#include <stdexcept>

#include "util/csprng.hpp"
#include "util/logging.hpp"

namespace mostrix::client {

namespace {

constexpr std::size_t kMaxResolvedIds = 4096;

void SetError(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
}

}  // namespace

const char* CorrelationOutcomeName(CorrelationOutcome outcome) {
  switch (outcome) {
    case CorrelationOutcome::kMatched:
      return "matched";
    case CorrelationOutcome::kMismatched:
      return "mismatched";
    case CorrelationOutcome::kTimedOut:
      return "timed-out";
    case CorrelationOutcome::kRejected:
      return "rejected";
    case CorrelationOutcome::kIgnored:
      return "ignored";
    case CorrelationOutcome::kPublishFailed:
      return "publish-failed";
  }
  return "unknown";
}

std::uint64_t RequestCorrelator::NewRequest(protocol::Action action, Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::uint64_t id = util::RandomU64();
  while (pending_.count(id) != 0 || resolved_.count(id) != 0) {
    id = util::RandomU64();
  }
  pending_.emplace(id, Pending{action, now});
  return id;
}

void RequestCorrelator::Register(std::uint64_t request_id, protocol::Action action,
                                 Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!pending_.emplace(request_id, Pending{action, now}).second) {
    throw std::invalid_argument("request id already pending: " + std::to_string(request_id));
  }
}

bool RequestCorrelator::Elapsed(const Pending& pending, Clock::time_point now) const {
  return now - pending.issued_at >= window_;
}

void RequestCorrelator::ResolveLocked(std::uint64_t request_id) {
  pending_.erase(request_id);
  if (resolved_.insert(request_id).second) {
    resolved_order_.push_back(request_id);
    if (resolved_order_.size() > kMaxResolvedIds) {
      resolved_.erase(resolved_order_.front());
      resolved_order_.pop_front();
    }
  }
}

CorrelationOutcome RequestCorrelator::Deliver(std::uint64_t request_id,
                                              const protocol::Message& response,
                                              Clock::time_point now, std::string* error) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = pending_.find(request_id);
  if (it == pending_.end()) {
    util::LogDebug("ignoring reply for settled request " + std::to_string(request_id));
    return CorrelationOutcome::kIgnored;
  }
  if (Elapsed(it->second, now)) {
    ResolveLocked(request_id);
    util::LogDebug("ignoring late reply for request " + std::to_string(request_id));
    return CorrelationOutcome::kIgnored;
  }
  const auto check = protocol::CheckResponse(response, request_id);
  switch (check.verdict) {
    case protocol::ResponseVerdict::kAccepted:
      ResolveLocked(request_id);
      return CorrelationOutcome::kMatched;
    case protocol::ResponseVerdict::kRejected:
      ResolveLocked(request_id);
      SetError(error, check.error);
      return CorrelationOutcome::kRejected;
    case protocol::ResponseVerdict::kMismatchedRequestId:
    case protocol::ResponseVerdict::kMissingRequestId:
      ResolveLocked(request_id);
      SetError(error, check.error);
      return CorrelationOutcome::kMismatched;
  }
  return CorrelationOutcome::kIgnored;
}

CorrelationOutcome RequestCorrelator::Deliver(const protocol::Message& response,
                                              Clock::time_point now, std::string* error) {
  const auto& request_id = response.kind.request_id;
  if (!request_id) {
    util::LogDebug("ignoring unsolicited " +
                   std::string(protocol::ActionName(response.kind.action)));
    return CorrelationOutcome::kIgnored;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.count(*request_id) == 0) {
      if (resolved_.count(*request_id) != 0) {
        return CorrelationOutcome::kIgnored;
      }
      util::LogWarn("reply for unknown request id " + std::to_string(*request_id));
      SetError(error, "Mismatched request_id");
      return CorrelationOutcome::kMismatched;
    }
  }
  return Deliver(*request_id, response, now, error);
}

std::size_t RequestCorrelator::Expire(Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t expired = 0;
  for (auto it = pending_.begin(); it != pending_.end();) {
    if (Elapsed(it->second, now)) {
      const auto id = it->first;
      ++it;
      ResolveLocked(id);
      ++expired;
    } else {
      ++it;
    }
  }
  return expired;
}

bool RequestCorrelator::IsPending(std::uint64_t request_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.count(request_id) != 0;
}

std::size_t RequestCorrelator::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

CorrelationResult RequestCorrelator::SendAndWait(
    net::RelayClient& relay, const protocol::Event& request, std::uint64_t request_id,
    protocol::Action action, const crypto::Keys& receiver,
    const std::optional<crypto::XOnlyPublicKey>& expected_sender) {
  CorrelationResult result;
  const auto subscription = relay.Subscribe(
      protocol::Filter().Kind(protocol::kKindGiftWrap).Pubkey(receiver.PublicKeyHex()));
  const auto issued = Clock::now();
  Register(request_id, action, issued);

  std::string error;
  if (!relay.Publish(request, &error)) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ResolveLocked(request_id);
    }
    result.outcome = CorrelationOutcome::kPublishFailed;
    result.error = "failed to publish request: " + error;
    util::LogWarn("request " + std::to_string(request_id) + " (" + protocol::ActionName(action) +
                  ") not published: " + error);
    return result;
  }

  const auto deadline = issued + window_;
  while (true) {
    const auto now = Clock::now();
    if (now >= deadline) {
      break;
    }
    auto event = subscription->Next(
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
    if (!event) {
      continue;
    }
    protocol::DecodedEnvelope decoded;
    std::string decode_error;
    if (!protocol::DecodeEnvelope(*event, receiver, &decoded, &decode_error)) {
      util::LogDebug("skipping undecodable reply: " + decode_error);
      continue;
    }
    if (expected_sender && decoded.seal_signer != *expected_sender) {
      util::LogDebug("skipping reply from unexpected sender " +
                     crypto::PublicKeyHex(decoded.seal_signer));
      continue;
    }
    std::string deliver_error;
    const auto outcome = Deliver(request_id, decoded.message, Clock::now(), &deliver_error);
    if (outcome == CorrelationOutcome::kIgnored) {
      break;
    }
    result.outcome = outcome;
    result.error = std::move(deliver_error);
    result.response = std::move(decoded);
    return result;
  }
  Expire(Clock::now());
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ResolveLocked(request_id);
  }
  result.outcome = CorrelationOutcome::kTimedOut;
  result.error = "Timeout waiting for response";
  util::LogWarn("request " + std::to_string(request_id) + " (" + protocol::ActionName(action) +
                ") timed out");
  return result;
}

}  // namespace mostrix::client
