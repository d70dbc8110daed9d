#include "client/dispute_chat.hpp"

#include <algorithm>
#include <initializer_list>
#include <set>
#include <stdexcept>

#include "client/attachment.hpp"
#include "crypto/key_deriver.hpp"
#include "protocol/event.hpp"
#include "protocol/filter.hpp"
#include "protocol/gift_wrap.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace mostrix::client {

namespace {

// Resets the single-flight flag however the cycle ends.
class FlightGuard {
 public:
  explicit FlightGuard(std::atomic<bool>& flag) : flag_(flag) {}
  ~FlightGuard() { flag_.store(false); }

  FlightGuard(const FlightGuard&) = delete;
  FlightGuard& operator=(const FlightGuard&) = delete;

 private:
  std::atomic<bool>& flag_;
};

const std::string& PartyPubkey(const AdminDispute& dispute, ChatParty party) {
  return party == ChatParty::kBuyer ? dispute.buyer_pubkey : dispute.seller_pubkey;
}

std::string ChannelName(const std::string& dispute_id, ChatParty party) {
  return dispute_id + "/" + ChatPartyName(party);
}

}  // namespace

std::size_t FetchOutcome::applied() const {
  std::size_t total = 0;
  for (const auto& update : updates) {
    total += update.messages.size();
  }
  return total;
}

DisputeChatSync::DisputeChatSync(crypto::Keys admin_keys, net::RelayClient& relay, Store& store,
                                 TranscriptLog transcripts, ChatSyncOptions options)
    : admin_keys_(std::move(admin_keys)),
      relay_(relay),
      store_(store),
      transcripts_(std::move(transcripts)),
      options_(options),
      updates_(kChatUpdateBacklog) {}

crypto::Keys DisputeChatSync::SharedKeys(const std::string& dispute_id, ChatParty party) {
  std::lock_guard<std::mutex> lock(keys_mutex_);
  auto keys = SharedKeysLocked(dispute_id, party);
  if (integrity_checked_.count(dispute_id) == 0) {
    CheckDistinctKeysLocked(dispute_id);
  }
  return keys;
}

crypto::Keys DisputeChatSync::SharedKeysLocked(const std::string& dispute_id, ChatParty party) {
  if (const auto stored = store_.GetSharedKey(dispute_id, party)) {
    if (auto keys = crypto::Keys::Parse(*stored)) {
      return *keys;
    }
    util::LogWarn("stored shared key for " + ChannelName(dispute_id, party) +
                  " is malformed; deriving it again");
  }
  const auto dispute = store_.GetDispute(dispute_id);
  if (!dispute) {
    throw std::runtime_error("unknown dispute: " + dispute_id);
  }
  const auto pubkey = crypto::ParsePublicKey(PartyPubkey(*dispute, party));
  if (!pubkey) {
    throw std::runtime_error("invalid " + std::string(ChatPartyName(party)) +
                             " pubkey for dispute " + dispute_id);
  }
  auto keys = crypto::KeyDeriver::DeriveSharedKey(admin_keys_.Secret(), *pubkey);
  std::string error;
  if (!store_.SetSharedKey(dispute_id, party, keys.SecretHex(), &error)) {
    util::LogWarn("failed to store shared key for " + ChannelName(dispute_id, party) + ": " +
                  error);
  }
  return keys;
}

void DisputeChatSync::EnsureSharedKeys(const std::string& dispute_id) {
  SharedKeys(dispute_id, ChatParty::kBuyer);
  SharedKeys(dispute_id, ChatParty::kSeller);
}

void DisputeChatSync::CheckDistinctKeysLocked(const std::string& dispute_id) {
  std::optional<crypto::Keys> buyer;
  std::optional<crypto::Keys> seller;
  try {
    buyer = SharedKeysLocked(dispute_id, ChatParty::kBuyer);
    seller = SharedKeysLocked(dispute_id, ChatParty::kSeller);
  } catch (const std::exception& ex) {
    // Checked again once both keys can be produced.
    util::LogWarn("cannot compare chat keys of dispute " + dispute_id + ": " + ex.what());
    return;
  }
  integrity_checked_.insert(dispute_id);
  if (buyer->PublicKey() != seller->PublicKey()) {
    return;
  }
  const auto dispute = store_.GetDispute(dispute_id);
  util::LogError("data integrity: buyer and seller of dispute " + dispute_id +
                 " map to the same shared chat key " + buyer->PublicKeyHex() + " (buyer " +
                 (dispute ? dispute->buyer_pubkey : "?") + ", seller " +
                 (dispute ? dispute->seller_pubkey : "?") + ")");
}

FetchOutcome DisputeChatSync::FetchOnce() {
  return FetchOnce(util::NowSeconds());
}

FetchOutcome DisputeChatSync::FetchOnce(std::int64_t now) {
  FetchOutcome outcome;
  bool expected = false;
  if (!fetch_in_flight_.compare_exchange_strong(expected, true)) {
    util::LogDebug("chat fetch already in flight; skipping");
    outcome.status = FetchOutcome::Status::kSkipped;
    return outcome;
  }
  FlightGuard guard(fetch_in_flight_);

  for (const auto& dispute : store_.Disputes()) {
    if (dispute.status != protocol::DisputeStatus::kInProgress) {
      continue;
    }
    for (const auto party : {ChatParty::kBuyer, ChatParty::kSeller}) {
      AdminChatUpdate update;
      std::string error;
      bool ok = false;
      try {
        ok = FetchChannel(dispute, party, now, &update, &error);
      } catch (const std::exception& ex) {
        error = ex.what();
      }
      if (!ok) {
        util::LogWarn("chat fetch for " + ChannelName(dispute.dispute_id, party) +
                      " failed: " + error);
        outcome.errors.push_back(ChannelName(dispute.dispute_id, party) + ": " + error);
        continue;
      }
      if (!update.messages.empty()) {
        if (!updates_.Push(update)) {
          util::LogDebug("chat update backlog full; dropped the oldest entry");
        }
        outcome.updates.push_back(std::move(update));
      }
    }
  }
  return outcome;
}

bool DisputeChatSync::FetchChannel(const AdminDispute& dispute, ChatParty party,
                                   std::int64_t now, AdminChatUpdate* update,
                                   std::string* error) {
  const auto keys = SharedKeys(dispute.dispute_id, party);
  const auto cursor = store_.GetChatCursor(dispute.dispute_id, party);
  const std::int64_t since = std::max(cursor.value_or(0), now - options_.window_seconds);
  // Wrap timestamps are pushed back by up to two days; the inner note's
  // timestamp decides what is new.
  const std::int64_t wrap_since =
      std::max<std::int64_t>(0, since - protocol::kMaxTimestampTweakSeconds);

  // Relays return the newest wraps first, so a full page is followed by a
  // query for the ones below it until a page comes back short.
  Batch batch;
  batch.complete = false;
  std::set<std::string> seen_wraps;
  std::set<std::string> seen_ids;
  std::optional<std::int64_t> until;
  for (std::size_t page = 0; page < options_.max_pages; ++page) {
    auto filter = protocol::Filter()
                      .Kind(protocol::kKindGiftWrap)
                      .Pubkey(keys.PublicKeyHex())
                      .Since(wrap_since)
                      .Limit(options_.fetch_limit);
    if (until) {
      filter.Until(*until);
    }
    std::vector<protocol::Event> events;
    if (!relay_.Fetch(filter, options_.fetch_timeout, &events, error)) {
      return false;
    }

    std::size_t new_wraps = 0;
    std::int64_t oldest = until.value_or(now);
    for (const auto& wrapped : events) {
      oldest = std::min(oldest, wrapped.created_at);
      if (!seen_wraps.insert(wrapped.id).second) {
        continue;
      }
      ++new_wraps;
      protocol::Event inner;
      std::string unwrap_error;
      if (!protocol::UnwrapChatMessage(wrapped, keys, &inner, &unwrap_error)) {
        util::LogWarn("failed to unwrap chat event " + wrapped.id + ": " + unwrap_error);
        continue;
      }
      if (inner.created_at <= since || !seen_ids.insert(inner.id).second) {
        continue;
      }
      DisputeChatMessage message;
      message.content = inner.content;
      message.timestamp = inner.created_at;
      if (inner.pubkey == admin_keys_.PublicKeyHex()) {
        message.sender = ChatSender::kAdmin;
        message.target_party = party;
      } else {
        message.sender = SenderForParty(party);
      }
      batch.max_timestamp = std::max(batch.max_timestamp, message.timestamp);
      batch.messages.push_back(std::move(message));
    }
    if (options_.fetch_limit == 0 || events.size() < options_.fetch_limit ||
        oldest <= wrap_since) {
      batch.complete = true;
      break;
    }
    // `until` is inclusive, so the boundary second is asked for again; once
    // it yields nothing new the query moves below it.
    until = new_wraps == 0 ? oldest - 1 : oldest;
  }
  if (!batch.complete) {
    util::LogWarn("chat fetch for " + ChannelName(dispute.dispute_id, party) + " stopped after " +
                  std::to_string(options_.max_pages) + " pages; cursor left unchanged");
  }

  std::stable_sort(batch.messages.begin(), batch.messages.end(),
                   [](const DisputeChatMessage& a, const DisputeChatMessage& b) {
                     return a.timestamp < b.timestamp;
                   });
  if (batch.messages.empty()) {
    return true;
  }
  std::vector<DisputeChatMessage> applied;
  if (!ApplyBatch(dispute.dispute_id, party, batch, &applied, error)) {
    return false;
  }
  update->dispute_id = dispute.dispute_id;
  update->party = party;
  update->messages = std::move(applied);
  return true;
}

bool DisputeChatSync::IsKnownLocked(const std::string& dispute_id,
                                    const DisputeChatMessage& message) const {
  const auto it = messages_.find(dispute_id);
  if (it == messages_.end()) {
    return false;
  }
  return std::any_of(it->second.begin(), it->second.end(), [&](const DisputeChatMessage& known) {
    return known.sender == message.sender && known.timestamp == message.timestamp &&
           known.content == message.content;
  });
}

bool DisputeChatSync::ApplyBatch(const std::string& dispute_id, ChatParty party,
                                 const Batch& batch, std::vector<DisputeChatMessage>* applied,
                                 std::string* error) {
  auto& fresh = *applied;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& message : batch.messages) {
      if (!IsKnownLocked(dispute_id, message)) {
        fresh.push_back(message);
      }
    }
  }
  // One write for the whole batch: either every new message reaches the
  // transcript or none does.
  std::vector<DisputeChatMessage> logged;
  logged.reserve(fresh.size());
  for (const auto& message : fresh) {
    logged.push_back(message);
    logged.back().content = TranscriptContent(message.content);
  }
  if (!transcripts_.Append(dispute_id, logged, error)) {
    fresh.clear();
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& messages = messages_[dispute_id];
    messages.insert(messages.end(), fresh.begin(), fresh.end());
  }
  if (!batch.complete) {
    return true;
  }
  if (store_.SetChatCursor(dispute_id, party, batch.max_timestamp, error) == 0) {
    if (error && error->empty()) {
      *error = "dispute " + dispute_id + " is no longer stored";
    }
    return false;
  }
  return true;
}

bool DisputeChatSync::SendMessage(const std::string& dispute_id, ChatParty party,
                                  const std::string& content, std::string* error) {
  try {
    const auto keys = SharedKeys(dispute_id, party);
    const auto wrap =
        protocol::WrapChatMessage(admin_keys_, keys.PublicKey(), content, options_.pow);
    if (!relay_.Publish(wrap, error)) {
      return false;
    }
    protocol::Event inner;
    std::string unwrap_error;
    DisputeChatMessage message{ChatSender::kAdmin, content, util::NowSeconds(), party};
    if (protocol::UnwrapChatMessage(wrap, keys, &inner, &unwrap_error)) {
      message.timestamp = inner.created_at;
    }
    DisputeChatMessage logged = message;
    logged.content = TranscriptContent(content);
    std::string log_error;
    if (!transcripts_.Append(dispute_id, logged, &log_error)) {
      util::LogWarn("sent message not saved to transcript: " + log_error);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    messages_[dispute_id].push_back(std::move(message));
    return true;
  } catch (const std::exception& ex) {
    if (error) {
      *error = ex.what();
    }
    return false;
  }
}

std::size_t DisputeChatSync::RestoreFromTranscripts() {
  std::size_t restored = 0;
  for (const auto& dispute : store_.Disputes()) {
    std::vector<DisputeChatMessage> messages;
    std::string error;
    if (!transcripts_.Load(dispute.dispute_id, &messages, &error)) {
      util::LogWarn("failed to restore chat for " + dispute.dispute_id + ": " + error);
      continue;
    }
    if (messages.empty()) {
      continue;
    }
    std::map<ChatParty, std::int64_t> last_seen;
    for (const auto& message : messages) {
      if (message.sender == ChatSender::kAdmin) {
        continue;
      }
      const auto party =
          message.sender == ChatSender::kBuyer ? ChatParty::kBuyer : ChatParty::kSeller;
      auto& slot = last_seen[party];
      slot = std::max(slot, message.timestamp);
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      messages_[dispute.dispute_id] = messages;
      for (const auto& [party, timestamp] : last_seen) {
        transcript_last_seen_[{dispute.dispute_id, party}] = timestamp;
      }
    }
    for (const auto& [party, timestamp] : last_seen) {
      const auto stored = store_.GetChatCursor(dispute.dispute_id, party);
      if (!stored) {
        if (store_.SetChatCursor(dispute.dispute_id, party, timestamp, &error) == 0) {
          util::LogWarn("failed to seed chat cursor for " +
                        ChannelName(dispute.dispute_id, party) + ": " + error);
        }
      } else if (*stored != timestamp) {
        util::LogInfo("chat cursor for " + ChannelName(dispute.dispute_id, party) +
                      " differs from transcript (" + std::to_string(*stored) + " vs " +
                      std::to_string(timestamp) + "); stored cursor governs");
      }
    }
    ++restored;
  }
  util::LogInfo("restored chat transcripts for " + std::to_string(restored) + " disputes");
  return restored;
}

std::vector<DisputeChatMessage> DisputeChatSync::Messages(const std::string& dispute_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = messages_.find(dispute_id);
  if (it == messages_.end()) {
    return {};
  }
  return it->second;
}

std::optional<std::int64_t> DisputeChatSync::TranscriptLastSeen(const std::string& dispute_id,
                                                                ChatParty party) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = transcript_last_seen_.find({dispute_id, party});
  if (it == transcript_last_seen_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace mostrix::client
