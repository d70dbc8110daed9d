#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "client/chat_types.hpp"
#include "client/scheduler.hpp"
#include "client/store.hpp"
#include "client/transcript.hpp"
#include "crypto/keys.hpp"
#include "net/relay.hpp"

namespace mostrix::client {

struct ChatSyncOptions {
  // Oldest message a fetch asks for, relative to now.
  std::int64_t window_seconds{7 * 24 * 60 * 60};
  // Events per relay query. A full page is followed by an older one.
  std::size_t fetch_limit{20};
  // Pages per channel and cycle. A channel that still has more leaves its
  // cursor where it was.
  std::size_t max_pages{50};
  std::chrono::milliseconds fetch_timeout{net::kFetchEventsTimeout};
  std::uint8_t pow{0};
};

// New messages applied for one (dispute, party) channel in a fetch cycle.
struct AdminChatUpdate {
  std::string dispute_id;
  ChatParty party{ChatParty::kBuyer};
  std::vector<DisputeChatMessage> messages;
};

struct FetchOutcome {
  enum class Status {
    kCompleted,
    // Another fetch cycle was still running; nothing was done.
    kSkipped,
  };

  Status status{Status::kCompleted};
  std::vector<AdminChatUpdate> updates;
  // One entry per channel that failed; other channels are unaffected.
  std::vector<std::string> errors;

  std::size_t applied() const;
};

// Undrained chat updates kept before the oldest is dropped.
constexpr std::size_t kChatUpdateBacklog = 256;

// Arbitrator side of the per-dispute chat. Each (dispute, party) channel is
// addressed to a shared key derived from the admin secret and the party's
// trade pubkey. Fetch cycles are single-flight; each channel's cursor only
// advances after its whole batch has been written to the transcript and to
// memory, and only when every page of the channel was read.
class DisputeChatSync {
 public:
  DisputeChatSync(crypto::Keys admin_keys, net::RelayClient& relay, Store& store,
                  TranscriptLog transcripts, ChatSyncOptions options = {});

  // Stored key when present, otherwise derived and stored. Throws
  // std::runtime_error for an unknown dispute or an unusable party pubkey.
  // The first time a dispute's key is produced or loaded, both parties' keys
  // are compared and a collision is logged as an integrity error.
  crypto::Keys SharedKeys(const std::string& dispute_id, ChatParty party);

  // Derives and stores both keys; run when a dispute is taken.
  void EnsureSharedKeys(const std::string& dispute_id);

  // One fetch cycle over every in-progress dispute.
  FetchOutcome FetchOnce(std::int64_t now);
  FetchOutcome FetchOnce();
  bool FetchInFlight() const { return fetch_in_flight_.load(); }

  // Publishes an admin message to `party` and records it locally.
  bool SendMessage(const std::string& dispute_id, ChatParty party, const std::string& content,
                   std::string* error = nullptr);

  // Rebuilds in-memory chat state from the transcript files of every stored
  // dispute. A missing stored cursor is seeded from the file; a stored one
  // keeps governing fetches. Returns the number of disputes restored.
  std::size_t RestoreFromTranscripts();

  std::vector<DisputeChatMessage> Messages(const std::string& dispute_id) const;
  // Latest counterparty timestamp seen in the transcript file.
  std::optional<std::int64_t> TranscriptLastSeen(const std::string& dispute_id,
                                                 ChatParty party) const;

  ResultChannel<AdminChatUpdate>& updates() { return updates_; }
  const crypto::Keys& admin_keys() const { return admin_keys_; }

 private:
  using ChannelKey = std::pair<std::string, ChatParty>;

  struct Batch {
    std::vector<DisputeChatMessage> messages;
    std::int64_t max_timestamp{0};
    // Every page down to the window start was read.
    bool complete{true};
  };

  bool FetchChannel(const AdminDispute& dispute, ChatParty party, std::int64_t now,
                    AdminChatUpdate* update, std::string* error);
  // `applied` receives the messages that were not already known.
  bool ApplyBatch(const std::string& dispute_id, ChatParty party, const Batch& batch,
                  std::vector<DisputeChatMessage>* applied, std::string* error);
  bool IsKnownLocked(const std::string& dispute_id, const DisputeChatMessage& message) const;
  crypto::Keys SharedKeysLocked(const std::string& dispute_id, ChatParty party);
  void CheckDistinctKeysLocked(const std::string& dispute_id);

  crypto::Keys admin_keys_;
  net::RelayClient& relay_;
  Store& store_;
  TranscriptLog transcripts_;
  ChatSyncOptions options_;
  std::atomic<bool> fetch_in_flight_{false};
  ResultChannel<AdminChatUpdate> updates_;

  mutable std::mutex mutex_;
  std::map<std::string, std::vector<DisputeChatMessage>> messages_;
  std::map<ChannelKey, std::int64_t> transcript_last_seen_;
  // Serializes key derivation and storage.
  std::mutex keys_mutex_;
  std::set<std::string> integrity_checked_;
};

}  // namespace mostrix::client
