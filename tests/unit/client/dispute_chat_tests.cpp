#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <sys/resource.h>

#include "client/dispute_chat.hpp"
#include "client/memory_store.hpp"
#include "client/transcript.hpp"
#include "crypto/key_deriver.hpp"
#include "crypto/keys.hpp"
#include "net/memory_relay.hpp"
#include "protocol/gift_wrap.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

using namespace mostrix;
using client::ChatParty;
using client::ChatSender;

namespace {

const std::string kDisputeId = "3f2e1d0c-9b8a-4765-8432-10fedcba9876";

std::filesystem::path MakeTempDir() {
  const auto suffix = static_cast<std::uint64_t>(std::random_device{}());
  return std::filesystem::temp_directory_path() /
         ("mostrix_dispute_chat_tests_" + std::to_string(suffix));
}

struct Fixture {
  crypto::Keys admin = crypto::Keys::Generate();
  crypto::Keys buyer = crypto::Keys::Generate();
  crypto::Keys seller = crypto::Keys::Generate();
  net::MemoryRelay relay;
  client::MemoryStore store;
  std::filesystem::path dir = MakeTempDir();

  Fixture() {
    client::AdminDispute dispute;
    dispute.id = "order-1";
    dispute.dispute_id = kDisputeId;
    dispute.buyer_pubkey = buyer.PublicKeyHex();
    dispute.seller_pubkey = seller.PublicKeyHex();
    if (!store.PutDispute(dispute)) {
      throw std::runtime_error("failed to seed dispute");
    }
  }

  ~Fixture() {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
  }

  // A party writes into its channel the way a trading client does.
  void PartySays(const crypto::Keys& party, const std::string& text, std::int64_t ts) {
    const auto shared = crypto::KeyDeriver::DeriveSharedKey(party.Secret(), admin.PublicKey());
    if (!relay.Publish(protocol::WrapChatMessage(party, shared.PublicKey(), text, 0, ts))) {
      throw std::runtime_error("failed to publish chat message");
    }
  }
};

bool TestFetchAndCursor() {
  Fixture fx;
  client::DisputeChatSync sync(fx.admin, fx.relay, fx.store, client::TranscriptLog(fx.dir));
  sync.EnsureSharedKeys(kDisputeId);
  const auto buyer_key = fx.store.GetSharedKey(kDisputeId, ChatParty::kBuyer);
  const auto expected =
      crypto::KeyDeriver::DeriveSharedKey(fx.admin.Secret(), fx.buyer.PublicKey());
  if (!buyer_key || *buyer_key != expected.SecretHex()) {
    std::cerr << "buyer shared key not stored\n";
    return false;
  }

  const std::int64_t now = util::NowSeconds();
  fx.PartySays(fx.buyer, "I paid", now - 100);
  fx.PartySays(fx.seller, "nothing arrived", now - 60);
  fx.PartySays(fx.seller, "checked again", now - 50);

  const auto outcome = sync.FetchOnce(now);
  if (outcome.status != client::FetchOutcome::Status::kCompleted || outcome.applied() != 3 ||
      !outcome.errors.empty()) {
    std::cerr << "expected 3 applied messages, got " << outcome.applied() << "\n";
    return false;
  }
  if (fx.store.GetChatCursor(kDisputeId, ChatParty::kBuyer) != now - 100 ||
      fx.store.GetChatCursor(kDisputeId, ChatParty::kSeller) != now - 50) {
    std::cerr << "cursor is not the newest applied timestamp\n";
    return false;
  }
  const auto messages = sync.Messages(kDisputeId);
  if (messages.size() != 3 || sync.updates().Size() != 2) {
    std::cerr << "messages not recorded in memory or update channel\n";
    return false;
  }

  if (sync.FetchOnce(now).applied() != 0) {
    std::cerr << "second fetch re-applied old messages\n";
    return false;
  }

  std::vector<client::DisputeChatMessage> logged;
  std::string error;
  if (!client::TranscriptLog(fx.dir).Load(kDisputeId, &logged, &error) || logged.size() != 3) {
    std::cerr << "transcript does not hold the fetched messages\n";
    return false;
  }

  if (!sync.SendMessage(kDisputeId, ChatParty::kBuyer, "please upload the receipt", &error)) {
    std::cerr << "send failed: " << error << "\n";
    return false;
  }
  const auto after_send = sync.Messages(kDisputeId);
  if (after_send.size() != 4 || after_send.back().sender != ChatSender::kAdmin ||
      after_send.back().target_party != ChatParty::kBuyer) {
    std::cerr << "sent message not recorded\n";
    return false;
  }
  if (fx.store.GetChatCursor(kDisputeId, ChatParty::kBuyer) != now - 100) {
    std::cerr << "sending moved the fetch cursor\n";
    return false;
  }

  // The buyer reads the admin message with the same shared key.
  const auto buyer_shared =
      crypto::KeyDeriver::DeriveSharedKey(fx.buyer.Secret(), fx.admin.PublicKey());
  bool delivered = false;
  for (const auto& event : fx.relay.Events()) {
    protocol::Event inner;
    if (protocol::UnwrapChatMessage(event, buyer_shared, &inner) &&
        inner.pubkey == fx.admin.PublicKeyHex()) {
      delivered = inner.content == "please upload the receipt";
    }
  }
  if (!delivered) {
    std::cerr << "buyer cannot read the admin message\n";
    return false;
  }
  return true;
}

bool TestSingleFlight() {
  Fixture fx;
  client::DisputeChatSync sync(fx.admin, fx.relay, fx.store, client::TranscriptLog(fx.dir));

  std::atomic<bool> entered{false};
  std::atomic<bool> release{false};
  std::atomic<bool> blocked_once{false};
  fx.relay.SetFetchHook([&](const protocol::Filter&) {
    if (blocked_once.exchange(true)) {
      return;
    }
    entered.store(true);
    while (!release.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  });

  client::FetchOutcome first;
  std::thread worker([&] { first = sync.FetchOnce(); });
  while (!entered.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  const auto overlapping = sync.FetchOnce();
  release.store(true);
  worker.join();

  if (overlapping.status != client::FetchOutcome::Status::kSkipped ||
      first.status != client::FetchOutcome::Status::kCompleted) {
    std::cerr << "overlapping fetch was not skipped\n";
    return false;
  }
  if (sync.FetchInFlight()) {
    std::cerr << "in-flight flag left set after a completed cycle\n";
    return false;
  }

  fx.relay.SetFetchHook(nullptr);
  fx.relay.SetFetchFailure(std::string("relay unreachable"));
  const auto failed = sync.FetchOnce();
  if (failed.errors.size() != 2 || sync.FetchInFlight()) {
    std::cerr << "failed cycle did not report per-channel errors or reset the flag\n";
    return false;
  }
  if (fx.store.GetChatCursor(kDisputeId, ChatParty::kBuyer)) {
    std::cerr << "failed fetch moved the cursor\n";
    return false;
  }
  fx.relay.SetFetchFailure(std::nullopt);
  fx.PartySays(fx.buyer, "still here", util::NowSeconds() - 5);
  if (sync.FetchOnce().applied() != 1) {
    std::cerr << "fetch did not recover after an error\n";
    return false;
  }
  return true;
}

bool TestRestore() {
  Fixture fx;
  const std::int64_t now = util::NowSeconds();
  {
    client::DisputeChatSync sync(fx.admin, fx.relay, fx.store, client::TranscriptLog(fx.dir));
    fx.PartySays(fx.buyer, "first line\nsecond line", now - 300);
    fx.PartySays(fx.seller, "hello", now - 200);
    if (sync.FetchOnce(now).applied() != 2) {
      std::cerr << "setup fetch failed\n";
      return false;
    }
  }

  // A fresh store without cursors, as after losing the database.
  client::MemoryStore fresh;
  if (!fresh.PutDispute(*fx.store.GetDispute(kDisputeId))) {
    return false;
  }
  client::AdminDispute reset = *fresh.GetDispute(kDisputeId);
  reset.buyer_chat_last_seen.reset();
  reset.seller_chat_last_seen = now - 1000;
  if (!fresh.PutDispute(reset)) {
    return false;
  }

  client::DisputeChatSync restored(fx.admin, fx.relay, fresh, client::TranscriptLog(fx.dir));
  if (restored.RestoreFromTranscripts() != 1) {
    std::cerr << "transcript not restored\n";
    return false;
  }
  const auto messages = restored.Messages(kDisputeId);
  if (messages.size() != 2 || messages[0].content != "first line\nsecond line" ||
      messages[0].sender != ChatSender::kBuyer || messages[0].timestamp != now - 300) {
    std::cerr << "restored messages differ from what was fetched\n";
    return false;
  }
  if (fresh.GetChatCursor(kDisputeId, ChatParty::kBuyer) != now - 300) {
    std::cerr << "missing cursor not seeded from the transcript\n";
    return false;
  }
  if (fresh.GetChatCursor(kDisputeId, ChatParty::kSeller) != now - 1000 ||
      restored.TranscriptLastSeen(kDisputeId, ChatParty::kSeller) != now - 200) {
    std::cerr << "stored cursor should keep governing fetches\n";
    return false;
  }
  return true;
}

bool TestBacklogAcrossPages() {
  Fixture fx;
  client::ChatSyncOptions options;
  options.fetch_limit = 5;
  client::DisputeChatSync sync(fx.admin, fx.relay, fx.store, client::TranscriptLog(fx.dir),
                               options);

  // Wraps are backdated by up to two days, so every cycle sees the whole
  // history again and only paging reaches the newest notes.
  const std::int64_t start = util::NowSeconds() - 3600;
  std::size_t applied = 0;
  std::int64_t last = 0;
  for (int cycle = 0; cycle < 20; ++cycle) {
    for (int i = 0; i < 3; ++i) {
      last = start + cycle * 60 + i;
      fx.PartySays(fx.buyer, "line " + std::to_string(cycle * 3 + i), last);
    }
    const auto outcome = sync.FetchOnce(last + 1);
    if (!outcome.errors.empty()) {
      std::cerr << "paged fetch failed: " << outcome.errors.front() << "\n";
      return false;
    }
    applied += outcome.applied();
  }
  if (applied != 60 || sync.Messages(kDisputeId).size() != 60) {
    std::cerr << "expected 60 applied messages, got " << applied << "\n";
    return false;
  }
  if (fx.store.GetChatCursor(kDisputeId, ChatParty::kBuyer) != last) {
    std::cerr << "cursor is not the newest message after paging\n";
    return false;
  }
  std::vector<client::DisputeChatMessage> logged;
  std::string error;
  if (!client::TranscriptLog(fx.dir).Load(kDisputeId, &logged, &error) || logged.size() != 60) {
    std::cerr << "transcript does not hold every paged message\n";
    return false;
  }
  return true;
}

bool TestTruncatedFetchKeepsCursor() {
  Fixture fx;
  client::ChatSyncOptions options;
  options.fetch_limit = 5;
  options.max_pages = 1;
  client::DisputeChatSync sync(fx.admin, fx.relay, fx.store, client::TranscriptLog(fx.dir),
                               options);
  const std::int64_t now = util::NowSeconds();
  for (int i = 0; i < 8; ++i) {
    fx.PartySays(fx.buyer, "message " + std::to_string(i), now - 100 + i);
  }

  if (sync.FetchOnce(now).applied() != 5) {
    std::cerr << "first page not applied\n";
    return false;
  }
  if (fx.store.GetChatCursor(kDisputeId, ChatParty::kBuyer)) {
    std::cerr << "cursor advanced past an unread page\n";
    return false;
  }
  if (sync.FetchOnce(now).applied() != 0 || sync.Messages(kDisputeId).size() != 5) {
    std::cerr << "known messages applied again\n";
    return false;
  }
  std::vector<client::DisputeChatMessage> logged;
  std::string error;
  if (!client::TranscriptLog(fx.dir).Load(kDisputeId, &logged, &error) || logged.size() != 5) {
    std::cerr << "transcript holds duplicates\n";
    return false;
  }
  return true;
}

// Restores the file size limit however the test ends.
class FileSizeLimit {
 public:
  explicit FileSizeLimit(rlim_t soft) {
    if (getrlimit(RLIMIT_FSIZE, &saved_) != 0) {
      throw std::runtime_error("getrlimit failed");
    }
    rlimit limited = saved_;
    limited.rlim_cur = soft;
    if (setrlimit(RLIMIT_FSIZE, &limited) != 0) {
      throw std::runtime_error("setrlimit failed");
    }
  }
  ~FileSizeLimit() { setrlimit(RLIMIT_FSIZE, &saved_); }

  FileSizeLimit(const FileSizeLimit&) = delete;
  FileSizeLimit& operator=(const FileSizeLimit&) = delete;

 private:
  rlimit saved_{};
};

bool TestFailedTranscriptWriteAppliesNothing() {
  Fixture fx;
  client::DisputeChatSync sync(fx.admin, fx.relay, fx.store, client::TranscriptLog(fx.dir));
  sync.EnsureSharedKeys(kDisputeId);
  const std::int64_t now = util::NowSeconds();
  fx.PartySays(fx.buyer, "short", now - 20);
  fx.PartySays(fx.buyer, std::string(4000, 'x'), now - 10);

  std::signal(SIGXFSZ, SIG_IGN);
  {
    FileSizeLimit limit(1024);
    const auto outcome = sync.FetchOnce(now);
    if (outcome.errors.size() != 1 || outcome.applied() != 0) {
      std::cerr << "failed transcript write was not reported\n";
      return false;
    }
  }
  const auto path = client::TranscriptLog(fx.dir).PathFor(kDisputeId);
  std::error_code ec;
  if (std::filesystem::exists(path, ec) && std::filesystem::file_size(path, ec) != 0) {
    std::cerr << "partial batch left in the transcript\n";
    return false;
  }
  if (!sync.Messages(kDisputeId).empty() ||
      fx.store.GetChatCursor(kDisputeId, ChatParty::kBuyer)) {
    std::cerr << "failed batch changed memory or the cursor\n";
    return false;
  }

  if (sync.FetchOnce(now).applied() != 2) {
    std::cerr << "batch not applied after the write limit was lifted\n";
    return false;
  }
  std::vector<client::DisputeChatMessage> logged;
  std::string error;
  if (!client::TranscriptLog(fx.dir).Load(kDisputeId, &logged, &error) || logged.size() != 2) {
    std::cerr << "retry duplicated transcript entries\n";
    return false;
  }
  return true;
}

bool LogContains(const std::filesystem::path& path, const std::string& needle) {
  std::ifstream in(path);
  const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return text.find(needle) != std::string::npos;
}

bool TestSharedKeyCollisionLogged() {
  Fixture fx;
  const std::string duplicate_id = "0a1b2c3d-4e5f-4a6b-8c7d-8e9f0a1b2c3d";
  client::AdminDispute dispute;
  dispute.id = "order-2";
  dispute.dispute_id = duplicate_id;
  dispute.buyer_pubkey = fx.buyer.PublicKeyHex();
  dispute.seller_pubkey = fx.buyer.PublicKeyHex();
  if (!fx.store.PutDispute(dispute)) {
    return false;
  }

  const auto log_path = fx.dir / "integrity.log";
  util::GetLogger().Enable(log_path);
  bool ok = true;
  {
    // Keys produced lazily by a fetch cycle.
    client::DisputeChatSync sync(fx.admin, fx.relay, fx.store, client::TranscriptLog(fx.dir));
    if (!sync.FetchOnce().errors.empty()) {
      std::cerr << "fetch failed for the duplicated dispute\n";
      ok = false;
    }
  }
  if (ok && !LogContains(log_path, "data integrity: buyer and seller of dispute " + duplicate_id)) {
    std::cerr << "collision not logged on the fetch path\n";
    ok = false;
  }
  if (ok && LogContains(log_path, "dispute " + kDisputeId + " map to")) {
    std::cerr << "distinct keys reported as a collision\n";
    ok = false;
  }

  // Keys loaded from the store by a fresh instance.
  std::error_code ec;
  std::filesystem::remove(log_path, ec);
  util::GetLogger().Enable(log_path);
  if (ok) {
    client::DisputeChatSync reloaded(fx.admin, fx.relay, fx.store, client::TranscriptLog(fx.dir));
    reloaded.SharedKeys(duplicate_id, ChatParty::kSeller);
    if (!LogContains(log_path, "data integrity: buyer and seller of dispute " + duplicate_id)) {
      std::cerr << "collision not logged for stored keys\n";
      ok = false;
    }
  }
  util::GetLogger().Disable();
  return ok;
}

}  // namespace

int main() {
  try {
    if (!TestFetchAndCursor() || !TestSingleFlight() || !TestRestore() ||
        !TestBacklogAcrossPages() || !TestTruncatedFetchKeepsCursor() ||
        !TestFailedTranscriptWriteAppliesNothing() || !TestSharedKeyCollisionLogged()) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "dispute_chat_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  std::cout << "dispute_chat_tests: OK\n";
  return EXIT_SUCCESS;
}
