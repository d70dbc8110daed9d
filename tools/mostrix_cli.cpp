#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "client/attachment.hpp"
#include "client/chat_types.hpp"
#include "client/dispute_chat.hpp"
#include "client/file_store.hpp"
#include "client/order_listener.hpp"
#include "client/recovery.hpp"
#include "client/scheduler.hpp"
#include "client/transcript.hpp"
#include "config/settings.hpp"
#include "crypto/key_deriver.hpp"
#include "crypto/keys.hpp"
#include "crypto/mnemonic.hpp"
#include "net/https_transfer.hpp"
#include "net/memory_relay.hpp"
#include "nlohmann/json.hpp"
#include "protocol/event.hpp"
#include "protocol/gift_wrap.hpp"
#include "protocol/message.hpp"
#include "util/atomic_file.hpp"
#include "util/hex.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace {

using namespace mostrix;

constexpr const char* kTranscriptDirName = "transcripts";
constexpr std::chrono::milliseconds kWatchPopTimeout{500};

std::atomic<bool> g_interrupted{false};

void HandleSignal(int) {
  g_interrupted.store(true);
}

// Only the watch loops trap the signals; other commands keep the default.
void InstallSignalHandlers() {
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);
}

void PrintUsage() {
  std::cout << "Usage: mostrix-cli [options] <command> [args]\n"
            << "Commands:\n"
            << "  keys [index]                     Identity key and trade key <index> (default: last used)\n"
            << "  new-mnemonic [words]             Print a fresh BIP-39 mnemonic (12 words by default)\n"
            << "  derive <index>                   Trade key at m/44'/1237'/38383'/<index>/0\n"
            << "  shared-key <pubkey>              Chat key shared between the admin key and <pubkey>\n"
            << "  wrap <recipient> <message-json> [index]\n"
            << "                                   Gift-wrap a Mostro message from trade key <index>\n"
            << "  unwrap <event-json> [index]      Decode a gift wrap addressed to trade key <index>\n"
            << "                                   (admin key in admin mode)\n"
            << "  chat-wrap <pubkey> <content>     Wrap an admin chat message for the party <pubkey>\n"
            << "  transcript <dispute_id>          Print a stored dispute chat transcript\n"
            << "  resolve-blob <url>               Map a blossom:// reference to its https URL\n"
            << "  fetch-attachment <json> [dispute_id]\n"
            << "                                   Download and decrypt a chat attachment\n"
            << "  decrypt-attachment <file> <hexkey> [out]\n"
            << "                                   Decrypt a blob saved without its key\n"
            << "  recover <events.json>            Rebuild active trades from a dump of relay events\n"
            << "  listen <events.json> [--watch]   Latest daemon message per active trade\n"
            << "  chat-sync <events.json> [--watch]\n"
            << "                                   Restore and fetch dispute chats (admin mode)\n"
            << "  settings                         Print the effective settings\n"
            << "Options:\n"
            << "  --conf <path>                    Config file (default: <data-dir>/mostrix.conf)\n"
            << "  --no-conf                        Do not read a config file\n"
            << "  --data-dir <path>                Data directory (default: ~/.mostrix)\n"
            << "  --mostro-pubkey <hex|npub>       Exchange daemon public key\n"
            << "  --relays <url,...>               Relay list (ws:// or wss://)\n"
            << "  --user-mode <user|admin>         Operating mode (default: user)\n"
            << "  --admin-privkey <hex|nsec>       Arbitrator key for admin mode\n"
            << "  --full-privacy                   Do not link trades to the identity key\n"
            << "  --pow <n>                        Proof-of-work difficulty (0-32)\n"
            << "  --log-level <lvl>                debug, info, warn, error (default: info)\n"
            << "  --log-stderr                     Mirror log lines to stderr\n"
            << "  --watch                          Re-read the events file every poll interval\n"
            << "                                   until interrupted\n";
}

void RequireArgs(const std::vector<std::string>& args, std::size_t count,
                 std::string_view usage) {
  if (args.size() < count + 1) {
    throw std::runtime_error("usage: " + std::string(usage));
  }
}

std::int64_t ParseIndex(const std::string& text) {
  std::size_t consumed = 0;
  long long value = -1;
  try {
    value = std::stoll(text, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error("invalid index: " + text);
  }
  if (consumed != text.size() || value < 0 || value > 0x7fffffff) {
    throw std::runtime_error("invalid index: " + text);
  }
  return value;
}

nlohmann::json KeyJson(const crypto::Keys& keys, bool with_secret) {
  nlohmann::json json;
  json["pubkey"] = keys.PublicKeyHex();
  json["npub"] = keys.Npub();
  if (with_secret) {
    json["nsec"] = keys.Nsec();
  }
  return json;
}

// Opens the client store, creating the user record with a fresh mnemonic on
// first use.
client::UserRecord LoadOrCreateUser(client::FileStore* store) {
  std::string error;
  if (!store->Load(&error)) {
    throw std::runtime_error(error);
  }
  if (auto user = store->GetUser()) {
    return *user;
  }
  client::UserRecord user;
  user.mnemonic = crypto::GenerateMnemonic();
  const crypto::KeyDeriver deriver(user.mnemonic);
  user.identity_pubkey = deriver.DeriveIdentityKey().PublicKeyHex();
  user.created_at = util::NowSeconds();
  if (!store->PutUser(user, &error)) {
    throw std::runtime_error("failed to save user: " + error);
  }
  util::LogInfo("created new identity " + user.identity_pubkey);
  std::cerr << "mostrix-cli: created a new mnemonic in " << store->path().string() << "\n";
  return user;
}

crypto::Keys RequireAdminKeys(const config::Settings& settings) {
  if (settings.admin_privkey.empty()) {
    throw std::runtime_error("admin_privkey is not configured");
  }
  auto keys = crypto::Keys::Parse(settings.admin_privkey);
  if (!keys) {
    throw std::runtime_error("invalid admin_privkey");
  }
  return *keys;
}

crypto::XOnlyPublicKey RequirePublicKey(const std::string& text) {
  const auto key = crypto::ParsePublicKey(text);
  if (!key) {
    throw std::runtime_error("invalid pubkey: " + text);
  }
  return *key;
}

std::filesystem::path StorePath(const config::Settings& settings) {
  return settings.DataDir() / client::FileStore::kDefaultFileName;
}

void RunKeys(const config::Settings& settings, const std::vector<std::string>& args) {
  client::FileStore store(StorePath(settings));
  const auto user = LoadOrCreateUser(&store);
  const crypto::KeyDeriver deriver(user.mnemonic);
  const auto last_index = store.GetTradeIndex().value_or(0);
  const auto index = args.size() > 1 ? ParseIndex(args[1]) : std::max<std::int64_t>(last_index, 1);

  nlohmann::json out;
  out["identity"] = KeyJson(deriver.DeriveIdentityKey(), false);
  out["last_trade_index"] = last_index;
  if (index > 0) {
    auto trade = KeyJson(deriver.DeriveTradeKey(index), false);
    trade["index"] = index;
    out["trade"] = trade;
  }
  std::cout << out.dump(2) << "\n";
}

void RunDerive(const config::Settings& settings, const std::vector<std::string>& args) {
  RequireArgs(args, 1, "derive <index>");
  const auto index = ParseIndex(args[1]);
  client::FileStore store(StorePath(settings));
  const auto user = LoadOrCreateUser(&store);
  const crypto::KeyDeriver deriver(user.mnemonic);
  auto out = KeyJson(index == 0 ? deriver.DeriveIdentityKey() : deriver.DeriveTradeKey(index),
                     true);
  out["index"] = index;
  std::cout << out.dump(2) << "\n";
}

void RunSharedKey(const config::Settings& settings, const std::vector<std::string>& args) {
  RequireArgs(args, 1, "shared-key <pubkey>");
  const auto admin = RequireAdminKeys(settings);
  const auto remote = RequirePublicKey(args[1]);
  const auto shared = crypto::KeyDeriver::DeriveSharedKey(admin.Secret(), remote);
  nlohmann::json out;
  out["shared_pubkey"] = shared.PublicKeyHex();
  out["shared_npub"] = shared.Npub();
  out["shared_secret"] = shared.SecretHex();
  std::cout << out.dump(2) << "\n";
}

void RunWrap(const config::Settings& settings, const std::vector<std::string>& args) {
  RequireArgs(args, 2, "wrap <recipient> <message-json> [index]");
  const auto recipient = RequirePublicKey(args[1]);
  protocol::Message message;
  std::string error;
  if (!protocol::ParseMessageJson(args[2], &message, &error)) {
    throw std::runtime_error("invalid message: " + error);
  }
  client::FileStore store(StorePath(settings));
  const auto user = LoadOrCreateUser(&store);
  const crypto::KeyDeriver deriver(user.mnemonic);
  const auto index = args.size() > 3 ? ParseIndex(args[3]) : 1;
  const auto identity = deriver.DeriveIdentityKey();
  const auto trade = index == 0 ? identity : deriver.DeriveTradeKey(index);

  protocol::EnvelopeOptions options;
  options.mode = settings.full_privacy ? protocol::PrivacyMode::kFullPrivacy
                                       : protocol::PrivacyMode::kReputation;
  options.pow = settings.pow;
  const auto event = protocol::EncodeEnvelope(message, trade, &identity, recipient, options);
  std::cout << protocol::EventToJson(event).dump(2) << "\n";
}

void RunUnwrap(const config::Settings& settings, const std::vector<std::string>& args) {
  RequireArgs(args, 1, "unwrap <event-json> [index]");
  protocol::Event event;
  std::string error;
  if (!protocol::ParseEventJson(args[1], &event, &error)) {
    throw std::runtime_error("invalid event: " + error);
  }
  std::optional<crypto::Keys> receiver;
  if (settings.user_mode == config::UserMode::kAdmin) {
    receiver = RequireAdminKeys(settings);
  } else {
    client::FileStore store(StorePath(settings));
    const auto user = LoadOrCreateUser(&store);
    const crypto::KeyDeriver deriver(user.mnemonic);
    const auto index = args.size() > 2 ? ParseIndex(args[2]) : 1;
    receiver = index == 0 ? deriver.DeriveIdentityKey() : deriver.DeriveTradeKey(index);
  }

  protocol::DecodedEnvelope decoded;
  if (!protocol::DecodeEnvelope(event, *receiver, &decoded, &error)) {
    throw std::runtime_error("cannot decode envelope: " + error);
  }
  nlohmann::json out;
  out["sender"] = crypto::PublicKeyHex(decoded.sender);
  out["seal_signer"] = crypto::PublicKeyHex(decoded.seal_signer);
  out["created_at"] = decoded.created_at;
  out["signed"] = decoded.signature_present;
  out["message"] = protocol::MessageToJson(decoded.message);
  std::cout << out.dump(2) << "\n";
}

void RunChatWrap(const config::Settings& settings, const std::vector<std::string>& args) {
  RequireArgs(args, 2, "chat-wrap <pubkey> <content>");
  const auto admin = RequireAdminKeys(settings);
  const auto party = RequirePublicKey(args[1]);
  const auto shared = crypto::KeyDeriver::DeriveSharedKey(admin.Secret(), party);
  const auto event = protocol::WrapChatMessage(admin, shared.PublicKey(), args[2], settings.pow);
  std::cout << protocol::EventToJson(event).dump(2) << "\n";
}

void RunTranscript(const config::Settings& settings, const std::vector<std::string>& args) {
  RequireArgs(args, 1, "transcript <dispute_id>");
  const client::TranscriptLog log(settings.DataDir() / kTranscriptDirName);
  std::vector<client::DisputeChatMessage> messages;
  std::string error;
  if (!log.Load(args[1], &messages, &error)) {
    throw std::runtime_error(error);
  }
  if (messages.empty()) {
    throw std::runtime_error("no transcript for dispute " + args[1]);
  }
  for (const auto& message : messages) {
    std::cout << client::FormatTranscriptEntry(message);
  }
}

void RunResolveBlob(const std::vector<std::string>& args) {
  RequireArgs(args, 1, "resolve-blob <url>");
  std::string url;
  std::string error;
  if (!client::ResolveBlobUrl(args[1], &url, &error)) {
    throw std::runtime_error(error);
  }
  std::cout << url << "\n";
}

void RunFetchAttachment(const config::Settings& settings, const std::vector<std::string>& args) {
  RequireArgs(args, 1, "fetch-attachment <json> [dispute_id]");
  const auto attachment = client::ParseChatAttachment(args[1]);
  if (!attachment) {
    throw std::runtime_error("not an attachment message");
  }
  const std::string dispute_id = args.size() > 2 ? args[2] : "attachment";
  net::HttpsTransfer transfer;
  client::AttachmentCodec codec(transfer, settings.AttachmentDir());
  std::filesystem::path saved;
  std::string error;
  if (!codec.Save(dispute_id, *attachment, std::nullopt, &saved, &error)) {
    throw std::runtime_error(error);
  }
  std::cout << saved.string() << "\n";
}

void RunDecryptAttachment(const std::vector<std::string>& args) {
  RequireArgs(args, 2, "decrypt-attachment <file> <hexkey> [out]");
  const std::filesystem::path input(args[1]);
  std::vector<std::uint8_t> blob;
  std::string error;
  if (!util::ReadFileBytes(input, &blob, &error)) {
    throw std::runtime_error(error);
  }
  std::vector<std::uint8_t> key;
  if (!util::HexDecode(args[2], &key)) {
    throw std::runtime_error("decryption key must be hex");
  }
  std::vector<std::uint8_t> plaintext;
  if (!client::DecryptBlob(key, blob, &plaintext, &error)) {
    throw std::runtime_error(error);
  }
  std::filesystem::path output;
  if (args.size() > 3) {
    output = args[3];
  } else if (input.extension() == ".enc") {
    output = input.parent_path() / input.stem();
  } else {
    output = input.string() + ".dec";
  }
  if (!util::AtomicWriteFileBytes(output, plaintext, &error)) {
    throw std::runtime_error(error);
  }
  std::cout << output.string() << "\n";
}

nlohmann::json NotificationJson(const client::MessageNotification& notification) {
  nlohmann::json out;
  out["order_id"] = notification.order_id;
  out["action"] = protocol::ActionName(notification.action);
  out["label"] = notification.label;
  out["timestamp"] = notification.timestamp;
  if (notification.sat_amount) {
    out["sat_amount"] = *notification.sat_amount;
  }
  if (notification.invoice) {
    out["invoice"] = *notification.invoice;
  }
  return out;
}

void PrintChatUpdate(const client::AdminChatUpdate& update) {
  std::cout << "== " << update.dispute_id << " (" << client::ChatPartyName(update.party)
            << ") ==\n";
  for (const auto& message : update.messages) {
    std::cout << client::FormatTranscriptEntry(message);
  }
}

std::chrono::milliseconds PollInterval(const config::Settings& settings) {
  return std::chrono::seconds(std::max<std::uint32_t>(settings.poll_interval_seconds, 1));
}

void RunRecover(const config::Settings& settings, const std::vector<std::string>& args) {
  RequireArgs(args, 1, "recover <events.json>");
  client::FileStore store(StorePath(settings));
  const auto user = LoadOrCreateUser(&store);
  const crypto::KeyDeriver deriver(user.mnemonic);
  net::MemoryRelay relay;
  net::LoadEventDump(args[1], &relay);

  client::RecoveryEngine engine(deriver, relay, store);
  nlohmann::json trades = nlohmann::json::array();
  for (const auto& trade : engine.Recover()) {
    nlohmann::json item;
    item["order_id"] = trade.order_id;
    item["trade_index"] = trade.trade_index;
    item["result"] = client::RecoveredTradeStatusName(trade.status);
    if (trade.state.status) {
      item["status"] = protocol::StatusName(*trade.state.status);
    }
    if (trade.state.last_action) {
      item["last_action"] = protocol::ActionName(*trade.state.last_action);
    }
    if (trade.state.dispute_id) {
      item["dispute_id"] = *trade.state.dispute_id;
    }
    if (!trade.error.empty()) {
      item["error"] = trade.error;
    }
    trades.push_back(item);
  }

  client::OrderListener listener(deriver, relay);
  listener.TrackActive(store);
  nlohmann::json notifications = nlohmann::json::array();
  for (const auto& notification : listener.PollOnce()) {
    notifications.push_back(NotificationJson(notification));
  }
  nlohmann::json out;
  out["trades"] = trades;
  out["notifications"] = notifications;
  std::cout << out.dump(2) << "\n";
}

void RunListen(const config::Settings& settings, const std::vector<std::string>& args,
               bool watch) {
  RequireArgs(args, 1, "listen <events.json> [--watch]");
  const std::filesystem::path events_path(args[1]);
  client::FileStore store(StorePath(settings));
  const auto user = LoadOrCreateUser(&store);
  const crypto::KeyDeriver deriver(user.mnemonic);
  net::MemoryRelay relay;
  net::LoadEventDump(events_path, &relay);

  client::OrderListener listener(deriver, relay);
  const auto tracked = listener.TrackActive(store);
  util::LogInfo("listening on " + std::to_string(tracked) + " active trades");
  if (!watch) {
    listener.PollOnce();
    for (const auto& notification : listener.notifications().Drain()) {
      std::cout << NotificationJson(notification).dump() << "\n";
    }
    return;
  }

  client::PeriodicTask poller("order-listener", PollInterval(settings), [&] {
    net::LoadEventDump(events_path, &relay);
    listener.PollOnce();
  });
  InstallSignalHandlers();
  poller.Start();
  while (!g_interrupted.load()) {
    if (const auto notification = listener.notifications().Pop(kWatchPopTimeout)) {
      std::cout << NotificationJson(*notification).dump() << std::endl;
    }
  }
  poller.Stop();
}

void RunChatSync(const config::Settings& settings, const std::vector<std::string>& args,
                 bool watch) {
  RequireArgs(args, 1, "chat-sync <events.json> [--watch]");
  const std::filesystem::path events_path(args[1]);
  const auto admin = RequireAdminKeys(settings);
  client::FileStore store(StorePath(settings));
  std::string error;
  if (!store.Load(&error)) {
    throw std::runtime_error(error);
  }
  net::MemoryRelay relay;
  net::LoadEventDump(events_path, &relay);

  client::ChatSyncOptions options;
  options.window_seconds = static_cast<std::int64_t>(settings.chat_window_days) * 24 * 60 * 60;
  options.pow = settings.pow;
  client::DisputeChatSync sync(admin, relay, store,
                               client::TranscriptLog(settings.DataDir() / kTranscriptDirName),
                               options);
  sync.RestoreFromTranscripts();
  const auto outcome = sync.FetchOnce();
  for (const auto& failure : outcome.errors) {
    std::cerr << "mostrix-cli: chat fetch failed: " << failure << "\n";
  }
  for (const auto& update : sync.updates().Drain()) {
    PrintChatUpdate(update);
  }
  if (!watch) {
    return;
  }

  client::PeriodicTask fetcher("dispute-chat", PollInterval(settings), [&] {
    net::LoadEventDump(events_path, &relay);
    sync.FetchOnce();
  });
  InstallSignalHandlers();
  fetcher.Start();
  while (!g_interrupted.load()) {
    if (const auto update = sync.updates().Pop(kWatchPopTimeout)) {
      PrintChatUpdate(*update);
      std::cout.flush();
    }
  }
  fetcher.Stop();
}

}  // namespace

int main(int argc, char** argv) {
  try {
    std::vector<std::string> raw_args;
    bool watch = false;
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--help" || arg == "-h") {
        PrintUsage();
        return 0;
      }
      if (arg == "--watch") {
        watch = true;
        continue;
      }
      raw_args.push_back(arg);
    }
    std::vector<std::string> args;
    const auto settings = config::LoadSettings(raw_args, &args);
    util::GetLogger().Configure(util::ParseLogLevelString(settings.log_level), 0, 0);
    util::GetLogger().SetStderr(settings.log_stderr);
    if (args.empty()) {
      PrintUsage();
      return 1;
    }

    const auto& command = args.front();
    if (command == "keys") {
      RunKeys(settings, args);
    } else if (command == "new-mnemonic") {
      const std::size_t words = args.size() > 1 ? static_cast<std::size_t>(ParseIndex(args[1])) : 12;
      std::cout << crypto::GenerateMnemonic(words) << "\n";
    } else if (command == "derive") {
      RunDerive(settings, args);
    } else if (command == "shared-key") {
      RunSharedKey(settings, args);
    } else if (command == "wrap") {
      RunWrap(settings, args);
    } else if (command == "unwrap") {
      RunUnwrap(settings, args);
    } else if (command == "chat-wrap") {
      RunChatWrap(settings, args);
    } else if (command == "transcript") {
      RunTranscript(settings, args);
    } else if (command == "resolve-blob") {
      RunResolveBlob(args);
    } else if (command == "fetch-attachment") {
      RunFetchAttachment(settings, args);
    } else if (command == "decrypt-attachment") {
      RunDecryptAttachment(args);
    } else if (command == "recover") {
      RunRecover(settings, args);
    } else if (command == "listen") {
      RunListen(settings, args, watch);
    } else if (command == "chat-sync") {
      RunChatSync(settings, args, watch);
    } else if (command == "settings") {
      std::cout << settings.ToJson().dump(2) << "\n";
    } else {
      throw std::runtime_error("unknown command: " + command);
    }
  } catch (const std::exception& ex) {
    std::cerr << "mostrix-cli: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
