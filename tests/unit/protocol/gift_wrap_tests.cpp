#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "crypto/keys.hpp"
#include "protocol/event.hpp"
#include "protocol/gift_wrap.hpp"
#include "protocol/message.hpp"
#include "util/hex.hpp"

using namespace mostrix;
using protocol::Action;
using protocol::Message;

namespace {

Message SampleMessage(std::uint64_t request_id) {
  return Message::Order("4a3e5b1c-7d2f-4e6a-8b9c-0d1e2f3a4b5c", request_id, 3,
                        Action::kFiatSent, std::nullopt);
}

bool TestReputationMode() {
  const auto identity = crypto::Keys::Generate();
  const auto trade = crypto::Keys::Generate();
  const auto mostro = crypto::Keys::Generate();
  const auto message = SampleMessage(11);

  protocol::EnvelopeOptions options;
  options.expiration = 1'800'000'000;
  const auto wrap = protocol::EncodeEnvelope(message, trade, &identity, mostro.PublicKey(), options);
  if (wrap.kind != protocol::kKindGiftWrap ||
      protocol::FirstTagValue(wrap, "p") != mostro.PublicKeyHex() ||
      protocol::FirstTagValue(wrap, "expiration") != "1800000000") {
    std::cerr << "unexpected outer wrap tags\n";
    return false;
  }
  if (wrap.pubkey == trade.PublicKeyHex() || wrap.pubkey == identity.PublicKeyHex()) {
    std::cerr << "outer wrap signed by a long-lived key\n";
    return false;
  }
  std::string error;
  if (!protocol::VerifyEvent(wrap, &error)) {
    std::cerr << "outer wrap does not verify: " << error << "\n";
    return false;
  }

  protocol::DecodedEnvelope decoded;
  if (!protocol::DecodeEnvelope(wrap, mostro, &decoded, &error)) {
    std::cerr << "decode failed: " << error << "\n";
    return false;
  }
  if (!(decoded.message == message) || decoded.sender != trade.PublicKey() ||
      decoded.seal_signer != identity.PublicKey() || !decoded.signature_present) {
    std::cerr << "reputation envelope decoded incorrectly\n";
    return false;
  }
  if (decoded.event_id != wrap.id) {
    std::cerr << "decoded envelope lost the wrap id\n";
    return false;
  }

  bool threw = false;
  try {
    protocol::EncodeEnvelope(message, trade, nullptr, mostro.PublicKey());
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw) {
    std::cerr << "reputation mode without identity keys accepted\n";
    return false;
  }
  return true;
}

bool TestFullPrivacyMode() {
  const auto trade = crypto::Keys::Generate();
  const auto mostro = crypto::Keys::Generate();
  const auto message = SampleMessage(12);
  protocol::EnvelopeOptions options;
  options.mode = protocol::PrivacyMode::kFullPrivacy;
  options.pow = 8;
  const auto wrap = protocol::EncodeEnvelope(message, trade, nullptr, mostro.PublicKey(), options);

  crypto::Sha256Hash id{};
  if (!util::HexDecode32(wrap.id, &id) || protocol::LeadingZeroBits(id) < 8) {
    std::cerr << "outer wrap does not carry the requested proof of work\n";
    return false;
  }
  if (!protocol::FirstTagValue(wrap, "nonce")) {
    std::cerr << "mined wrap lacks a nonce tag\n";
    return false;
  }

  protocol::DecodedEnvelope decoded;
  std::string error;
  if (!protocol::DecodeEnvelope(wrap, mostro, &decoded, &error)) {
    std::cerr << "full privacy decode failed: " << error << "\n";
    return false;
  }
  if (decoded.seal_signer != trade.PublicKey() || decoded.sender != trade.PublicKey() ||
      decoded.signature_present) {
    std::cerr << "full privacy envelope leaked an identity or signature\n";
    return false;
  }

  const auto stranger = crypto::Keys::Generate();
  if (protocol::DecodeEnvelope(wrap, stranger, &decoded, &error)) {
    std::cerr << "envelope opened with the wrong key\n";
    return false;
  }
  auto tampered = wrap;
  tampered.content[tampered.content.size() / 2] =
      tampered.content[tampered.content.size() / 2] == 'A' ? 'B' : 'A';
  if (protocol::DecodeEnvelope(tampered, mostro, &decoded, &error)) {
    std::cerr << "tampered envelope decoded\n";
    return false;
  }
  auto wrong_kind = wrap;
  wrong_kind.kind = protocol::kKindTextNote;
  if (protocol::DecodeEnvelope(wrong_kind, mostro, &decoded, &error)) {
    std::cerr << "non gift-wrap event decoded\n";
    return false;
  }
  return true;
}

bool TestChatWrap() {
  const auto admin = crypto::Keys::Generate();
  const auto shared = crypto::Keys::Generate();
  const auto wrap = protocol::WrapChatMessage(admin, shared.PublicKey(),
                                              "please share the receipt", 0, 1'700'000'123);
  if (protocol::FirstTagValue(wrap, "p") != shared.PublicKeyHex()) {
    std::cerr << "chat wrap not addressed to the shared key\n";
    return false;
  }
  if (wrap.created_at > 1'700'000'123) {
    std::cerr << "chat wrap timestamp is in the future of its note\n";
    return false;
  }
  protocol::Event inner;
  std::string error;
  if (!protocol::UnwrapChatMessage(wrap, shared, &inner, &error)) {
    std::cerr << "chat unwrap failed: " << error << "\n";
    return false;
  }
  if (inner.pubkey != admin.PublicKeyHex() || inner.content != "please share the receipt" ||
      inner.created_at != 1'700'000'123 || inner.kind != protocol::kKindTextNote) {
    std::cerr << "chat note decoded incorrectly\n";
    return false;
  }
  if (protocol::UnwrapChatMessage(wrap, admin, &inner, &error)) {
    std::cerr << "chat wrap opened without the shared key\n";
    return false;
  }
  return true;
}

bool TestParseDirectMessages() {
  const auto identity = crypto::Keys::Generate();
  const auto mostro = crypto::Keys::Generate();
  const auto trade = crypto::Keys::Generate();
  const auto stranger = crypto::Keys::Generate();

  std::vector<protocol::Event> events;
  const auto first = protocol::EncodeEnvelope(SampleMessage(1), identity, &identity,
                                              trade.PublicKey());
  events.push_back(first);
  events.push_back(first);
  // Addressed to someone else.
  events.push_back(protocol::EncodeEnvelope(SampleMessage(2), identity, &identity,
                                            stranger.PublicKey()));
  protocol::Event note;
  note.kind = protocol::kKindTextNote;
  note.content = "unrelated";
  protocol::SignEvent(&note, stranger);
  events.push_back(note);
  events.push_back(protocol::EncodePrivateDm(SampleMessage(3), mostro, trade.PublicKey()));

  const auto messages = protocol::ParseDirectMessages(events, trade);
  if (messages.size() != 2) {
    std::cerr << "expected 2 direct messages, got " << messages.size() << "\n";
    return false;
  }
  for (std::size_t i = 1; i < messages.size(); ++i) {
    if (messages[i - 1].created_at > messages[i].created_at) {
      std::cerr << "direct messages not sorted by time\n";
      return false;
    }
  }
  bool saw_dm = false;
  for (const auto& message : messages) {
    if (message.message.kind.request_id == 3u) {
      saw_dm = message.sender == mostro.PublicKey();
    } else if (message.sender != identity.PublicKey()) {
      std::cerr << "gift wrap sender is not the seal signer\n";
      return false;
    }
  }
  if (!saw_dm) {
    std::cerr << "private direct message missing or misattributed\n";
    return false;
  }

  const auto recent = protocol::ParseDirectMessages(events, trade, messages.back().created_at + 1);
  if (!recent.empty()) {
    std::cerr << "since filter kept older messages\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!TestReputationMode() || !TestFullPrivacyMode() || !TestChatWrap() ||
        !TestParseDirectMessages()) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "gift_wrap_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  std::cout << "gift_wrap_tests: OK\n";
  return EXIT_SUCCESS;
}
