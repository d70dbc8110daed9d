#include "client/attachment.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "crypto/key_deriver.hpp"
#include "crypto/keys.hpp"
#include "nlohmann/json.hpp"
#include "util/aead.hpp"
#include "util/atomic_file.hpp"
#include "util/hex.hpp"
#include "util/logging.hpp"
#include "util/secure_wipe.hpp"

namespace mostrix::client {

namespace {

void SetError(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
}

std::string_view TrimView(std::string_view value) {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
    value.remove_prefix(1);
  }
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
    value.remove_suffix(1);
  }
  return value;
}

}  // namespace

std::optional<ChatAttachment> ParseChatAttachment(std::string_view content) {
  const auto trimmed = TrimView(content);
  if (trimmed.empty() || trimmed.front() != '{') {
    return std::nullopt;
  }
  const auto json = nlohmann::json::parse(std::string(trimmed), nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    return std::nullopt;
  }
  ChatAttachment attachment;
  try {
    const auto type = json.at("type").get<std::string>();
    if (type == "image_encrypted") {
      attachment.type = AttachmentType::kImage;
    } else if (type == "file_encrypted") {
      attachment.type = AttachmentType::kFile;
    } else {
      return std::nullopt;
    }
    attachment.blossom_url = json.at("blossom_url").get<std::string>();
    attachment.filename = json.value("filename", std::string{});
    attachment.mime_type = json.value("mime_type", std::string{});
    attachment.size = json.value("size", std::uint64_t{0});
    if (const auto it = json.find("nonce"); it != json.end() && it->is_string()) {
      std::vector<std::uint8_t> nonce;
      if (!util::HexDecode(it->get<std::string>(), &nonce) || nonce.size() != kBlobNonceSize) {
        return std::nullopt;
      }
      attachment.nonce.emplace();
      std::copy(nonce.begin(), nonce.end(), attachment.nonce->begin());
    }
    if (const auto it = json.find("decryption_key"); it != json.end() && it->is_string()) {
      std::vector<std::uint8_t> key;
      if (!util::HexDecode(it->get<std::string>(), &key)) {
        return std::nullopt;
      }
      attachment.decryption_key = std::move(key);
    }
  } catch (const std::exception&) {
    return std::nullopt;
  }
  if (attachment.blossom_url.empty()) {
    return std::nullopt;
  }
  if (attachment.filename.empty()) {
    attachment.filename = "attachment";
  }
  return attachment;
}

std::string AttachmentPlaceholder(const ChatAttachment& attachment) {
  const std::string mime = attachment.mime_type.empty()
                               ? (attachment.type == AttachmentType::kImage ? "image" : "file")
                               : attachment.mime_type;
  return "[attachment] " + attachment.filename + " (" + mime + ", " +
         std::to_string(attachment.size) + " bytes)";
}

std::string TranscriptContent(const std::string& content) {
  if (const auto attachment = ParseChatAttachment(content)) {
    return AttachmentPlaceholder(*attachment);
  }
  return content;
}

bool ResolveBlobUrl(std::string_view reference, std::string* url, std::string* error) {
  const auto trimmed = TrimView(reference);
  constexpr std::string_view kBlossom = "blossom://";
  constexpr std::string_view kHttps = "https://";
  if (trimmed.substr(0, kBlossom.size()) == kBlossom) {
    *url = "https://" + std::string(trimmed.substr(kBlossom.size()));
    return true;
  }
  if (trimmed.substr(0, kHttps.size()) == kHttps) {
    *url = std::string(trimmed);
    return true;
  }
  SetError(error,
           "Blossom URL must start with blossom:// or https://, got: " + std::string(trimmed));
  return false;
}

bool DecryptBlob(std::span<const std::uint8_t> key, std::span<const std::uint8_t> blob,
                 std::vector<std::uint8_t>* plaintext, std::string* error) {
  if (key.size() != util::kChaCha20Poly1305KeySize) {
    SetError(error, "decrypt key must be 32 bytes, got " + std::to_string(key.size()));
    return false;
  }
  if (blob.size() < kBlobNonceSize + kBlobTagSize) {
    SetError(error, "blob too short for nonce+tag (need at least 28 bytes, got " +
                        std::to_string(blob.size()) + ")");
    return false;
  }
  const auto nonce = blob.first(kBlobNonceSize);
  const auto sealed = blob.subspan(kBlobNonceSize);
  if (!util::ChaCha20Poly1305Decrypt(key, nonce, {}, sealed, plaintext)) {
    SetError(error, "decrypt failed: authentication tag mismatch");
    return false;
  }
  return true;
}

std::string SanitizeFilename(std::string_view name) {
  std::string sanitized;
  sanitized.reserve(name.size());
  for (const char c : name) {
    const auto u = static_cast<unsigned char>(c);
    if (u < 0x80 && (std::isalnum(u) || c == '.' || c == '_' || c == '-')) {
      sanitized.push_back(c);
    } else {
      sanitized.push_back('_');
    }
  }
  if (sanitized.empty()) {
    return "attachment";
  }
  return sanitized;
}

std::filesystem::path AttachmentSavePath(const std::filesystem::path& dir,
                                         const std::string& dispute_id,
                                         const std::string& filename, bool encrypted) {
  std::string name = SanitizeFilename(filename);
  if (encrypted) {
    name += ".enc";
  }
  return dir / (dispute_id + "_" + name);
}

std::optional<std::array<std::uint8_t, 32>> AttachmentFallbackKey(
    const crypto::SecretKey& admin_secret, const AdminDispute& dispute, ChatSender sender) {
  std::string pubkey_text;
  switch (sender) {
    case ChatSender::kBuyer:
      pubkey_text = dispute.buyer_pubkey;
      break;
    case ChatSender::kSeller:
      pubkey_text = dispute.seller_pubkey;
      break;
    case ChatSender::kAdmin:
      return std::nullopt;
  }
  const auto pubkey = crypto::ParsePublicKey(pubkey_text);
  if (!pubkey) {
    util::LogWarn("no usable " + std::string(ChatSenderName(sender)) +
                  " pubkey for attachment key in dispute " + dispute.dispute_id);
    return std::nullopt;
  }
  try {
    return crypto::KeyDeriver::DeriveSharedSecret(admin_secret, *pubkey);
  } catch (const std::exception& ex) {
    util::LogWarn(std::string("attachment key derivation failed: ") + ex.what());
    return std::nullopt;
  }
}

AttachmentCodec::AttachmentCodec(net::Transfer& transfer, std::filesystem::path output_dir,
                                 std::size_t max_bytes, std::chrono::seconds timeout)
    : transfer_(transfer),
      output_dir_(std::move(output_dir)),
      max_bytes_(max_bytes),
      timeout_(timeout) {}

bool AttachmentCodec::Fetch(const std::string& reference, std::vector<std::uint8_t>* blob,
                            std::string* error) {
  std::string url;
  if (!ResolveBlobUrl(reference, &url, error)) {
    return false;
  }
  return transfer_.Get(url, max_bytes_, timeout_, blob, error);
}

bool AttachmentCodec::Save(const std::string& dispute_id, const ChatAttachment& attachment,
                           const std::optional<std::array<std::uint8_t, 32>>& fallback_key,
                           std::filesystem::path* saved_path, std::string* error) {
  std::vector<std::uint8_t> blob;
  if (!Fetch(attachment.blossom_url, &blob, error)) {
    return false;
  }
  if (attachment.nonce && blob.size() >= kBlobNonceSize &&
      !std::equal(attachment.nonce->begin(), attachment.nonce->end(), blob.begin())) {
    SetError(error, "attachment nonce does not match the blob");
    return false;
  }

  std::vector<std::uint8_t> key;
  if (attachment.decryption_key) {
    key = *attachment.decryption_key;
  } else if (fallback_key) {
    key.assign(fallback_key->begin(), fallback_key->end());
  }

  const bool encrypted = key.empty();
  std::vector<std::uint8_t> contents;
  if (encrypted) {
    contents = std::move(blob);
  } else {
    const bool ok = DecryptBlob(key, blob, &contents, error);
    util::SecureWipe(key);
    if (!ok) {
      return false;
    }
  }

  const auto path = AttachmentSavePath(output_dir_, dispute_id, attachment.filename, encrypted);
  std::string write_error;
  if (!util::AtomicWriteFileBytes(path, contents, &write_error)) {
    SetError(error, "Write file: " + write_error);
    return false;
  }
  util::LogInfo("saved attachment to " + path.string());
  if (saved_path) {
    *saved_path = path;
  }
  return true;
}

}  // namespace mostrix::client
