#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "client/chat_types.hpp"
#include "client/store.hpp"
#include "crypto/secp256k1.hpp"
#include "net/transfer.hpp"

namespace mostrix::client {

constexpr std::size_t kMaxBlobSize = 25 * 1024 * 1024;
constexpr std::chrono::seconds kBlobFetchTimeout{30};
constexpr std::size_t kBlobNonceSize = 12;
constexpr std::size_t kBlobTagSize = 16;

enum class AttachmentType { kImage, kFile };

// Encrypted file shared in a dispute chat. The chat message content is a
// JSON object:
//   {"type": "image_encrypted" | "file_encrypted", "blossom_url": "...",
//    "filename": "...", "mime_type": "...", "size": N,
//    "nonce": "<24 hex>", "decryption_key": "<64 hex>"}
// Only type and blossom_url are required.
struct ChatAttachment {
  AttachmentType type{AttachmentType::kFile};
  std::string blossom_url;
  std::string filename;
  std::string mime_type;
  std::uint64_t size{0};
  std::optional<std::array<std::uint8_t, kBlobNonceSize>> nonce;
  std::optional<std::vector<std::uint8_t>> decryption_key;

  bool operator==(const ChatAttachment&) const = default;
};

std::optional<ChatAttachment> ParseChatAttachment(std::string_view content);

// "[attachment] <filename> (<mime>, <size> bytes)"
std::string AttachmentPlaceholder(const ChatAttachment& attachment);

// What a transcript records for a chat message: the placeholder for an
// attachment, the content otherwise.
std::string TranscriptContent(const std::string& content);

// blossom://x becomes https://x; https URLs are kept.
bool ResolveBlobUrl(std::string_view reference, std::string* url, std::string* error = nullptr);

// Blob layout: nonce (12) || ciphertext || tag (16), ChaCha20-Poly1305 with
// empty associated data. A tag mismatch fails; nothing is returned.
bool DecryptBlob(std::span<const std::uint8_t> key, std::span<const std::uint8_t> blob,
                 std::vector<std::uint8_t>* plaintext, std::string* error = nullptr);

// Keeps [A-Za-z0-9._-]; every other character becomes '_'.
std::string SanitizeFilename(std::string_view name);

// <dir>/<dispute_id>_<sanitized name>, with ".enc" appended for blobs saved
// without decryption.
std::filesystem::path AttachmentSavePath(const std::filesystem::path& dir,
                                         const std::string& dispute_id,
                                         const std::string& filename, bool encrypted);

// Shared secret between the arbitrator key and the party that sent the
// attachment. nullopt for admin-sent attachments or an unusable pubkey.
std::optional<std::array<std::uint8_t, 32>> AttachmentFallbackKey(
    const crypto::SecretKey& admin_secret, const AdminDispute& dispute, ChatSender sender);

class AttachmentCodec {
 public:
  AttachmentCodec(net::Transfer& transfer, std::filesystem::path output_dir,
                  std::size_t max_bytes = kMaxBlobSize,
                  std::chrono::seconds timeout = kBlobFetchTimeout);

  bool Fetch(const std::string& reference, std::vector<std::uint8_t>* blob,
             std::string* error = nullptr);

  // Downloads the blob and writes it under the output directory. The
  // embedded key is preferred, then `fallback_key`; without either the
  // encrypted blob is written with a ".enc" suffix.
  bool Save(const std::string& dispute_id, const ChatAttachment& attachment,
            const std::optional<std::array<std::uint8_t, 32>>& fallback_key,
            std::filesystem::path* saved_path, std::string* error = nullptr);

  const std::filesystem::path& output_dir() const { return output_dir_; }

 private:
  net::Transfer& transfer_;
  std::filesystem::path output_dir_;
  std::size_t max_bytes_;
  std::chrono::seconds timeout_;
};

}  // namespace mostrix::client
