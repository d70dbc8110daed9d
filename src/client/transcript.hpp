#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "client/chat_types.hpp"

namespace mostrix::client {

// Append-only plain-text chat log, one file per dispute. Each entry is
//   <Admin|Buyer|Seller> - dd-mm-YYYY - HH:MM:SS
//   <content>
//   <blank line>
// with the timestamp in UTC.
class TranscriptLog {
 public:
  explicit TranscriptLog(std::filesystem::path dir) : dir_(std::move(dir)) {}

  std::filesystem::path PathFor(const std::string& dispute_id) const;

  bool Append(const std::string& dispute_id, const DisputeChatMessage& message,
              std::string* error = nullptr) const;
  // One write for the whole batch. On failure the file is cut back to its
  // previous length, so the batch is recorded completely or not at all.
  bool Append(const std::string& dispute_id, const std::vector<DisputeChatMessage>& messages,
              std::string* error = nullptr) const;

  // A missing file yields an empty transcript.
  bool Load(const std::string& dispute_id, std::vector<DisputeChatMessage>* messages,
            std::string* error = nullptr) const;

  // Dispute ids that have a transcript file.
  std::vector<std::string> DisputeIds() const;

  const std::filesystem::path& dir() const { return dir_; }

 private:
  std::filesystem::path dir_;
};

std::string FormatTranscriptEntry(const DisputeChatMessage& message);

// A line after a blank line that does not parse as a header stays in the
// previous entry's body. Placeholder timestamps ("??-??-????") come back as 0.
std::vector<DisputeChatMessage> ParseTranscript(std::string_view text);

}  // namespace mostrix::client
