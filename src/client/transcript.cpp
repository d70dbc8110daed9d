#include "client/transcript.hpp"

#include <cstdint>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <system_error>

#include "util/logging.hpp"
#include "util/time.hpp"

namespace mostrix::client {

namespace {

constexpr const char* kDateFormat = "%d-%m-%Y";
constexpr const char* kTimeFormat = "%H:%M:%S";
constexpr std::string_view kUnknownDate = "??-??-????";
constexpr std::string_view kUnknownTime = "??:??:??";
constexpr std::string_view kSeparator = " - ";

struct Header {
  ChatSender sender;
  std::int64_t timestamp;
};

bool AllDigitsAt(std::string_view text, std::initializer_list<std::size_t> positions) {
  for (const auto pos : positions) {
    if (pos >= text.size() || text[pos] < '0' || text[pos] > '9') {
      return false;
    }
  }
  return true;
}

std::optional<Header> ParseHeader(std::string_view line) {
  const auto first = line.find(kSeparator);
  if (first == std::string_view::npos) {
    return std::nullopt;
  }
  const auto sender = ParseChatSender(line.substr(0, first));
  if (!sender) {
    return std::nullopt;
  }
  const auto rest = line.substr(first + kSeparator.size());
  // dd-mm-YYYY - HH:MM:SS
  if (rest.size() != 10 + kSeparator.size() + 8 || rest.substr(10, kSeparator.size()) != kSeparator) {
    return std::nullopt;
  }
  const auto date = rest.substr(0, 10);
  const auto time = rest.substr(10 + kSeparator.size());
  if (date == kUnknownDate || time == kUnknownTime) {
    return Header{*sender, 0};
  }
  if (!AllDigitsAt(date, {0, 1, 3, 4, 6, 7, 8, 9}) || date[2] != '-' || date[5] != '-' ||
      !AllDigitsAt(time, {0, 1, 3, 4, 6, 7}) || time[2] != ':' || time[5] != ':') {
    return std::nullopt;
  }
  const auto parsed =
      util::ParseUtc(std::string(date) + " " + std::string(time), "%d-%m-%Y %H:%M:%S");
  if (!parsed) {
    return std::nullopt;
  }
  return Header{*sender, *parsed};
}

}  // namespace

std::string FormatTranscriptEntry(const DisputeChatMessage& message) {
  const auto date = util::FormatUtc(message.timestamp, kDateFormat);
  const auto time = util::FormatUtc(message.timestamp, kTimeFormat);
  std::string entry = ChatSenderName(message.sender);
  entry += kSeparator;
  entry += date ? *date : std::string(kUnknownDate);
  entry += kSeparator;
  entry += time ? *time : std::string(kUnknownTime);
  entry += "\n";
  entry += message.content;
  entry += "\n\n";
  return entry;
}

std::vector<DisputeChatMessage> ParseTranscript(std::string_view text) {
  std::vector<DisputeChatMessage> messages;
  std::istringstream in{std::string(text)};
  std::string line;
  std::optional<DisputeChatMessage> current;
  std::vector<std::string> body;
  bool previous_blank = true;

  const auto flush = [&]() {
    if (!current) {
      return;
    }
    // Drop the blank separator line that ends every entry.
    if (!body.empty() && body.back().empty()) {
      body.pop_back();
    }
    std::string content;
    for (std::size_t i = 0; i < body.size(); ++i) {
      if (i > 0) {
        content += "\n";
      }
      content += body[i];
    }
    current->content = std::move(content);
    messages.push_back(std::move(*current));
    current.reset();
    body.clear();
  };

  while (std::getline(in, line)) {
    if (previous_blank) {
      if (const auto header = ParseHeader(line)) {
        flush();
        current = DisputeChatMessage{header->sender, {}, header->timestamp, std::nullopt};
        previous_blank = false;
        continue;
      }
    }
    if (current) {
      body.push_back(line);
    }
    previous_blank = line.empty();
  }
  flush();
  return messages;
}

std::filesystem::path TranscriptLog::PathFor(const std::string& dispute_id) const {
  return dir_ / (dispute_id + ".txt");
}

bool TranscriptLog::Append(const std::string& dispute_id, const DisputeChatMessage& message,
                           std::string* error) const {
  return Append(dispute_id, std::vector<DisputeChatMessage>{message}, error);
}

bool TranscriptLog::Append(const std::string& dispute_id,
                           const std::vector<DisputeChatMessage>& messages,
                           std::string* error) const {
  if (messages.empty()) {
    return true;
  }
  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec) {
    if (error) {
      *error = "failed to create transcript directory: " + ec.message();
    }
    return false;
  }
  const auto path = PathFor(dispute_id);
  const bool existed = std::filesystem::exists(path, ec);
  const std::uintmax_t previous_size = existed ? std::filesystem::file_size(path, ec) : 0;
  if (ec) {
    if (error) {
      *error = "failed to inspect chat file " + path.string() + ": " + ec.message();
    }
    return false;
  }

  std::string text;
  for (const auto& message : messages) {
    text += FormatTranscriptEntry(message);
  }
  bool written = false;
  {
    std::ofstream out(path, std::ios::app | std::ios::binary);
    if (!out) {
      if (error) {
        *error = "failed to open chat file " + path.string();
      }
      return false;
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    written = static_cast<bool>(out);
  }
  if (written) {
    util::LogDebug(std::to_string(messages.size()) + " chat messages saved to " + path.string());
    return true;
  }

  // Cut off whatever part of the batch reached the file.
  std::error_code rollback_ec;
  if (existed) {
    std::filesystem::resize_file(path, previous_size, rollback_ec);
  } else {
    std::filesystem::remove(path, rollback_ec);
  }
  if (rollback_ec) {
    util::LogError("failed to roll back partial write to " + path.string() + ": " +
                   rollback_ec.message());
  }
  if (error) {
    *error = "failed to write chat messages to " + path.string();
  }
  return false;
}

bool TranscriptLog::Load(const std::string& dispute_id, std::vector<DisputeChatMessage>* messages,
                         std::string* error) const {
  messages->clear();
  const auto path = PathFor(dispute_id);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return true;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (error) {
      *error = "failed to open chat file " + path.string();
    }
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  *messages = ParseTranscript(buffer.str());
  return true;
}

std::vector<std::string> TranscriptLog::DisputeIds() const {
  std::vector<std::string> ids;
  std::error_code ec;
  if (!std::filesystem::is_directory(dir_, ec)) {
    return ids;
  }
  for (const auto& entry : std::filesystem::directory_iterator(dir_, ec)) {
    if (entry.is_regular_file(ec) && entry.path().extension() == ".txt") {
      ids.push_back(entry.path().stem().string());
    }
  }
  return ids;
}

}  // namespace mostrix::client
