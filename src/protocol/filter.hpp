#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "protocol/event.hpp"

namespace mostrix::protocol {

// NIP-01 subscription filter. Empty lists match everything.
class Filter {
 public:
  Filter& Kind(std::uint32_t kind);
  Filter& Author(const std::string& pubkey_hex);
  // Shorthand for CustomTag('p', ...).
  Filter& Pubkey(const std::string& pubkey_hex);
  Filter& CustomTag(char letter, const std::string& value);
  Filter& Since(std::int64_t timestamp);
  Filter& Until(std::int64_t timestamp);
  Filter& Limit(std::size_t limit);

  const std::vector<std::uint32_t>& kinds() const { return kinds_; }
  const std::vector<std::string>& authors() const { return authors_; }
  const std::map<char, std::vector<std::string>>& tags() const { return tags_; }
  std::optional<std::int64_t> since() const { return since_; }
  std::optional<std::int64_t> until() const { return until_; }
  std::optional<std::size_t> limit() const { return limit_; }

  // Everything but `limit`, which applies to a result set.
  bool Matches(const Event& event) const;

  nlohmann::json ToJson() const;

 private:
  std::vector<std::uint32_t> kinds_;
  std::vector<std::string> authors_;
  std::map<char, std::vector<std::string>> tags_;
  std::optional<std::int64_t> since_;
  std::optional<std::int64_t> until_;
  std::optional<std::size_t> limit_;
};

}  // namespace mostrix::protocol
