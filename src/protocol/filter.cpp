#include "protocol/filter.hpp"

#include <algorithm>

namespace mostrix::protocol {

namespace {

template <typename T>
bool ContainsOrEmpty(const std::vector<T>& values, const T& value) {
  return values.empty() || std::find(values.begin(), values.end(), value) != values.end();
}

}  // namespace

Filter& Filter::Kind(std::uint32_t kind) {
  kinds_.push_back(kind);
  return *this;
}

Filter& Filter::Author(const std::string& pubkey_hex) {
  authors_.push_back(pubkey_hex);
  return *this;
}

Filter& Filter::Pubkey(const std::string& pubkey_hex) { return CustomTag('p', pubkey_hex); }

Filter& Filter::CustomTag(char letter, const std::string& value) {
  tags_[letter].push_back(value);
  return *this;
}

Filter& Filter::Since(std::int64_t timestamp) {
  since_ = timestamp;
  return *this;
}

Filter& Filter::Until(std::int64_t timestamp) {
  until_ = timestamp;
  return *this;
}

Filter& Filter::Limit(std::size_t limit) {
  limit_ = limit;
  return *this;
}

bool Filter::Matches(const Event& event) const {
  if (!ContainsOrEmpty(kinds_, event.kind) || !ContainsOrEmpty(authors_, event.pubkey)) {
    return false;
  }
  if (since_ && event.created_at < *since_) {
    return false;
  }
  if (until_ && event.created_at > *until_) {
    return false;
  }
  for (const auto& [letter, values] : tags_) {
    const bool found = std::any_of(event.tags.begin(), event.tags.end(), [&](const Tag& tag) {
      return tag.size() >= 2 && tag[0].size() == 1 && tag[0][0] == letter &&
             std::find(values.begin(), values.end(), tag[1]) != values.end();
    });
    if (!found) {
      return false;
    }
  }
  return true;
}

nlohmann::json Filter::ToJson() const {
  nlohmann::json json = nlohmann::json::object();
  if (!kinds_.empty()) json["kinds"] = kinds_;
  if (!authors_.empty()) json["authors"] = authors_;
  for (const auto& [letter, values] : tags_) {
    json[std::string("#") + letter] = values;
  }
  if (since_) json["since"] = *since_;
  if (until_) json["until"] = *until_;
  if (limit_) json["limit"] = *limit_;
  return json;
}

}  // namespace mostrix::protocol
