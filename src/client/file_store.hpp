#pragma once

#include <filesystem>
#include <string>

#include "client/memory_store.hpp"
#include "nlohmann/json.hpp"

namespace mostrix::client {

// Store backed by one JSON document, rewritten atomically after every
// mutation.
class FileStore : public MemoryStore {
 public:
  explicit FileStore(std::filesystem::path path);

  // A missing file is an empty store. Unreadable or malformed content fails.
  bool Load(std::string* error = nullptr);

  const std::filesystem::path& path() const { return path_; }

  static constexpr const char* kDefaultFileName = "mostrix.json";

 protected:
  bool Commit(const State& state, std::string* error) override;

 private:
  std::filesystem::path path_;
};

nlohmann::json OrderRecordToJson(const OrderRecord& order);
bool OrderRecordFromJson(const nlohmann::json& json, OrderRecord* order,
                         std::string* error = nullptr);
nlohmann::json AdminDisputeToJson(const AdminDispute& dispute);
bool AdminDisputeFromJson(const nlohmann::json& json, AdminDispute* dispute,
                          std::string* error = nullptr);

}  // namespace mostrix::client
