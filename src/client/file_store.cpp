#include "client/file_store.hpp"

#include <fstream>
#include <system_error>
#include <utility>

#include "util/atomic_file.hpp"
#include "util/logging.hpp"

namespace mostrix::client {

namespace {

constexpr int kFileVersion = 1;

void SetError(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
}

template <typename T>
void PutOptional(nlohmann::json& json, const char* key, const std::optional<T>& value) {
  if (value) {
    json[key] = *value;
  } else {
    json[key] = nullptr;
  }
}

template <typename T>
std::optional<T> GetOptional(const nlohmann::json& json, const char* key) {
  const auto it = json.find(key);
  if (it == json.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

}  // namespace

nlohmann::json OrderRecordToJson(const OrderRecord& order) {
  nlohmann::json json;
  json["id"] = order.id;
  if (order.kind) {
    json["kind"] = protocol::OrderKindName(*order.kind);
  } else {
    json["kind"] = nullptr;
  }
  if (order.status) {
    json["status"] = protocol::StatusName(*order.status);
  } else {
    json["status"] = nullptr;
  }
  json["amount"] = order.amount;
  PutOptional(json, "min_amount", order.min_amount);
  PutOptional(json, "max_amount", order.max_amount);
  json["fiat_code"] = order.fiat_code;
  json["fiat_amount"] = order.fiat_amount;
  json["payment_method"] = order.payment_method;
  json["premium"] = order.premium;
  json["trade_index"] = order.trade_index;
  json["trade_keys"] = order.trade_keys;
  PutOptional(json, "request_id", order.request_id);
  PutOptional(json, "buyer_invoice", order.buyer_invoice);
  json["is_mine"] = order.is_mine;
  json["created_at"] = order.created_at;
  json["expires_at"] = order.expires_at;
  return json;
}

bool OrderRecordFromJson(const nlohmann::json& json, OrderRecord* order, std::string* error) {
  if (!json.is_object()) {
    SetError(error, "order record must be an object");
    return false;
  }
  OrderRecord parsed;
  try {
    parsed.id = json.at("id").get<std::string>();
    if (const auto kind = GetOptional<std::string>(json, "kind")) {
      parsed.kind = protocol::ParseOrderKind(*kind);
      if (!parsed.kind) {
        SetError(error, "invalid order kind: " + *kind);
        return false;
      }
    }
    if (const auto status = GetOptional<std::string>(json, "status")) {
      parsed.status = protocol::ParseStatus(*status);
      if (!parsed.status) {
        SetError(error, "invalid order status: " + *status);
        return false;
      }
    }
    parsed.amount = json.value("amount", std::int64_t{0});
    parsed.min_amount = GetOptional<std::int64_t>(json, "min_amount");
    parsed.max_amount = GetOptional<std::int64_t>(json, "max_amount");
    parsed.fiat_code = json.value("fiat_code", std::string{});
    parsed.fiat_amount = json.value("fiat_amount", std::int64_t{0});
    parsed.payment_method = json.value("payment_method", std::string{});
    parsed.premium = json.value("premium", std::int64_t{0});
    parsed.trade_index = json.value("trade_index", std::int64_t{0});
    parsed.trade_keys = json.value("trade_keys", std::string{});
    parsed.request_id = GetOptional<std::uint64_t>(json, "request_id");
    parsed.buyer_invoice = GetOptional<std::string>(json, "buyer_invoice");
    parsed.is_mine = json.value("is_mine", false);
    parsed.created_at = json.value("created_at", std::int64_t{0});
    parsed.expires_at = json.value("expires_at", std::int64_t{0});
  } catch (const std::exception& ex) {
    SetError(error, std::string("malformed order record: ") + ex.what());
    return false;
  }
  if (parsed.id.empty()) {
    SetError(error, "order record without id");
    return false;
  }
  *order = std::move(parsed);
  return true;
}

nlohmann::json AdminDisputeToJson(const AdminDispute& dispute) {
  nlohmann::json json;
  json["id"] = dispute.id;
  json["dispute_id"] = dispute.dispute_id;
  json["status"] = protocol::DisputeStatusName(dispute.status);
  json["initiator_pubkey"] = dispute.initiator_pubkey;
  json["buyer_pubkey"] = dispute.buyer_pubkey;
  json["seller_pubkey"] = dispute.seller_pubkey;
  json["initiator_full_privacy"] = dispute.initiator_full_privacy;
  json["counterpart_full_privacy"] = dispute.counterpart_full_privacy;
  json["premium"] = dispute.premium;
  json["payment_method"] = dispute.payment_method;
  json["amount"] = dispute.amount;
  json["fiat_amount"] = dispute.fiat_amount;
  json["fiat_code"] = dispute.fiat_code;
  json["fee"] = dispute.fee;
  json["routing_fee"] = dispute.routing_fee;
  PutOptional(json, "buyer_invoice", dispute.buyer_invoice);
  PutOptional(json, "invoice_held_at", dispute.invoice_held_at);
  json["taken_at"] = dispute.taken_at;
  json["created_at"] = dispute.created_at;
  PutOptional(json, "buyer_chat_last_seen", dispute.buyer_chat_last_seen);
  PutOptional(json, "seller_chat_last_seen", dispute.seller_chat_last_seen);
  PutOptional(json, "buyer_shared_key", dispute.buyer_shared_key);
  PutOptional(json, "seller_shared_key", dispute.seller_shared_key);
  return json;
}

bool AdminDisputeFromJson(const nlohmann::json& json, AdminDispute* dispute, std::string* error) {
  if (!json.is_object()) {
    SetError(error, "dispute record must be an object");
    return false;
  }
  AdminDispute parsed;
  try {
    parsed.id = json.value("id", std::string{});
    parsed.dispute_id = json.at("dispute_id").get<std::string>();
    const auto status_name = json.value("status", std::string{"in-progress"});
    const auto status = protocol::ParseDisputeStatus(status_name);
    if (!status) {
      SetError(error, "invalid dispute status: " + status_name);
      return false;
    }
    parsed.status = *status;
    parsed.initiator_pubkey = json.value("initiator_pubkey", std::string{});
    parsed.buyer_pubkey = json.value("buyer_pubkey", std::string{});
    parsed.seller_pubkey = json.value("seller_pubkey", std::string{});
    parsed.initiator_full_privacy = json.value("initiator_full_privacy", false);
    parsed.counterpart_full_privacy = json.value("counterpart_full_privacy", false);
    parsed.premium = json.value("premium", std::int64_t{0});
    parsed.payment_method = json.value("payment_method", std::string{});
    parsed.amount = json.value("amount", std::int64_t{0});
    parsed.fiat_amount = json.value("fiat_amount", std::int64_t{0});
    parsed.fiat_code = json.value("fiat_code", std::string{"USD"});
    parsed.fee = json.value("fee", std::int64_t{0});
    parsed.routing_fee = json.value("routing_fee", std::int64_t{0});
    parsed.buyer_invoice = GetOptional<std::string>(json, "buyer_invoice");
    parsed.invoice_held_at = GetOptional<std::int64_t>(json, "invoice_held_at");
    parsed.taken_at = json.value("taken_at", std::int64_t{0});
    parsed.created_at = json.value("created_at", std::int64_t{0});
    parsed.buyer_chat_last_seen = GetOptional<std::int64_t>(json, "buyer_chat_last_seen");
    parsed.seller_chat_last_seen = GetOptional<std::int64_t>(json, "seller_chat_last_seen");
    parsed.buyer_shared_key = GetOptional<std::string>(json, "buyer_shared_key");
    parsed.seller_shared_key = GetOptional<std::string>(json, "seller_shared_key");
  } catch (const std::exception& ex) {
    SetError(error, std::string("malformed dispute record: ") + ex.what());
    return false;
  }
  if (parsed.dispute_id.empty()) {
    SetError(error, "dispute record without dispute_id");
    return false;
  }
  *dispute = std::move(parsed);
  return true;
}

FileStore::FileStore(std::filesystem::path path) : path_(std::move(path)) {}

bool FileStore::Commit(const State& state, std::string* error) {
  nlohmann::json json;
  json["version"] = kFileVersion;
  if (state.user) {
    json["user"] = {{"mnemonic", state.user->mnemonic},
                    {"identity_pubkey", state.user->identity_pubkey},
                    {"created_at", state.user->created_at}};
  } else {
    json["user"] = nullptr;
  }
  PutOptional(json, "last_trade_index", state.last_trade_index);
  json["orders"] = nlohmann::json::array();
  for (const auto& [id, order] : state.orders) {
    json["orders"].push_back(OrderRecordToJson(order));
  }
  json["disputes"] = nlohmann::json::array();
  for (const auto& [id, dispute] : state.disputes) {
    json["disputes"].push_back(AdminDisputeToJson(dispute));
  }
  const std::string text = json.dump(2);
  std::string write_error;
  const bool ok = util::AtomicWriteFile(
      path_,
      [&](std::ofstream& out) {
        out << text;
        return static_cast<bool>(out);
      },
      &write_error);
  if (!ok) {
    SetError(error, "failed to write store " + path_.string() + ": " + write_error);
    util::LogError("store: " + write_error);
  }
  return ok;
}

bool FileStore::Load(std::string* error) {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    ResetState(State{});
    return true;
  }
  std::ifstream in(path_);
  if (!in) {
    SetError(error, "failed to open store for read: " + path_.string());
    return false;
  }
  nlohmann::json json;
  try {
    in >> json;
  } catch (const std::exception& ex) {
    SetError(error, "failed to parse store " + path_.string() + ": " + ex.what());
    return false;
  }
  if (!json.is_object()) {
    SetError(error, "store file must contain a JSON object");
    return false;
  }
  State state;
  try {
    const auto version = json.value("version", 0);
    if (version != kFileVersion) {
      SetError(error, "unsupported store version " + std::to_string(version));
      return false;
    }
    if (const auto it = json.find("user"); it != json.end() && !it->is_null()) {
      UserRecord user;
      user.mnemonic = it->at("mnemonic").get<std::string>();
      user.identity_pubkey = it->value("identity_pubkey", std::string{});
      user.created_at = it->value("created_at", std::int64_t{0});
      state.user = std::move(user);
    }
    state.last_trade_index = GetOptional<std::int64_t>(json, "last_trade_index");
    for (const auto& item : json.value("orders", nlohmann::json::array())) {
      OrderRecord order;
      if (!OrderRecordFromJson(item, &order, error)) {
        return false;
      }
      state.orders[order.id] = std::move(order);
    }
    for (const auto& item : json.value("disputes", nlohmann::json::array())) {
      AdminDispute dispute;
      if (!AdminDisputeFromJson(item, &dispute, error)) {
        return false;
      }
      state.disputes[dispute.dispute_id] = std::move(dispute);
    }
  } catch (const std::exception& ex) {
    SetError(error, std::string("malformed store: ") + ex.what());
    return false;
  }
  ResetState(std::move(state));
  return true;
}

}  // namespace mostrix::client
