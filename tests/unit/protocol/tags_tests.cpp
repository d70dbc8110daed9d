#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "protocol/event.hpp"
#include "protocol/filter.hpp"
#include "protocol/tags.hpp"

using namespace mostrix;

namespace {

const std::string kOrderA = "1b2c3d4e-5f60-4172-8394-a5b6c7d8e9f0";
const std::string kOrderB = "9f8e7d6c-5b4a-4392-8170-6f5e4d3c2b1a";

protocol::Event OrderEvent(const std::string& id, const std::string& kind, const std::string& status,
                           const std::string& fiat, std::int64_t created_at) {
  protocol::Event event;
  event.kind = protocol::kKindMostroOrder;
  event.created_at = created_at;
  event.tags = {{"d", id},         {"k", kind},      {"f", fiat},
                {"s", status},     {"amt", "0"},     {"fa", "100"},
                {"pm", "sepa", "bizum"}, {"premium", "2"}, {"z", "order"}};
  return event;
}

bool TestOrderFromTags() {
  const protocol::Tags tags = {{"d", kOrderA},  {"k", "sell"},        {"f", "EUR"},
                               {"s", "bogus"},  {"fa", "10", "50"},   {"pm", "sepa", "bizum"},
                               {"amt", "x12"},  {"premium", "-3"}};
  const auto order = protocol::OrderFromTags(tags);
  if (order.id != kOrderA || order.kind != protocol::OrderKind::kSell || order.fiat_code != "EUR") {
    std::cerr << "order identity fields mismatch\n";
    return false;
  }
  if (order.status != protocol::Status::kPending) {
    std::cerr << "unknown status did not fall back to pending\n";
    return false;
  }
  if (order.min_amount != 10 || order.max_amount != 50 || order.fiat_amount != 0) {
    std::cerr << "range amounts not parsed\n";
    return false;
  }
  if (order.payment_method != "sepa,bizum" || order.amount != 0 || order.premium != -3) {
    std::cerr << "payment method, amount or premium mismatch\n";
    return false;
  }

  const auto bad_id = protocol::OrderFromTags({{"d", "not-a-uuid"}, {"fa", "1.5"}});
  if (bad_id.id || bad_id.fiat_amount != 0) {
    std::cerr << "invalid id or fractional amount accepted\n";
    return false;
  }
  return true;
}

bool TestParseOrders() {
  std::vector<protocol::Event> events = {
      OrderEvent(kOrderA, "buy", "pending", "USD", 100),
      OrderEvent(kOrderA, "buy", "canceled", "USD", 200),
      OrderEvent(kOrderB, "sell", "pending", "VES", 150),
  };
  protocol::Event no_kind = OrderEvent(kOrderB, "", "pending", "VES", 300);
  events.push_back(no_kind);

  const auto all = protocol::ParseOrders(events);
  if (all.size() != 2 || all[0].id != kOrderA || all[0].status != protocol::Status::kCanceled ||
      all[0].created_at != 200 || all[1].id != kOrderB) {
    std::cerr << "latest revision per order not selected\n";
    return false;
  }

  protocol::OrderListFilter pending;
  pending.status = protocol::Status::kPending;
  const auto open = protocol::ParseOrders(events, pending);
  if (open.size() != 1 || open[0].id != kOrderB) {
    std::cerr << "status filter mismatch\n";
    return false;
  }

  protocol::OrderListFilter currencies;
  currencies.currencies = {"USD", "ARS"};
  if (protocol::ParseOrders(events, currencies).size() != 1) {
    std::cerr << "currency filter mismatch\n";
    return false;
  }
  protocol::OrderListFilter sells;
  sells.kind = protocol::OrderKind::kSell;
  if (protocol::ParseOrders(events, sells).size() != 1) {
    std::cerr << "kind filter mismatch\n";
    return false;
  }
  return true;
}

bool TestParseDisputes() {
  protocol::Event first;
  first.created_at = 10;
  first.tags = {{"d", kOrderA}, {"s", "initiated"}, {"y", "dispute"}};
  protocol::Event second = first;
  second.created_at = 20;
  second.tags[1][1] = "in-progress";
  protocol::Event broken;
  broken.tags = {{"d", kOrderB}, {"s", "lost"}};

  const auto disputes = protocol::ParseDisputes({first, second, broken});
  if (disputes.size() != 1 || disputes[0].status != protocol::DisputeStatus::kInProgress ||
      disputes[0].created_at != 20) {
    std::cerr << "dispute revisions not merged\n";
    return false;
  }
  protocol::PublicDispute dispute;
  std::string error;
  if (protocol::DisputeFromTags(broken.tags, &dispute, &error) ||
      error != "Invalid dispute status") {
    std::cerr << "invalid dispute status accepted: " << error << "\n";
    return false;
  }
  return true;
}

bool TestFilter() {
  const auto filter = protocol::OrdersFilter("mostro", 1'000'000);
  const auto json = filter.ToJson();
  if (json["kinds"] != nlohmann::json::array({protocol::kKindMostroOrder}) ||
      json["authors"] != nlohmann::json::array({"mostro"}) ||
      json["#z"] != nlohmann::json::array({"order"}) ||
      json["since"] != 1'000'000 - protocol::kListWindowSeconds ||
      json["limit"] != protocol::kListLimit) {
    std::cerr << "unexpected orders filter: " << json.dump() << "\n";
    return false;
  }

  auto event = OrderEvent(kOrderA, "buy", "pending", "USD", 1'000'000);
  event.pubkey = "mostro";
  if (!filter.Matches(event)) {
    std::cerr << "filter rejected a matching order event\n";
    return false;
  }
  event.created_at = 1;
  if (filter.Matches(event)) {
    std::cerr << "filter accepted an event before since\n";
    return false;
  }
  if (protocol::DisputesFilter("mostro", 1'000'000).Matches(event)) {
    std::cerr << "disputes filter accepted an order event\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!TestOrderFromTags() || !TestParseOrders() || !TestParseDisputes() || !TestFilter()) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "tags_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  std::cout << "tags_tests: OK\n";
  return EXIT_SUCCESS;
}
