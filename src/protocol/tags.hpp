#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "protocol/event.hpp"
#include "protocol/filter.hpp"
#include "protocol/message.hpp"

namespace mostrix::protocol {

// Public dispute announcement (kind 38383, y=dispute).
struct PublicDispute {
  std::string id;
  DisputeStatus status{DisputeStatus::kInitiated};
  std::int64_t created_at{0};
};

constexpr std::size_t kListLimit = 50;
constexpr std::int64_t kListWindowSeconds = 7 * 24 * 60 * 60;

bool IsUuid(std::string_view text);

// Order fields from NIP-33 tags. Unparsable values are left unset; an
// unknown status falls back to pending. Never fails.
SmallOrder OrderFromTags(const Tags& tags);

// Dispute id and status from tags; an invalid id or status is an error.
bool DisputeFromTags(const Tags& tags, PublicDispute* dispute, std::string* error = nullptr);

struct OrderListFilter {
  std::optional<Status> status;
  // Empty means every currency.
  std::vector<std::string> currencies;
  std::optional<OrderKind> kind;
};

// Latest revision per order id, newest first. Events without an id or kind
// are skipped.
std::vector<SmallOrder> ParseOrders(const std::vector<Event>& events,
                                    const OrderListFilter& filter = {});
// Latest revision per dispute id, newest first.
std::vector<PublicDispute> ParseDisputes(const std::vector<Event>& events);

// Public listings published by the exchange daemon over the last week.
Filter OrdersFilter(const std::string& mostro_pubkey, std::int64_t now);
Filter DisputesFilter(const std::string& mostro_pubkey, std::int64_t now);

}  // namespace mostrix::protocol
