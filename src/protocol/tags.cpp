#include "protocol/tags.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <unordered_map>

#include "util/logging.hpp"

namespace mostrix::protocol {

namespace {

std::optional<std::int64_t> ParseInteger(std::string_view text) {
  std::int64_t value = 0;
  const auto* end = text.data() + text.size();
  const auto result = std::from_chars(text.data(), end, value);
  if (result.ec != std::errc() || result.ptr != end) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

bool IsUuid(std::string_view text) {
  if (text.size() != 36) {
    return false;
  }
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (text[i] != '-') {
        return false;
      }
    } else if (!std::isxdigit(static_cast<unsigned char>(text[i]))) {
      return false;
    }
  }
  return true;
}

SmallOrder OrderFromTags(const Tags& tags) {
  SmallOrder order;
  for (const auto& tag : tags) {
    if (tag.empty()) {
      continue;
    }
    const std::string& key = tag[0];
    const std::string value = tag.size() > 1 ? tag[1] : std::string{};
    if (key == "d") {
      order.id = IsUuid(value) ? std::optional<std::string>(value) : std::nullopt;
    } else if (key == "k") {
      order.kind = ParseOrderKind(value);
    } else if (key == "f") {
      order.fiat_code = value;
    } else if (key == "s") {
      order.status = ParseStatus(value).value_or(Status::kPending);
    } else if (key == "amt") {
      order.amount = ParseInteger(value).value_or(0);
    } else if (key == "fa") {
      if (value.find('.') != std::string::npos) {
        continue;
      }
      if (tag.size() > 2) {
        order.min_amount = ParseInteger(value);
        order.max_amount = ParseInteger(tag[2]);
      } else {
        order.fiat_amount = ParseInteger(value).value_or(0);
      }
    } else if (key == "pm") {
      std::string joined;
      for (std::size_t i = 1; i < tag.size(); ++i) {
        if (i > 1) {
          joined += ',';
        }
        joined += tag[i];
      }
      order.payment_method = std::move(joined);
    } else if (key == "premium") {
      order.premium = ParseInteger(value).value_or(0);
    }
  }
  return order;
}

bool DisputeFromTags(const Tags& tags, PublicDispute* dispute, std::string* error) {
  PublicDispute parsed;
  for (const auto& tag : tags) {
    if (tag.size() < 2) {
      continue;
    }
    if (tag[0] == "d") {
      if (!IsUuid(tag[1])) {
        if (error) *error = "Invalid dispute id";
        return false;
      }
      parsed.id = tag[1];
    } else if (tag[0] == "s") {
      const auto status = ParseDisputeStatus(tag[1]);
      if (!status) {
        if (error) *error = "Invalid dispute status";
        return false;
      }
      parsed.status = *status;
    }
  }
  *dispute = std::move(parsed);
  return true;
}

std::vector<SmallOrder> ParseOrders(const std::vector<Event>& events,
                                    const OrderListFilter& filter) {
  std::unordered_map<std::string, SmallOrder> latest_by_id;
  for (const auto& event : events) {
    SmallOrder order = OrderFromTags(event.tags);
    if (!order.id) {
      util::LogDebug("Order ID is none");
      continue;
    }
    if (!order.kind) {
      util::LogDebug("Order kind is none");
      continue;
    }
    order.created_at = event.created_at;
    auto it = latest_by_id.find(*order.id);
    if (it == latest_by_id.end()) {
      latest_by_id.emplace(*order.id, std::move(order));
    } else if (order.created_at.value_or(0) > it->second.created_at.value_or(0)) {
      it->second = std::move(order);
    }
  }

  std::vector<SmallOrder> requested;
  for (auto& [id, order] : latest_by_id) {
    if (filter.status && order.status != filter.status) {
      continue;
    }
    if (!filter.currencies.empty() &&
        std::find(filter.currencies.begin(), filter.currencies.end(), order.fiat_code) ==
            filter.currencies.end()) {
      continue;
    }
    if (filter.kind && order.kind != filter.kind) {
      continue;
    }
    requested.push_back(std::move(order));
  }
  std::sort(requested.begin(), requested.end(), [](const SmallOrder& a, const SmallOrder& b) {
    return a.created_at.value_or(0) > b.created_at.value_or(0);
  });
  return requested;
}

std::vector<PublicDispute> ParseDisputes(const std::vector<Event>& events) {
  std::unordered_map<std::string, PublicDispute> latest_by_id;
  for (const auto& event : events) {
    PublicDispute dispute;
    std::string error;
    if (!DisputeFromTags(event.tags, &dispute, &error)) {
      util::LogWarn("Failed to parse dispute from tags: " + error);
      continue;
    }
    dispute.created_at = event.created_at;
    auto it = latest_by_id.find(dispute.id);
    if (it == latest_by_id.end()) {
      latest_by_id.emplace(dispute.id, std::move(dispute));
    } else if (dispute.created_at > it->second.created_at) {
      it->second = std::move(dispute);
    }
  }
  std::vector<PublicDispute> disputes;
  disputes.reserve(latest_by_id.size());
  for (auto& [id, dispute] : latest_by_id) {
    disputes.push_back(std::move(dispute));
  }
  std::sort(disputes.begin(), disputes.end(), [](const PublicDispute& a, const PublicDispute& b) {
    return a.created_at > b.created_at;
  });
  return disputes;
}

Filter OrdersFilter(const std::string& mostro_pubkey, std::int64_t now) {
  return Filter()
      .Author(mostro_pubkey)
      .Kind(kKindMostroOrder)
      .CustomTag('z', "order")
      .Since(now - kListWindowSeconds)
      .Limit(kListLimit);
}

Filter DisputesFilter(const std::string& mostro_pubkey, std::int64_t now) {
  return Filter()
      .Author(mostro_pubkey)
      .Kind(kKindMostroOrder)
      .CustomTag('y', "dispute")
      .Since(now - kListWindowSeconds)
      .Limit(kListLimit);
}

}  // namespace mostrix::protocol
