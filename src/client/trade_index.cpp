#include "client/trade_index.hpp"

#include <stdexcept>
#include <string>

#include "util/logging.hpp"

namespace mostrix::client {

std::int64_t TradeIndexAllocator::Next() {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::int64_t next = store_.GetTradeIndex().value_or(0) + 1;
  std::string error;
  if (!store_.SetTradeIndex(next, &error)) {
    throw std::runtime_error("failed to persist trade index: " + error);
  }
  util::LogDebug("allocated trade index " + std::to_string(next));
  return next;
}

std::int64_t TradeIndexAllocator::Peek() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_.GetTradeIndex().value_or(0);
}

}  // namespace mostrix::client
