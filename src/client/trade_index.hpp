#pragma once

#include <cstdint>
#include <mutex>

#include "client/store.hpp"

namespace mostrix::client {

// Sole owner of the per-identity trade index counter. Index 0 belongs to the
// identity key, so the first trade gets index 1.
class TradeIndexAllocator {
 public:
  explicit TradeIndexAllocator(Store& store) : store_(store) {}

  // Reserves and persists the next index. Throws std::runtime_error when the
  // new value cannot be stored; the counter is left unchanged in that case.
  std::int64_t Next();

  // Last index handed out, 0 before the first trade.
  std::int64_t Peek() const;

 private:
  Store& store_;
  mutable std::mutex mutex_;
};

}  // namespace mostrix::client
