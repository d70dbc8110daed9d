#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "protocol/event.hpp"
#include "protocol/filter.hpp"

namespace mostrix::net {

// Default window for one-shot relay queries and request/response waits.
constexpr std::chrono::seconds kFetchEventsTimeout{15};

// Live stream of events published after the subscription was opened.
class Subscription {
 public:
  virtual ~Subscription() = default;

  // Next matching event, or nullopt once `timeout` elapses with nothing new.
  virtual std::optional<protocol::Event> Next(std::chrono::milliseconds timeout) = 0;
};

// Publish/subscribe access to a pool of relays.
class RelayClient {
 public:
  virtual ~RelayClient() = default;

  virtual bool Publish(const protocol::Event& event, std::string* error = nullptr) = 0;

  // Stored events matching `filter`, at most `filter.limit()` of the newest.
  virtual bool Fetch(const protocol::Filter& filter, std::chrono::milliseconds timeout,
                     std::vector<protocol::Event>* events, std::string* error = nullptr) = 0;

  virtual std::unique_ptr<Subscription> Subscribe(const protocol::Filter& filter) = 0;
};

}  // namespace mostrix::net
