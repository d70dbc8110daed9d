#pragma once

#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "net/relay.hpp"

namespace mostrix::net {

// In-process relay. Stores every published event and fans it out to open
// subscriptions. Used by tests and by the offline commands of mostrix-cli.
class MemoryRelay : public RelayClient {
 public:
  using PublishHook = std::function<void(const protocol::Event&)>;
  using FetchHook = std::function<void(const protocol::Filter&)>;

  bool Publish(const protocol::Event& event, std::string* error = nullptr) override;
  bool Fetch(const protocol::Filter& filter, std::chrono::milliseconds timeout,
             std::vector<protocol::Event>* events, std::string* error = nullptr) override;
  std::unique_ptr<Subscription> Subscribe(const protocol::Filter& filter) override;

  // While set, every Fetch fails with this message.
  void SetFetchFailure(std::optional<std::string> error);
  // Runs after an event is stored, outside the relay lock; may publish.
  void SetPublishHook(PublishHook hook);
  // Runs at the start of every Fetch, outside the relay lock; may block.
  void SetFetchHook(FetchHook hook);

  std::vector<protocol::Event> Events() const;
  std::size_t FetchCount() const;

 private:
  struct Channel {
    protocol::Filter filter;
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<protocol::Event> queue;
  };

  class ChannelSubscription : public Subscription {
   public:
    explicit ChannelSubscription(std::shared_ptr<Channel> channel) : channel_(std::move(channel)) {}
    std::optional<protocol::Event> Next(std::chrono::milliseconds timeout) override;

   private:
    std::shared_ptr<Channel> channel_;
  };

  mutable std::mutex mutex_;
  std::vector<protocol::Event> events_;
  std::vector<std::weak_ptr<Channel>> channels_;
  std::optional<std::string> fetch_failure_;
  PublishHook publish_hook_;
  FetchHook fetch_hook_;
  std::size_t fetch_count_{0};
};

// Publishes a JSON array of signed events, as saved from a relay, into
// `relay`. Entries that do not parse are skipped with a warning and events
// already present are ignored. Returns the number of entries accepted; an
// unreadable or malformed file throws std::runtime_error.
std::size_t LoadEventDump(const std::filesystem::path& path, MemoryRelay* relay);

}  // namespace mostrix::net
