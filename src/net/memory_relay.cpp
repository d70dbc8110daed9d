#include "net/memory_relay.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>

#include "nlohmann/json.hpp"
#include "protocol/event.hpp"
#include "util/atomic_file.hpp"
#include "util/logging.hpp"

namespace mostrix::net {

bool MemoryRelay::Publish(const protocol::Event& event, std::string* error) {
  if (event.id.empty() || event.sig.empty()) {
    if (error) *error = "refusing to publish an unsigned event";
    return false;
  }
  std::vector<std::shared_ptr<Channel>> targets;
  PublishHook hook;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool duplicate = std::any_of(events_.begin(), events_.end(),
                                       [&](const protocol::Event& e) { return e.id == event.id; });
    if (duplicate) {
      return true;
    }
    events_.push_back(event);
    for (auto it = channels_.begin(); it != channels_.end();) {
      if (auto channel = it->lock()) {
        if (channel->filter.Matches(event)) {
          targets.push_back(std::move(channel));
        }
        ++it;
      } else {
        it = channels_.erase(it);
      }
    }
    hook = publish_hook_;
  }
  for (const auto& channel : targets) {
    {
      std::lock_guard<std::mutex> lock(channel->mutex);
      channel->queue.push_back(event);
    }
    channel->cv.notify_all();
  }
  if (hook) {
    hook(event);
  }
  return true;
}

bool MemoryRelay::Fetch(const protocol::Filter& filter, std::chrono::milliseconds /*timeout*/,
                        std::vector<protocol::Event>* events, std::string* error) {
  FetchHook hook;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++fetch_count_;
    hook = fetch_hook_;
  }
  if (hook) {
    hook(filter);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (fetch_failure_) {
    if (error) *error = *fetch_failure_;
    return false;
  }
  std::vector<protocol::Event> matched;
  for (const auto& event : events_) {
    if (filter.Matches(event)) {
      matched.push_back(event);
    }
  }
  std::stable_sort(matched.begin(), matched.end(),
                   [](const protocol::Event& a, const protocol::Event& b) {
                     return a.created_at > b.created_at;
                   });
  if (filter.limit() && matched.size() > *filter.limit()) {
    matched.resize(*filter.limit());
  }
  *events = std::move(matched);
  return true;
}

std::unique_ptr<Subscription> MemoryRelay::Subscribe(const protocol::Filter& filter) {
  auto channel = std::make_shared<Channel>();
  channel->filter = filter;
  std::lock_guard<std::mutex> lock(mutex_);
  channels_.push_back(channel);
  return std::make_unique<ChannelSubscription>(std::move(channel));
}

std::optional<protocol::Event> MemoryRelay::ChannelSubscription::Next(
    std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(channel_->mutex);
  if (!channel_->cv.wait_for(lock, timeout, [this] { return !channel_->queue.empty(); })) {
    return std::nullopt;
  }
  auto event = std::move(channel_->queue.front());
  channel_->queue.pop_front();
  return event;
}

void MemoryRelay::SetFetchFailure(std::optional<std::string> error) {
  std::lock_guard<std::mutex> lock(mutex_);
  fetch_failure_ = std::move(error);
}

void MemoryRelay::SetPublishHook(PublishHook hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  publish_hook_ = std::move(hook);
}

void MemoryRelay::SetFetchHook(FetchHook hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  fetch_hook_ = std::move(hook);
}

std::vector<protocol::Event> MemoryRelay::Events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::size_t MemoryRelay::FetchCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fetch_count_;
}

std::size_t LoadEventDump(const std::filesystem::path& path, MemoryRelay* relay) {
  std::vector<std::uint8_t> bytes;
  std::string error;
  if (!util::ReadFileBytes(path, &bytes, &error)) {
    throw std::runtime_error(error);
  }
  const auto json = nlohmann::json::parse(bytes.begin(), bytes.end(), nullptr, false);
  if (json.is_discarded() || !json.is_array()) {
    throw std::runtime_error(path.string() + " is not a JSON array of events");
  }
  std::size_t loaded = 0;
  for (const auto& item : json) {
    protocol::Event event;
    if (!protocol::EventFromJson(item, &event, &error) || !relay->Publish(event, &error)) {
      util::LogWarn("skipping event in " + path.string() + ": " + error);
      continue;
    }
    ++loaded;
  }
  util::LogDebug("loaded " + std::to_string(loaded) + " events from " + path.string());
  return loaded;
}

}  // namespace mostrix::net
