#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <iterator>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace mostrix::client {

// Multi-producer queue through which background work hands results to the
// interactive loop. A bounded channel drops its oldest entry to make room, so
// a loop nobody drains cannot grow it without limit.
template <typename T>
class ResultChannel {
 public:
  // 0 means unbounded.
  explicit ResultChannel(std::size_t capacity = 0) : capacity_(capacity) {}

  // Returns false when an older entry was dropped.
  bool Push(T value) {
    bool kept_all = true;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (capacity_ != 0 && queue_.size() >= capacity_) {
        queue_.pop_front();
        kept_all = false;
      }
      queue_.push_back(std::move(value));
    }
    cv_.notify_one();
    return kept_all;
  }

  std::optional<T> TryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  std::optional<T> Pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  std::vector<T> Drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<T> values(std::make_move_iterator(queue_.begin()),
                          std::make_move_iterator(queue_.end()));
    queue_.clear();
    return values;
  }

  std::size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

 private:
  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> queue_;
};

// Runs `work` on its own thread immediately and then every `interval` until
// stopped. An exception thrown by `work` is logged and the loop continues.
class PeriodicTask {
 public:
  using Work = std::function<void()>;

  PeriodicTask(std::string name, std::chrono::milliseconds interval, Work work);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&) = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void Start();
  // Requests a stop and joins. Safe to call more than once.
  void Stop();
  // Runs the next tick now instead of waiting for the interval.
  void Wake();

  bool Running() const { return running_.load(); }
  std::uint64_t Ticks() const { return ticks_.load(); }

 private:
  void Loop(std::stop_token stop);

  std::string name_;
  std::chrono::milliseconds interval_;
  Work work_;
  std::mutex mutex_;
  std::condition_variable_any cv_;
  bool wake_requested_{false};
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> ticks_{0};
  std::jthread thread_;
};

}  // namespace mostrix::client
