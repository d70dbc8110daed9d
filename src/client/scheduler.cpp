#include "client/scheduler.hpp"

#include <exception>
#include <utility>

#include "util/logging.hpp"

namespace mostrix::client {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, Work work)
    : name_(std::move(name)), interval_(interval), work_(std::move(work)) {}

PeriodicTask::~PeriodicTask() {
  Stop();
}

void PeriodicTask::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::jthread([this](std::stop_token stop) { Loop(stop); });
}

void PeriodicTask::Stop() {
  if (!thread_.joinable()) {
    return;
  }
  thread_.request_stop();
  cv_.notify_all();
  thread_.join();
  running_.store(false);
}

void PeriodicTask::Wake() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    wake_requested_ = true;
  }
  cv_.notify_all();
}

void PeriodicTask::Loop(std::stop_token stop) {
  util::LogDebug("[" + name_ + "] started");
  while (!stop.stop_requested()) {
    try {
      work_();
    } catch (const std::exception& ex) {
      util::LogWarn("[" + name_ + "] tick failed: " + ex.what());
    }
    ticks_.fetch_add(1);
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, stop, interval_, [this] { return wake_requested_; });
    wake_requested_ = false;
  }
  util::LogDebug("[" + name_ + "] stopped");
}

}  // namespace mostrix::client
