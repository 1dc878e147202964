#include "event_queue.h"

#include <utility>

#include "platform_log.h"

namespace cm::client {

EventQueue::EventQueue(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

PushStatus EventQueue::Push(ClientEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return PushStatus::kClosed;
    }
    if (events_.size() >= capacity_) {
      return PushStatus::kFull;
    }
    events_.push_back(std::move(event));
  }
  cv_.notify_one();
  return PushStatus::kOk;
}

bool EventQueue::Pop(ClientEvent& out, std::chrono::milliseconds wait) {
  const auto deadline = std::chrono::steady_clock::now() + wait;
  std::unique_lock<std::mutex> lock(mutex_);
  const auto ready = [&]() { return !events_.empty() || closed_; };
  if (!ready() && wait.count() > 0) {
    cv_.wait_until(lock, deadline, ready);
  }
  if (events_.empty()) {
    return false;
  }
  out = std::move(events_.front());
  events_.pop_front();
  return true;
}

void EventQueue::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool EventQueue::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::size_t EventQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

bool Publish(EventQueue& queue, ClientEvent event) {
  const std::size_t kind = event.index();
  switch (queue.Push(std::move(event))) {
    case PushStatus::kOk:
      return true;
    case PushStatus::kFull:
      platform::log::Log(platform::log::Level::kWarn, "events",
                         "event queue full, dropping event",
                         {{"kind", std::to_string(kind)}});
      return true;
    case PushStatus::kClosed:
      return false;
  }
  return false;
}

}  // namespace cm::client
