#ifndef CM_CLIENT_EVENT_QUEUE_H
#define CM_CLIENT_EVENT_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

#include "engine_types.h"

namespace cm::client {

enum class PushStatus : std::uint8_t { kOk = 0, kFull = 1, kClosed = 2 };

// Bounded many-producer, single-consumer queue of client events.
class EventQueue {
 public:
  explicit EventQueue(std::size_t capacity = 256);

  EventQueue(const EventQueue&) = delete;
  EventQueue& operator=(const EventQueue&) = delete;

  // Never blocks; a full queue drops the event.
  PushStatus Push(ClientEvent event);

  // Waits up to `wait` for an event. Returns false on timeout or when the
  // queue is closed and drained.
  bool Pop(ClientEvent& out, std::chrono::milliseconds wait);

  // Consumer gone; subsequent pushes report kClosed.
  void Close();
  bool closed() const;

  std::size_t size() const;
  std::size_t capacity() const { return capacity_; }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<ClientEvent> events_;
  std::size_t capacity_{0};
  bool closed_{false};
};

// Pushes and logs a drop on a full queue. Returns false once the consumer
// has gone away.
bool Publish(EventQueue& queue, ClientEvent event);

}  // namespace cm::client

#endif  // CM_CLIENT_EVENT_QUEUE_H
