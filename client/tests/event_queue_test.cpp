#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <variant>

#include "event_queue.h"

int main() {
  using cm::client::ClientEvent;
  using cm::client::EventQueue;
  using cm::client::LogEvent;
  using cm::client::PushStatus;

  EventQueue queue(2);
  assert(queue.capacity() == 2);
  assert(queue.Push(LogEvent{"a"}) == PushStatus::kOk);
  assert(queue.Push(LogEvent{"b"}) == PushStatus::kOk);
  assert(queue.Push(LogEvent{"c"}) == PushStatus::kFull);
  // Drops are not fatal to the producer.
  assert(cm::client::Publish(queue, LogEvent{"d"}));
  assert(queue.size() == 2);

  ClientEvent event;
  assert(queue.Pop(event, std::chrono::milliseconds(0)));
  assert(std::get<LogEvent>(event).line == "a");
  assert(cm::client::DescribeEvent(event) == "log: a");
  assert(queue.Pop(event, std::chrono::milliseconds(0)));
  assert(std::get<LogEvent>(event).line == "b");

  // Timeout on an empty queue.
  const auto start = std::chrono::steady_clock::now();
  assert(!queue.Pop(event, std::chrono::milliseconds(30)));
  assert(std::chrono::steady_clock::now() - start >=
         std::chrono::milliseconds(25));

  // A waiting consumer is woken by a producer on another thread.
  std::thread producer([&queue]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    queue.Push(cm::client::ErrorEvent{"boom"});
  });
  assert(queue.Pop(event, std::chrono::seconds(5)));
  producer.join();
  assert(std::holds_alternative<cm::client::ErrorEvent>(event));

  // Closed: queued events drain, new ones are refused.
  assert(queue.Push(LogEvent{"last"}) == PushStatus::kOk);
  queue.Close();
  assert(queue.closed());
  assert(queue.Push(LogEvent{"late"}) == PushStatus::kClosed);
  assert(!cm::client::Publish(queue, LogEvent{"late"}));
  assert(queue.Pop(event, std::chrono::milliseconds(0)));
  assert(!queue.Pop(event, std::chrono::milliseconds(10)));
  return 0;
}
