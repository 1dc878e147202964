#ifndef CM_CLIENT_ENGINE_H
#define CM_CLIENT_ENGINE_H

#include <cstddef>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "active_connection.h"
#include "connector.h"
#include "engine_types.h"
#include "event_queue.h"

namespace cm::client {

// Unbounded many-producer queue drained by the actor coroutine.
class CommandQueue : public std::enable_shared_from_this<CommandQueue> {
 public:
  explicit CommandQueue(boost::asio::io_context& io);

  // Any thread. False once closed.
  bool Push(EngineCommand command);
  // Any thread. Commands already queued are still delivered.
  void Close();

  // io thread only. False when closed and drained.
  bool Pop(EngineCommand& out, Yield yield);

  // Called once the runtime thread has exited, before the io_context is
  // destroyed. Handles may keep the queue alive past that point.
  void ReleaseSignal();

 private:
  void Wake();

  boost::asio::io_context& io_;
  std::mutex mutex_;
  std::deque<EngineCommand> items_;
  bool closed_{false};
  std::unique_ptr<boost::asio::steady_timer> signal_;
};

class EngineHandle {
 public:
  EngineHandle() = default;

  // Fails with "engine offline" once the actor has stopped accepting work.
  bool Send(EngineCommand command, std::string& error) const;

 private:
  friend class Engine;
  explicit EngineHandle(std::shared_ptr<CommandQueue> queue);

  std::shared_ptr<CommandQueue> queue_;
};

// Owns the runtime thread and the actor that serializes commands against
// at most one ActiveConnection.
class Engine {
 public:
  explicit Engine(std::size_t event_capacity = 256,
                  std::shared_ptr<Connector> connector = nullptr);
  ~Engine();

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  EngineHandle Handle() const;
  EventQueue& Events() { return *events_; }

  // Closes the command queue and joins the runtime thread. Coroutines still
  // suspended after the grace period are unwound before this returns.
  // Idempotent.
  void Shutdown();

 private:
  using Slot = std::unique_ptr<ActiveConnection>;

  void RunActor(Yield yield);
  void OnCommand(ConnectCommand& command, Slot& slot, Yield yield);
  void OnCommand(DisconnectCommand& command, Slot& slot, Yield yield);
  void OnCommand(JoinCommand& command, Slot& slot, Yield yield);
  void OnCommand(SendMessageCommand& command, Slot& slot, Yield yield);
  void OnCommand(LeaveCommand& command, Slot& slot, Yield yield);
  void OnCommand(PresenceCommand& command, Slot& slot, Yield yield);
  void EmitError(std::string detail);

  std::unique_ptr<boost::asio::io_context> io_;
  std::shared_ptr<EventQueue> events_;
  std::shared_ptr<CommandQueue> commands_;
  std::shared_ptr<Connector> connector_;
  std::promise<void> stopped_;
  std::future<void> stopped_future_;
  std::thread thread_;
};

}  // namespace cm::client

#endif  // CM_CLIENT_ENGINE_H
