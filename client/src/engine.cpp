#include "engine.h"

#include <chrono>
#include <exception>
#include <utility>
#include <variant>

#include <boost/asio/post.hpp>
#include <boost/asio/spawn.hpp>

#include "platform_log.h"

namespace cm::client {

namespace {
constexpr const char* kTag = "engine";
constexpr auto kShutdownGrace = std::chrono::seconds(5);
constexpr char kOffline[] = "engine offline";
constexpr char kNoConnection[] = "no active connection";
}  // namespace

CommandQueue::CommandQueue(boost::asio::io_context& io)
    : io_(io),
      signal_(std::make_unique<boost::asio::steady_timer>(
          io, boost::asio::steady_timer::time_point::max())) {}

bool CommandQueue::Push(EngineCommand command) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    items_.push_back(std::move(command));
  }
  Wake();
  return true;
}

void CommandQueue::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
  }
  Wake();
}

void CommandQueue::Wake() {
  auto self = shared_from_this();
  boost::asio::post(io_, [self]() {
    if (self->signal_) {
      self->signal_->cancel();
    }
  });
}

bool CommandQueue::Pop(EngineCommand& out, Yield yield) {
  for (;;) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!items_.empty()) {
        out = std::move(items_.front());
        items_.pop_front();
        return true;
      }
      if (closed_) {
        return false;
      }
    }
    boost::system::error_code ec;
    signal_->async_wait(yield[ec]);
  }
}

void CommandQueue::ReleaseSignal() {
  std::lock_guard<std::mutex> lock(mutex_);
  signal_.reset();
}

EngineHandle::EngineHandle(std::shared_ptr<CommandQueue> queue)
    : queue_(std::move(queue)) {}

bool EngineHandle::Send(EngineCommand command, std::string& error) const {
  if (!queue_ || !queue_->Push(std::move(command))) {
    error = kOffline;
    return false;
  }
  return true;
}

Engine::Engine(std::size_t event_capacity,
               std::shared_ptr<Connector> connector)
    : io_(std::make_unique<boost::asio::io_context>()),
      events_(std::make_shared<EventQueue>(event_capacity)),
      commands_(std::make_shared<CommandQueue>(*io_)),
      connector_(connector ? std::move(connector)
                           : std::make_shared<NetworkConnector>()),
      stopped_future_(stopped_.get_future()) {
  boost::asio::spawn(*io_, [this](Yield yield) { RunActor(yield); });
  thread_ = std::thread([this]() {
    try {
      io_->run();
    } catch (const std::exception& e) {
      platform::log::Log(platform::log::Level::kError, kTag,
                         "runtime stopped", {{"error", e.what()}});
    }
    stopped_.set_value();
  });
}

Engine::~Engine() { Shutdown(); }

EngineHandle Engine::Handle() const { return EngineHandle(commands_); }

void Engine::Shutdown() {
  if (!thread_.joinable()) {
    return;
  }
  commands_->Close();
  if (stopped_future_.wait_for(kShutdownGrace) != std::future_status::ready) {
    platform::log::Log(platform::log::Level::kWarn, kTag,
                       "runtime did not drain, stopping");
    io_->stop();
  }
  thread_.join();
  // Destroying the context unwinds suspended coroutines; the queues and the
  // connector they reference are still alive here.
  commands_->ReleaseSignal();
  io_.reset();
}

void Engine::RunActor(Yield yield) {
  Slot slot;
  EngineCommand command;
  while (commands_->Pop(command, yield)) {
    try {
      std::visit([&](auto& cmd) { OnCommand(cmd, slot, yield); }, command);
    } catch (const std::exception& e) {
      platform::log::Log(platform::log::Level::kError, kTag,
                         "command failed", {{"error", e.what()}});
      EmitError(std::string("internal error: ") + e.what());
    }
  }
  if (slot) {
    slot->Close();
    slot.reset();
  }
}

void Engine::EmitError(std::string detail) {
  Publish(*events_, ErrorEvent{std::move(detail)});
}

void Engine::OnCommand(ConnectCommand& command, Slot& slot, Yield yield) {
  if (slot) {
    EmitError("already connected");
    return;
  }
  std::unique_ptr<ActiveConnection> conn;
  ConnectError error;
  if (!connector_->Connect(*io_, command.profile, events_, yield, conn,
                           error)) {
    const std::string detail = error.ToString();
    platform::log::Log(platform::log::Level::kError, kTag, "connect failed",
                       {{"error", detail}});
    EmitError(detail);
    return;
  }
  Publish(*events_,
          ConnectedEvent{conn->session_id(), conn->pairing_required()});
  slot = std::move(conn);
}

void Engine::OnCommand(DisconnectCommand&, Slot& slot, Yield) {
  if (!slot) {
    EmitError(kNoConnection);
    return;
  }
  slot->Close();
  slot.reset();
  Publish(*events_, DisconnectedEvent{"disconnected"});
}

void Engine::OnCommand(JoinCommand& command, Slot& slot, Yield yield) {
  if (!slot) {
    EmitError(kNoConnection);
    return;
  }
  std::string error;
  if (!slot->SendJoin(command.channel_id, command.members, command.relay,
                      yield, error)) {
    EmitError(error);
  }
}

void Engine::OnCommand(SendMessageCommand& command, Slot& slot, Yield yield) {
  if (!slot) {
    EmitError(kNoConnection);
    return;
  }
  std::string error;
  if (!slot->SendMessage(command.channel_id, command.body, yield, error)) {
    EmitError(error);
  }
}

void Engine::OnCommand(LeaveCommand& command, Slot& slot, Yield yield) {
  if (!slot) {
    EmitError(kNoConnection);
    return;
  }
  std::string error;
  if (!slot->SendLeave(command.channel_id, yield, error)) {
    EmitError(error);
  }
}

void Engine::OnCommand(PresenceCommand& command, Slot& slot, Yield yield) {
  if (!slot) {
    EmitError(kNoConnection);
    return;
  }
  std::string error;
  if (!slot->SendPresence(command.state, yield, error)) {
    EmitError(error);
  }
}

}  // namespace cm::client
