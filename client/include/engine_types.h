#ifndef CM_CLIENT_ENGINE_TYPES_H
#define CM_CLIENT_ENGINE_TYPES_H

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "frame.h"
#include "profile.h"

namespace cm::client {

struct ConnectCommand {
  Profile profile;
};

struct DisconnectCommand {};

struct JoinCommand {
  std::uint64_t channel_id{0};
  std::vector<std::string> members;
  bool relay{false};
};

struct SendMessageCommand {
  std::uint64_t channel_id{0};
  std::vector<std::uint8_t> body;
};

struct LeaveCommand {
  std::uint64_t channel_id{0};
};

struct PresenceCommand {
  std::string state;
};

using EngineCommand =
    std::variant<ConnectCommand, DisconnectCommand, JoinCommand,
                 SendMessageCommand, LeaveCommand, PresenceCommand>;

struct ConnectedEvent {
  std::string session_id;
  bool pairing_required{false};
};

struct DisconnectedEvent {
  std::string reason;
};

struct FrameEvent {
  proto::Frame frame;
};

struct ErrorEvent {
  std::string detail;
};

struct LogEvent {
  std::string line;
};

using ClientEvent = std::variant<ConnectedEvent, DisconnectedEvent, FrameEvent,
                                 ErrorEvent, LogEvent>;

// One-line rendering used by the demo client and debug logs.
std::string DescribeEvent(const ClientEvent& event);

}  // namespace cm::client

#endif  // CM_CLIENT_ENGINE_TYPES_H
