#ifndef CM_CLIENT_HANDSHAKE_H
#define CM_CLIENT_HANDSHAKE_H

#include <cstdint>
#include <string>
#include <vector>

#include "connect_error.h"
#include "event_queue.h"
#include "noise_handshake.h"
#include "profile.h"
#include "stream_channel.h"

namespace cm::client {

constexpr char kClientAgent[] = "commucat-cli/0.1";
constexpr char kSessionUnknown[] = "unknown";

// Everything validated from the profile before any network I/O.
struct HandshakeSetup {
  NoiseConfig noise;
  std::string pattern_label;
  std::string device_id;
  std::string client_static_hex;
};

bool PrepareHandshake(const Profile& profile, HandshakeSetup& out,
                      ConnectError& error);

struct HandshakeResult {
  std::string session_id;
  bool pairing_required{false};
  std::uint64_t next_sequence{3};
  // Bytes read past the completing Ack; they seed the inbound reader.
  std::vector<std::uint8_t> leftover;
  bool profile_updated{false};
};

// Hello (seq 1) -> server Auth -> Auth (seq 2) -> Ack {"handshake":"ok"}.
// Frames that do not advance the exchange are forwarded as Frame events;
// an Error frame rejects the attempt. Learned identity fields are merged
// into `profile` and saved once to its storage path.
bool RunHandshake(const HandshakeSetup& setup, Profile& profile,
                  SendChannel& send, RecvChannel& recv, EventQueue& events,
                  Yield yield, HandshakeResult& out, ConnectError& error);

}  // namespace cm::client

#endif  // CM_CLIENT_HANDSHAKE_H
