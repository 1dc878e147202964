#include "handshake.h"

#include <utility>

#include <nlohmann/json.hpp>

#include "frame_io.h"
#include "hex_utils.h"
#include "platform_log.h"

namespace cm::client {

namespace {
constexpr const char* kTag = "handshake";
constexpr std::uint64_t kHelloSequence = 1;
constexpr std::uint64_t kAuthSequence = 2;
constexpr std::uint64_t kFirstAppSequence = 3;

proto::Frame ControlFrame(std::uint64_t channel_id, std::uint64_t sequence,
                          proto::FrameType type, nlohmann::json properties) {
  proto::Frame frame;
  frame.channel_id = channel_id;
  frame.sequence = sequence;
  frame.type = type;
  frame.payload = proto::ControlEnvelope{std::move(properties)};
  return frame;
}

bool IsHandshakeAck(const proto::Frame& frame) {
  const nlohmann::json* props = proto::ControlProperties(frame);
  if (!props) {
    return false;
  }
  const auto it = props->find("handshake");
  return it != props->end() && it->is_string() &&
         it->get<std::string>() == "ok";
}

std::string RejectionDetail(const proto::Frame& frame) {
  const nlohmann::json* props = proto::ControlProperties(frame);
  if (!props) {
    return "server error frame";
  }
  for (const char* key : {"message", "reason", "error"}) {
    const auto it = props->find(key);
    if (it != props->end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return props->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Returns true when any field changed.
bool MergeUser(const nlohmann::json& payload, Profile& profile) {
  const auto user = payload.find("user");
  if (user == payload.end() || !user->is_object()) {
    return false;
  }
  bool changed = false;
  const auto merge = [&](const char* key, std::string& field) {
    const auto it = user->find(key);
    if (it == user->end() || !it->is_string()) {
      return;
    }
    std::string value = it->get<std::string>();
    if (value != field) {
      field = std::move(value);
      changed = true;
    }
  };
  merge("id", profile.user_id);
  merge("handle", profile.user_handle);
  merge("display_name", profile.user_display_name);
  merge("avatar_url", profile.user_avatar_url);
  return changed;
}

class HandshakeReader {
 public:
  HandshakeReader(RecvChannel& recv, Yield yield)
      : recv_(recv), yield_(yield) {}

  bool Next(proto::Frame& out, ConnectError& error) {
    for (;;) {
      std::string detail;
      switch (buffer_.Next(out, detail)) {
        case proto::DecodeStatus::kOk:
          return true;
        case proto::DecodeStatus::kError:
          error = MakeConnectError(ConnectFailure::kDecodeFailed, detail);
          return false;
        case proto::DecodeStatus::kIncomplete:
          break;
      }
      std::vector<std::uint8_t> chunk;
      switch (recv_.Read(chunk, yield_, detail)) {
        case ReadStatus::kData:
          buffer_.Append(chunk);
          break;
        case ReadStatus::kEnd:
          error = MakeConnectError(ConnectFailure::kPeerClosed,
                                   "server closed during handshake");
          return false;
        case ReadStatus::kError:
          error = MakeConnectError(ConnectFailure::kReadFailed, detail);
          return false;
        case ReadStatus::kCancelled:
          error = MakeConnectError(ConnectFailure::kReadFailed, "cancelled");
          return false;
      }
    }
  }

  std::vector<std::uint8_t> TakeRemaining() { return buffer_.TakeRemaining(); }

 private:
  RecvChannel& recv_;
  Yield yield_;
  FrameBuffer buffer_;
};
}  // namespace

bool PrepareHandshake(const Profile& profile, HandshakeSetup& out,
                      ConnectError& error) {
  out = HandshakeSetup{};
  NoisePattern pattern = NoisePattern::kXK;
  if (!ParseNoisePattern(profile.noise_pattern, pattern)) {
    error = MakeConnectError(ConnectFailure::kUnsupportedPattern,
                             profile.noise_pattern);
    return false;
  }

  std::string detail;
  if (!profile.DeviceKeyPair(out.noise.local_static, detail)) {
    error = MakeConnectError(ConnectFailure::kInvalidKey, detail);
    return false;
  }
  Key32 derived{};
  DeriveNoisePublicKey(out.noise.local_static.private_key, derived);
  if (derived != out.noise.local_static.public_key) {
    error = MakeConnectError(ConnectFailure::kInvalidKey,
                             "device public_key does not match private_key");
    return false;
  }

  if (PatternRequiresRemoteStatic(pattern)) {
    if (profile.server_static.empty()) {
      error = MakeConnectError(
          ConnectFailure::kMissingRemoteStatic,
          std::string("server_static required for ") +
              NoisePatternLabel(pattern));
      return false;
    }
    if (!common::HexToKey32(profile.server_static, out.noise.remote_static,
                            detail)) {
      error = MakeConnectError(ConnectFailure::kInvalidKey,
                               "server_static: " + detail);
      return false;
    }
    out.noise.has_remote_static = true;
  }

  out.noise.pattern = pattern;
  out.noise.role = NoiseRole::kInitiator;
  out.noise.prologue.assign(profile.prologue.begin(), profile.prologue.end());
  out.pattern_label = NoisePatternLabel(pattern);
  out.device_id = profile.device_id;
  out.client_static_hex = profile.public_key;
  return true;
}

bool RunHandshake(const HandshakeSetup& setup, Profile& profile,
                  SendChannel& send, RecvChannel& recv, EventQueue& events,
                  Yield yield, HandshakeResult& out, ConnectError& error) {
  out = HandshakeResult{};
  std::string detail;
  NoiseHandshake noise;
  if (!noise.Initialize(setup.noise, detail)) {
    error = MakeConnectError(ConnectFailure::kHandshakeFailed, detail);
    return false;
  }
  std::vector<std::uint8_t> message;
  if (!noise.WriteMessage({}, message, detail)) {
    error = MakeConnectError(ConnectFailure::kHandshakeFailed,
                             "message one: " + detail);
    return false;
  }

  nlohmann::json hello = {
      {"protocol_version", proto::kProtocolVersion},
      {"pattern", setup.pattern_label},
      {"device_id", setup.device_id},
      {"client_static", setup.client_static_hex},
      {"handshake", common::BytesToHex(message)},
      {"capabilities", nlohmann::json::array({"noise", "zstd"})},
  };
  if (!profile.user_handle.empty()) {
    nlohmann::json user = {{"handle", profile.user_handle}};
    if (!profile.user_id.empty()) user["id"] = profile.user_id;
    if (!profile.user_display_name.empty()) {
      user["display_name"] = profile.user_display_name;
    }
    if (!profile.user_avatar_url.empty()) {
      user["avatar_url"] = profile.user_avatar_url;
    }
    hello["user"] = std::move(user);
  }

  Publish(events, LogEvent{"handshake start for " + setup.device_id});
  if (!WriteFrame(send,
                  ControlFrame(0, kHelloSequence, proto::FrameType::kHello,
                               std::move(hello)),
                  yield, detail)) {
    error = MakeConnectError(ConnectFailure::kRequestFailed, detail);
    return false;
  }

  HandshakeReader reader(recv, yield);
  bool auth_done = false;
  bool saw_payload = false;
  bool profile_dirty = false;
  std::string session_id;
  for (;;) {
    proto::Frame frame;
    if (!reader.Next(frame, error)) {
      return false;
    }
    if (frame.type == proto::FrameType::kAuth && !auth_done) {
      const nlohmann::json* props = proto::ControlProperties(frame);
      std::string server_hex;
      if (props) {
        const auto hs = props->find("handshake");
        if (hs != props->end() && hs->is_string()) {
          server_hex = hs->get<std::string>();
        }
      }
      if (server_hex.empty()) {
        error = MakeConnectError(ConnectFailure::kHandshakeFailed,
                                 "auth frame missing handshake");
        return false;
      }
      std::vector<std::uint8_t> server_message;
      if (!common::HexToBytes(server_hex, server_message)) {
        error = MakeConnectError(ConnectFailure::kDecodeFailed,
                                 "auth handshake is not hex");
        return false;
      }
      std::vector<std::uint8_t> payload;
      if (!noise.ReadMessage(server_message, payload, detail)) {
        error = MakeConnectError(ConnectFailure::kHandshakeFailed,
                                 "message two: " + detail);
        return false;
      }
      if (!payload.empty()) {
        saw_payload = true;
        const nlohmann::json doc =
            nlohmann::json::parse(payload.begin(), payload.end(), nullptr,
                                  false);
        if (doc.is_discarded() || !doc.is_object()) {
          error = MakeConnectError(ConnectFailure::kDecodeFailed,
                                   "handshake payload is not a json object");
          return false;
        }
        const auto session = doc.find("session");
        if (session == doc.end() || !session->is_string()) {
          error = MakeConnectError(ConnectFailure::kSessionMissing,
                                   "handshake payload has no session");
          return false;
        }
        session_id = session->get<std::string>();
        if (MergeUser(doc, profile)) {
          profile_dirty = true;
        }
      }
      message.clear();
      if (!noise.WriteMessage({}, message, detail)) {
        error = MakeConnectError(ConnectFailure::kHandshakeFailed,
                                 "message three: " + detail);
        return false;
      }
      if (!WriteFrame(send,
                      ControlFrame(frame.channel_id, kAuthSequence,
                                   proto::FrameType::kAuth,
                                   {{"handshake", common::BytesToHex(message)}}),
                      yield, detail)) {
        error = MakeConnectError(ConnectFailure::kRequestFailed, detail);
        return false;
      }
      auth_done = true;
      continue;
    }

    if (frame.type == proto::FrameType::kAck && auth_done &&
        IsHandshakeAck(frame)) {
      const nlohmann::json* props = proto::ControlProperties(frame);
      const auto pairing = props->find("pairing_required");
      out.pairing_required =
          pairing != props->end() && pairing->is_boolean() &&
          pairing->get<bool>();
      break;
    }

    if (frame.type == proto::FrameType::kError) {
      const std::string reason = RejectionDetail(frame);
      Publish(events, FrameEvent{std::move(frame)});
      error = MakeConnectError(ConnectFailure::kRejected, reason);
      return false;
    }

    if (frame.type != proto::FrameType::kAck) {
      platform::log::Log(platform::log::Level::kWarn, kTag,
                         "unexpected frame during handshake",
                         {{"type", proto::FrameTypeName(frame.type)}});
    }
    Publish(events, FrameEvent{std::move(frame)});
  }

  out.session_id = saw_payload ? session_id : kSessionUnknown;
  out.next_sequence = kFirstAppSequence;
  out.leftover = reader.TakeRemaining();
  out.profile_updated = profile_dirty;
  Publish(events, LogEvent{"handshake ok: session " + out.session_id});

  if (profile_dirty) {
    if (profile.storage_path.empty()) {
      platform::log::Log(platform::log::Level::kInfo, kTag,
                         "learned identity not saved, profile has no path");
    } else if (!SaveProfile(profile, profile.storage_path, detail)) {
      platform::log::Log(platform::log::Level::kWarn, kTag,
                         "profile save failed", {{"error", detail}});
      Publish(events, LogEvent{"profile save failed: " + detail});
    }
  }
  return true;
}

}  // namespace cm::client
