#include <cassert>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>

#include "handshake.h"
#include "loopback_transport.h"

namespace {

using cm::client::ClientEvent;
using cm::client::ConnectError;
using cm::client::ConnectFailure;
using cm::client::EventQueue;
using cm::client::HandshakeResult;
using cm::client::HandshakeSetup;
using cm::client::Profile;
using cm::client::Yield;
using cm::client::testing::Control;
using cm::client::testing::LoopbackPeer;
using cm::client::testing::ServerRecord;
using cm::client::testing::ServerScript;
using cm::proto::FrameType;

struct Outcome {
  bool ok{false};
  HandshakeResult result;
  ConnectError error;
  std::vector<ClientEvent> events;
  ServerRecord record;
  Profile profile;
};

Outcome RunScenario(const ServerScript& script, Profile profile) {
  boost::asio::io_context io;
  EventQueue events(64);
  auto peer = std::make_shared<LoopbackPeer>(io, script);
  peer->Start();

  Outcome outcome;
  outcome.profile = std::move(profile);
  boost::asio::spawn(io, [&](Yield yield) {
    HandshakeSetup setup;
    const bool prepared =
        cm::client::PrepareHandshake(outcome.profile, setup, outcome.error);
    assert(prepared);
    auto send = peer->client_send();
    auto recv = peer->client_recv();
    outcome.ok = cm::client::RunHandshake(setup, outcome.profile, *send,
                                          *recv, events, yield,
                                          outcome.result, outcome.error);
    send->Finish();
  });
  io.run();

  outcome.record = peer->record();
  ClientEvent event;
  while (events.Pop(event, std::chrono::milliseconds(0))) {
    outcome.events.push_back(std::move(event));
  }
  return outcome;
}

std::vector<cm::proto::Frame> ForwardedFrames(const Outcome& outcome) {
  std::vector<cm::proto::Frame> frames;
  for (const auto& event : outcome.events) {
    if (const auto* f = std::get_if<cm::client::FrameEvent>(&event)) {
      frames.push_back(f->frame);
    }
  }
  return frames;
}

}  // namespace

int main() {
  const auto server = cm::client::testing::MakeServerKeys();

  // Plain XK handshake.
  {
    ServerScript script;
    script.server_static = server;
    const Profile profile = cm::client::testing::MakeProfile(server, "XK");
    const Outcome out = RunScenario(script, profile);
    assert(out.ok);
    assert(out.result.session_id == "sess-1");
    assert(!out.result.pairing_required);
    assert(out.result.next_sequence == 3);
    assert(out.result.leftover.empty());
    assert(!out.result.profile_updated);
    assert(out.record.hello_ok);
    assert(out.record.hello_sequence == 1);
    assert(out.record.auth_sequence == 2);
    assert(out.record.handshake_complete);
    assert(cm::common::BytesToHex(out.record.client_static.data(), 32) ==
           profile.public_key);
    assert(ForwardedFrames(out).empty());
    const auto* first = std::get_if<cm::client::LogEvent>(&out.events.front());
    assert(first && first->line == "handshake start for dev-test");
    const auto* last = std::get_if<cm::client::LogEvent>(&out.events.back());
    assert(last && last->line == "handshake ok: session sess-1");
  }

  // IK, pairing required, and a frame that arrived with the Ack.
  {
    ServerScript script;
    script.server_static = server;
    script.pairing_required = true;
    script.after_ack.push_back(Control(9, 1, FrameType::kPresence,
                                       {{"state", "away"}}));
    const Outcome out =
        RunScenario(script, cm::client::testing::MakeProfile(server, "ik"));
    assert(out.ok);
    assert(out.result.pairing_required);
    cm::client::FrameBuffer rest(out.result.leftover);
    cm::proto::Frame frame;
    std::string error;
    assert(rest.Next(frame, error) == cm::proto::DecodeStatus::kOk);
    assert(frame.channel_id == 9 && frame.type == FrameType::kPresence);
  }

  // Frames that do not advance the handshake are forwarded.
  {
    ServerScript script;
    script.server_static = server;
    script.before_auth.push_back(Control(0, 7, FrameType::kAck,
                                         {{"handshake", "pending"}}));
    script.before_auth.push_back(Control(4, 8, FrameType::kTyping,
                                         {{"user", "x"}}));
    const Outcome out =
        RunScenario(script, cm::client::testing::MakeProfile(server, "XK"));
    assert(out.ok);
    const auto frames = ForwardedFrames(out);
    assert(frames.size() == 2);
    assert(frames[0].type == FrameType::kAck);
    assert(frames[1].type == FrameType::kTyping);
  }

  // Rejection: the Error frame fails the attempt and is forwarded.
  {
    ServerScript script;
    script.server_static = server;
    script.reject = true;
    const Outcome out =
        RunScenario(script, cm::client::testing::MakeProfile(server, "XK"));
    assert(!out.ok);
    assert(out.error.kind == ConnectFailure::kRejected);
    assert(out.error.ToString() ==
           "server rejected connection: device revoked");
    const auto frames = ForwardedFrames(out);
    assert(frames.size() == 1 && frames[0].type == FrameType::kError);
  }

  // Payload without a session.
  {
    ServerScript script;
    script.server_static = server;
    script.payload = {{"user", {{"handle", "bob"}}}};
    const Outcome out =
        RunScenario(script, cm::client::testing::MakeProfile(server, "XK"));
    assert(!out.ok);
    assert(out.error.kind == ConnectFailure::kSessionMissing);
  }

  // No payload at all.
  {
    ServerScript script;
    script.server_static = server;
    script.payload = nullptr;
    const Outcome out =
        RunScenario(script, cm::client::testing::MakeProfile(server, "XK"));
    assert(out.ok);
    assert(out.result.session_id == cm::client::kSessionUnknown);
  }

  // Learned identity is written back to the profile file.
  {
    std::error_code ec;
    const auto dir =
        std::filesystem::temp_directory_path(ec) / "cm_handshake_test";
    std::filesystem::remove_all(dir, ec);
    Profile profile = cm::client::testing::MakeProfile(server, "XK");
    profile.storage_path = (dir / "client.ini").string();

    ServerScript script;
    script.server_static = server;
    script.payload = {{"session", "sess-9"},
                      {"user", {{"id", "u-1"}, {"handle", "bob"}}}};
    const Outcome out = RunScenario(script, profile);
    assert(out.ok);
    assert(out.result.profile_updated);
    assert(out.profile.user_handle == "bob");

    Profile saved;
    std::string error;
    assert(cm::client::LoadProfile(profile.storage_path, saved, error));
    assert(saved.user_id == "u-1");
    assert(saved.user_handle == "bob");
    assert(saved.device_id == "dev-test");
    std::filesystem::remove_all(dir, ec);
  }

  // Server closing before the Ack.
  {
    ServerScript script;
    script.server_static = cm::client::testing::MakeServerKeys();
    const Outcome out =
        RunScenario(script, cm::client::testing::MakeProfile(server, "XK"));
    assert(!out.ok);
    assert(out.error.kind == ConnectFailure::kPeerClosed);
  }

  // Configuration failures.
  {
    HandshakeSetup setup;
    ConnectError error;
    Profile profile = cm::client::testing::MakeProfile(server, "XK");
    profile.server_static.clear();
    assert(!cm::client::PrepareHandshake(profile, setup, error));
    assert(error.kind == ConnectFailure::kMissingRemoteStatic);
    assert(cm::client::IsConfigurationFailure(error.kind));

    profile = cm::client::testing::MakeProfile(server, "NN");
    assert(!cm::client::PrepareHandshake(profile, setup, error));
    assert(error.kind == ConnectFailure::kUnsupportedPattern);

    profile = cm::client::testing::MakeProfile(server, "XK");
    profile.public_key = std::string(64, '0');
    assert(!cm::client::PrepareHandshake(profile, setup, error));
    assert(error.kind == ConnectFailure::kInvalidKey);
  }
  return 0;
}
