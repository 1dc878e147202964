#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "engine.h"
#include "platform_log.h"
#include "profile.h"

namespace {

bool ParseChannel(const std::string& text, std::uint64_t& out) {
  if (text.empty()) {
    return false;
  }
  std::uint64_t value = 0;
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
    const std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
    if (value > (UINT64_MAX - digit) / 10) {
      return false;
    }
    value = value * 10 + digit;
  }
  out = value;
  return true;
}

void PrintUsage() {
  std::cout << "commands:\n"
               "  /connect\n"
               "  /join <channel> [member...] [--relay]\n"
               "  /leave <channel>\n"
               "  /msg <channel> <text>\n"
               "  /presence <state>\n"
               "  /disconnect\n"
               "  /quit\n";
}

// `/connect` re-reads the profile so identity saved by an earlier
// handshake is reused.
bool BuildCommand(const std::string& line, const std::string& profile_path,
                  cm::client::EngineCommand& out, std::string& error) {
  std::istringstream in(line);
  std::string verb;
  in >> verb;
  if (verb == "/connect") {
    cm::client::Profile profile;
    if (!cm::client::LoadProfile(profile_path, profile, error)) {
      return false;
    }
    out = cm::client::ConnectCommand{std::move(profile)};
    return true;
  }
  if (verb == "/disconnect") {
    out = cm::client::DisconnectCommand{};
    return true;
  }
  if (verb == "/presence") {
    cm::client::PresenceCommand cmd;
    in >> cmd.state;
    if (cmd.state.empty()) {
      error = "usage: /presence <state>";
      return false;
    }
    out = cmd;
    return true;
  }
  std::string channel_text;
  in >> channel_text;
  std::uint64_t channel = 0;
  if (verb == "/join" || verb == "/leave" || verb == "/msg") {
    if (!ParseChannel(channel_text, channel)) {
      error = "invalid channel id";
      return false;
    }
  }
  if (verb == "/join") {
    cm::client::JoinCommand cmd;
    cmd.channel_id = channel;
    std::string member;
    while (in >> member) {
      if (member == "--relay") {
        cmd.relay = true;
      } else {
        cmd.members.push_back(member);
      }
    }
    out = cmd;
    return true;
  }
  if (verb == "/leave") {
    out = cm::client::LeaveCommand{channel};
    return true;
  }
  if (verb == "/msg") {
    std::string text;
    std::getline(in, text);
    const auto start = text.find_first_not_of(' ');
    text = start == std::string::npos ? std::string() : text.substr(start);
    out = cm::client::SendMessageCommand{
        channel, std::vector<std::uint8_t>(text.begin(), text.end())};
    return true;
  }
  error = "unknown command";
  return false;
}

}  // namespace

int main(int argc, char** argv) {
  const char* verbose = std::getenv("COMMUCAT_DEBUG");
  if (verbose && *verbose) {
    cm::platform::log::SetMinLevel(cm::platform::log::Level::kDebug);
  }
  std::string path;
  std::string error;
  if (argc > 1) {
    path = argv[1];
  } else if (!cm::client::DefaultProfilePath(path, error)) {
    std::cerr << error << "\n";
    return 1;
  }
  cm::client::Profile profile;
  if (!cm::client::LoadProfile(path, profile, error)) {
    std::cerr << error << "\n";
    return 1;
  }

  cm::client::Engine engine;
  const cm::client::EngineHandle handle = engine.Handle();

  std::atomic<bool> running{true};
  std::thread printer([&engine, &running]() {
    cm::client::ClientEvent event;
    while (running.load()) {
      if (engine.Events().Pop(event, std::chrono::milliseconds(200))) {
        std::cout << cm::client::DescribeEvent(event) << std::endl;
      }
    }
  });

  if (!handle.Send(cm::client::ConnectCommand{profile}, error)) {
    std::cerr << error << "\n";
  }
  PrintUsage();

  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.empty()) {
      continue;
    }
    if (line == "/quit") {
      break;
    }
    cm::client::EngineCommand command;
    if (!BuildCommand(line, path, command, error)) {
      std::cerr << error << "\n";
      continue;
    }
    if (!handle.Send(std::move(command), error)) {
      std::cerr << error << "\n";
      break;
    }
  }

  engine.Shutdown();
  running.store(false);
  printer.join();
  engine.Events().Close();
  return 0;
}
