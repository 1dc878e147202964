#include <cassert>
#include <string>
#include <vector>

#include "platform_log.h"

namespace {

struct Captured {
  std::vector<std::string> lines;
};

void Capture(cm::platform::log::Level level, const char* tag,
             const char* message, const cm::platform::log::Field* fields,
             std::size_t field_count, void* user_data) {
  auto* captured = static_cast<Captured*>(user_data);
  std::string line = cm::platform::log::LevelName(level);
  line += ' ';
  line += tag;
  line += ": ";
  line += message;
  for (std::size_t i = 0; i < field_count; ++i) {
    line += ' ';
    line += std::string(fields[i].key);
    line += '=';
    line += std::string(fields[i].value);
  }
  captured->lines.push_back(line);
}

}  // namespace

int main() {
  namespace log = cm::platform::log;

  assert(log::IsSensitiveKey("server_static_key"));
  assert(log::IsSensitiveKey("session_token"));
  assert(log::IsSensitiveKey("device_id"));
  assert(!log::IsSensitiveKey("key_id"));
  assert(!log::IsSensitiveKey("session"));
  assert(log::RedactValue("password", "hunter2") == "***");
  assert(log::RedactValue("state", "online") == "online");
  assert(log::RedactMessage("login token=abc, ok") == "login token=***, ok");

  Captured captured;
  log::SetLogCallback(&Capture, &captured);
  log::SetMinLevel(log::Level::kWarn);
  log::Log(log::Level::kInfo, "engine", "dropped");
  log::Log(log::Level::kWarn, "engine", "connect failed",
           {{"error", "tls"}, {"device_id", "dev-1"}});
  assert(captured.lines.size() == 1);
  assert(captured.lines[0] ==
         "WARN engine: connect failed error=tls device_id=***");

  log::SetMinLevel(log::Level::kDebug);
  log::Log(log::Level::kDebug, "reader", "secret=xyz seen");
  assert(captured.lines.size() == 2);
  assert(captured.lines[1] == "DEBUG reader: secret=*** seen");

  log::SetLogCallback(nullptr, nullptr);
  log::SetMinLevel(log::Level::kInfo);
  assert(log::MinLevel() == log::Level::kInfo);
  return 0;
}
