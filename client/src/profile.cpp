#include "profile.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <system_error>
#include <vector>

#include "hex_utils.h"
#include "platform_fs.h"

namespace cm::client {

namespace {

std::string Trim(const std::string& s) {
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_space);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
  if (b >= e) return {};
  return std::string(b, e);
}

std::string StripInlineComment(const std::string& input) {
  for (std::size_t i = 0; i < input.size(); ++i) {
    const char ch = input[i];
    if ((ch == '#' || ch == ';') &&
        (i == 0 ||
         std::isspace(static_cast<unsigned char>(input[i - 1])) != 0)) {
      return Trim(input.substr(0, i));
    }
  }
  return input;
}

bool ParseUint32(const std::string& text, std::uint32_t& out) {
  if (text.empty()) return false;
  char* end_ptr = nullptr;
  const unsigned long v = std::strtoul(text.c_str(), &end_ptr, 10);
  if (end_ptr == text.c_str() || *end_ptr != '\0' || v > 0xFFFFFFFFu) {
    return false;
  }
  out = static_cast<std::uint32_t>(v);
  return true;
}

bool ParseBool(const std::string& text, bool& out) {
  if (text == "1" || text == "true" || text == "on" || text == "yes") {
    out = true;
    return true;
  }
  if (text == "0" || text == "false" || text == "off" || text == "no") {
    out = false;
    return true;
  }
  return false;
}

void ApplyDefaults(Profile& p) {
  if (p.noise_pattern.empty()) p.noise_pattern = "XK";
  if (p.prologue.empty()) p.prologue = "commucat";
  if (p.presence_state.empty()) p.presence_state = "online";
  if (p.presence_interval_secs == 0) p.presence_interval_secs = 30;
}

struct Entry {
  const char* key;
  const std::string* value;
};

bool AppendSection(std::ostringstream& out, const char* section,
                   const std::vector<Entry>& entries, std::string& error) {
  out << '[' << section << "]\n";
  for (const auto& e : entries) {
    if (e.value->empty()) {
      continue;
    }
    if (e.value->find_first_of("\r\n") != std::string::npos) {
      error = std::string("newline in ") + section + "." + e.key;
      return false;
    }
    out << e.key << " = " << *e.value << '\n';
  }
  out << '\n';
  return true;
}

}  // namespace

bool Profile::DeviceKeyPair(NoiseKeyPair& out, std::string& error) const {
  if (!common::HexToKey32(private_key, out.private_key, error)) {
    error = "device private_key: " + error;
    return false;
  }
  if (!common::HexToKey32(public_key, out.public_key, error)) {
    error = "device public_key: " + error;
    return false;
  }
  return true;
}

bool DefaultProfilePath(std::string& out_path, std::string& error) {
  std::filesystem::path base;
  const char* home_override = std::getenv("COMMUCAT_CLIENT_HOME");
  if (home_override && *home_override) {
    base = home_override;
  } else {
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
      error = "HOME not set";
      return false;
    }
    base = std::filesystem::path(home) / ".config" / "commucat";
  }
  out_path = (base / "client.ini").string();
  return true;
}

bool LoadProfile(const std::string& path, Profile& out, std::string& error) {
  out = Profile{};
  std::string text;
  std::error_code ec;
  if (!platform::fs::ReadTextFile(path, text, ec)) {
    error = "profile not found: " + path;
    return false;
  }

  std::istringstream in(text);
  std::string section;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::string t = StripInlineComment(Trim(line));
    if (t.empty()) continue;
    if (t.front() == '[' && t.back() == ']') {
      section = Trim(t.substr(1, t.size() - 2));
      continue;
    }
    const auto pos = t.find('=');
    if (pos == std::string::npos) {
      error = "invalid line " + std::to_string(line_no);
      return false;
    }
    const std::string key = Trim(t.substr(0, pos));
    const std::string val = StripInlineComment(Trim(t.substr(pos + 1)));
    if (section == "server") {
      if (key == "url") {
        out.server_url = val;
      } else if (key == "domain") {
        out.domain = val;
      } else if (key == "server_static") {
        out.server_static = val;
      } else if (key == "tls_ca_path") {
        out.tls_ca_path = val;
      } else if (key == "insecure") {
        if (!ParseBool(val, out.insecure)) {
          error = "invalid insecure at line " + std::to_string(line_no);
          return false;
        }
      } else if (key == "traceparent") {
        out.traceparent = val;
      }
    } else if (section == "device") {
      if (key == "id") {
        out.device_id = val;
      } else if (key == "name") {
        out.device_name = val;
      } else if (key == "private_key") {
        out.private_key = val;
      } else if (key == "public_key") {
        out.public_key = val;
      }
    } else if (section == "noise") {
      if (key == "pattern") {
        out.noise_pattern = val;
      } else if (key == "prologue") {
        out.prologue = val;
      }
    } else if (section == "presence") {
      if (key == "state") {
        out.presence_state = val;
      } else if (key == "interval_secs") {
        if (!ParseUint32(val, out.presence_interval_secs)) {
          error = "invalid interval_secs at line " + std::to_string(line_no);
          return false;
        }
      }
    } else if (section == "user") {
      if (key == "handle") {
        out.user_handle = val;
      } else if (key == "display_name") {
        out.user_display_name = val;
      } else if (key == "avatar_url") {
        out.user_avatar_url = val;
      } else if (key == "id") {
        out.user_id = val;
      } else if (key == "session_token") {
        out.session_token = val;
      }
    }
  }
  ApplyDefaults(out);
  out.storage_path = path;
  return true;
}

bool SaveProfile(const Profile& profile, const std::string& path,
                 std::string& error) {
  if (path.empty()) {
    error = "profile path empty";
    return false;
  }
  const std::string insecure = profile.insecure ? "true" : "false";
  const std::string interval = std::to_string(profile.presence_interval_secs);

  std::ostringstream out;
  if (!AppendSection(out, "server",
                     {{"url", &profile.server_url},
                      {"domain", &profile.domain},
                      {"server_static", &profile.server_static},
                      {"tls_ca_path", &profile.tls_ca_path},
                      {"insecure", &insecure},
                      {"traceparent", &profile.traceparent}},
                     error) ||
      !AppendSection(out, "device",
                     {{"id", &profile.device_id},
                      {"name", &profile.device_name},
                      {"private_key", &profile.private_key},
                      {"public_key", &profile.public_key}},
                     error) ||
      !AppendSection(out, "noise",
                     {{"pattern", &profile.noise_pattern},
                      {"prologue", &profile.prologue}},
                     error) ||
      !AppendSection(out, "presence",
                     {{"state", &profile.presence_state},
                      {"interval_secs", &interval}},
                     error) ||
      !AppendSection(out, "user",
                     {{"handle", &profile.user_handle},
                      {"display_name", &profile.user_display_name},
                      {"avatar_url", &profile.user_avatar_url},
                      {"id", &profile.user_id},
                      {"session_token", &profile.session_token}},
                     error)) {
    return false;
  }

  const std::filesystem::path target(path);
  std::error_code ec;
  if (target.has_parent_path() &&
      !platform::fs::CreateDirectories(target.parent_path(), ec)) {
    error = "profile directory: " + ec.message();
    return false;
  }
  const std::string text = out.str();
  if (!platform::fs::AtomicWrite(
          target, reinterpret_cast<const std::uint8_t*>(text.data()),
          text.size(), ec)) {
    error = "write profile: " + ec.message();
    return false;
  }
  return true;
}

std::string GenerateDeviceId(std::string_view prefix) {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
  std::string id(prefix);
  id += '-';
  id += std::to_string(ms);
  return id;
}

bool GenerateDeviceKeyPair(Profile& profile, std::string& error) {
  NoiseKeyPair keys;
  if (!GenerateNoiseKeyPair(keys, error)) {
    return false;
  }
  profile.private_key =
      common::BytesToHex(keys.private_key.data(), keys.private_key.size());
  profile.public_key =
      common::BytesToHex(keys.public_key.data(), keys.public_key.size());
  return true;
}

}  // namespace cm::client
