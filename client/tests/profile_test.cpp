#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <string>

#include "platform_fs.h"
#include "profile.h"

namespace {

std::filesystem::path MakeTempDir(const std::string& name_prefix) {
  std::error_code ec;
  auto base = std::filesystem::temp_directory_path(ec);
  if (base.empty()) {
    base = std::filesystem::current_path(ec);
  }
  if (base.empty()) {
    base = std::filesystem::path{"."};
  }
  std::filesystem::path dir = base / name_prefix;
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir, ec);
  return dir;
}

void WriteText(const std::filesystem::path& path, const std::string& text) {
  std::error_code ec;
  assert(cm::platform::fs::AtomicWrite(
      path, reinterpret_cast<const std::uint8_t*>(text.data()), text.size(),
      ec));
}

}  // namespace

int main() {
  using cm::client::LoadProfile;
  using cm::client::Profile;
  using cm::client::SaveProfile;

  const auto dir = MakeTempDir("cm_profile_test");
  std::string error;

  // Minimal file: defaults fill in the rest.
  const auto minimal = dir / "minimal.ini";
  WriteText(minimal,
            "# comment\n"
            "[server]\n"
            "url = https://chat.example.test:8443  ; trailing\n"
            "insecure = yes\n"
            "[device]\n"
            "id = dev-1\n");
  Profile p;
  assert(LoadProfile(minimal.string(), p, error));
  assert(p.server_url == "https://chat.example.test:8443");
  assert(p.insecure);
  assert(p.device_id == "dev-1");
  assert(p.noise_pattern == "XK");
  assert(p.prologue == "commucat");
  assert(p.presence_state == "online");
  assert(p.presence_interval_secs == 30);
  assert(p.storage_path == minimal.string());

  // Round trip through SaveProfile into a directory that does not exist yet.
  p.domain = "example.test";
  p.noise_pattern = "IK";
  p.user_handle = "alice";
  p.user_display_name = "Alice A";
  p.presence_interval_secs = 45;
  assert(cm::client::GenerateDeviceKeyPair(p, error));
  const auto nested = dir / "nested" / "client.ini";
  assert(SaveProfile(p, nested.string(), error));
  Profile back;
  assert(LoadProfile(nested.string(), back, error));
  assert(back.server_url == p.server_url);
  assert(back.domain == "example.test");
  assert(back.insecure);
  assert(back.noise_pattern == "IK");
  assert(back.user_handle == "alice");
  assert(back.user_display_name == "Alice A");
  assert(back.presence_interval_secs == 45);
  assert(back.private_key == p.private_key);

  cm::client::NoiseKeyPair keys;
  assert(back.DeviceKeyPair(keys, error));
  cm::client::Key32 derived{};
  cm::client::DeriveNoisePublicKey(keys.private_key, derived);
  assert(derived == keys.public_key);

  // Values must stay on one line.
  p.device_name = "bad\nname";
  assert(!SaveProfile(p, (dir / "bad.ini").string(), error));
  assert(error == "newline in device.name");

  // Errors.
  assert(!LoadProfile((dir / "missing.ini").string(), p, error));
  assert(error.rfind("profile not found: ", 0) == 0);
  const auto broken = dir / "broken.ini";
  WriteText(broken, "[server]\nurl\n");
  assert(!LoadProfile(broken.string(), p, error));
  assert(error == "invalid line 2");
  WriteText(broken, "[presence]\ninterval_secs = soon\n");
  assert(!LoadProfile(broken.string(), p, error));

  // Default path honours the override directory.
  setenv("COMMUCAT_CLIENT_HOME", dir.string().c_str(), 1);
  std::string path;
  assert(cm::client::DefaultProfilePath(path, error));
  assert(path == (dir / "client.ini").string());

  const std::string id = cm::client::GenerateDeviceId("cli");
  assert(id.rfind("cli-", 0) == 0 && id.size() > 4);

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  return 0;
}
