#ifndef CM_CLIENT_PROFILE_H
#define CM_CLIENT_PROFILE_H

#include <cstdint>
#include <string>
#include <string_view>

#include "noise_handshake.h"

namespace cm::client {

// Local device/session profile. Empty strings mean "not set".
struct Profile {
  std::string server_url;
  std::string domain;
  std::string server_static;
  std::string tls_ca_path;
  bool insecure{false};
  std::string traceparent;

  std::string device_id;
  std::string device_name;
  std::string private_key;
  std::string public_key;

  std::string noise_pattern{"XK"};
  std::string prologue{"commucat"};

  std::string presence_state{"online"};
  std::uint32_t presence_interval_secs{30};

  std::string user_handle;
  std::string user_display_name;
  std::string user_avatar_url;
  std::string user_id;
  std::string session_token;

  // File the profile was loaded from; learned fields are saved back here.
  std::string storage_path;

  bool DeviceKeyPair(NoiseKeyPair& out, std::string& error) const;
};

// $COMMUCAT_CLIENT_HOME/client.ini, else $HOME/.config/commucat/client.ini.
bool DefaultProfilePath(std::string& out_path, std::string& error);

bool LoadProfile(const std::string& path, Profile& out, std::string& error);
bool SaveProfile(const Profile& profile, const std::string& path,
                 std::string& error);

std::string GenerateDeviceId(std::string_view prefix);
bool GenerateDeviceKeyPair(Profile& profile, std::string& error);

}  // namespace cm::client

#endif  // CM_CLIENT_PROFILE_H
