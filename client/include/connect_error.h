#ifndef CM_CLIENT_CONNECT_ERROR_H
#define CM_CLIENT_CONNECT_ERROR_H

#include <cstdint>
#include <string>
#include <utility>

namespace cm::client {

enum class ConnectFailure : std::uint8_t {
  kInvalidUrl = 0,
  kUnsupportedScheme,
  kInvalidKey,
  kMissingRemoteStatic,
  kUnsupportedPattern,
  kDnsFailed,
  kTcpFailed,
  kTlsFailed,
  kMultiplexFailed,
  kRequestFailed,
  kPeerClosed,
  kReadFailed,
  kDecodeFailed,
  kHandshakeFailed,
  kSessionMissing,
  kRejected,
};

const char* ConnectFailureLabel(ConnectFailure kind);

// Raised before any network I/O.
bool IsConfigurationFailure(ConnectFailure kind);

struct ConnectError {
  ConnectFailure kind{ConnectFailure::kHandshakeFailed};
  std::string detail;

  std::string ToString() const;
};

inline ConnectError MakeConnectError(ConnectFailure kind, std::string detail) {
  ConnectError e;
  e.kind = kind;
  e.detail = std::move(detail);
  return e;
}

}  // namespace cm::client

#endif  // CM_CLIENT_CONNECT_ERROR_H
