#include "connect_error.h"

namespace cm::client {

const char* ConnectFailureLabel(ConnectFailure kind) {
  switch (kind) {
    case ConnectFailure::kInvalidUrl:
      return "invalid server url";
    case ConnectFailure::kUnsupportedScheme:
      return "unsupported url scheme";
    case ConnectFailure::kInvalidKey:
      return "invalid key material";
    case ConnectFailure::kMissingRemoteStatic:
      return "missing server static key";
    case ConnectFailure::kUnsupportedPattern:
      return "unsupported noise pattern";
    case ConnectFailure::kDnsFailed:
      return "dns resolution failed";
    case ConnectFailure::kTcpFailed:
      return "tcp connect failed";
    case ConnectFailure::kTlsFailed:
      return "tls handshake failed";
    case ConnectFailure::kMultiplexFailed:
      return "http/2 setup failed";
    case ConnectFailure::kRequestFailed:
      return "connect request failed";
    case ConnectFailure::kPeerClosed:
      return "server closed stream";
    case ConnectFailure::kReadFailed:
      return "stream read failed";
    case ConnectFailure::kDecodeFailed:
      return "frame decode failed";
    case ConnectFailure::kHandshakeFailed:
      return "noise handshake failed";
    case ConnectFailure::kSessionMissing:
      return "session not established";
    case ConnectFailure::kRejected:
      return "server rejected connection";
  }
  return "connect failed";
}

bool IsConfigurationFailure(ConnectFailure kind) {
  switch (kind) {
    case ConnectFailure::kInvalidUrl:
    case ConnectFailure::kUnsupportedScheme:
    case ConnectFailure::kInvalidKey:
    case ConnectFailure::kMissingRemoteStatic:
    case ConnectFailure::kUnsupportedPattern:
      return true;
    default:
      return false;
  }
}

std::string ConnectError::ToString() const {
  std::string out = ConnectFailureLabel(kind);
  if (!detail.empty()) {
    out += ": ";
    out += detail;
  }
  return out;
}

}  // namespace cm::client
