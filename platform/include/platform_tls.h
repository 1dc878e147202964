#ifndef CM_PLATFORM_TLS_H
#define CM_PLATFORM_TLS_H

#include <string>

#include <openssl/ssl.h>

namespace cm::platform::tls {

struct ClientVerifyConfig {
  bool verify_peer{true};
  bool verify_hostname{true};
  // PEM file or hashed directory; empty selects the system bundle.
  std::string ca_bundle_path;
  // Wire-format ALPN list, e.g. "\x02h2\x08http/1.1".
  std::string alpn;
};

// Protocol floor, options, ALPN offer and trust roots.
bool ConfigureClientContext(SSL_CTX* ctx, const ClientVerifyConfig& verify,
                            std::string& error);

// SNI and, when verifying, hostname checking for one connection.
bool PrepareClientSession(SSL* ssl, const std::string& host,
                          const ClientVerifyConfig& verify,
                          std::string& error);

// Empty when the server selected nothing.
std::string SelectedAlpn(const SSL* ssl);

}  // namespace cm::platform::tls

#endif  // CM_PLATFORM_TLS_H
