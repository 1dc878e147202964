#include "platform_tls.h"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <openssl/err.h>
#include <openssl/x509v3.h>
#include <openssl/x509.h>

#include <filesystem>
#include <mutex>
#include <system_error>

namespace cm::platform::tls {

namespace {
bool IsIpLiteral(const std::string& host) {
  unsigned char buf[sizeof(struct in6_addr)];
  return ::inet_pton(AF_INET, host.c_str(), buf) == 1 ||
         ::inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

bool EnsureOpenSsl() {
  static std::once_flag init_once;
  static bool ok = false;
  std::call_once(init_once, []() {
    ok = OPENSSL_init_ssl(0, nullptr) == 1;
  });
  return ok;
}

std::string GetOpenSslError() {
  const unsigned long err = ERR_get_error();
  if (err == 0) {
    return "openssl error";
  }
  char buf[256] = {};
  ERR_error_string_n(err, buf, sizeof(buf));
  return std::string(buf);
}

bool LoadDefaultCaBundle(SSL_CTX* ctx, std::string& error) {
  if (!ctx) {
    error = "tls ctx missing";
    return false;
  }
  const bool default_ok = SSL_CTX_set_default_verify_paths(ctx) == 1;
  const char* const candidates[] = {
      "/etc/ssl/certs/ca-certificates.crt",
      "/etc/pki/tls/certs/ca-bundle.crt",
      "/etc/ssl/ca-bundle.pem",
      "/etc/ssl/cert.pem",
      "/etc/pki/ca-trust/extracted/pem/tls-ca-bundle.pem",
      "/usr/local/share/certs/ca-root-nss.crt",
  };
  for (const char* path : candidates) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
      continue;
    }
    const bool is_dir = std::filesystem::is_directory(path, ec);
    if (ec) {
      continue;
    }
    const char* ca_file = is_dir ? nullptr : path;
    const char* ca_dir = is_dir ? path : nullptr;
    if (SSL_CTX_load_verify_locations(ctx, ca_file, ca_dir) == 1) {
      return true;
    }
  }
  if (default_ok) {
    return true;
  }
  error = "tls ca bundle missing";
  return false;
}
}  // namespace

bool ConfigureClientContext(SSL_CTX* ctx, const ClientVerifyConfig& verify,
                            std::string& error) {
  error.clear();
  if (!EnsureOpenSsl()) {
    error = "openssl init failed";
    return false;
  }
  if (!ctx) {
    error = "tls ctx missing";
    return false;
  }

  SSL_CTX_set_options(ctx, SSL_OP_NO_SSLv2 | SSL_OP_NO_SSLv3);
  SSL_CTX_set_options(ctx, SSL_OP_NO_COMPRESSION);
  if (SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION) != 1) {
    error = GetOpenSslError();
    return false;
  }
  if (!verify.alpn.empty()) {
    // Returns 0 on success.
    if (SSL_CTX_set_alpn_protos(
            ctx, reinterpret_cast<const unsigned char*>(verify.alpn.data()),
            static_cast<unsigned int>(verify.alpn.size())) != 0) {
      error = "tls alpn setup failed";
      return false;
    }
  }

  if (!verify.verify_peer) {
    SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
    return true;
  }
  if (!verify.ca_bundle_path.empty()) {
    const std::filesystem::path ca_path(verify.ca_bundle_path);
    const std::string ca_path_str = ca_path.string();
    std::error_code ec;
    const bool is_dir = std::filesystem::is_directory(ca_path, ec);
    const char* ca_file = is_dir ? nullptr : ca_path_str.c_str();
    const char* ca_dir = is_dir ? ca_path_str.c_str() : nullptr;
    if (SSL_CTX_load_verify_locations(ctx, ca_file, ca_dir) != 1) {
      error = "tls ca bundle load failed: " + ca_path_str;
      return false;
    }
  } else if (!LoadDefaultCaBundle(ctx, error)) {
    return false;
  }
  SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
  return true;
}

bool PrepareClientSession(SSL* ssl, const std::string& host,
                          const ClientVerifyConfig& verify,
                          std::string& error) {
  error.clear();
  if (!ssl) {
    error = "tls session missing";
    return false;
  }
  SSL_set_mode(ssl, SSL_MODE_AUTO_RETRY);
  if (host.empty()) {
    return true;
  }
  const bool is_ip = IsIpLiteral(host);
  // No SNI for address literals.
  if (!is_ip && SSL_set_tlsext_host_name(ssl, host.c_str()) != 1) {
    error = "tls sni setup failed";
    return false;
  }
  if (verify.verify_peer && verify.verify_hostname) {
    const int rc =
        is_ip ? X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl), host.c_str())
              : SSL_set1_host(ssl, host.c_str());
    if (rc != 1) {
      error = "tls host verify setup failed";
      return false;
    }
  }
  return true;
}

std::string SelectedAlpn(const SSL* ssl) {
  if (!ssl) {
    return {};
  }
  const unsigned char* proto = nullptr;
  unsigned int len = 0;
  SSL_get0_alpn_selected(ssl, &proto, &len);
  if (!proto || len == 0) {
    return {};
  }
  return std::string(reinterpret_cast<const char*>(proto), len);
}

}  // namespace cm::platform::tls
