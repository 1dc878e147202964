#include "transport_bootstrap.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

#include <openssl/x509.h>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>

#include "platform_log.h"
#include "platform_tls.h"

namespace cm::client {

namespace {
constexpr const char* kTag = "bootstrap";
constexpr char kAlpnOffer[] = "\x02h2\x08http/1.1";

std::string ToLower(std::string s) {
  for (auto& ch : s) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return s;
}

bool ParsePort(std::string_view text, std::uint16_t& out) {
  if (text.empty() || text.size() > 5) return false;
  std::uint32_t v = 0;
  for (const char c : text) {
    if (c < '0' || c > '9') return false;
    v = v * 10 + static_cast<std::uint32_t>(c - '0');
  }
  if (v == 0 || v > 65535) return false;
  out = static_cast<std::uint16_t>(v);
  return true;
}

std::string EndpointText(const boost::asio::ip::tcp::endpoint& ep) {
  std::ostringstream out;
  out << ep;
  return out.str();
}
}  // namespace

bool ParseServerUrl(std::string_view url, ServerEndpoint& out,
                    ConnectError& error) {
  out = ServerEndpoint{};
  while (!url.empty() && std::isspace(static_cast<unsigned char>(url.front()))) {
    url.remove_prefix(1);
  }
  while (!url.empty() && std::isspace(static_cast<unsigned char>(url.back()))) {
    url.remove_suffix(1);
  }
  if (url.empty()) {
    error = MakeConnectError(ConnectFailure::kInvalidUrl, "empty url");
    return false;
  }

  std::string_view rest = url;
  const auto scheme_end = url.find("://");
  if (scheme_end != std::string_view::npos) {
    const std::string scheme = ToLower(std::string(url.substr(0, scheme_end)));
    if (scheme != "https") {
      error = MakeConnectError(ConnectFailure::kUnsupportedScheme,
                               "only https is supported, got " + scheme);
      return false;
    }
    rest = url.substr(scheme_end + 3);
  }

  const auto fragment = rest.find('#');
  if (fragment != std::string_view::npos) {
    rest = rest.substr(0, fragment);
  }
  const auto authority_end = rest.find_first_of("/?");
  std::string_view authority = rest.substr(0, authority_end);
  const std::string_view path_query =
      authority_end == std::string_view::npos ? std::string_view{}
                                              : rest.substr(authority_end);
  const auto at = authority.rfind('@');
  if (at != std::string_view::npos) {
    authority = authority.substr(at + 1);
  }
  if (authority.empty()) {
    error = MakeConnectError(ConnectFailure::kInvalidUrl, "host missing");
    return false;
  }

  std::string_view host;
  std::string_view port_text;
  if (authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string_view::npos) {
      error = MakeConnectError(ConnectFailure::kInvalidUrl,
                               "unterminated ipv6 literal");
      return false;
    }
    host = authority.substr(1, close - 1);
    const std::string_view tail = authority.substr(close + 1);
    if (!tail.empty()) {
      if (tail.front() != ':') {
        error = MakeConnectError(ConnectFailure::kInvalidUrl,
                                 "unexpected text after ipv6 literal");
        return false;
      }
      port_text = tail.substr(1);
    }
  } else {
    const auto colon = authority.find(':');
    if (colon != std::string_view::npos &&
        authority.find(':', colon + 1) != std::string_view::npos) {
      error = MakeConnectError(ConnectFailure::kInvalidUrl,
                               "ipv6 host must be bracketed");
      return false;
    }
    host = authority.substr(0, colon);
    if (colon != std::string_view::npos) {
      port_text = authority.substr(colon + 1);
    }
  }
  if (host.empty()) {
    error = MakeConnectError(ConnectFailure::kInvalidUrl, "host missing");
    return false;
  }
  if (!port_text.empty() && !ParsePort(port_text, out.port)) {
    error = MakeConnectError(ConnectFailure::kInvalidUrl,
                             "invalid port " + std::string(port_text));
    return false;
  }

  out.host = std::string(host);
  out.authority = std::string(authority);
  if (path_query.empty() || path_query == "/") {
    out.path = "/connect";
  } else if (path_query.front() == '?') {
    out.path = "/" + std::string(path_query);
  } else {
    out.path = std::string(path_query);
  }
  return true;
}

bool BootstrapTransport(boost::asio::io_context& io,
                        const ServerEndpoint& endpoint,
                        const TransportOptions& options, EventQueue& events,
                        Yield yield,
                        std::shared_ptr<http2::Connection>& out,
                        ConnectError& error) {
  using boost::asio::ip::tcp;
  namespace ssl = boost::asio::ssl;

  boost::system::error_code ec;
  tcp::resolver resolver(io);
  const auto results = resolver.async_resolve(
      endpoint.host, std::to_string(endpoint.port), yield[ec]);
  if (ec) {
    error = MakeConnectError(ConnectFailure::kDnsFailed,
                             endpoint.host + ": " + ec.message());
    return false;
  }
  if (results.empty()) {
    error = MakeConnectError(ConnectFailure::kDnsFailed,
                             "no address for " + endpoint.host);
    return false;
  }

  tcp::socket socket(io);
  std::string last_error = "all sockets failed";
  bool connected = false;
  for (const auto& entry : results) {
    const std::string addr = EndpointText(entry.endpoint());
    boost::system::error_code close_ec;
    socket.close(close_ec);
    socket.async_connect(entry.endpoint(), yield[ec]);
    if (!ec) {
      Publish(events, LogEvent{"connected to " + addr});
      connected = true;
      break;
    }
    last_error = ec.message();
    Publish(events,
            LogEvent{"connect attempt " + addr + " failed: " + last_error});
  }
  if (!connected) {
    error = MakeConnectError(ConnectFailure::kTcpFailed, last_error);
    return false;
  }
  socket.set_option(tcp::no_delay(true), ec);
  if (ec) {
    platform::log::Log(platform::log::Level::kDebug, kTag,
                       "no_delay not applied", {{"error", ec.message()}});
  }

  platform::tls::ClientVerifyConfig verify;
  verify.verify_peer = !options.insecure;
  verify.ca_bundle_path = options.ca_path;
  verify.alpn.assign(kAlpnOffer, sizeof(kAlpnOffer) - 1);
  if (options.insecure) {
    platform::log::Log(platform::log::Level::kWarn, kTag,
                       "tls certificate verification disabled",
                       {{"host", endpoint.host}});
  }

  auto ssl_ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
  std::string tls_error;
  if (!platform::tls::ConfigureClientContext(ssl_ctx->native_handle(), verify,
                                             tls_error)) {
    error = MakeConnectError(ConnectFailure::kTlsFailed, tls_error);
    return false;
  }
  auto tls = std::make_unique<http2::TlsStream>(std::move(socket), *ssl_ctx);
  if (!platform::tls::PrepareClientSession(tls->native_handle(), endpoint.host,
                                           verify, tls_error)) {
    error = MakeConnectError(ConnectFailure::kTlsFailed, tls_error);
    return false;
  }
  tls->async_handshake(ssl::stream_base::client, yield[ec]);
  if (ec) {
    std::string detail = ec.message();
    if (verify.verify_peer) {
      const long verify_result = SSL_get_verify_result(tls->native_handle());
      if (verify_result != X509_V_OK) {
        detail = X509_verify_cert_error_string(verify_result);
      }
    }
    error = MakeConnectError(ConnectFailure::kTlsFailed, detail);
    return false;
  }

  const std::string alpn = platform::tls::SelectedAlpn(tls->native_handle());
  if (alpn == "http/1.1") {
    error = MakeConnectError(ConnectFailure::kMultiplexFailed,
                             "server selected http/1.1");
    return false;
  }
  if (alpn.empty()) {
    platform::log::Log(platform::log::Level::kDebug, kTag,
                       "no alpn selected, assuming h2");
  }

  auto conn = std::make_shared<http2::Connection>(io, ssl_ctx, std::move(tls));
  std::string h2_error;
  if (!conn->Start(yield, h2_error)) {
    conn->Abort();
    error = MakeConnectError(ConnectFailure::kMultiplexFailed, h2_error);
    return false;
  }
  out = std::move(conn);
  return true;
}

}  // namespace cm::client
