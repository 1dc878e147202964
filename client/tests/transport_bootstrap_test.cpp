#include <cassert>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/spawn.hpp>

#include "connect_error.h"
#include "event_queue.h"
#include "tls_test_peer.h"
#include "transport_bootstrap.h"

namespace {

using boost::asio::ip::tcp;

std::vector<std::string> LogLines(cm::client::EventQueue& events) {
  std::vector<std::string> lines;
  cm::client::ClientEvent event;
  while (events.Pop(event, std::chrono::milliseconds(0))) {
    if (const auto* log = std::get_if<cm::client::LogEvent>(&event)) {
      lines.push_back(log->line);
    }
  }
  return lines;
}

bool StartsWith(const std::string& text, const std::string& prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

// Runs BootstrapTransport against a local TLS server that answers the
// HTTP/2 preface with an empty SETTINGS frame.
bool BootstrapAgainstServer(bool select_h2, cm::client::EventQueue& events,
                            cm::client::ConnectError& error) {
  namespace h2 = cm::client::http2;
  boost::asio::io_context io;
  auto server_ctx = cm::client::testing::MakeServerContext(select_h2);
  assert(server_ctx);
  tcp::acceptor acceptor(
      io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));

  boost::asio::spawn(io, [&](cm::client::Yield yield) {
    cm::client::testing::H2TestPeer peer;
    if (!peer.Accept(acceptor, *server_ctx, yield)) {
      return;
    }
    if (select_h2 && peer.ReadPreface(yield)) {
      std::vector<std::uint8_t> settings;
      h2::AppendSettings(settings, {});
      peer.Write(yield, settings);
    }
    peer.Drain(yield);
  });

  cm::client::ServerEndpoint endpoint;
  endpoint.host = "127.0.0.1";
  endpoint.port = acceptor.local_endpoint().port();
  endpoint.authority = "127.0.0.1";
  cm::client::TransportOptions options;
  options.insecure = true;
  bool ok = false;
  boost::asio::spawn(io, [&](cm::client::Yield yield) {
    std::shared_ptr<h2::Connection> conn;
    ok = cm::client::BootstrapTransport(io, endpoint, options, events, yield,
                                        conn, error);
    if (conn) {
      conn->Abort();
    }
  });
  io.run_for(std::chrono::seconds(10));
  return ok;
}

}  // namespace

int main() {
  using cm::client::ConnectError;
  using cm::client::ConnectFailure;
  using cm::client::ParseServerUrl;
  using cm::client::ServerEndpoint;

  ServerEndpoint ep;
  ConnectError error;

  assert(ParseServerUrl("https://chat.example.test", ep, error));
  assert(ep.host == "chat.example.test");
  assert(ep.port == 443);
  assert(ep.authority == "chat.example.test");
  assert(ep.path == "/connect");

  assert(ParseServerUrl("  HTTPS://user@chat.example.test:8443/ws?x=1#frag ",
                        ep, error));
  assert(ep.host == "chat.example.test");
  assert(ep.port == 8443);
  assert(ep.authority == "chat.example.test:8443");
  assert(ep.path == "/ws?x=1");

  assert(ParseServerUrl("chat.example.test/", ep, error));
  assert(ep.port == 443 && ep.path == "/connect");

  assert(ParseServerUrl("https://h.test?token=a", ep, error));
  assert(ep.path == "/?token=a");

  assert(ParseServerUrl("https://[::1]:9000", ep, error));
  assert(ep.host == "::1");
  assert(ep.port == 9000);
  assert(ep.authority == "[::1]:9000");

  assert(!ParseServerUrl("http://chat.example.test", ep, error));
  assert(error.kind == ConnectFailure::kUnsupportedScheme);
  assert(cm::client::IsConfigurationFailure(error.kind));

  assert(!ParseServerUrl("https://::1", ep, error));
  assert(error.kind == ConnectFailure::kInvalidUrl);
  assert(!ParseServerUrl("https://h.test:99999", ep, error));
  assert(error.kind == ConnectFailure::kInvalidUrl);
  assert(!ParseServerUrl("https://[::1", ep, error));
  assert(!ParseServerUrl("   ", ep, error));
  assert(error.ToString() == "invalid server url: empty url");

  assert(!cm::client::IsConfigurationFailure(ConnectFailure::kTlsFailed));
  assert(!cm::client::IsConfigurationFailure(ConnectFailure::kRejected));

  // Every candidate refuses: one Log event per attempt, then TcpFailed.
  {
    boost::asio::io_context io;
    std::uint16_t port = 0;
    {
      tcp::acceptor reserved(
          io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
      port = reserved.local_endpoint().port();
    }
    cm::client::EventQueue events(16);
    ServerEndpoint closed;
    closed.host = "127.0.0.1";
    closed.port = port;
    closed.authority = "127.0.0.1:" + std::to_string(port);
    bool ok = true;
    boost::asio::spawn(io, [&](cm::client::Yield yield) {
      std::shared_ptr<cm::client::http2::Connection> conn;
      ok = cm::client::BootstrapTransport(io, closed, {}, events, yield, conn,
                                          error);
      assert(!conn);
    });
    io.run_for(std::chrono::seconds(10));
    assert(!ok);
    assert(error.kind == ConnectFailure::kTcpFailed);
    assert(!error.detail.empty());
    const auto lines = LogLines(events);
    assert(lines.size() == 1);
    const std::string prefix =
        "connect attempt 127.0.0.1:" + std::to_string(port) + " failed: ";
    assert(StartsWith(lines[0], prefix));
    assert(lines[0].substr(prefix.size()) == error.detail);
  }

  // A listening candidate is reported and carried through TLS and the
  // HTTP/2 preface.
  {
    cm::client::EventQueue events(16);
    error = ConnectError{};
    assert(BootstrapAgainstServer(true, events, error));
    const auto lines = LogLines(events);
    assert(!lines.empty());
    assert(StartsWith(lines[0], "connected to 127.0.0.1:"));
  }

  // A server that only speaks http/1.1 is refused after TLS.
  {
    cm::client::EventQueue events(16);
    error = ConnectError{};
    assert(!BootstrapAgainstServer(false, events, error));
    assert(error.kind == ConnectFailure::kMultiplexFailed);
    assert(error.detail == "server selected http/1.1");
  }
  return 0;
}
