#include "connector.h"

#include <utility>

#include "http2_connection.h"
#include "transport_bootstrap.h"

namespace cm::client {

bool EstablishSession(boost::asio::io_context& io,
                      const HandshakeSetup& setup, Profile& profile,
                      const std::shared_ptr<SendChannel>& send,
                      const std::shared_ptr<RecvChannel>& recv,
                      const std::shared_ptr<ConnectionDriver>& driver,
                      const std::shared_ptr<EventQueue>& events, Yield yield,
                      std::unique_ptr<ActiveConnection>& out,
                      ConnectError& error) {
  HandshakeResult result;
  if (!RunHandshake(setup, profile, *send, *recv, *events, yield, result,
                    error)) {
    send->Finish();
    recv->Cancel();
    driver->Abort();
    return false;
  }
  auto reader = std::make_shared<InboundReader>(
      recv, std::move(result.leftover), events);
  reader->Start(io);
  out = std::make_unique<ActiveConnection>(send, reader, driver,
                                           std::move(result.session_id),
                                           result.pairing_required,
                                           result.next_sequence);
  return true;
}

bool NetworkConnector::Connect(boost::asio::io_context& io, Profile& profile,
                               const std::shared_ptr<EventQueue>& events,
                               Yield yield,
                               std::unique_ptr<ActiveConnection>& out,
                               ConnectError& error) {
  ServerEndpoint endpoint;
  if (!ParseServerUrl(profile.server_url, endpoint, error)) {
    return false;
  }
  HandshakeSetup setup;
  if (!PrepareHandshake(profile, setup, error)) {
    return false;
  }

  TransportOptions options;
  options.ca_path = profile.tls_ca_path;
  options.insecure = profile.insecure;
  std::shared_ptr<http2::Connection> conn;
  if (!BootstrapTransport(io, endpoint, options, *events, yield, conn,
                          error)) {
    return false;
  }

  http2::RequestHead head;
  head.method = "POST";
  head.scheme = "https";
  head.authority = endpoint.authority;
  head.path = endpoint.path;
  head.headers.push_back({"content-type", "application/octet-stream"});
  head.headers.push_back({"user-agent", kClientAgent});
  head.headers.push_back({"te", "trailers"});
  if (!profile.traceparent.empty()) {
    head.headers.push_back({"traceparent", profile.traceparent});
  }

  std::shared_ptr<SendChannel> send;
  std::shared_ptr<RecvChannel> recv;
  std::string detail;
  if (!conn->OpenStream(head, send, recv, detail)) {
    conn->Abort();
    error = MakeConnectError(ConnectFailure::kRequestFailed, detail);
    return false;
  }
  return EstablishSession(io, setup, profile, send, recv, conn, events, yield,
                          out, error);
}

}  // namespace cm::client
