#ifndef CM_CLIENT_TRANSPORT_BOOTSTRAP_H
#define CM_CLIENT_TRANSPORT_BOOTSTRAP_H

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>

#include "connect_error.h"
#include "event_queue.h"
#include "http2_connection.h"
#include "stream_channel.h"

namespace cm::client {

struct ServerEndpoint {
  std::string host;
  std::uint16_t port{443};
  // host[:port] as written in the URL.
  std::string authority;
  // Path and query; "/connect" when the URL has none.
  std::string path{"/connect"};
};

// A missing scheme means https; any other scheme is rejected.
bool ParseServerUrl(std::string_view url, ServerEndpoint& out,
                    ConnectError& error);

struct TransportOptions {
  std::string ca_path;
  bool insecure{false};
};

// Resolves the host, tries every address in order, wraps the first
// connected socket in TLS offering h2 then http/1.1, and runs the HTTP/2
// preface. Each address attempt is reported as a Log event.
bool BootstrapTransport(boost::asio::io_context& io,
                        const ServerEndpoint& endpoint,
                        const TransportOptions& options, EventQueue& events,
                        Yield yield,
                        std::shared_ptr<http2::Connection>& out,
                        ConnectError& error);

}  // namespace cm::client

#endif  // CM_CLIENT_TRANSPORT_BOOTSTRAP_H
