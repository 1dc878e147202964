#ifndef CM_CLIENT_CONNECTOR_H
#define CM_CLIENT_CONNECTOR_H

#include <memory>

#include <boost/asio/io_context.hpp>

#include "active_connection.h"
#include "connect_error.h"
#include "event_queue.h"
#include "handshake.h"
#include "profile.h"
#include "stream_channel.h"

namespace cm::client {

// Produces an authenticated connection for the engine actor.
class Connector {
 public:
  virtual ~Connector() = default;

  virtual bool Connect(boost::asio::io_context& io, Profile& profile,
                       const std::shared_ptr<EventQueue>& events, Yield yield,
                       std::unique_ptr<ActiveConnection>& out,
                       ConnectError& error) = 0;
};

// URL parsing, handshake preparation, DNS/TCP/TLS/HTTP/2 bootstrap and the
// POST request carrying the frame stream.
class NetworkConnector : public Connector {
 public:
  bool Connect(boost::asio::io_context& io, Profile& profile,
               const std::shared_ptr<EventQueue>& events, Yield yield,
               std::unique_ptr<ActiveConnection>& out,
               ConnectError& error) override;
};

// Runs the handshake over an opened stream and, on success, starts the
// inbound reader. On failure the stream and driver are torn down.
bool EstablishSession(boost::asio::io_context& io,
                      const HandshakeSetup& setup, Profile& profile,
                      const std::shared_ptr<SendChannel>& send,
                      const std::shared_ptr<RecvChannel>& recv,
                      const std::shared_ptr<ConnectionDriver>& driver,
                      const std::shared_ptr<EventQueue>& events, Yield yield,
                      std::unique_ptr<ActiveConnection>& out,
                      ConnectError& error);

}  // namespace cm::client

#endif  // CM_CLIENT_CONNECTOR_H
