#include <cassert>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>

#include "http2_connection.h"
#include "http2_frame.h"
#include "tls_test_peer.h"

namespace {

namespace h2 = cm::client::http2;
namespace ssl = boost::asio::ssl;
using boost::asio::ip::tcp;
using cm::client::Yield;
using cm::client::testing::H2TestPeer;

constexpr std::uint32_t kTinyWindow = 4;

struct Progress {
  bool first_write_done{false};
  bool blocked_before_update{false};
  bool reset_seen{false};
  bool status_seen{false};
  bool goaway_seen{false};
  bool server_done{false};
  std::string reset_error;
  std::string status_error;
  std::string goaway_error;
  std::string open_after_goaway_error;
};

std::vector<std::uint8_t> Bytes(std::size_t n, std::uint8_t fill) {
  return std::vector<std::uint8_t>(n, fill);
}

void RunServer(tcp::acceptor& acceptor, ssl::context& ctx, Progress& progress,
               Yield yield) {
  H2TestPeer peer;
  bool ok = peer.Accept(acceptor, ctx, yield);
  assert(ok);
  ok = peer.ReadPreface(yield);
  assert(ok);
  std::vector<std::uint8_t> payload;
  ok = peer.ReadUntil(yield, h2::FrameType::kSettings, 0, payload);
  assert(ok);

  std::vector<std::uint8_t> out;
  h2::AppendSettings(
      out, {{static_cast<std::uint16_t>(h2::SettingsId::kInitialWindowSize),
             kTinyWindow}});
  h2::AppendSettingsAck(out);
  ok = peer.Write(yield, out);
  assert(ok);

  // Stream 1: the first DATA frame is capped by the stream window and the
  // writer stays suspended until the window is reopened.
  ok = peer.ReadUntil(yield, h2::FrameType::kHeaders, 1, payload);
  assert(ok);
  ok = peer.ReadUntil(yield, h2::FrameType::kData, 1, payload);
  assert(ok && payload.size() == kTinyWindow);
  {
    boost::asio::steady_timer settle(acceptor.get_executor());
    settle.expires_after(std::chrono::milliseconds(50));
    boost::system::error_code ec;
    settle.async_wait(yield[ec]);
  }
  progress.blocked_before_update = !progress.first_write_done;

  out.clear();
  h2::AppendWindowUpdate(out, 1, 6);
  ok = peer.Write(yield, out);
  assert(ok);
  ok = peer.ReadUntil(yield, h2::FrameType::kData, 1, payload);
  assert(ok && payload.size() == 6);

  // The client's next write is parked on the drained window; RST_STREAM
  // ends it.
  out.clear();
  h2::AppendRstStream(out, 1, h2::ErrorCode::kCancel);
  ok = peer.Write(yield, out);
  assert(ok);

  // Stream 3: a Huffman-coded ":status 401" fails the stream and the client
  // cancels it.
  ok = peer.ReadUntil(yield, h2::FrameType::kHeaders, 3, payload);
  assert(ok);
  out.clear();
  h2::AppendHeaders(out, 3, {0x48, 0x82, 0x68, 0x01}, false,
                    h2::kDefaultMaxFrameSize);
  ok = peer.Write(yield, out);
  assert(ok);
  ok = peer.ReadUntil(yield, h2::FrameType::kRstStream, 3, payload);
  assert(ok && payload.size() == 4 &&
         payload[3] == static_cast<std::uint8_t>(h2::ErrorCode::kCancel));

  // Stream 5: GOAWAY naming stream 3 as the last one refuses it.
  ok = peer.ReadUntil(yield, h2::FrameType::kData, 5, payload);
  assert(ok && payload.size() == kTinyWindow);
  out.clear();
  h2::AppendGoAway(out, 3, h2::ErrorCode::kNoError);
  ok = peer.Write(yield, out);
  assert(ok);

  peer.Drain(yield);
  progress.server_done = true;
}

void RunClient(boost::asio::io_context& io, const tcp::endpoint& server,
               Progress& progress, Yield yield) {
  auto ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
  ctx->set_verify_mode(ssl::verify_none);
  tcp::socket socket(io);
  boost::system::error_code ec;
  socket.async_connect(server, yield[ec]);
  assert(!ec);
  auto tls = std::make_unique<h2::TlsStream>(std::move(socket), *ctx);
  tls->async_handshake(ssl::stream_base::client, yield[ec]);
  assert(!ec);

  auto conn = std::make_shared<h2::Connection>(io, ctx, std::move(tls));
  std::string error;
  bool ok = conn->Start(yield, error);
  assert(ok);

  h2::RequestHead head;
  head.authority = "localhost";
  head.path = "/connect";
  std::shared_ptr<cm::client::SendChannel> send;
  std::shared_ptr<cm::client::RecvChannel> recv;

  ok = conn->OpenStream(head, send, recv, error);
  assert(ok);
  ok = send->Write(Bytes(10, 0xAB), yield, error);
  assert(ok);
  progress.first_write_done = true;
  ok = send->Write(Bytes(10, 0xCD), yield, error);
  assert(!ok);
  progress.reset_seen = true;
  progress.reset_error = error;

  ok = conn->OpenStream(head, send, recv, error);
  assert(ok);
  std::vector<std::uint8_t> data;
  const auto status = recv->Read(data, yield, error);
  assert(status == cm::client::ReadStatus::kError);
  progress.status_seen = true;
  progress.status_error = error;

  ok = conn->OpenStream(head, send, recv, error);
  assert(ok);
  ok = send->Write(Bytes(10, 0xEF), yield, error);
  assert(!ok);
  progress.goaway_seen = true;
  progress.goaway_error = error;

  ok = conn->OpenStream(head, send, recv, error);
  assert(!ok);
  progress.open_after_goaway_error = error;
  conn->Abort();
}

}  // namespace

int main() {
  boost::asio::io_context io;
  auto server_ctx = cm::client::testing::MakeServerContext(true);
  assert(server_ctx);
  tcp::acceptor acceptor(io, tcp::endpoint(
                                 boost::asio::ip::make_address("127.0.0.1"),
                                 0));
  const tcp::endpoint server = acceptor.local_endpoint();

  Progress progress;
  boost::asio::spawn(io, [&](Yield yield) {
    RunServer(acceptor, *server_ctx, progress, yield);
  });
  boost::asio::spawn(io, [&](Yield yield) {
    RunClient(io, server, progress, yield);
  });
  io.run_for(std::chrono::seconds(10));

  assert(progress.blocked_before_update);
  assert(progress.first_write_done);
  assert(progress.reset_seen);
  assert(progress.reset_error == "stream reset by peer (code 8)");
  assert(progress.status_seen);
  assert(progress.status_error == "http status 401");
  assert(progress.goaway_seen);
  assert(progress.goaway_error == "stream refused by goaway");
  assert(progress.open_after_goaway_error == "connection going away");
  assert(progress.server_done);
  return 0;
}
