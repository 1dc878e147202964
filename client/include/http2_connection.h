#ifndef CM_CLIENT_HTTP2_CONNECTION_H
#define CM_CLIENT_HTTP2_CONNECTION_H

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>

#include "http2_frame.h"
#include "stream_channel.h"

namespace cm::client::http2 {

using TlsStream = boost::asio::ssl::stream<boost::asio::ip::tcp::socket>;

struct StreamState {
  StreamState(boost::asio::io_context& io, std::uint32_t stream_id,
              std::int64_t initial_send_window);

  std::uint32_t id{0};
  std::int64_t send_window{0};
  std::deque<std::vector<std::uint8_t>> inbound;
  std::vector<std::uint8_t> header_block;
  bool header_block_ends_stream{false};
  bool headers_received{false};
  bool local_closed{false};
  bool remote_closed{false};
  bool cancelled{false};
  std::string error;
  // Never expires; cancel() wakes every waiter.
  boost::asio::steady_timer signal;
};

// Client side of one HTTP/2 connection over TLS. All members run on the
// io_context thread. The driver coroutine reads and dispatches frames; a
// flusher coroutine owns every socket write.
class Connection : public ConnectionDriver,
                   public std::enable_shared_from_this<Connection> {
 public:
  Connection(boost::asio::io_context& io,
             std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
             std::unique_ptr<TlsStream> tls);
  ~Connection() override;

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // Preface and SETTINGS exchange, then starts the driver and flusher.
  bool Start(Yield yield, std::string& error);

  bool OpenStream(const RequestHead& head,
                  std::shared_ptr<SendChannel>& out_send,
                  std::shared_ptr<RecvChannel>& out_recv,
                  std::string& error);

  // Drops the receive side immediately; bytes already queued get a short
  // grace period to flush before the socket is closed.
  void Abort() override;


  bool SendData(StreamState& stream, const std::vector<std::uint8_t>& bytes,
                Yield yield, std::string& error);
  void FinishStream(StreamState& stream);
  ReadStatus ReadData(StreamState& stream, std::vector<std::uint8_t>& out,
                      Yield yield, std::string& error);
  void CancelStream(StreamState& stream);

 private:
  bool ReadFrame(Yield yield, FrameHeader& header,
                 std::vector<std::uint8_t>& payload, std::string& error);
  bool ApplySettings(const std::uint8_t* payload, std::size_t len,
                     std::string& error);
  // False on a connection error; `error` then holds the reason.
  bool Dispatch(const FrameHeader& header,
                const std::vector<std::uint8_t>& payload, ErrorCode& code,
                std::string& error);
  bool OnData(const FrameHeader& header,
              const std::vector<std::uint8_t>& payload, ErrorCode& code,
              std::string& error);
  bool OnHeaderBlock(const FrameHeader& header, const std::uint8_t* fragment,
                     std::size_t len, ErrorCode& code, std::string& error);
  bool OnWindowUpdate(const FrameHeader& header,
                      const std::vector<std::uint8_t>& payload,
                      ErrorCode& code, std::string& error);
  void OnRstStream(const FrameHeader& header,
                   const std::vector<std::uint8_t>& payload);
  void OnGoAway(const std::vector<std::uint8_t>& payload);
  void CompleteHeaderBlock(StreamState& stream);

  void RunDriver(Yield yield);
  void RunFlusher(Yield yield);
  void Queue(std::vector<std::uint8_t> bytes);
  void ReleaseCapacity(StreamState& stream, std::size_t bytes);
  void FailAll(const std::string& reason);
  void NotifyStreams();
  void CloseSocket();
  StreamState* FindStream(std::uint32_t id);

  boost::asio::io_context& io_;
  std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
  std::unique_ptr<TlsStream> tls_;

  std::map<std::uint32_t, std::shared_ptr<StreamState>> streams_;
  std::uint32_t next_stream_id_{1};
  std::uint32_t continuation_stream_{0};

  std::int64_t conn_send_window_{kDefaultWindowSize};
  std::int64_t conn_recv_window_{kDefaultWindowSize};
  std::int64_t peer_initial_window_{kDefaultWindowSize};
  std::uint32_t peer_max_frame_size_{kDefaultMaxFrameSize};

  std::deque<std::vector<std::uint8_t>> out_queue_;
  boost::asio::steady_timer flush_signal_;
  boost::asio::steady_timer linger_timer_;

  bool started_{false};
  bool going_away_{false};
  bool closing_{false};
  bool closed_{false};
  bool aborted_{false};
  bool socket_closed_{false};
  std::string close_reason_;
};

}  // namespace cm::client::http2

#endif  // CM_CLIENT_HTTP2_CONNECTION_H
