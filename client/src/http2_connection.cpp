#include "http2_connection.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

#include <boost/asio/read.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/write.hpp>

#include "platform_log.h"

namespace cm::client::http2 {

namespace {
constexpr const char* kTag = "http2";
constexpr std::uint32_t kLocalStreamWindow = 1u << 20;
constexpr std::uint32_t kLocalConnectionWindow = 1u << 20;
constexpr std::uint32_t kLocalMaxFrameSize = kDefaultMaxFrameSize;
constexpr std::uint32_t kMaxAllowedFrameSize = 16777215;
constexpr auto kLingerTimeout = std::chrono::seconds(1);

std::uint32_t GetU32(const std::uint8_t* p) {
  return (static_cast<std::uint32_t>(p[0]) << 24) |
         (static_cast<std::uint32_t>(p[1]) << 16) |
         (static_cast<std::uint32_t>(p[2]) << 8) |
         static_cast<std::uint32_t>(p[3]);
}

void WaitSignal(boost::asio::steady_timer& signal, Yield yield) {
  boost::system::error_code ec;
  signal.async_wait(yield[ec]);
}

class StreamSender : public SendChannel {
 public:
  StreamSender(std::shared_ptr<Connection> conn,
               std::shared_ptr<StreamState> stream)
      : conn_(std::move(conn)), stream_(std::move(stream)) {}

  bool Write(const std::vector<std::uint8_t>& bytes, Yield yield,
             std::string& error) override {
    return conn_->SendData(*stream_, bytes, yield, error);
  }

  void Finish() override { conn_->FinishStream(*stream_); }

 private:
  std::shared_ptr<Connection> conn_;
  std::shared_ptr<StreamState> stream_;
};

class StreamReceiver : public RecvChannel {
 public:
  StreamReceiver(std::shared_ptr<Connection> conn,
                 std::shared_ptr<StreamState> stream)
      : conn_(std::move(conn)), stream_(std::move(stream)) {}

  ReadStatus Read(std::vector<std::uint8_t>& out, Yield yield,
                  std::string& error) override {
    return conn_->ReadData(*stream_, out, yield, error);
  }

  void Cancel() override { conn_->CancelStream(*stream_); }

 private:
  std::shared_ptr<Connection> conn_;
  std::shared_ptr<StreamState> stream_;
};
}  // namespace

StreamState::StreamState(boost::asio::io_context& io, std::uint32_t stream_id,
                         std::int64_t initial_send_window)
    : id(stream_id),
      send_window(initial_send_window),
      signal(io, boost::asio::steady_timer::time_point::max()) {}

Connection::Connection(boost::asio::io_context& io,
                       std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
                       std::unique_ptr<TlsStream> tls)
    : io_(io),
      ssl_ctx_(std::move(ssl_ctx)),
      tls_(std::move(tls)),
      flush_signal_(io, boost::asio::steady_timer::time_point::max()),
      linger_timer_(io) {}

Connection::~Connection() { CloseSocket(); }

bool Connection::ReadFrame(Yield yield, FrameHeader& header,
                           std::vector<std::uint8_t>& payload,
                           std::string& error) {
  std::uint8_t head[kFrameHeaderSize];
  boost::system::error_code ec;
  boost::asio::async_read(*tls_, boost::asio::buffer(head), yield[ec]);
  if (ec) {
    error = ec == boost::asio::error::eof ? "connection closed by peer"
                                          : "read failed: " + ec.message();
    return false;
  }
  header = ParseFrameHeader(head);
  if (header.length > kLocalMaxFrameSize) {
    error = "frame size " + std::to_string(header.length) + " over limit";
    return false;
  }
  payload.resize(header.length);
  if (header.length > 0) {
    boost::asio::async_read(*tls_, boost::asio::buffer(payload), yield[ec]);
    if (ec) {
      error = "read failed: " + ec.message();
      return false;
    }
  }
  return true;
}

bool Connection::Start(Yield yield, std::string& error) {
  std::vector<std::uint8_t> hello(kClientPreface,
                                  kClientPreface + kClientPrefaceSize);
  AppendSettings(hello,
                 {{static_cast<std::uint16_t>(SettingsId::kEnablePush), 0},
                  {static_cast<std::uint16_t>(SettingsId::kInitialWindowSize),
                   kLocalStreamWindow}});
  AppendWindowUpdate(hello, 0, kLocalConnectionWindow - kDefaultWindowSize);
  conn_recv_window_ = kLocalConnectionWindow;

  boost::system::error_code ec;
  boost::asio::async_write(*tls_, boost::asio::buffer(hello), yield[ec]);
  if (ec) {
    error = "preface write failed: " + ec.message();
    return false;
  }

  // The server preface is a SETTINGS frame.
  FrameHeader header;
  std::vector<std::uint8_t> payload;
  if (!ReadFrame(yield, header, payload, error)) {
    return false;
  }
  if (header.type != static_cast<std::uint8_t>(FrameType::kSettings) ||
      (header.flags & flags::kAck) != 0 || header.stream_id != 0) {
    error = "server preface missing settings";
    return false;
  }
  if (!ApplySettings(payload.data(), payload.size(), error)) {
    return false;
  }
  std::vector<std::uint8_t> ack;
  AppendSettingsAck(ack);
  boost::asio::async_write(*tls_, boost::asio::buffer(ack), yield[ec]);
  if (ec) {
    error = "settings ack failed: " + ec.message();
    return false;
  }

  started_ = true;
  auto self = shared_from_this();
  boost::asio::spawn(io_, [self](Yield y) { self->RunDriver(y); });
  boost::asio::spawn(io_, [self](Yield y) { self->RunFlusher(y); });
  return true;
}

bool Connection::OpenStream(const RequestHead& head,
                            std::shared_ptr<SendChannel>& out_send,
                            std::shared_ptr<RecvChannel>& out_recv,
                            std::string& error) {
  if (!started_ || closed_ || closing_) {
    error = closed_ ? close_reason_ : "connection not open";
    return false;
  }
  if (going_away_) {
    error = "connection going away";
    return false;
  }
  const std::uint32_t id = next_stream_id_;
  next_stream_id_ += 2;
  auto stream = std::make_shared<StreamState>(io_, id, peer_initial_window_);
  streams_[id] = stream;

  std::vector<std::uint8_t> frame;
  AppendHeaders(frame, id, EncodeRequestHeaders(head), false,
                peer_max_frame_size_);
  Queue(std::move(frame));

  auto self = shared_from_this();
  out_send = std::make_shared<StreamSender>(self, stream);
  out_recv = std::make_shared<StreamReceiver>(self, stream);
  return true;
}

void Connection::Abort() {
  if (aborted_) {
    return;
  }
  aborted_ = true;
  closing_ = true;
  for (auto& entry : streams_) {
    entry.second->cancelled = true;
  }
  NotifyStreams();
  if (!started_) {
    CloseSocket();
    return;
  }
  flush_signal_.cancel();
  linger_timer_.expires_after(kLingerTimeout);
  auto self = shared_from_this();
  linger_timer_.async_wait([self](const boost::system::error_code& ec) {
    if (!ec) {
      self->CloseSocket();
    }
  });
}

bool Connection::SendData(StreamState& stream,
                          const std::vector<std::uint8_t>& bytes, Yield yield,
                          std::string& error) {
  std::size_t off = 0;
  while (off < bytes.size()) {
    if (closed_ || aborted_) {
      error = closed_ ? close_reason_ : "connection aborted";
      return false;
    }
    if (stream.cancelled || stream.local_closed || !stream.error.empty()) {
      error = stream.error.empty() ? "stream closed" : stream.error;
      return false;
    }
    const std::int64_t avail =
        std::min<std::int64_t>({conn_send_window_, stream.send_window,
                                static_cast<std::int64_t>(peer_max_frame_size_)});
    if (avail <= 0) {
      WaitSignal(stream.signal, yield);
      continue;
    }
    const std::size_t chunk =
        std::min(static_cast<std::size_t>(avail), bytes.size() - off);
    std::vector<std::uint8_t> frame;
    frame.reserve(kFrameHeaderSize + chunk);
    AppendData(frame, stream.id, bytes.data() + off, chunk, false);
    Queue(std::move(frame));
    conn_send_window_ -= static_cast<std::int64_t>(chunk);
    stream.send_window -= static_cast<std::int64_t>(chunk);
    off += chunk;
  }
  return true;
}

void Connection::FinishStream(StreamState& stream) {
  if (stream.local_closed || closed_ || aborted_ || !stream.error.empty()) {
    return;
  }
  stream.local_closed = true;
  std::vector<std::uint8_t> frame;
  AppendData(frame, stream.id, nullptr, 0, true);
  Queue(std::move(frame));
}

ReadStatus Connection::ReadData(StreamState& stream,
                                std::vector<std::uint8_t>& out, Yield yield,
                                std::string& error) {
  for (;;) {
    if (stream.cancelled) {
      return ReadStatus::kCancelled;
    }
    if (!stream.inbound.empty()) {
      out = std::move(stream.inbound.front());
      stream.inbound.pop_front();
      ReleaseCapacity(stream, out.size());
      return ReadStatus::kData;
    }
    if (!stream.error.empty()) {
      error = stream.error;
      return ReadStatus::kError;
    }
    if (stream.remote_closed) {
      return ReadStatus::kEnd;
    }
    if (closed_) {
      error = close_reason_;
      return ReadStatus::kError;
    }
    WaitSignal(stream.signal, yield);
  }
}

void Connection::CancelStream(StreamState& stream) {
  stream.cancelled = true;
  stream.signal.cancel();
}

bool Connection::ApplySettings(const std::uint8_t* payload, std::size_t len,
                               std::string& error) {
  std::vector<Setting> settings;
  if (!ParseSettings(payload, len, settings, error)) {
    return false;
  }
  for (const auto& s : settings) {
    switch (static_cast<SettingsId>(s.first)) {
      case SettingsId::kInitialWindowSize: {
        if (s.second > kMaxWindowSize) {
          error = "initial window size too large";
          return false;
        }
        const std::int64_t delta =
            static_cast<std::int64_t>(s.second) - peer_initial_window_;
        peer_initial_window_ = s.second;
        for (auto& entry : streams_) {
          entry.second->send_window += delta;
        }
        break;
      }
      case SettingsId::kMaxFrameSize:
        if (s.second < kDefaultMaxFrameSize ||
            s.second > kMaxAllowedFrameSize) {
          error = "invalid max frame size";
          return false;
        }
        peer_max_frame_size_ = s.second;
        break;
      default:
        break;
    }
  }
  NotifyStreams();
  return true;
}

StreamState* Connection::FindStream(std::uint32_t id) {
  const auto it = streams_.find(id);
  return it == streams_.end() ? nullptr : it->second.get();
}

bool Connection::Dispatch(const FrameHeader& header,
                          const std::vector<std::uint8_t>& payload,
                          ErrorCode& code, std::string& error) {
  code = ErrorCode::kProtocolError;
  const auto type = static_cast<FrameType>(header.type);
  if (continuation_stream_ != 0 &&
      (type != FrameType::kContinuation ||
       header.stream_id != continuation_stream_)) {
    error = "expected continuation frame";
    return false;
  }
  switch (type) {
    case FrameType::kData:
      return OnData(header, payload, code, error);
    case FrameType::kHeaders: {
      if (header.stream_id == 0) {
        error = "headers on stream 0";
        return false;
      }
      const std::uint8_t* fragment = payload.data();
      std::size_t len = payload.size();
      if (!StripPadding(type, header.flags, fragment, len, error)) {
        return false;
      }
      if (StreamState* stream = FindStream(header.stream_id)) {
        stream->header_block.clear();
        stream->header_block_ends_stream =
            (header.flags & flags::kEndStream) != 0;
      }
      return OnHeaderBlock(header, fragment, len, code, error);
    }
    case FrameType::kContinuation:
      if (continuation_stream_ == 0) {
        error = "unexpected continuation frame";
        return false;
      }
      return OnHeaderBlock(header, payload.data(), payload.size(), code,
                           error);
    case FrameType::kPriority:
      return true;
    case FrameType::kRstStream:
      if (payload.size() != 4 || header.stream_id == 0) {
        code = ErrorCode::kFrameSizeError;
        error = "malformed rst_stream";
        return false;
      }
      OnRstStream(header, payload);
      return true;
    case FrameType::kSettings:
      if (header.stream_id != 0) {
        error = "settings on stream " + std::to_string(header.stream_id);
        return false;
      }
      if (header.flags & flags::kAck) {
        return true;
      }
      if (!ApplySettings(payload.data(), payload.size(), error)) {
        return false;
      }
      {
        std::vector<std::uint8_t> ack;
        AppendSettingsAck(ack);
        Queue(std::move(ack));
      }
      return true;
    case FrameType::kPushPromise:
      error = "push promise while push is disabled";
      return false;
    case FrameType::kPing:
      if (payload.size() != 8) {
        code = ErrorCode::kFrameSizeError;
        error = "malformed ping";
        return false;
      }
      if ((header.flags & flags::kAck) == 0) {
        std::vector<std::uint8_t> pong;
        AppendPing(pong, payload.data(), true);
        Queue(std::move(pong));
      }
      return true;
    case FrameType::kGoAway:
      if (payload.size() < 8) {
        code = ErrorCode::kFrameSizeError;
        error = "malformed goaway";
        return false;
      }
      OnGoAway(payload);
      return true;
    case FrameType::kWindowUpdate:
      return OnWindowUpdate(header, payload, code, error);
  }
  // Unknown frame types are ignored.
  return true;
}

bool Connection::OnData(const FrameHeader& header,
                        const std::vector<std::uint8_t>& payload,
                        ErrorCode& code, std::string& error) {
  if (header.stream_id == 0) {
    error = "data on stream 0";
    return false;
  }
  conn_recv_window_ -= static_cast<std::int64_t>(payload.size());
  if (conn_recv_window_ < 0) {
    code = ErrorCode::kFlowControlError;
    error = "connection receive window exceeded";
    return false;
  }
  const std::uint8_t* data = payload.data();
  std::size_t len = payload.size();
  if (!StripPadding(FrameType::kData, header.flags, data, len, error)) {
    return false;
  }

  StreamState* stream = FindStream(header.stream_id);
  const bool readable =
      stream && !stream->cancelled && stream->error.empty();
  // Padding, and data nobody will read, is returned at once.
  const std::size_t unread = readable ? payload.size() - len : payload.size();
  if (unread > 0) {
    std::vector<std::uint8_t> update;
    AppendWindowUpdate(update, 0, static_cast<std::uint32_t>(unread));
    Queue(std::move(update));
    conn_recv_window_ += static_cast<std::int64_t>(unread);
  }
  if (!stream) {
    return true;
  }
  if (readable && len > 0) {
    stream->inbound.emplace_back(data, data + len);
  }
  if (header.flags & flags::kEndStream) {
    stream->remote_closed = true;
  }
  stream->signal.cancel();
  return true;
}

bool Connection::OnHeaderBlock(const FrameHeader& header,
                               const std::uint8_t* fragment, std::size_t len,
                               ErrorCode& code, std::string& error) {
  StreamState* stream = FindStream(header.stream_id);
  if (stream) {
    stream->header_block.insert(stream->header_block.end(), fragment,
                                fragment + len);
    if (stream->header_block.size() > 64 * 1024) {
      code = ErrorCode::kProtocolError;
      error = "header block too large";
      return false;
    }
  }
  if ((header.flags & flags::kEndHeaders) == 0) {
    continuation_stream_ = header.stream_id;
    return true;
  }
  continuation_stream_ = 0;
  if (stream) {
    CompleteHeaderBlock(*stream);
  }
  return true;
}

void Connection::CompleteHeaderBlock(StreamState& stream) {
  if (!stream.headers_received) {
    stream.headers_received = true;
    int status = 0;
    if (!DecodeResponseStatus(stream.header_block, status)) {
      stream.error = "http status unreadable";
    } else if (status != 200) {
      stream.error = "http status " + std::to_string(status);
    }
    if (!stream.error.empty()) {
      std::vector<std::uint8_t> rst;
      AppendRstStream(rst, stream.id, ErrorCode::kCancel);
      Queue(std::move(rst));
    }
  }
  // Trailers and informational blocks carry nothing we use.
  stream.header_block.clear();
  if (stream.header_block_ends_stream) {
    stream.remote_closed = true;
  }
  stream.signal.cancel();
}

bool Connection::OnWindowUpdate(const FrameHeader& header,
                                const std::vector<std::uint8_t>& payload,
                                ErrorCode& code, std::string& error) {
  if (payload.size() != 4) {
    code = ErrorCode::kFrameSizeError;
    error = "malformed window_update";
    return false;
  }
  const std::uint32_t increment = GetU32(payload.data()) & 0x7fffffffu;
  if (header.stream_id == 0) {
    if (increment == 0) {
      error = "zero connection window increment";
      return false;
    }
    conn_send_window_ += increment;
    if (conn_send_window_ > kMaxWindowSize) {
      code = ErrorCode::kFlowControlError;
      error = "connection send window overflow";
      return false;
    }
    NotifyStreams();
    return true;
  }
  StreamState* stream = FindStream(header.stream_id);
  if (!stream) {
    return true;
  }
  if (increment == 0 || stream->send_window + increment > kMaxWindowSize) {
    stream->error = "stream flow control error";
    std::vector<std::uint8_t> rst;
    AppendRstStream(rst, stream->id, ErrorCode::kFlowControlError);
    Queue(std::move(rst));
  } else {
    stream->send_window += increment;
  }
  stream->signal.cancel();
  return true;
}

void Connection::OnRstStream(const FrameHeader& header,
                             const std::vector<std::uint8_t>& payload) {
  StreamState* stream = FindStream(header.stream_id);
  if (!stream) {
    return;
  }
  const std::uint32_t code = GetU32(payload.data());
  if (stream->error.empty()) {
    stream->error = "stream reset by peer (code " + std::to_string(code) + ")";
  }
  stream->signal.cancel();
}

void Connection::OnGoAway(const std::vector<std::uint8_t>& payload) {
  const std::uint32_t last_stream = GetU32(payload.data()) & 0x7fffffffu;
  const std::uint32_t code = GetU32(payload.data() + 4);
  going_away_ = true;
  platform::log::Log(platform::log::Level::kWarn, kTag, "server sent goaway",
                     {{"last_stream", std::to_string(last_stream)},
                      {"code", std::to_string(code)}});
  for (auto& entry : streams_) {
    if (entry.first > last_stream && entry.second->error.empty()) {
      entry.second->error = "stream refused by goaway";
      entry.second->signal.cancel();
    }
  }
}

void Connection::RunDriver(Yield yield) {
  std::string reason;
  try {
    FrameHeader header;
    std::vector<std::uint8_t> payload;
    for (;;) {
      if (!ReadFrame(yield, header, payload, reason)) {
        break;
      }
      if (aborted_) {
        break;
      }
      ErrorCode code = ErrorCode::kNoError;
      if (!Dispatch(header, payload, code, reason)) {
        std::vector<std::uint8_t> goaway;
        AppendGoAway(goaway, 0, code);
        Queue(std::move(goaway));
        break;
      }
    }
  } catch (const std::exception& e) {
    reason = std::string("driver failed: ") + e.what();
  }
  if (!aborted_) {
    platform::log::Log(platform::log::Level::kWarn, kTag,
                       "http/2 connection ended", {{"reason", reason}});
  }
  FailAll(reason.empty() ? "connection closed" : reason);
}

void Connection::RunFlusher(Yield yield) {
  try {
    for (;;) {
      while (out_queue_.empty() && !closing_) {
        WaitSignal(flush_signal_, yield);
      }
      if (out_queue_.empty() || socket_closed_) {
        break;
      }
      std::vector<std::uint8_t> batch;
      for (auto& chunk : out_queue_) {
        batch.insert(batch.end(), chunk.begin(), chunk.end());
      }
      out_queue_.clear();
      boost::system::error_code ec;
      boost::asio::async_write(*tls_, boost::asio::buffer(batch), yield[ec]);
      if (ec) {
        if (!closed_ && !aborted_) {
          FailAll("write failed: " + ec.message());
        }
        break;
      }
    }
  } catch (const std::exception& e) {
    platform::log::Log(platform::log::Level::kError, kTag, "flusher failed",
                       {{"error", e.what()}});
  }
  out_queue_.clear();
  CloseSocket();
}

void Connection::Queue(std::vector<std::uint8_t> bytes) {
  if (aborted_ || socket_closed_) {
    return;
  }
  out_queue_.push_back(std::move(bytes));
  flush_signal_.cancel();
}

void Connection::ReleaseCapacity(StreamState& stream, std::size_t bytes) {
  if (bytes == 0 || closed_) {
    return;
  }
  std::vector<std::uint8_t> update;
  if (!stream.remote_closed) {
    AppendWindowUpdate(update, stream.id, static_cast<std::uint32_t>(bytes));
  }
  AppendWindowUpdate(update, 0, static_cast<std::uint32_t>(bytes));
  conn_recv_window_ += static_cast<std::int64_t>(bytes);
  Queue(std::move(update));
}

void Connection::FailAll(const std::string& reason) {
  if (closed_) {
    return;
  }
  closed_ = true;
  closing_ = true;
  close_reason_ = reason;
  for (auto& entry : streams_) {
    StreamState& stream = *entry.second;
    if (stream.error.empty() && !stream.remote_closed) {
      stream.error = reason;
    }
  }
  NotifyStreams();
  flush_signal_.cancel();
}

void Connection::NotifyStreams() {
  for (auto& entry : streams_) {
    entry.second->signal.cancel();
  }
}

void Connection::CloseSocket() {
  if (socket_closed_) {
    return;
  }
  socket_closed_ = true;
  boost::system::error_code ec;
  auto& socket = tls_->lowest_layer();
  socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  socket.close(ec);
  linger_timer_.cancel();
  flush_signal_.cancel();
}

}  // namespace cm::client::http2
