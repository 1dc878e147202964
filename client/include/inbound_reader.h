#ifndef CM_CLIENT_INBOUND_READER_H
#define CM_CLIENT_INBOUND_READER_H

#include <cstdint>
#include <memory>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "event_queue.h"
#include "frame_io.h"
#include "stream_channel.h"

namespace cm::client {

// Decodes frames from the receive half of an established connection and
// publishes them as events until the peer closes, the read fails, the
// event consumer goes away or Cancel() is called.
class InboundReader : public std::enable_shared_from_this<InboundReader> {
 public:
  InboundReader(std::shared_ptr<RecvChannel> recv,
                std::vector<std::uint8_t> buffered,
                std::shared_ptr<EventQueue> events);

  InboundReader(const InboundReader&) = delete;
  InboundReader& operator=(const InboundReader&) = delete;

  void Start(boost::asio::io_context& io);

  // Fire-and-forget; no events are published after this returns.
  void Cancel();

  bool finished() const { return finished_; }

 private:
  void Run(Yield yield);
  // False once the reader should stop.
  bool DrainBuffer();

  std::shared_ptr<RecvChannel> recv_;
  FrameBuffer buffer_;
  std::shared_ptr<EventQueue> events_;
  bool cancelled_{false};
  bool finished_{false};
};

}  // namespace cm::client

#endif  // CM_CLIENT_INBOUND_READER_H
