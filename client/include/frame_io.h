#ifndef CM_CLIENT_FRAME_IO_H
#define CM_CLIENT_FRAME_IO_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "frame.h"
#include "stream_channel.h"

namespace cm::client {

// Receive-side byte accumulator that hands out whole frames.
class FrameBuffer {
 public:
  FrameBuffer() = default;
  explicit FrameBuffer(std::vector<std::uint8_t> seed);

  void Append(const std::vector<std::uint8_t>& bytes);
  proto::DecodeStatus Next(proto::Frame& out, std::string& error);
  void Clear();
  std::vector<std::uint8_t> TakeRemaining();

  std::size_t pending() const { return buf_.size() - off_; }

 private:
  std::vector<std::uint8_t> buf_;
  std::size_t off_{0};
};

// Encodes the frame and writes it once the stream has capacity for it.
bool WriteFrame(SendChannel& send, const proto::Frame& frame, Yield yield,
                std::string& error);

}  // namespace cm::client

#endif  // CM_CLIENT_FRAME_IO_H
