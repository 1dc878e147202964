#include "frame_io.h"

#include <utility>

namespace cm::client {

namespace {
constexpr std::size_t kCompactThreshold = 1024u * 1024u;
}  // namespace

FrameBuffer::FrameBuffer(std::vector<std::uint8_t> seed)
    : buf_(std::move(seed)) {}

void FrameBuffer::Append(const std::vector<std::uint8_t>& bytes) {
  if (off_ > 0 && off_ >= buf_.size()) {
    buf_.clear();
    off_ = 0;
  }
  buf_.insert(buf_.end(), bytes.begin(), bytes.end());
}

proto::DecodeStatus FrameBuffer::Next(proto::Frame& out, std::string& error) {
  if (off_ >= buf_.size()) {
    return proto::DecodeStatus::kIncomplete;
  }
  std::size_t consumed = 0;
  const proto::DecodeStatus status = proto::DecodeFrame(
      buf_.data() + off_, buf_.size() - off_, out, consumed, error);
  if (status != proto::DecodeStatus::kOk) {
    return status;
  }
  off_ += consumed;
  if (off_ >= buf_.size()) {
    buf_.clear();
    off_ = 0;
  } else if (off_ > kCompactThreshold) {
    std::vector<std::uint8_t> compact(
        buf_.begin() + static_cast<std::ptrdiff_t>(off_), buf_.end());
    buf_.swap(compact);
    off_ = 0;
  }
  return status;
}

void FrameBuffer::Clear() {
  buf_.clear();
  off_ = 0;
}

std::vector<std::uint8_t> FrameBuffer::TakeRemaining() {
  std::vector<std::uint8_t> rest(
      buf_.begin() + static_cast<std::ptrdiff_t>(off_), buf_.end());
  Clear();
  return rest;
}

bool WriteFrame(SendChannel& send, const proto::Frame& frame, Yield yield,
                std::string& error) {
  std::vector<std::uint8_t> bytes;
  if (!proto::EncodeFrame(frame, bytes, error)) {
    error = "encode frame: " + error;
    return false;
  }
  return send.Write(bytes, yield, error);
}

}  // namespace cm::client
