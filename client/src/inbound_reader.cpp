#include "inbound_reader.h"

#include <exception>
#include <string>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/spawn.hpp>

#include "platform_log.h"

namespace cm::client {

namespace {
constexpr const char* kTag = "reader";
}  // namespace

InboundReader::InboundReader(std::shared_ptr<RecvChannel> recv,
                             std::vector<std::uint8_t> buffered,
                             std::shared_ptr<EventQueue> events)
    : recv_(std::move(recv)),
      buffer_(std::move(buffered)),
      events_(std::move(events)) {}

void InboundReader::Start(boost::asio::io_context& io) {
  auto self = shared_from_this();
  // Posted so the caller can publish Connected before the first frame.
  boost::asio::post(io, [self, &io]() {
    boost::asio::spawn(io, [self](Yield yield) {
      try {
        self->Run(yield);
      } catch (const std::exception& e) {
        platform::log::Log(platform::log::Level::kError, kTag,
                           "reader failed", {{"error", e.what()}});
      }
      self->finished_ = true;
    });
  });
}

void InboundReader::Cancel() {
  if (cancelled_) {
    return;
  }
  cancelled_ = true;
  recv_->Cancel();
}

bool InboundReader::DrainBuffer() {
  for (;;) {
    proto::Frame frame;
    std::string detail;
    switch (buffer_.Next(frame, detail)) {
      case proto::DecodeStatus::kOk:
        if (cancelled_ || !Publish(*events_, FrameEvent{std::move(frame)})) {
          return false;
        }
        break;
      case proto::DecodeStatus::kIncomplete:
        return true;
      case proto::DecodeStatus::kError:
        // No resynchronisation inside a corrupt buffer.
        buffer_.Clear();
        if (cancelled_ ||
            !Publish(*events_, ErrorEvent{"decode error: " + detail})) {
          return false;
        }
        return true;
    }
  }
}

void InboundReader::Run(Yield yield) {
  std::vector<std::uint8_t> chunk;
  for (;;) {
    if (cancelled_ || !DrainBuffer()) {
      return;
    }
    std::string detail;
    const ReadStatus status = recv_->Read(chunk, yield, detail);
    if (cancelled_) {
      return;
    }
    switch (status) {
      case ReadStatus::kData:
        buffer_.Append(chunk);
        break;
      case ReadStatus::kEnd:
        Publish(*events_, DisconnectedEvent{"remote closed"});
        return;
      case ReadStatus::kError: {
        const std::string reason = "receive failed: " + detail;
        if (Publish(*events_, ErrorEvent{reason})) {
          Publish(*events_, DisconnectedEvent{reason});
        }
        return;
      }
      case ReadStatus::kCancelled:
        return;
    }
  }
}

}  // namespace cm::client
