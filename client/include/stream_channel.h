#ifndef CM_CLIENT_STREAM_CHANNEL_H
#define CM_CLIENT_STREAM_CHANNEL_H

#include <cstdint>
#include <string>
#include <vector>

#include <boost/asio/spawn.hpp>

namespace cm::client {

using Yield = boost::asio::yield_context;

// Write half of one request stream.
class SendChannel {
 public:
  virtual ~SendChannel() = default;

  // Suspends until the transport grants enough send capacity, then writes.
  // Fails once the stream is closed or reset.
  virtual bool Write(const std::vector<std::uint8_t>& bytes, Yield yield,
                     std::string& error) = 0;

  // Empty end-of-stream write. Never suspends.
  virtual void Finish() = 0;
};

enum class ReadStatus : std::uint8_t {
  kData = 0,
  kEnd = 1,
  kError = 2,
  kCancelled = 3
};

// Read half of one request stream.
class RecvChannel {
 public:
  virtual ~RecvChannel() = default;

  virtual ReadStatus Read(std::vector<std::uint8_t>& out, Yield yield,
                          std::string& error) = 0;

  // Wakes a pending Read with kCancelled; later reads return kCancelled.
  virtual void Cancel() = 0;
};

// Background task pumping the multiplexed connection.
class ConnectionDriver {
 public:
  virtual ~ConnectionDriver() = default;
  virtual void Abort() = 0;
};

}  // namespace cm::client

#endif  // CM_CLIENT_STREAM_CHANNEL_H
