#ifndef CM_CLIENT_ACTIVE_CONNECTION_H
#define CM_CLIENT_ACTIVE_CONNECTION_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "frame.h"
#include "inbound_reader.h"
#include "stream_channel.h"

namespace cm::client {

// An authenticated session. Owned by the engine actor only.
class ActiveConnection {
 public:
  ActiveConnection(std::shared_ptr<SendChannel> send,
                   std::shared_ptr<InboundReader> reader,
                   std::shared_ptr<ConnectionDriver> driver,
                   std::string session_id, bool pairing_required,
                   std::uint64_t next_sequence);
  ~ActiveConnection();

  ActiveConnection(const ActiveConnection&) = delete;
  ActiveConnection& operator=(const ActiveConnection&) = delete;

  bool SendJoin(std::uint64_t channel_id,
                const std::vector<std::string>& members, bool relay,
                Yield yield, std::string& error);
  bool SendLeave(std::uint64_t channel_id, Yield yield, std::string& error);
  bool SendMessage(std::uint64_t channel_id,
                   const std::vector<std::uint8_t>& body, Yield yield,
                   std::string& error);
  bool SendPresence(const std::string& state, Yield yield,
                    std::string& error);

  // Ends the send side, cancels the reader and aborts the driver. Never
  // suspends; safe to call more than once.
  void Close();

  const std::string& session_id() const { return session_id_; }
  bool pairing_required() const { return pairing_required_; }

 private:
  bool Send(std::uint64_t channel_id, proto::FrameType type,
            proto::FramePayload payload, Yield yield, std::string& error);

  std::shared_ptr<SendChannel> send_;
  std::shared_ptr<InboundReader> reader_;
  std::shared_ptr<ConnectionDriver> driver_;
  std::string session_id_;
  bool pairing_required_{false};
  std::uint64_t next_sequence_{3};
  bool closed_{false};
};

}  // namespace cm::client

#endif  // CM_CLIENT_ACTIVE_CONNECTION_H
