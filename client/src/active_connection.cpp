#include "active_connection.h"

#include <utility>

#include <nlohmann/json.hpp>

#include "frame_io.h"

namespace cm::client {

ActiveConnection::ActiveConnection(std::shared_ptr<SendChannel> send,
                                   std::shared_ptr<InboundReader> reader,
                                   std::shared_ptr<ConnectionDriver> driver,
                                   std::string session_id,
                                   bool pairing_required,
                                   std::uint64_t next_sequence)
    : send_(std::move(send)),
      reader_(std::move(reader)),
      driver_(std::move(driver)),
      session_id_(std::move(session_id)),
      pairing_required_(pairing_required),
      next_sequence_(next_sequence) {}

ActiveConnection::~ActiveConnection() { Close(); }

bool ActiveConnection::SendJoin(std::uint64_t channel_id,
                                const std::vector<std::string>& members,
                                bool relay, Yield yield, std::string& error) {
  proto::ControlEnvelope envelope;
  envelope.properties = {{"members", members}, {"relay", relay}};
  return Send(channel_id, proto::FrameType::kJoin, std::move(envelope), yield,
              error);
}

bool ActiveConnection::SendLeave(std::uint64_t channel_id, Yield yield,
                                 std::string& error) {
  return Send(channel_id, proto::FrameType::kLeave, proto::ControlEnvelope{},
              yield, error);
}

bool ActiveConnection::SendMessage(std::uint64_t channel_id,
                                   const std::vector<std::uint8_t>& body,
                                   Yield yield, std::string& error) {
  return Send(channel_id, proto::FrameType::kMsg, proto::OpaquePayload(body),
              yield, error);
}

bool ActiveConnection::SendPresence(const std::string& state, Yield yield,
                                    std::string& error) {
  proto::ControlEnvelope envelope;
  envelope.properties = {{"state", state}};
  return Send(0, proto::FrameType::kPresence, std::move(envelope), yield,
              error);
}

bool ActiveConnection::Send(std::uint64_t channel_id, proto::FrameType type,
                            proto::FramePayload payload, Yield yield,
                            std::string& error) {
  if (closed_) {
    error = "connection closed";
    return false;
  }
  proto::Frame frame;
  frame.channel_id = channel_id;
  frame.sequence = next_sequence_++;
  frame.type = type;
  frame.payload = std::move(payload);
  return WriteFrame(*send_, frame, yield, error);
}

void ActiveConnection::Close() {
  if (closed_) {
    return;
  }
  closed_ = true;
  if (send_) {
    send_->Finish();
  }
  if (reader_) {
    reader_->Cancel();
  }
  if (driver_) {
    driver_->Abort();
  }
}

}  // namespace cm::client
