#ifndef CM_PROTO_FRAME_H
#define CM_PROTO_FRAME_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace cm::proto {

constexpr std::uint32_t kProtocolVersion = 1;
constexpr std::size_t kMaxFrameBodyBytes = 16u * 1024u * 1024u;

enum class FrameType : std::uint8_t {
  kHello = 1,
  kAuth = 2,
  kJoin = 3,
  kLeave = 4,
  kMsg = 5,
  kAck = 6,
  kTyping = 7,
  kPresence = 8,
  kKeyUpdate = 9,
  kGroupCreate = 10,
  kGroupInvite = 11,
  kGroupEvent = 12,
  kCallOffer = 13,
  kCallAnswer = 14,
  kCallEnd = 15,
  kVoiceFrame = 16,
  kVideoFrame = 17,
  kCallStats = 18,
  kError = 19
};

const char* FrameTypeName(FrameType type);
bool FrameTypeFromWire(std::uint8_t value, FrameType& out);

// Structured payload; `properties` is a free-form JSON document.
struct ControlEnvelope {
  nlohmann::json properties = nlohmann::json::object();
};

using OpaquePayload = std::vector<std::uint8_t>;
using FramePayload = std::variant<ControlEnvelope, OpaquePayload>;

struct Frame {
  std::uint64_t channel_id{0};
  std::uint64_t sequence{0};
  FrameType type{FrameType::kMsg};
  FramePayload payload{OpaquePayload{}};
};

// nullptr when the payload is opaque.
const nlohmann::json* ControlProperties(const Frame& frame);
const OpaquePayload* OpaqueBytes(const Frame& frame);

bool EncodeFrame(const Frame& frame, std::vector<std::uint8_t>& out,
                 std::string& error);

enum class DecodeStatus : std::uint8_t { kOk = 0, kIncomplete = 1, kError = 2 };

// Decodes one frame from the front of `data`. kIncomplete means the buffer
// holds a prefix of a frame and more bytes are needed; it is not an error.
DecodeStatus DecodeFrame(const std::uint8_t* data, std::size_t len, Frame& out,
                         std::size_t& consumed, std::string& error);

}  // namespace cm::proto

#endif  // CM_PROTO_FRAME_H
