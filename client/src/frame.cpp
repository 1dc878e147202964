#include "frame.h"

#include <limits>

namespace cm::proto {

namespace {

constexpr std::size_t kMaxVarintBytes = 10;
constexpr std::uint8_t kPayloadOpaque = 0;
constexpr std::uint8_t kPayloadControl = 1;

void WriteVarint(std::uint64_t v, std::vector<std::uint8_t>& out) {
  while (v >= 0x80) {
    out.push_back(static_cast<std::uint8_t>((v & 0x7F) | 0x80));
    v >>= 7;
  }
  out.push_back(static_cast<std::uint8_t>(v));
}

// kIncomplete when the input ends inside the varint.
DecodeStatus ReadVarint(const std::uint8_t* data, std::size_t len,
                        std::size_t& pos, std::uint64_t& out) {
  out = 0;
  for (std::size_t i = 0; i < kMaxVarintBytes; ++i) {
    if (pos >= len) {
      return DecodeStatus::kIncomplete;
    }
    const std::uint8_t b = data[pos++];
    if (i == kMaxVarintBytes - 1 && b > 0x01) {
      return DecodeStatus::kError;
    }
    out |= static_cast<std::uint64_t>(b & 0x7F) << (7 * i);
    if ((b & 0x80) == 0) {
      return DecodeStatus::kOk;
    }
  }
  return DecodeStatus::kError;
}

}  // namespace

const char* FrameTypeName(FrameType type) {
  switch (type) {
    case FrameType::kHello:
      return "Hello";
    case FrameType::kAuth:
      return "Auth";
    case FrameType::kJoin:
      return "Join";
    case FrameType::kLeave:
      return "Leave";
    case FrameType::kMsg:
      return "Msg";
    case FrameType::kAck:
      return "Ack";
    case FrameType::kTyping:
      return "Typing";
    case FrameType::kPresence:
      return "Presence";
    case FrameType::kKeyUpdate:
      return "KeyUpdate";
    case FrameType::kGroupCreate:
      return "GroupCreate";
    case FrameType::kGroupInvite:
      return "GroupInvite";
    case FrameType::kGroupEvent:
      return "GroupEvent";
    case FrameType::kCallOffer:
      return "CallOffer";
    case FrameType::kCallAnswer:
      return "CallAnswer";
    case FrameType::kCallEnd:
      return "CallEnd";
    case FrameType::kVoiceFrame:
      return "VoiceFrame";
    case FrameType::kVideoFrame:
      return "VideoFrame";
    case FrameType::kCallStats:
      return "CallStats";
    case FrameType::kError:
      return "Error";
  }
  return "Unknown";
}

bool FrameTypeFromWire(std::uint8_t value, FrameType& out) {
  if (value < static_cast<std::uint8_t>(FrameType::kHello) ||
      value > static_cast<std::uint8_t>(FrameType::kError)) {
    return false;
  }
  out = static_cast<FrameType>(value);
  return true;
}

const nlohmann::json* ControlProperties(const Frame& frame) {
  const auto* envelope = std::get_if<ControlEnvelope>(&frame.payload);
  return envelope ? &envelope->properties : nullptr;
}

const OpaquePayload* OpaqueBytes(const Frame& frame) {
  return std::get_if<OpaquePayload>(&frame.payload);
}

bool EncodeFrame(const Frame& frame, std::vector<std::uint8_t>& out,
                 std::string& error) {
  out.clear();
  error.clear();

  std::vector<std::uint8_t> body;
  body.push_back(static_cast<std::uint8_t>(frame.type));
  if (const auto* envelope = std::get_if<ControlEnvelope>(&frame.payload)) {
    body.push_back(kPayloadControl);
    WriteVarint(frame.channel_id, body);
    WriteVarint(frame.sequence, body);
    std::string json;
    try {
      json = envelope->properties.dump();
    } catch (const nlohmann::json::exception& ex) {
      error = std::string("control payload encode failed: ") + ex.what();
      return false;
    }
    body.insert(body.end(), json.begin(), json.end());
  } else {
    const auto& opaque = std::get<OpaquePayload>(frame.payload);
    body.push_back(kPayloadOpaque);
    WriteVarint(frame.channel_id, body);
    WriteVarint(frame.sequence, body);
    body.insert(body.end(), opaque.begin(), opaque.end());
  }

  if (body.size() > kMaxFrameBodyBytes) {
    error = "frame too large";
    return false;
  }
  out.reserve(body.size() + kMaxVarintBytes);
  WriteVarint(static_cast<std::uint64_t>(body.size()), out);
  out.insert(out.end(), body.begin(), body.end());
  return true;
}

DecodeStatus DecodeFrame(const std::uint8_t* data, std::size_t len, Frame& out,
                         std::size_t& consumed, std::string& error) {
  consumed = 0;
  error.clear();
  if (!data || len == 0) {
    return DecodeStatus::kIncomplete;
  }

  std::size_t pos = 0;
  std::uint64_t body_len = 0;
  const DecodeStatus len_status = ReadVarint(data, len, pos, body_len);
  if (len_status == DecodeStatus::kIncomplete) {
    return DecodeStatus::kIncomplete;
  }
  if (len_status == DecodeStatus::kError) {
    error = "invalid length prefix";
    return DecodeStatus::kError;
  }
  if (body_len > kMaxFrameBodyBytes) {
    error = "frame too large";
    return DecodeStatus::kError;
  }
  if (len - pos < body_len) {
    return DecodeStatus::kIncomplete;
  }
  if (body_len < 2) {
    error = "frame body truncated";
    return DecodeStatus::kError;
  }

  const std::uint8_t* body = data + pos;
  const std::size_t body_size = static_cast<std::size_t>(body_len);
  FrameType type;
  if (!FrameTypeFromWire(body[0], type)) {
    error = "unknown frame type " + std::to_string(body[0]);
    return DecodeStatus::kError;
  }
  const std::uint8_t kind = body[1];
  if (kind != kPayloadOpaque && kind != kPayloadControl) {
    error = "unknown payload kind " + std::to_string(kind);
    return DecodeStatus::kError;
  }

  std::size_t body_pos = 2;
  std::uint64_t channel_id = 0;
  std::uint64_t sequence = 0;
  if (ReadVarint(body, body_size, body_pos, channel_id) != DecodeStatus::kOk ||
      ReadVarint(body, body_size, body_pos, sequence) != DecodeStatus::kOk) {
    error = "frame header truncated";
    return DecodeStatus::kError;
  }

  const std::uint8_t* payload = body + body_pos;
  const std::size_t payload_len = body_size - body_pos;
  Frame frame;
  frame.channel_id = channel_id;
  frame.sequence = sequence;
  frame.type = type;
  if (kind == kPayloadControl) {
    auto doc = nlohmann::json::parse(payload, payload + payload_len, nullptr,
                                     false);
    if (doc.is_discarded() || !doc.is_object()) {
      error = "invalid control payload";
      return DecodeStatus::kError;
    }
    frame.payload = ControlEnvelope{std::move(doc)};
  } else {
    frame.payload = OpaquePayload(payload, payload + payload_len);
  }

  out = std::move(frame);
  consumed = pos + body_size;
  return DecodeStatus::kOk;
}

}  // namespace cm::proto
