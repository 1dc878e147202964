#include "http2_frame.h"

#include <algorithm>

namespace cm::client::http2 {

namespace {
void PutU32(std::vector<std::uint8_t>& out, std::uint32_t v) {
  out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

std::uint32_t GetU32(const std::uint8_t* p) {
  return (static_cast<std::uint32_t>(p[0]) << 24) |
         (static_cast<std::uint32_t>(p[1]) << 16) |
         (static_cast<std::uint32_t>(p[2]) << 8) |
         static_cast<std::uint32_t>(p[3]);
}

// RFC 7541 5.1 integer with an N-bit prefix; `high` holds the pattern bits.
void PutHpackInt(std::vector<std::uint8_t>& out, std::uint8_t high,
                 int prefix_bits, std::size_t value) {
  const std::size_t max_prefix = (1u << prefix_bits) - 1;
  if (value < max_prefix) {
    out.push_back(static_cast<std::uint8_t>(high | value));
    return;
  }
  out.push_back(static_cast<std::uint8_t>(high | max_prefix));
  value -= max_prefix;
  while (value >= 0x80) {
    out.push_back(static_cast<std::uint8_t>((value & 0x7F) | 0x80));
    value >>= 7;
  }
  out.push_back(static_cast<std::uint8_t>(value));
}

bool GetHpackInt(const std::uint8_t* data, std::size_t len, std::size_t& pos,
                 int prefix_bits, std::size_t& value) {
  if (pos >= len) return false;
  const std::size_t max_prefix = (1u << prefix_bits) - 1;
  value = data[pos++] & max_prefix;
  if (value < max_prefix) return true;
  int shift = 0;
  while (pos < len) {
    const std::uint8_t b = data[pos++];
    value += static_cast<std::size_t>(b & 0x7F) << shift;
    if ((b & 0x80) == 0) return true;
    shift += 7;
    if (shift > 28) return false;
  }
  return false;
}

void PutHpackString(std::vector<std::uint8_t>& out, const std::string& s) {
  PutHpackInt(out, 0x00, 7, s.size());
  out.insert(out.end(), s.begin(), s.end());
}

// RFC 7541 Appendix B restricted to the digits a status code uses:
// '0'..'2' are the 5-bit codes 0..2, '3'..'9' the 6-bit codes 0x19..0x1f.
// The final partial octet must be EOS padding (all ones, under 8 bits).
bool HuffmanDigits(const std::uint8_t* data, std::size_t len,
                   std::string& out) {
  const std::size_t total_bits = len * 8;
  auto bits_at = [&](std::size_t bit, int count) {
    std::uint32_t v = 0;
    for (int i = 0; i < count; ++i) {
      const std::size_t at = bit + static_cast<std::size_t>(i);
      v = (v << 1) | ((data[at / 8] >> (7 - at % 8)) & 1u);
    }
    return v;
  };
  std::size_t bit = 0;
  while (bit < total_bits) {
    const std::size_t left = total_bits - bit;
    if (left < 8 && bits_at(bit, static_cast<int>(left)) ==
                        (1u << left) - 1) {
      return true;
    }
    if (left < 5) return false;
    const std::uint32_t five = bits_at(bit, 5);
    if (five <= 2) {
      out.push_back(static_cast<char>('0' + five));
      bit += 5;
      continue;
    }
    if (left < 6) return false;
    const std::uint32_t six = bits_at(bit, 6);
    if (six < 0x19 || six > 0x1f) return false;
    out.push_back(static_cast<char>('3' + (six - 0x19)));
    bit += 6;
  }
  return true;
}

int StaticStatus(std::size_t index) {
  switch (index) {
    case 8:
      return 200;
    case 9:
      return 204;
    case 10:
      return 206;
    case 11:
      return 304;
    case 12:
      return 400;
    case 13:
      return 404;
    case 14:
      return 500;
    default:
      return 0;
  }
}

constexpr std::size_t kStatusNameIndexFirst = 8;
constexpr std::size_t kStatusNameIndexLast = 14;
}  // namespace

FrameHeader ParseFrameHeader(const std::uint8_t* p) {
  FrameHeader h;
  h.length = (static_cast<std::uint32_t>(p[0]) << 16) |
             (static_cast<std::uint32_t>(p[1]) << 8) |
             static_cast<std::uint32_t>(p[2]);
  h.type = p[3];
  h.flags = p[4];
  h.stream_id = GetU32(p + 5) & 0x7fffffffu;
  return h;
}

void AppendFrameHeader(std::vector<std::uint8_t>& out, std::uint32_t length,
                       FrameType type, std::uint8_t frame_flags,
                       std::uint32_t stream_id) {
  out.push_back(static_cast<std::uint8_t>((length >> 16) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((length >> 8) & 0xFF));
  out.push_back(static_cast<std::uint8_t>(length & 0xFF));
  out.push_back(static_cast<std::uint8_t>(type));
  out.push_back(frame_flags);
  PutU32(out, stream_id & 0x7fffffffu);
}

void AppendSettings(std::vector<std::uint8_t>& out,
                    const std::vector<Setting>& settings) {
  AppendFrameHeader(out, static_cast<std::uint32_t>(settings.size() * 6),
                    FrameType::kSettings, 0, 0);
  for (const auto& s : settings) {
    out.push_back(static_cast<std::uint8_t>((s.first >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(s.first & 0xFF));
    PutU32(out, s.second);
  }
}

void AppendSettingsAck(std::vector<std::uint8_t>& out) {
  AppendFrameHeader(out, 0, FrameType::kSettings, flags::kAck, 0);
}

void AppendWindowUpdate(std::vector<std::uint8_t>& out,
                        std::uint32_t stream_id, std::uint32_t increment) {
  AppendFrameHeader(out, 4, FrameType::kWindowUpdate, 0, stream_id);
  PutU32(out, increment & 0x7fffffffu);
}

void AppendPing(std::vector<std::uint8_t>& out, const std::uint8_t* opaque,
                bool ack) {
  AppendFrameHeader(out, 8, FrameType::kPing, ack ? flags::kAck : 0, 0);
  out.insert(out.end(), opaque, opaque + 8);
}

void AppendGoAway(std::vector<std::uint8_t>& out,
                  std::uint32_t last_stream_id, ErrorCode code) {
  AppendFrameHeader(out, 8, FrameType::kGoAway, 0, 0);
  PutU32(out, last_stream_id & 0x7fffffffu);
  PutU32(out, static_cast<std::uint32_t>(code));
}

void AppendRstStream(std::vector<std::uint8_t>& out, std::uint32_t stream_id,
                     ErrorCode code) {
  AppendFrameHeader(out, 4, FrameType::kRstStream, 0, stream_id);
  PutU32(out, static_cast<std::uint32_t>(code));
}

void AppendData(std::vector<std::uint8_t>& out, std::uint32_t stream_id,
                const std::uint8_t* data, std::size_t len, bool end_stream) {
  AppendFrameHeader(out, static_cast<std::uint32_t>(len), FrameType::kData,
                    end_stream ? flags::kEndStream : 0, stream_id);
  if (len > 0) {
    out.insert(out.end(), data, data + len);
  }
}

void AppendHeaders(std::vector<std::uint8_t>& out, std::uint32_t stream_id,
                   const std::vector<std::uint8_t>& block, bool end_stream,
                   std::uint32_t max_frame_size) {
  const std::size_t chunk_max = std::max<std::uint32_t>(max_frame_size, 1);
  std::size_t offset = 0;
  bool first = true;
  do {
    const std::size_t chunk = std::min(chunk_max, block.size() - offset);
    const bool last = offset + chunk == block.size();
    std::uint8_t frame_flags = last ? flags::kEndHeaders : 0;
    if (first && end_stream) {
      frame_flags |= flags::kEndStream;
    }
    AppendFrameHeader(out, static_cast<std::uint32_t>(chunk),
                      first ? FrameType::kHeaders : FrameType::kContinuation,
                      frame_flags, stream_id);
    out.insert(out.end(), block.begin() + offset,
               block.begin() + offset + chunk);
    offset += chunk;
    first = false;
  } while (offset < block.size());
}

bool ParseSettings(const std::uint8_t* payload, std::size_t len,
                   std::vector<Setting>& out, std::string& error) {
  out.clear();
  if (len % 6 != 0) {
    error = "settings frame size";
    return false;
  }
  for (std::size_t off = 0; off < len; off += 6) {
    const std::uint16_t id = static_cast<std::uint16_t>(
        (static_cast<std::uint16_t>(payload[off]) << 8) | payload[off + 1]);
    out.emplace_back(id, GetU32(payload + off + 2));
  }
  return true;
}

bool StripPadding(FrameType type, std::uint8_t frame_flags,
                  const std::uint8_t*& payload, std::size_t& len,
                  std::string& error) {
  std::size_t pad = 0;
  if (frame_flags & flags::kPadded) {
    if (len < 1) {
      error = "padded frame too short";
      return false;
    }
    pad = payload[0];
    ++payload;
    --len;
  }
  if (type == FrameType::kHeaders && (frame_flags & flags::kPriority)) {
    if (len < 5) {
      error = "headers priority truncated";
      return false;
    }
    payload += 5;
    len -= 5;
  }
  if (pad > len) {
    error = "padding exceeds payload";
    return false;
  }
  len -= pad;
  return true;
}

std::vector<std::uint8_t> EncodeRequestHeaders(const RequestHead& head) {
  std::vector<std::uint8_t> out;
  if (head.method == "POST") {
    out.push_back(0x83);
  } else if (head.method == "GET") {
    out.push_back(0x82);
  } else {
    PutHpackInt(out, 0x00, 4, 2);
    PutHpackString(out, head.method);
  }
  if (head.scheme == "https") {
    out.push_back(0x87);
  } else {
    out.push_back(0x86);
  }
  // :path (4) and :authority (1) as literals with an indexed name.
  PutHpackInt(out, 0x00, 4, 4);
  PutHpackString(out, head.path.empty() ? std::string("/") : head.path);
  if (!head.authority.empty()) {
    PutHpackInt(out, 0x00, 4, 1);
    PutHpackString(out, head.authority);
  }
  for (const auto& field : head.headers) {
    out.push_back(0x00);
    PutHpackString(out, field.name);
    PutHpackString(out, field.value);
  }
  return out;
}

bool DecodeResponseStatus(const std::vector<std::uint8_t>& block,
                          int& status) {
  status = 0;
  const std::uint8_t* data = block.data();
  const std::size_t len = block.size();
  std::size_t pos = 0;
  while (pos < len) {
    const std::uint8_t b = data[pos];
    std::size_t index = 0;
    if (b & 0x80) {
      if (!GetHpackInt(data, len, pos, 7, index)) return false;
      status = StaticStatus(index);
      return status != 0;
    }
    if ((b & 0xE0) == 0x20) {
      // Dynamic table size update precedes the first field.
      if (!GetHpackInt(data, len, pos, 5, index)) return false;
      continue;
    }
    const int prefix = (b & 0xC0) == 0x40 ? 6 : 4;
    if (!GetHpackInt(data, len, pos, prefix, index)) return false;
    if (index < kStatusNameIndexFirst || index > kStatusNameIndexLast) {
      return false;
    }
    if (pos >= len) return false;
    const bool huffman = (data[pos] & 0x80) != 0;
    std::size_t value_len = 0;
    if (!GetHpackInt(data, len, pos, 7, value_len)) return false;
    if (value_len == 0 || value_len > 3 || len - pos < value_len) {
      return false;
    }
    std::string digits;
    if (huffman) {
      if (!HuffmanDigits(data + pos, value_len, digits)) return false;
    } else {
      digits.assign(reinterpret_cast<const char*>(data + pos), value_len);
    }
    if (digits.empty() || digits.size() > 3) return false;
    int value = 0;
    for (const char c : digits) {
      if (c < '0' || c > '9') return false;
      value = value * 10 + (c - '0');
    }
    status = value;
    return true;
  }
  return false;
}

}  // namespace cm::client::http2
