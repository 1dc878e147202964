#ifndef CM_CLIENT_HTTP2_FRAME_H
#define CM_CLIENT_HTTP2_FRAME_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace cm::client::http2 {

constexpr std::size_t kFrameHeaderSize = 9;
constexpr std::uint32_t kDefaultWindowSize = 65535;
constexpr std::uint32_t kDefaultMaxFrameSize = 16384;
constexpr std::uint32_t kMaxWindowSize = 0x7fffffff;
constexpr char kClientPreface[] = "PRI * HTTP/2.0\r\n\r\nSM\r\n\r\n";
constexpr std::size_t kClientPrefaceSize = sizeof(kClientPreface) - 1;

enum class FrameType : std::uint8_t {
  kData = 0x0,
  kHeaders = 0x1,
  kPriority = 0x2,
  kRstStream = 0x3,
  kSettings = 0x4,
  kPushPromise = 0x5,
  kPing = 0x6,
  kGoAway = 0x7,
  kWindowUpdate = 0x8,
  kContinuation = 0x9
};

namespace flags {
constexpr std::uint8_t kEndStream = 0x1;
constexpr std::uint8_t kAck = 0x1;
constexpr std::uint8_t kEndHeaders = 0x4;
constexpr std::uint8_t kPadded = 0x8;
constexpr std::uint8_t kPriority = 0x20;
}  // namespace flags

enum class SettingsId : std::uint16_t {
  kHeaderTableSize = 0x1,
  kEnablePush = 0x2,
  kMaxConcurrentStreams = 0x3,
  kInitialWindowSize = 0x4,
  kMaxFrameSize = 0x5,
  kMaxHeaderListSize = 0x6
};

enum class ErrorCode : std::uint32_t {
  kNoError = 0x0,
  kProtocolError = 0x1,
  kInternalError = 0x2,
  kFlowControlError = 0x3,
  kSettingsTimeout = 0x4,
  kStreamClosed = 0x5,
  kFrameSizeError = 0x6,
  kRefusedStream = 0x7,
  kCancel = 0x8,
  kCompressionError = 0x9
};

struct FrameHeader {
  std::uint32_t length{0};
  std::uint8_t type{0};
  std::uint8_t flags{0};
  std::uint32_t stream_id{0};
};

using Setting = std::pair<std::uint16_t, std::uint32_t>;

FrameHeader ParseFrameHeader(const std::uint8_t* p);
void AppendFrameHeader(std::vector<std::uint8_t>& out, std::uint32_t length,
                       FrameType type, std::uint8_t flags,
                       std::uint32_t stream_id);

void AppendSettings(std::vector<std::uint8_t>& out,
                    const std::vector<Setting>& settings);
void AppendSettingsAck(std::vector<std::uint8_t>& out);
void AppendWindowUpdate(std::vector<std::uint8_t>& out,
                        std::uint32_t stream_id, std::uint32_t increment);
void AppendPing(std::vector<std::uint8_t>& out, const std::uint8_t* opaque,
                bool ack);
void AppendGoAway(std::vector<std::uint8_t>& out,
                  std::uint32_t last_stream_id, ErrorCode code);
void AppendRstStream(std::vector<std::uint8_t>& out, std::uint32_t stream_id,
                     ErrorCode code);
void AppendData(std::vector<std::uint8_t>& out, std::uint32_t stream_id,
                const std::uint8_t* data, std::size_t len, bool end_stream);
// Splits the block into HEADERS + CONTINUATION frames of at most
// `max_frame_size` bytes each.
void AppendHeaders(std::vector<std::uint8_t>& out, std::uint32_t stream_id,
                   const std::vector<std::uint8_t>& block, bool end_stream,
                   std::uint32_t max_frame_size);

bool ParseSettings(const std::uint8_t* payload, std::size_t len,
                   std::vector<Setting>& out, std::string& error);

// Drops the pad length byte, trailing padding and (for HEADERS) the
// priority fields.
bool StripPadding(FrameType type, std::uint8_t frame_flags,
                  const std::uint8_t*& payload, std::size_t& len,
                  std::string& error);

struct HeaderField {
  std::string name;
  std::string value;
};

struct RequestHead {
  std::string method{"POST"};
  std::string scheme{"https"};
  std::string authority;
  std::string path{"/"};
  std::vector<HeaderField> headers;
};

// HPACK block using static-table entries and literals without indexing.
// No Huffman coding; names must already be lower case.
std::vector<std::uint8_t> EncodeRequestHeaders(const RequestHead& head);

// Reads the response :status from the start of a header block; literal
// values may be Huffman-coded. Returns false when the block does not lead
// with a decodable :status.
bool DecodeResponseStatus(const std::vector<std::uint8_t>& block,
                          int& status);

}  // namespace cm::client::http2

#endif  // CM_CLIENT_HTTP2_FRAME_H
