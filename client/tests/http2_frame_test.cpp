#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

#include "http2_frame.h"

int main() {
  namespace h2 = cm::client::http2;

  // Frame header layout.
  std::vector<std::uint8_t> out;
  h2::AppendWindowUpdate(out, 3, 1024);
  assert(out.size() == h2::kFrameHeaderSize + 4);
  const h2::FrameHeader wu = h2::ParseFrameHeader(out.data());
  assert(wu.length == 4);
  assert(wu.type == static_cast<std::uint8_t>(h2::FrameType::kWindowUpdate));
  assert(wu.stream_id == 3);
  assert(out[9] == 0 && out[10] == 0 && out[11] == 0x04 && out[12] == 0x00);

  // SETTINGS and its ACK.
  out.clear();
  h2::AppendSettings(out, {{0x2, 0}, {0x4, 1u << 20}});
  const h2::FrameHeader sh = h2::ParseFrameHeader(out.data());
  assert(sh.length == 12 && sh.stream_id == 0 && sh.flags == 0);
  std::vector<h2::Setting> settings;
  std::string error;
  assert(h2::ParseSettings(out.data() + 9, sh.length, settings, error));
  assert(settings.size() == 2);
  assert(settings[1].first == 0x4 && settings[1].second == (1u << 20));
  assert(!h2::ParseSettings(out.data() + 9, 5, settings, error));
  out.clear();
  h2::AppendSettingsAck(out);
  assert(h2::ParseFrameHeader(out.data()).flags == h2::flags::kAck);

  // Large header blocks are split into CONTINUATION frames.
  std::vector<std::uint8_t> block(40, 0x11);
  out.clear();
  h2::AppendHeaders(out, 1, block, false, 16);
  const h2::FrameHeader first = h2::ParseFrameHeader(out.data());
  assert(first.type == static_cast<std::uint8_t>(h2::FrameType::kHeaders));
  assert(first.length == 16 && (first.flags & h2::flags::kEndHeaders) == 0);
  const h2::FrameHeader last = h2::ParseFrameHeader(out.data() + 2 * (9 + 16));
  assert(last.type == static_cast<std::uint8_t>(h2::FrameType::kContinuation));
  assert(last.length == 8 && (last.flags & h2::flags::kEndHeaders) != 0);
  assert(out.size() == 3 * 9 + 40);

  // HPACK request block.
  h2::RequestHead head;
  head.authority = "a.test";
  head.path = "/connect";
  head.headers.push_back({"te", "trailers"});
  const std::vector<std::uint8_t> hpack = h2::EncodeRequestHeaders(head);
  const std::vector<std::uint8_t> expected = {
      0x83, 0x87, 0x04, 0x08, '/', 'c', 'o', 'n', 'n', 'e', 'c', 't',
      0x01, 0x06, 'a', '.', 't', 'e', 's', 't',
      0x00, 0x02, 't', 'e', 0x08, 't', 'r', 'a', 'i', 'l', 'e', 'r', 's'};
  assert(hpack == expected);

  // Response status.
  int status = 0;
  assert(h2::DecodeResponseStatus({0x88}, status) && status == 200);
  assert(h2::DecodeResponseStatus({0x8d}, status) && status == 404);
  assert(h2::DecodeResponseStatus({0x3f, 0xe1, 0x1f, 0x88}, status) &&
         status == 200);
  assert(h2::DecodeResponseStatus({0x08, 0x03, '5', '0', '3'}, status) &&
         status == 503);
  assert(h2::DecodeResponseStatus({0x48, 0x03, '4', '2', '9'}, status) &&
         status == 429);
  // Huffman-coded values: "401", "200", "503".
  assert(h2::DecodeResponseStatus({0x48, 0x82, 0x68, 0x01}, status) &&
         status == 401);
  assert(h2::DecodeResponseStatus({0x08, 0x82, 0x10, 0x01}, status) &&
         status == 200);
  assert(h2::DecodeResponseStatus({0x08, 0x83, 0x6c, 0x0c, 0xff}, status) &&
         status == 503);
  // Non-digit symbol, and padding that is not all ones.
  assert(!h2::DecodeResponseStatus({0x08, 0x81, 0x1f}, status));
  assert(!h2::DecodeResponseStatus({0x08, 0x82, 0x10, 0x00}, status));
  assert(!h2::DecodeResponseStatus({}, status));

  // Padding removal.
  const std::vector<std::uint8_t> padded = {2, 'o', 'k', 0, 0};
  const std::uint8_t* p = padded.data();
  std::size_t len = padded.size();
  assert(h2::StripPadding(h2::FrameType::kData, h2::flags::kPadded, p, len,
                          error));
  assert(len == 2 && p[0] == 'o');
  p = padded.data();
  len = 2;
  assert(!h2::StripPadding(h2::FrameType::kData, h2::flags::kPadded, p, len,
                           error));
  return 0;
}
