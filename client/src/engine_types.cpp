#include "engine_types.h"

#include <type_traits>

namespace cm::client {

namespace {
std::string DescribeFrame(const proto::Frame& frame) {
  std::string out = "frame ";
  out += proto::FrameTypeName(frame.type);
  out += " ch=" + std::to_string(frame.channel_id);
  out += " seq=" + std::to_string(frame.sequence);
  if (const auto* props = proto::ControlProperties(frame)) {
    out += ' ';
    out += props->dump(-1, ' ', false,
                       nlohmann::json::error_handler_t::replace);
  } else if (const auto* bytes = proto::OpaqueBytes(frame)) {
    out += " opaque(" + std::to_string(bytes->size()) + " bytes)";
  }
  return out;
}
}  // namespace

std::string DescribeEvent(const ClientEvent& event) {
  return std::visit(
      [](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ConnectedEvent>) {
          return "connected session=" + e.session_id +
                 (e.pairing_required ? " (pairing required)" : "");
        } else if constexpr (std::is_same_v<T, DisconnectedEvent>) {
          return "disconnected: " + e.reason;
        } else if constexpr (std::is_same_v<T, FrameEvent>) {
          return DescribeFrame(e.frame);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          return "error: " + e.detail;
        } else {
          static_assert(std::is_same_v<T, LogEvent>, "unhandled event kind");
          return "log: " + e.line;
        }
      },
      event);
}

}  // namespace cm::client
