#include "src/social/wire.h"

#include "lansocial/framing.hpp"
#include "lansocial/util.hpp"

using lansocial::json;

namespace social {

std::string_view packet_type_name(PacketType t) {
  switch (t) {
    case PacketType::Announce:
      return "announce";
    case PacketType::Probe:
      return "probe";
  }
  return "announce";
}

json make_discovery_packet(PacketType type, const SelfInfo& self) {
  json j;
  j["type"] = std::string(packet_type_name(type));
  j["node_id"] = self.node_id;
  j["name"] = self.name;
  j["chat_port"] = self.chat_port;
  j["reply_port"] = self.discovery_port;
  j["ts"] = lansocial::unix_time_seconds();
  return j;
}

std::optional<DiscoveryPacket> parse_discovery_packet(std::string_view bytes) {
  const auto j = lansocial::parse_json_object(bytes);
  if (!j) return std::nullopt;

  DiscoveryPacket p;
  p.type = lansocial::json_string_or(*j, "type");
  p.node_id = lansocial::json_string_or(*j, "node_id");
  p.name = lansocial::json_string_or(*j, "name");
  p.chat_port = lansocial::json_int_or_zero(*j, "chat_port");
  return p;
}

std::string make_chat_line(const SelfInfo& self, std::string_view text) {
  json j;
  j["type"] = "chat";
  j["node_id"] = self.node_id;
  j["from"] = self.name;
  j["text"] = std::string(text);
  j["ts"] = lansocial::unix_time_seconds();
  j["reply_port"] = self.chat_port;
  return lansocial::frame_json_line(j);
}

std::optional<ChatMessage> parse_chat_line(std::string_view line) {
  const auto j = lansocial::parse_json_object(line);
  if (!j) return std::nullopt;
  if (lansocial::json_string_or(*j, "type") != "chat") return std::nullopt;

  ChatMessage m;
  m.node_id = lansocial::json_string_or(*j, "node_id");
  m.from = lansocial::json_string_or(*j, "from");
  m.text = lansocial::json_string_or(*j, "text");
  const long long reply_port = lansocial::json_int_or_zero(*j, "reply_port");
  if (reply_port > 0 && reply_port <= 65535) m.reply_port = static_cast<uint16_t>(reply_port);
  if (auto it = j->find("ts"); it != j->end() && it->is_number()) m.ts = it->get<double>();
  return m;
}

} // namespace social
