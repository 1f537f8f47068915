#pragma once

#include "lansocial/json.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace social {

// What this node advertises about itself in every packet.
struct SelfInfo {
  std::string node_id;
  std::string name;
  uint16_t chat_port = 0;      // 0 while the chat server is not serving
  uint16_t discovery_port = 0;
};

enum class PacketType { Announce, Probe };

std::string_view packet_type_name(PacketType t);

// {type, node_id, name, chat_port, reply_port, ts}; reply_port is the discovery port.
lansocial::json make_discovery_packet(PacketType type, const SelfInfo& self);

struct DiscoveryPacket {
  std::string type;    // unknown types are kept so the caller can ignore them
  std::string node_id;
  std::string name;    // empty when absent
  long long chat_port = 0;
};

// nullopt for anything that is not a JSON object.
std::optional<DiscoveryPacket> parse_discovery_packet(std::string_view bytes);

struct ChatMessage {
  std::string node_id;
  std::string from;    // empty when absent
  std::string text;
  uint16_t reply_port = 0; // 0 when absent or out of range
  double ts = 0;
};

// One newline-terminated {type:"chat", node_id, from, text, ts, reply_port} line.
std::string make_chat_line(const SelfInfo& self, std::string_view text);

// nullopt unless the line is a JSON object with type == "chat".
std::optional<ChatMessage> parse_chat_line(std::string_view line);

} // namespace social
