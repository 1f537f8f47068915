#pragma once

#include "lansocial/util.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lansocial {

enum class PeerSource { Lan, Manual };

inline std::string_view source_to_string(PeerSource s) {
  switch (s) {
    case PeerSource::Lan:
      return "LAN";
    case PeerSource::Manual:
      return "manual";
  }
  return "unknown";
}

struct Peer {
  using Clock = std::chrono::steady_clock;

  std::string name;
  std::string host;
  uint16_t port = 0;
  PeerSource source = PeerSource::Lan;
  std::string node_id;
  // Zero (epoch) for manual peers that were never sighted.
  Clock::time_point last_seen{};

  std::string key() const { return host_port_key(host, port); }
  bool is_lan() const { return source == PeerSource::Lan; }
};

// "alias@host:port" or "host:port"; alias defaults to host.
inline std::optional<Peer> parse_manual_peer(std::string_view text) {
  std::string_view raw = trim(text);
  if (raw.empty()) return std::nullopt;

  std::string_view alias;
  if (const auto at = raw.find('@'); at != std::string_view::npos) {
    alias = trim(raw.substr(0, at));
    raw = raw.substr(at + 1);
  }

  const auto hp = parse_host_port(raw);
  if (!hp) return std::nullopt;

  Peer p;
  p.host = hp->host;
  p.port = hp->port;
  p.name = alias.empty() ? p.host : std::string(alias);
  p.source = PeerSource::Manual;
  return p;
}

} // namespace lansocial
