#pragma once

#include "lansocial/json.hpp"
#include "lansocial/peer.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace lansocial::peer_store {

inline std::filesystem::path resolve_root() {
  if (const char* env = std::getenv("LANSOCIAL_CONFIG_DIR"); env && *env) {
    return std::filesystem::path(env);
  }
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return std::filesystem::path(xdg) / "lansocial";
  }
  if (const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".config" / "lansocial";
  }
  return std::filesystem::path(".") / "lansocial";
}

inline std::filesystem::path default_peers_path() {
  return resolve_root() / "social_peers.json";
}

// A missing file is an empty store, not an error.
inline bool load_manual_peers(const std::filesystem::path& path,
                              std::vector<Peer>* out,
                              std::string* error_out = nullptr) {
  if (!out) return false;
  out->clear();

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return true;

  std::ifstream in(path);
  if (!in) {
    if (error_out) *error_out = "failed to open peers file: " + path.string();
    return false;
  }

  json j;
  try {
    j = json::parse(in);
  } catch (const std::exception& e) {
    if (error_out) *error_out = std::string("failed to parse peers file: ") + e.what();
    return false;
  }
  if (!j.is_object()) {
    if (error_out) *error_out = "peers file is not an object";
    return false;
  }
  if (!j.contains("manual_peers")) return true;
  if (!j["manual_peers"].is_array()) {
    if (error_out) *error_out = "manual_peers is not an array";
    return false;
  }

  for (const auto& v : j["manual_peers"]) {
    if (!v.is_object()) continue;
    Peer p;
    p.host = v.value("host", std::string{});
    const long long port = (v.contains("port") && v["port"].is_number_integer()) ? v["port"].get<long long>() : 0;
    if (p.host.empty() || port < 1 || port > 65535) continue;
    p.port = static_cast<uint16_t>(port);
    p.name = v.value("name", std::string{});
    if (p.name.empty()) p.name = p.host;
    p.source = PeerSource::Manual;
    out->push_back(std::move(p));
  }
  return true;
}

// Writes only the manual entries of `peers`.
inline bool save_manual_peers(const std::filesystem::path& path,
                              const std::vector<Peer>& peers,
                              std::string* error_out = nullptr) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      if (error_out) *error_out = "failed to create directory: " + path.parent_path().string();
      return false;
    }
  }

  json j;
  j["manual_peers"] = json::array();
  for (const auto& p : peers) {
    if (p.source != PeerSource::Manual) continue;
    j["manual_peers"].push_back({
        {"name", p.name},
        {"host", p.host},
        {"port", p.port},
    });
  }

  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    if (error_out) *error_out = "failed to write peers file: " + path.string();
    return false;
  }
  out << j.dump(2, ' ', false, json::error_handler_t::replace);
  return static_cast<bool>(out);
}

} // namespace lansocial::peer_store
