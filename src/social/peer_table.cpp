#include "src/social/peer_table.h"

#include <algorithm>
#include <utility>

namespace social {

bool PeerTable::upsert(const Peer& peer, Clock::time_point now, Peer* stored_out, std::string* moved_from_out) {
  if (moved_from_out) moved_from_out->clear();
  if (peer.host.empty() || peer.port == 0) return false;

  Peer merged = peer;
  if (merged.name.empty()) merged.name = merged.host;
  const std::string key = merged.key();

  std::lock_guard lk(m_);
  auto it = peers_.find(key);
  if (it == peers_.end()) {
    if (merged.is_lan()) {
      merged.last_seen = now;
      if (!merged.node_id.empty()) {
        // Same process restarted on another chat port. Other hosts sharing the id
        // (multi-homed nodes) stay separate entries and age out on their own.
        for (auto old = peers_.begin(); old != peers_.end(); ++old) {
          if (!old->second.is_lan() || old->second.node_id != merged.node_id) continue;
          if (old->second.host != merged.host) continue;
          if (moved_from_out) *moved_from_out = old->first;
          peers_.erase(old);
          break;
        }
      }
    }
    auto& stored = peers_.emplace(key, std::move(merged)).first->second;
    if (stored_out) *stored_out = stored;
    return true;
  }

  const Peer& prev = it->second;
  if (merged.node_id.empty()) merged.node_id = prev.node_id;
  if (prev.source == PeerSource::Manual && peer.source == PeerSource::Lan) {
    // A sighting refreshes a manual entry but never demotes it or renames it.
    merged.source = PeerSource::Manual;
    merged.name = prev.name;
  }
  if (peer.source == PeerSource::Lan) {
    merged.last_seen = std::max(prev.last_seen, now);
  } else {
    merged.last_seen = prev.last_seen;
  }

  const bool changed = merged.name != prev.name || merged.node_id != prev.node_id || merged.source != prev.source;
  it->second = std::move(merged);
  if (stored_out) *stored_out = it->second;
  return changed;
}

bool PeerTable::remove(const std::string& key) {
  std::lock_guard lk(m_);
  return peers_.erase(key) > 0;
}

std::optional<Peer> PeerTable::find(const std::string& key) const {
  std::lock_guard lk(m_);
  auto it = peers_.find(key);
  if (it == peers_.end()) return std::nullopt;
  return it->second;
}

std::vector<Peer> PeerTable::snapshot() const {
  std::vector<Peer> out;
  {
    std::lock_guard lk(m_);
    out.reserve(peers_.size());
    for (const auto& kv : peers_) out.push_back(kv.second);
  }
  std::sort(out.begin(), out.end(), [](const Peer& a, const Peer& b) {
    if (a.host != b.host) return a.host < b.host;
    return a.port < b.port;
  });
  return out;
}

std::size_t PeerTable::size() const {
  std::lock_guard lk(m_);
  return peers_.size();
}

std::vector<std::string> PeerTable::collect_stale(Clock::time_point now, Clock::duration timeout) {
  std::vector<std::string> removed;
  std::lock_guard lk(m_);
  for (auto it = peers_.begin(); it != peers_.end();) {
    if (it->second.is_lan() && now - it->second.last_seen > timeout) {
      removed.push_back(it->first);
      it = peers_.erase(it);
    } else {
      ++it;
    }
  }
  std::sort(removed.begin(), removed.end());
  return removed;
}

} // namespace social
