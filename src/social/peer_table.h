#pragma once

#include "lansocial/peer.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace social {

using lansocial::Peer;
using lansocial::PeerSource;

// Known endpoints keyed by "host:port". Safe to share between threads.
class PeerTable {
 public:
  using Clock = Peer::Clock;

  // Inserts or merges `peer` under peer.key().
  // Returns true when the entry is new or its name, node_id or source changed;
  // a pure last_seen refresh returns false. Peers without host or port are ignored.
  // A LAN sighting of a known node_id on the same host but a new port moves that
  // node's LAN entry; the old key is reported through `moved_from_out`.
  bool upsert(const Peer& peer,
              Clock::time_point now,
              Peer* stored_out = nullptr,
              std::string* moved_from_out = nullptr);
  bool upsert(const Peer& peer, Peer* stored_out = nullptr, std::string* moved_from_out = nullptr) {
    return upsert(peer, Clock::now(), stored_out, moved_from_out);
  }

  bool remove(const std::string& key);
  std::optional<Peer> find(const std::string& key) const;

  // Copy taken under the lock, ordered by key.
  std::vector<Peer> snapshot() const;
  std::size_t size() const;

  // Removes LAN peers not seen for longer than `timeout`; manual peers are never touched.
  std::vector<std::string> collect_stale(Clock::time_point now, Clock::duration timeout);

 private:
  mutable std::mutex m_;
  std::unordered_map<std::string, Peer> peers_;
};

} // namespace social
