#pragma once

#include "lansocial/peer.hpp"
#include "src/social/peer_table.h"

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace social {

struct Event {
  enum class Kind { PeerUp, PeerDown, Chat, Status };

  Kind kind = Kind::Status;
  std::string key;        // PeerUp, PeerDown
  lansocial::Peer peer;   // PeerUp
  std::string from;       // Chat: sender display name
  std::string from_key;   // Chat: host:reply_port when the sender declared one
  std::string text;       // Chat text or Status message

  static Event peer_up(const lansocial::Peer& p);
  static Event peer_down(std::string key);
  static Event chat(std::string from, std::string from_key, std::string text);
  static Event status(std::string message);
};

// Unbounded FIFO; workers push, the consumer drains on its own schedule.
class EventQueue {
 public:
  void push(Event e);

  std::optional<Event> try_pop();
  // Everything pending right now, oldest first. Never blocks on producers.
  std::vector<Event> drain();

  std::size_t size() const;

 private:
  mutable std::mutex m_;
  std::deque<Event> q_;
};

// Upserts `peer` and pushes a PeerUp event when the table reports a change,
// preceded by PeerDown for the old key when the peer moved endpoints.
bool upsert_and_notify(PeerTable& table, EventQueue& events, const lansocial::Peer& peer);

} // namespace social
