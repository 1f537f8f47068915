#include "src/social/event_queue.h"

#include <iterator>
#include <utility>

namespace social {

Event Event::peer_up(const lansocial::Peer& p) {
  Event e;
  e.kind = Kind::PeerUp;
  e.key = p.key();
  e.peer = p;
  return e;
}

Event Event::peer_down(std::string key) {
  Event e;
  e.kind = Kind::PeerDown;
  e.key = std::move(key);
  return e;
}

Event Event::chat(std::string from, std::string from_key, std::string text) {
  Event e;
  e.kind = Kind::Chat;
  e.from = std::move(from);
  e.from_key = std::move(from_key);
  e.text = std::move(text);
  return e;
}

Event Event::status(std::string message) {
  Event e;
  e.kind = Kind::Status;
  e.text = std::move(message);
  return e;
}

void EventQueue::push(Event e) {
  std::lock_guard lk(m_);
  q_.push_back(std::move(e));
}

std::optional<Event> EventQueue::try_pop() {
  std::lock_guard lk(m_);
  if (q_.empty()) return std::nullopt;
  Event e = std::move(q_.front());
  q_.pop_front();
  return e;
}

std::vector<Event> EventQueue::drain() {
  std::deque<Event> pending;
  {
    std::lock_guard lk(m_);
    pending.swap(q_);
  }
  return std::vector<Event>(std::make_move_iterator(pending.begin()), std::make_move_iterator(pending.end()));
}

std::size_t EventQueue::size() const {
  std::lock_guard lk(m_);
  return q_.size();
}

bool upsert_and_notify(PeerTable& table, EventQueue& events, const lansocial::Peer& peer) {
  lansocial::Peer stored;
  std::string moved_from;
  if (!table.upsert(peer, &stored, &moved_from)) return false;
  if (!moved_from.empty()) events.push(Event::peer_down(std::move(moved_from)));
  events.push(Event::peer_up(stored));
  return true;
}

} // namespace social
