#include "src/social/event_queue.h"
#include "src/social/peer_table.h"

#include <cassert>
#include <chrono>
#include <string>
#include <utility>

using social::Event;
using social::EventQueue;
using social::Peer;
using social::PeerSource;
using social::PeerTable;

namespace {

Peer lan(std::string name, std::string host, uint16_t port, std::string node_id) {
  Peer p;
  p.name = std::move(name);
  p.host = std::move(host);
  p.port = port;
  p.source = PeerSource::Lan;
  p.node_id = std::move(node_id);
  return p;
}

} // namespace

int main() {
  using namespace std::chrono_literals;
  const auto t0 = PeerTable::Clock::now();

  {
    PeerTable table;
    assert(table.upsert(lan("bob", "192.168.1.20", 38600, "b0b0b0b0b0b0"), t0));
    assert(!table.upsert(lan("bob", "192.168.1.20", 38600, "b0b0b0b0b0b0"), t0 + 1s));
    const auto snap = table.snapshot();
    assert(snap.size() == 1);
    assert(snap[0].key() == "192.168.1.20:38600");
    assert(snap[0].last_seen == t0 + 1s);

    // Rename is a change; an older sighting never moves last_seen backwards.
    assert(table.upsert(lan("bobby", "192.168.1.20", 38600, "b0b0b0b0b0b0"), t0));
    const auto p = table.find("192.168.1.20:38600");
    assert(p && p->name == "bobby");
    assert(p->last_seen == t0 + 1s);

    // An anonymous sighting keeps the known node id.
    assert(!table.upsert(lan("bobby", "192.168.1.20", 38600, ""), t0 + 2s));
    assert(table.find("192.168.1.20:38600")->node_id == "b0b0b0b0b0b0");
  }

  {
    PeerTable table;
    assert(!table.upsert(lan("x", "", 38600, "n"), t0));
    assert(!table.upsert(lan("x", "10.1.1.1", 0, "n"), t0));
    assert(table.size() == 0);

    assert(table.upsert(lan("", "10.1.1.1", 4000, ""), t0));
    assert(table.find("10.1.1.1:4000")->name == "10.1.1.1");
  }

  {
    // A LAN sighting refreshes a manual entry without demoting or renaming it.
    PeerTable table;
    Peer manual;
    manual.name = "alice";
    manual.host = "192.168.1.30";
    manual.port = 38601;
    manual.source = PeerSource::Manual;
    assert(table.upsert(manual, t0));
    assert(table.upsert(lan("Player1", "192.168.1.30", 38601, "a11ce0a11ce0"), t0 + 1s));
    const auto p = table.find("192.168.1.30:38601");
    assert(p->source == PeerSource::Manual);
    assert(p->name == "alice");
    assert(p->node_id == "a11ce0a11ce0");
    assert(p->last_seen == t0 + 1s);
    assert(!table.upsert(lan("Player1", "192.168.1.30", 38601, "a11ce0a11ce0"), t0 + 2s));

    // Manual entries are never collected, however old.
    assert(table.collect_stale(t0 + 1h, 10s).empty());
    assert(table.size() == 1);
  }

  {
    // Staleness is strictly "older than the timeout".
    PeerTable table;
    table.upsert(lan("a", "192.168.1.2", 38600, "aaaaaaaaaaaa"), t0);
    table.upsert(lan("b", "192.168.1.3", 38600, "bbbbbbbbbbbb"), t0 + 5s);
    assert(table.collect_stale(t0 + 10s, 10s).empty());
    const auto removed = table.collect_stale(t0 + 11s, 10s);
    assert(removed.size() == 1 && removed[0] == "192.168.1.2:38600");
    assert(table.find("192.168.1.3:38600"));
    assert(!table.find("192.168.1.2:38600"));
  }

  {
    // A restarted node announcing a new chat port keeps a single entry.
    PeerTable table;
    assert(table.upsert(lan("carol", "192.168.1.40", 38600, "cccccccccccc"), t0));
    std::string moved_from;
    Peer stored;
    assert(table.upsert(lan("carol", "192.168.1.40", 38602, "cccccccccccc"), t0 + 1s, &stored, &moved_from));
    assert(moved_from == "192.168.1.40:38600");
    assert(stored.port == 38602);
    assert(table.size() == 1);
    assert(table.find("192.168.1.40:38602"));
  }

  {
    PeerTable table;
    EventQueue events;
    assert(social::upsert_and_notify(table, events, lan("dave", "192.168.1.50", 38600, "dddddddddddd")));
    assert(!social::upsert_and_notify(table, events, lan("dave", "192.168.1.50", 38600, "dddddddddddd")));
    assert(events.size() == 1);
    assert(social::upsert_and_notify(table, events, lan("dave", "192.168.1.50", 38611, "dddddddddddd")));

    auto drained = events.drain();
    assert(events.size() == 0);
    assert(drained.size() == 3);
    assert(drained[0].kind == Event::Kind::PeerUp && drained[0].key == "192.168.1.50:38600");
    assert(drained[1].kind == Event::Kind::PeerDown && drained[1].key == "192.168.1.50:38600");
    assert(drained[2].kind == Event::Kind::PeerUp && drained[2].peer.port == 38611);

    events.push(Event::status("one"));
    events.push(Event::status("two"));
    assert(events.try_pop()->text == "one");
    assert(events.try_pop()->text == "two");
    assert(!events.try_pop());
  }

  return 0;
}
