#include "src/social/candidates.h"

#include <cassert>
#include <string>
#include <utility>
#include <vector>

using lansocial::Peer;
using lansocial::PeerSource;

namespace {

Peer peer(std::string name, std::string host, uint16_t port, std::string node_id = {},
          PeerSource source = PeerSource::Lan) {
  Peer p;
  p.name = std::move(name);
  p.host = std::move(host);
  p.port = port;
  p.node_id = std::move(node_id);
  p.source = source;
  return p;
}

std::vector<std::string> keys(const std::vector<social::SendCandidate>& c) {
  std::vector<std::string> out;
  for (const auto& x : c) out.push_back(x.key);
  return out;
}

} // namespace

int main() {
  assert(social::host_priority("127.0.0.1") == 30);
  assert(social::host_priority("10.0.2.15") == 20);
  assert(social::host_priority("10.0.3.15") == 0);
  assert(social::host_priority("192.168.1.4") == 0);

  {
    // Exact match first, then same node, same host, same LAN name.
    const Peer selected = peer("Bob", "192.168.1.20", 38600, "b0b0b0b0b0b0");
    const std::vector<Peer> known = {
        peer("bob", "192.168.1.77", 38600, "", PeerSource::Manual),
        peer("BOB", "192.168.1.50", 38600),
        peer("other", "192.168.1.20", 38605),
        peer("Bob", "192.168.1.33", 38601, "b0b0b0b0b0b0"),
        peer("Bob", "192.168.1.20", 38600, "b0b0b0b0b0b0"),
        peer("carol", "192.168.1.99", 38600, "cccccccccccc"),
    };
    const auto c = social::resolve_send_candidates(selected, known);
    assert(c.size() == 4);
    assert(c[0].key == "192.168.1.20:38600" && c[0].rank == social::kRankExact);
    assert(c[1].key == "192.168.1.33:38601" && c[1].rank == social::kRankSameNode);
    assert(c[2].key == "192.168.1.20:38605" && c[2].rank == social::kRankSameHost);
    assert(c[3].key == "192.168.1.50:38600" && c[3].rank == social::kRankSameLanName);
  }

  {
    // Within a rank, loopback and VirtualBox NAT go last, then host and port order.
    const Peer selected = peer("dave", "192.168.1.9", 38600, "dddddddddddd");
    const std::vector<Peer> known = {
        peer("dave", "127.0.0.1", 38600, "dddddddddddd"),
        peer("dave", "10.0.2.15", 38600, "dddddddddddd"),
        peer("dave", "192.168.56.4", 38601, "dddddddddddd"),
        peer("dave", "192.168.56.4", 38600, "dddddddddddd"),
    };
    const auto c = social::resolve_send_candidates(selected, known);
    assert((keys(c) == std::vector<std::string>{"192.168.56.4:38600", "192.168.56.4:38601", "10.0.2.15:38600",
                                                "127.0.0.1:38600"}));
  }

  {
    // Unrelated peers are a last resort only.
    const Peer selected = peer("erin", "192.168.1.5", 38600);
    const std::vector<Peer> known = {
        peer("x", "192.168.1.7", 38600),
        peer("y", "127.0.0.1", 38600),
        peer("z", "", 38600),
        peer("w", "192.168.1.8", 0),
    };
    const auto c = social::resolve_send_candidates(selected, known);
    assert((keys(c) == std::vector<std::string>{"192.168.1.7:38600", "127.0.0.1:38600"}));
    assert(c[0].rank == social::kRankUnrelated);
  }

  {
    // Empty node ids never count as a shared identity; duplicates collapse.
    const Peer selected = peer("", "192.168.1.5", 38600);
    const std::vector<Peer> known = {
        peer("a", "192.168.1.6", 38600),
        peer("a", "192.168.1.5", 38600),
        peer("a", "192.168.1.5", 38600),
    };
    const auto c = social::resolve_send_candidates(selected, known);
    assert(c.size() == 1);
    assert(c[0].rank == social::kRankExact);
  }

  assert(social::resolve_send_candidates(peer("a", "1.2.3.4", 5), {}).empty());
  return 0;
}
