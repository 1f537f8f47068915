#pragma once

#include "lansocial/peer.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace social {

struct SendCandidate {
  std::string host;
  uint16_t port = 0;
  std::string key;
  int rank = 0;
};

// Match ranks, lowest tried first.
constexpr int kRankExact = 0;
constexpr int kRankSameNode = 1;
constexpr int kRankSameHost = 2;
constexpr int kRankSameLanName = 3;
constexpr int kRankUnrelated = 9;

// Tie-break penalty: loopback and the VirtualBox NAT range sort last within a rank.
int host_priority(std::string_view host);

int match_rank(const lansocial::Peer& selected, const lansocial::Peer& candidate);

// Ranked, endpoint-unique list of places to deliver a message meant for `selected`.
// Unrelated peers are only offered when nothing related is known.
std::vector<SendCandidate> resolve_send_candidates(const lansocial::Peer& selected,
                                                   const std::vector<lansocial::Peer>& known);

} // namespace social
