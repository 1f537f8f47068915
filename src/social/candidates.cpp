#include "src/social/candidates.h"

#include "lansocial/util.hpp"

#include <algorithm>
#include <tuple>
#include <unordered_set>
#include <utility>

namespace social {

int host_priority(std::string_view host) {
  if (lansocial::starts_with(host, "127.")) return 30;
  if (lansocial::starts_with(host, "10.0.2.")) return 20;
  return 0;
}

int match_rank(const lansocial::Peer& selected, const lansocial::Peer& candidate) {
  if (candidate.host == selected.host && candidate.port == selected.port) return kRankExact;
  if (!selected.node_id.empty() && candidate.node_id == selected.node_id) return kRankSameNode;
  if (candidate.host == selected.host) return kRankSameHost;
  if (candidate.is_lan() && !selected.name.empty() &&
      lansocial::to_lower(candidate.name) == lansocial::to_lower(selected.name)) {
    return kRankSameLanName;
  }
  return kRankUnrelated;
}

std::vector<SendCandidate> resolve_send_candidates(const lansocial::Peer& selected,
                                                   const std::vector<lansocial::Peer>& known) {
  std::vector<SendCandidate> ranked;
  ranked.reserve(known.size());
  for (const auto& p : known) {
    if (p.host.empty() || p.port == 0) continue;
    ranked.push_back(SendCandidate{p.host, p.port, p.key(), match_rank(selected, p)});
  }

  const bool have_related = std::any_of(ranked.begin(), ranked.end(),
                                        [](const SendCandidate& c) { return c.rank < kRankUnrelated; });
  if (have_related) {
    ranked.erase(std::remove_if(ranked.begin(), ranked.end(),
                                [](const SendCandidate& c) { return c.rank >= kRankUnrelated; }),
                 ranked.end());
  }

  std::sort(ranked.begin(), ranked.end(), [](const SendCandidate& a, const SendCandidate& b) {
    return std::make_tuple(a.rank, host_priority(a.host), a.host, a.port) <
           std::make_tuple(b.rank, host_priority(b.host), b.host, b.port);
  });

  std::vector<SendCandidate> out;
  std::unordered_set<std::string> seen;
  for (auto& c : ranked) {
    if (seen.insert(c.key).second) out.push_back(std::move(c));
  }
  return out;
}

} // namespace social
