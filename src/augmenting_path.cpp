/*
  find_augmenting_path — BFS over positive-residual arcs.

  Breadth-first order yields a path with the fewest arcs, which is what bounds
  Edmonds–Karp to O(V·E) augmentations. The search stops as soon as dst is
  discovered; the bottleneck is taken along the recorded predecessor chain.
*/
#include "tierflow/core/augmenting_path.hpp"

#include <algorithm>
#include <limits>
#include <queue>

namespace tierflow::core {

std::vector<NodeId> AugmentingPath::nodes() const {
  std::vector<NodeId> out;
  if (dst < 0 || static_cast<std::size_t>(dst) >= parent.size()) return out;
  for (NodeId v = dst; v != src; v = parent[static_cast<std::size_t>(v)]) {
    out.push_back(v);
  }
  out.push_back(src);
  std::reverse(out.begin(), out.end());
  return out;
}

std::optional<AugmentingPath>
find_augmenting_path(const ResidualGraph& residual, NodeId src, NodeId dst) {
  const auto N = residual.num_nodes();
  if (src < 0 || src >= N || dst < 0 || dst >= N || src == dst) {
    return std::nullopt;
  }
  AugmentingPath path;
  path.src = src;
  path.dst = dst;
  path.parent.assign(static_cast<std::size_t>(N), kNoNode);
  path.parent[static_cast<std::size_t>(src)] = src;

  std::queue<NodeId> q;
  q.push(src);
  bool found = false;
  while (!q.empty() && !found) {
    auto u = q.front(); q.pop();
    for (auto const& [v, cap] : residual.arcs(u)) {
      if (cap <= 0 || path.parent[static_cast<std::size_t>(v)] != kNoNode) continue;
      path.parent[static_cast<std::size_t>(v)] = u;
      if (v == dst) { found = true; break; }
      q.push(v);
    }
  }
  if (!found) return std::nullopt;

  Cap bottleneck = std::numeric_limits<Cap>::max();
  for (NodeId v = dst; v != src; ) {
    NodeId u = path.parent[static_cast<std::size_t>(v)];
    bottleneck = std::min(bottleneck, residual.residual(u, v));
    v = u;
  }
  path.bottleneck = bottleneck;
  return path;
}

} // namespace tierflow::core
