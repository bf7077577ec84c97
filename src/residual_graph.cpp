/*
  ResidualGraph — per-node residual arcs with guaranteed reciprocals.

  Forward capacities are copied from the CapacityGraph; a reverse arc is
  created with residual 0 only where none exists, so a genuine opposite edge
  (bidirectional pair) keeps its own capacity.
*/
#include "tierflow/core/residual_graph.hpp"

#include <stdexcept>
#include <string>

#include "absl/log/check.h"

namespace tierflow::core {

ResidualGraph::ResidualGraph(const CapacityGraph& g)
  : adj_(static_cast<std::size_t>(g.num_nodes())) {
  for (NodeId u = 0; u < g.num_nodes(); ++u) {
    for (auto const& [v, c] : g.out_edges(u)) {
      adj_[static_cast<std::size_t>(u)][v] = c;
    }
  }
  // Fill reverse gaps in a second pass; try_emplace never demotes an entry.
  for (NodeId u = 0; u < g.num_nodes(); ++u) {
    for (auto const& [v, c] : g.out_edges(u)) {
      adj_[static_cast<std::size_t>(v)].try_emplace(u, Cap{0});
    }
  }
}

const std::map<NodeId, Cap>& ResidualGraph::arcs(NodeId u) const {
  if (u < 0 || u >= num_nodes()) {
    throw std::out_of_range("ResidualGraph::arcs: node id " + std::to_string(u) + " out of range");
  }
  return adj_[static_cast<std::size_t>(u)];
}

Cap ResidualGraph::residual(NodeId u, NodeId v) const noexcept {
  if (u < 0 || u >= num_nodes()) return 0;
  const auto& row = adj_[static_cast<std::size_t>(u)];
  auto it = row.find(v);
  return it == row.end() ? 0 : it->second;
}

bool ResidualGraph::has_arc(NodeId u, NodeId v) const noexcept {
  return u >= 0 && u < num_nodes() && adj_[static_cast<std::size_t>(u)].count(v) > 0;
}

void ResidualGraph::push(NodeId u, NodeId v, Cap amount) {
  if (!has_arc(u, v)) {
    throw std::invalid_argument("ResidualGraph::push: no arc " + std::to_string(u) +
                                "->" + std::to_string(v));
  }
  auto& fwd = adj_[static_cast<std::size_t>(u)][v];
  if (amount < 0 || amount > fwd) {
    throw std::invalid_argument("ResidualGraph::push: amount " + std::to_string(amount) +
                                " outside [0, " + std::to_string(fwd) + "]");
  }
  auto rev = adj_[static_cast<std::size_t>(v)].find(u);
  DCHECK(rev != adj_[static_cast<std::size_t>(v)].end()) << "missing reciprocal arc";
  fwd -= amount;
  rev->second += amount;
}

ResidualGraph build_residual(const CapacityGraph& g) {
  return ResidualGraph(g);
}

} // namespace tierflow::core
