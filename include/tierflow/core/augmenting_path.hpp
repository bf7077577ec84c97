/* Shortest (fewest-arc) augmenting path search over a ResidualGraph. */
#pragma once

#include <optional>
#include <vector>

#include "tierflow/core/residual_graph.hpp"
#include "tierflow/core/types.hpp"

namespace tierflow::core {

// BFS tree recorded while searching for dst.
// parent[v] is the predecessor of v on the path (parent[src] == src);
// kNoNode marks nodes not visited before dst was reached.
struct AugmentingPath {
  Cap bottleneck {0};
  NodeId src { kNoNode };
  NodeId dst { kNoNode };
  std::vector<NodeId> parent;

  // Nodes along the path in order src ... dst.
  [[nodiscard]] std::vector<NodeId> nodes() const;
};

// Returns std::nullopt when dst is unreachable over arcs with positive
// residual; that is the solver's termination signal, not an error.
[[nodiscard]] std::optional<AugmentingPath>
find_augmenting_path(const ResidualGraph& residual, NodeId src, NodeId dst);

} // namespace tierflow::core
