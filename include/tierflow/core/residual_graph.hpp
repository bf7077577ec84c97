/* Residual graph with paired reverse arcs, derived from a CapacityGraph. */
#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "tierflow/core/capacity_graph.hpp"
#include "tierflow/core/types.hpp"

namespace tierflow::core {

// For every arc (u, v) present, the reciprocal arc (v, u) is present too
// (possibly with residual 0). Built fresh for each solve; never aliases the
// CapacityGraph it was derived from.
class ResidualGraph {
public:
  explicit ResidualGraph(const CapacityGraph& g);

  [[nodiscard]] std::int32_t num_nodes() const noexcept { return static_cast<std::int32_t>(adj_.size()); }
  [[nodiscard]] const std::map<NodeId, Cap>& arcs(NodeId u) const;
  [[nodiscard]] Cap residual(NodeId u, NodeId v) const noexcept;
  [[nodiscard]] bool has_arc(NodeId u, NodeId v) const noexcept;

  // Move `amount` units of residual from arc u->v to arc v->u.
  // Throws std::invalid_argument if the arc is missing, amount is negative,
  // or amount exceeds the current residual of u->v.
  void push(NodeId u, NodeId v, Cap amount);

private:
  std::vector<std::map<NodeId, Cap>> adj_ {};
};

[[nodiscard]] ResidualGraph build_residual(const CapacityGraph& g);

} // namespace tierflow::core
