/* Edmonds–Karp max-flow with flow extraction, min-cut and batch evaluation. */
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "tierflow/core/capacity_graph.hpp"
#include "tierflow/core/options.hpp"
#include "tierflow/core/residual_graph.hpp"
#include "tierflow/core/types.hpp"

namespace tierflow::core {

// Original edges crossing from the source side to the sink side of the final
// residual graph. capacity equals the max-flow value.
struct MinCut {
  std::vector<std::pair<NodeId, NodeId>> edges;
  Cap capacity {0};
};

struct FlowSummary {
  Flow total_flow {0};
  // Number of augmenting paths pushed; each one raised total_flow by >= 1.
  std::int64_t augmentations {0};
  // Optional outputs; populated only when requested via MaxFlowOptions.
  FlowMatrix flow_matrix;
  MinCut min_cut {};
  std::optional<ResidualGraph> residual;
  std::vector<std::uint8_t> reachable_nodes; // length == g.num_nodes(); 0/1 flags
};

// Throws InvalidEndpoints when src == dst or either id is not a node of g.
[[nodiscard]] std::pair<Flow, FlowSummary>
calc_max_flow(const CapacityGraph& g, NodeId src, NodeId dst,
              const MaxFlowOptions& opts = {});

[[nodiscard]] std::pair<Flow, FlowSummary>
calc_max_flow(const CapacityGraph& g, std::string_view src, std::string_view dst,
              const MaxFlowOptions& opts = {});

[[nodiscard]] std::vector<FlowSummary>
batch_max_flow(const CapacityGraph& g,
               const std::vector<std::pair<NodeId,NodeId>>& pairs,
               const MaxFlowOptions& opts = {});

// Realized flow per original edge: max(0, capacity - residual).
[[nodiscard]] FlowMatrix extract_flows(const CapacityGraph& g, const ResidualGraph& residual);

// Reachability from src over arcs with positive residual. When `reachable` is
// non-null it receives the 0/1 flags (resized to g.num_nodes()).
[[nodiscard]] MinCut compute_min_cut(const CapacityGraph& g, const ResidualGraph& residual,
                                     NodeId src,
                                     std::vector<std::uint8_t>* reachable = nullptr);

} // namespace tierflow::core
