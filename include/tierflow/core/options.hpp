/* Option structs for the solver and the tiered network builder. */
#pragma once

#include <string>

#include "tierflow/core/types.hpp"

namespace tierflow::core {

struct MaxFlowOptions {
  // Populate FlowSummary::flow_matrix from the final residual graph.
  bool with_flow_matrix { true };
  // Keep the final residual graph in FlowSummary::residual.
  bool with_residual { true };
  // Derive the min-cut (edges + capacity) from the final residual graph.
  bool with_min_cut { true };
  // Fill FlowSummary::reachable_nodes with 0/1 source-side flags.
  bool with_reachable { false };
};

struct TieredNetworkOptions {
  std::string super_source { "__source__" };
  std::string super_sink { "__sink__" };
  // Capacity of consumer->sink for consumers without any delivery link.
  Cap unbounded_demand { 1'000'000'000 };
};

} // namespace tierflow::core
