/* Algorithms façade: forwards calls to a Backend, validating handles. */
#pragma once

#include <memory>
#include <span>
#include <utility>
#include <vector>

#include "tierflow/core/backend.hpp"

namespace tierflow::core {

class Algorithms {
public:
  explicit Algorithms(BackendPtr backend);

  [[nodiscard]] GraphHandle build_graph(const CapacityGraph& g) const;
  [[nodiscard]] GraphHandle build_graph(std::shared_ptr<const CapacityGraph> g) const;

  [[nodiscard]] std::pair<Flow, FlowSummary> max_flow(
      const GraphHandle& gh, NodeId src, NodeId dst, const MaxFlowOptions& opts = {}) const;

  [[nodiscard]] std::vector<FlowSummary> batch_max_flow(
      const GraphHandle& gh,
      const std::vector<std::pair<NodeId,NodeId>>& pairs,
      const MaxFlowOptions& opts = {}) const;

  [[nodiscard]] AttributionTable decompose(
      std::span<const EdgeFlow> upstream,
      std::span<const EdgeFlow> downstream) const;

private:
  BackendPtr backend_;
};

} // namespace tierflow::core
