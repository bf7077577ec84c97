/*
  CPU Backend — thin adapter that delegates to in-process algorithms.
*/
#include "tierflow/core/backend.hpp"
#include "tierflow/core/flow_decomposition.hpp"
#include "tierflow/core/max_flow.hpp"

#include <stdexcept>

namespace tierflow::core {

namespace {
class CpuBackend final : public Backend {
public:
  GraphHandle build_graph(const CapacityGraph& g) override {
    // Create a non-owning shared_ptr with no-op deleter; lifetime is managed by caller
    return GraphHandle{ std::shared_ptr<const CapacityGraph>(&g, [](const CapacityGraph*){}) };
  }

  GraphHandle build_graph(std::shared_ptr<const CapacityGraph> g) override {
    return GraphHandle{ std::move(g) };
  }

  std::pair<Flow, FlowSummary> max_flow(
      const GraphHandle& gh, NodeId src, NodeId dst, const MaxFlowOptions& opts) override {
    return tierflow::core::calc_max_flow(*gh.graph, src, dst, opts);
  }

  std::vector<FlowSummary> batch_max_flow(
      const GraphHandle& gh,
      const std::vector<std::pair<NodeId,NodeId>>& pairs,
      const MaxFlowOptions& opts) override {
    return tierflow::core::batch_max_flow(*gh.graph, pairs, opts);
  }

  AttributionTable decompose(std::span<const EdgeFlow> upstream,
                             std::span<const EdgeFlow> downstream) override {
    return tierflow::core::decompose_flows(upstream, downstream);
  }
};
} // namespace

BackendPtr make_cpu_backend() {
  return std::make_shared<CpuBackend>();
}

} // namespace tierflow::core
