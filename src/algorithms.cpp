/*
  Algorithms façade — validates handles and forwards to the selected Backend.
*/
#include "tierflow/core/algorithms.hpp"

#include <stdexcept>

namespace tierflow::core {

namespace {
void check_handle(const GraphHandle& gh) {
  if (!gh.graph) {
    throw std::invalid_argument("Algorithms: empty GraphHandle");
  }
}
} // namespace

Algorithms::Algorithms(BackendPtr backend) : backend_(std::move(backend)) {
  if (!backend_) {
    throw std::invalid_argument("Algorithms: backend must not be null");
  }
}

GraphHandle Algorithms::build_graph(const CapacityGraph& g) const {
  return backend_->build_graph(g);
}

GraphHandle Algorithms::build_graph(std::shared_ptr<const CapacityGraph> g) const {
  if (!g) {
    throw std::invalid_argument("Algorithms::build_graph: null graph");
  }
  return backend_->build_graph(std::move(g));
}

std::pair<Flow, FlowSummary> Algorithms::max_flow(
    const GraphHandle& gh, NodeId src, NodeId dst, const MaxFlowOptions& opts) const {
  check_handle(gh);
  return backend_->max_flow(gh, src, dst, opts);
}

std::vector<FlowSummary> Algorithms::batch_max_flow(
    const GraphHandle& gh,
    const std::vector<std::pair<NodeId,NodeId>>& pairs,
    const MaxFlowOptions& opts) const {
  check_handle(gh);
  return backend_->batch_max_flow(gh, pairs, opts);
}

AttributionTable Algorithms::decompose(std::span<const EdgeFlow> upstream,
                                       std::span<const EdgeFlow> downstream) const {
  return backend_->decompose(upstream, downstream);
}

} // namespace tierflow::core
