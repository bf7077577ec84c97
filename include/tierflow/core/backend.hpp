/*
  Backend interface — abstracts the max-flow and decomposition implementations.

  The default CPU backend delegates to in-process algorithm implementations.
  All execution flows through this interface via an Algorithms façade.

  For Python developers:
  - std::shared_ptr<T>: reference-counted pointer (like Python object references)
  - virtual: method can be overridden in subclasses (like Python's inheritance)
  - = 0: pure virtual (must be implemented by subclass, like @abstractmethod)
*/
#pragma once

#include <memory>
#include <span>
#include <utility>
#include <vector>

#include "tierflow/core/capacity_graph.hpp"
#include "tierflow/core/max_flow.hpp"
#include "tierflow/core/options.hpp"
#include "tierflow/core/types.hpp"

namespace tierflow::core {

// GraphHandle: opaque handle to a backend-owned graph.
struct GraphHandle {
  std::shared_ptr<const CapacityGraph> graph {};
};

class Backend {
public:
  virtual ~Backend() noexcept = default;

  // Non-owning handle; the caller keeps `g` alive while the handle is used.
  [[nodiscard]] virtual GraphHandle build_graph(const CapacityGraph& g) = 0;

  // Handle sharing ownership of `g`.
  [[nodiscard]] virtual GraphHandle build_graph(std::shared_ptr<const CapacityGraph> g) = 0;

  [[nodiscard]] virtual std::pair<Flow, FlowSummary> max_flow(
      const GraphHandle& gh, NodeId src, NodeId dst, const MaxFlowOptions& opts) = 0;

  [[nodiscard]] virtual std::vector<FlowSummary> batch_max_flow(
      const GraphHandle& gh,
      const std::vector<std::pair<NodeId,NodeId>>& pairs,
      const MaxFlowOptions& opts) = 0;

  [[nodiscard]] virtual AttributionTable decompose(
      std::span<const EdgeFlow> upstream,
      std::span<const EdgeFlow> downstream) = 0;
};

using BackendPtr = std::shared_ptr<Backend>;

[[nodiscard]] BackendPtr make_cpu_backend();

} // namespace tierflow::core
