/*
  calc_max_flow — Edmonds–Karp over a ResidualGraph.

  Each iteration finds a fewest-arc augmenting path, pushes its bottleneck
  (forward residual down, reverse residual up) and adds it to the total. When
  no path remains, realized per-edge flows are read off the final residual and
  the min-cut is derived from residual reachability.
*/
#include "tierflow/core/max_flow.hpp"
#include "tierflow/core/augmenting_path.hpp"
#include "tierflow/core/error.hpp"

#include <queue>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"

namespace tierflow::core {

namespace {

void check_endpoints(const CapacityGraph& g, NodeId src, NodeId dst) {
  if (!g.contains(src)) {
    throw InvalidEndpoints("source id " + std::to_string(src) + " is not a node of the graph");
  }
  if (!g.contains(dst)) {
    throw InvalidEndpoints("sink id " + std::to_string(dst) + " is not a node of the graph");
  }
  if (src == dst) {
    throw InvalidEndpoints("source and sink must differ ('" + g.name(src) + "')");
  }
}

} // namespace

std::pair<Flow, FlowSummary>
calc_max_flow(const CapacityGraph& g, NodeId src, NodeId dst, const MaxFlowOptions& opts) {
  check_endpoints(g, src, dst);
  FlowSummary summary;
  ResidualGraph residual = build_residual(g);
  Flow total = 0;

  while (true) {
    auto path = find_augmenting_path(residual, src, dst);
    if (!path) break;
    const Cap b = path->bottleneck;
    DCHECK_GT(b, 0) << "augmenting path with empty bottleneck";
    total += b;
    ++summary.augmentations;
    // Walk predecessors from sink back to source.
    for (NodeId v = dst; v != src; ) {
      NodeId u = path->parent[static_cast<std::size_t>(v)];
      residual.push(u, v, b);
      v = u;
    }
    VLOG(2) << "augmentation " << summary.augmentations << ": pushed " << b
            << " over " << path->nodes().size() - 1 << " arcs, total " << total;
  }

  summary.total_flow = total;
  VLOG(1) << "max flow " << g.name(src) << " -> " << g.name(dst) << " = " << total
          << " after " << summary.augmentations << " augmentations";

  if (opts.with_flow_matrix) {
    summary.flow_matrix = extract_flows(g, residual);
  }
  if (opts.with_min_cut || opts.with_reachable) {
    std::vector<std::uint8_t> reach;
    auto mc = compute_min_cut(g, residual, src, &reach);
    DCHECK_EQ(mc.capacity, total) << "min-cut capacity differs from max flow";
    if (opts.with_min_cut) summary.min_cut = std::move(mc);
    if (opts.with_reachable) summary.reachable_nodes = std::move(reach);
  }
  if (opts.with_residual) {
    summary.residual.emplace(std::move(residual));
  }
  return {summary.total_flow, std::move(summary)};
}

std::pair<Flow, FlowSummary>
calc_max_flow(const CapacityGraph& g, std::string_view src, std::string_view dst,
              const MaxFlowOptions& opts) {
  auto s = g.find(src);
  auto t = g.find(dst);
  if (!s) throw InvalidEndpoints("unknown source '" + std::string(src) + "'");
  if (!t) throw InvalidEndpoints("unknown sink '" + std::string(dst) + "'");
  return calc_max_flow(g, *s, *t, opts);
}

std::vector<FlowSummary>
batch_max_flow(const CapacityGraph& g,
               const std::vector<std::pair<NodeId,NodeId>>& pairs,
               const MaxFlowOptions& opts) {
  // Validate every pair up front so a bad pair fails the batch before any solve.
  for (auto const& pr : pairs) check_endpoints(g, pr.first, pr.second);
  std::vector<FlowSummary> out;
  out.reserve(pairs.size());
  for (auto const& pr : pairs) {
    auto [val, summary] = calc_max_flow(g, pr.first, pr.second, opts);
    out.push_back(std::move(summary));
  }
  return out;
}

FlowMatrix extract_flows(const CapacityGraph& g, const ResidualGraph& residual) {
  FlowMatrix out;
  for (auto const& e : g.edges()) {
    Flow used = e.capacity - residual.residual(e.from, e.to);
    // Negative only on the weaker side of a bidirectional pair, where the net
    // flow is reported on the opposite edge.
    out[e.from][e.to] = used > 0 ? used : 0;
  }
  return out;
}

MinCut compute_min_cut(const CapacityGraph& g, const ResidualGraph& residual,
                       NodeId src, std::vector<std::uint8_t>* reachable) {
  MinCut out;
  const auto N = static_cast<std::size_t>(g.num_nodes());
  std::vector<std::uint8_t> visited(N, 0u);
  std::queue<NodeId> q;
  if (g.contains(src)) { visited[static_cast<std::size_t>(src)] = 1u; q.push(src); }
  while (!q.empty()) {
    auto u = q.front(); q.pop();
    // Reverse arcs are explicit in the residual graph, so cancellation
    // capacity is followed here as well.
    for (auto const& [v, cap] : residual.arcs(u)) {
      if (cap > 0 && !visited[static_cast<std::size_t>(v)]) {
        visited[static_cast<std::size_t>(v)] = 1u;
        q.push(v);
      }
    }
  }
  for (auto const& e : g.edges()) {
    if (e.capacity <= 0) continue;
    if (visited[static_cast<std::size_t>(e.from)] && !visited[static_cast<std::size_t>(e.to)]) {
      out.edges.emplace_back(e.from, e.to);
      out.capacity += e.capacity;
    }
  }
  if (reachable) *reachable = std::move(visited);
  return out;
}

} // namespace tierflow::core
