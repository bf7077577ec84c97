/* Proportional attribution of consumer deliveries to upstream sources. */
#pragma once

#include <map>
#include <span>
#include <vector>

#include "tierflow/core/types.hpp"

namespace tierflow::core {

// For every hub h (a `to` node in upstream, a `from` node in downstream):
//   share[u] = flow(u->h) / sum_u' flow(u'->h)
//   attribution[u][d] += flow(h->d) * share[u]
// Flow merging at a hub is treated as fungible: no per-source tagging survives
// the merge. Hubs without inflow contribute nothing; zero entries are omitted.
// Repeated (from, to) pairs in either input accumulate.
// Throws std::invalid_argument on a negative flow.
[[nodiscard]] AttributionTable
decompose_flows(std::span<const EdgeFlow> upstream,
                std::span<const EdgeFlow> downstream);

// Realized flows of the original edges from any node of from_tier to any node
// of to_tier, in (from, to) order.
[[nodiscard]] std::vector<EdgeFlow>
tier_flows(const FlowMatrix& flows,
           std::span<const NodeId> from_tier,
           std::span<const NodeId> to_tier);

// Sum of each source's row.
[[nodiscard]] std::map<NodeId, Share> attributed_totals(const AttributionTable& table);

} // namespace tierflow::core
