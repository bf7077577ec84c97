/* Core type aliases and helper structs.
 *
 * For Python developers:
 * - NodeId: int32 index assigned by CapacityGraph in first-seen order
 * - Cap/Flow: int64 (capacities and realized flows are integral)
 * - Share: float64 (attributed flow after proportional splitting)
 * - std::map<K, V>: ordered dict; iteration order is by key
 */
#pragma once

#include <cstdint>
#include <map>

namespace tierflow::core {

// Node identifiers are signed 32-bit integers; -1 marks "no node".
using NodeId = std::int32_t;
using Cap    = std::int64_t;  // Edge capacity
using Flow   = std::int64_t;  // Flow amount (same unit as capacity)
using Share  = double;        // Attributed (possibly fractional) flow

inline constexpr NodeId kNoNode = -1;

// Realized flow on one directed edge.
struct EdgeFlow {
  NodeId from { kNoNode };
  NodeId to { kNoNode };
  Flow flow { 0 };
  friend bool operator==(const EdgeFlow& a, const EdgeFlow& b) noexcept {
    return a.from==b.from && a.to==b.to && a.flow==b.flow;
  }
};

// flow_matrix[u][v] = realized flow on original edge u->v.
using FlowMatrix = std::map<NodeId, std::map<NodeId, Flow>>;

// attribution[source][consumer] = flow delivered to consumer attributed to source.
using AttributionTable = std::map<NodeId, std::map<NodeId, Share>>;

} // namespace tierflow::core
