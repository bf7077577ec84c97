/* Directed capacitated graph with name interning and accumulating edges. */
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "tierflow/core/types.hpp"

namespace tierflow::core {

// Non-negative capacity. Construction is the single place where the sign is
// checked; everything downstream of a Capacity can assume value() >= 0.
class Capacity {
public:
  explicit Capacity(Cap value);
  [[nodiscard]] Cap value() const noexcept { return value_; }

private:
  Cap value_ {0};
};

struct EdgeCapacity {
  NodeId from { kNoNode };
  NodeId to { kNoNode };
  Cap capacity { 0 };
};

// Notes on node identifiers:
// - Nodes are identified by name at the API boundary and interned into dense
//   NodeIds in first-seen order. Ids never change once assigned.
// - Every node that appears as an edge endpoint owns an adjacency entry, even
//   when it has no outgoing edges, so traversal code can index any visited id.
// - Adding the same (u, v) pair again sums capacities into one edge.
class CapacityGraph {
public:
  CapacityGraph() = default;

  // Return the id of `name`, creating the node if it does not exist yet.
  NodeId add_node(std::string_view name);

  // Register or accumulate edge u->v. Throws InvalidCapacity when capacity is
  // negative, or when the out-capacity of u, the in-capacity of v or the
  // combined capacity of u->v and v->u would overflow Cap; the graph is left
  // unchanged in that case.
  void add_edge(std::string_view u, std::string_view v, Cap capacity);
  void add_edge(NodeId u, NodeId v, Cap capacity);

  [[nodiscard]] std::int32_t num_nodes() const noexcept { return static_cast<std::int32_t>(names_.size()); }
  [[nodiscard]] std::int32_t num_edges() const noexcept { return num_edges_; }
  [[nodiscard]] bool contains(NodeId u) const noexcept { return u >= 0 && u < num_nodes(); }

  [[nodiscard]] const std::string& name(NodeId u) const;
  [[nodiscard]] std::optional<NodeId> find(std::string_view name) const;
  // Like find() but throws std::out_of_range for unknown names.
  [[nodiscard]] NodeId id(std::string_view name) const;

  [[nodiscard]] const std::map<NodeId, Cap>& out_edges(NodeId u) const;
  [[nodiscard]] Cap capacity(NodeId u, NodeId v) const noexcept;
  [[nodiscard]] bool has_edge(NodeId u, NodeId v) const noexcept;
  [[nodiscard]] Cap out_capacity(NodeId u) const;
  [[nodiscard]] Cap in_capacity(NodeId v) const;

  // All edges ordered by (from, to).
  [[nodiscard]] std::vector<EdgeCapacity> edges() const;

private:
  void check_node(NodeId u, const char* what) const;
  void check_accumulate(std::optional<NodeId> u, std::optional<NodeId> v, Cap c,
                        std::string_view u_name, std::string_view v_name) const;

  std::vector<std::string> names_ {};
  std::unordered_map<std::string, NodeId> index_ {};
  std::vector<std::map<NodeId, Cap>> adj_ {};
  std::int32_t num_edges_ {0};
};

} // namespace tierflow::core
