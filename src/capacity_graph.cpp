/*
  CapacityGraph — interned nodes and accumulating directed edges.

  Capacities are validated through the Capacity value type before any state
  is touched, so a rejected insert leaves the graph exactly as it was.
*/
#include "tierflow/core/capacity_graph.hpp"
#include "tierflow/core/error.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace tierflow::core {

Capacity::Capacity(Cap value) : value_(value) {
  if (value < 0) {
    throw InvalidCapacity("capacity must be >= 0, got " + std::to_string(value));
  }
}

NodeId CapacityGraph::add_node(std::string_view name) {
  std::string key(name);
  auto it = index_.find(key);
  if (it != index_.end()) return it->second;
  if (names_.size() >= static_cast<std::size_t>(std::numeric_limits<NodeId>::max())) {
    throw std::length_error("CapacityGraph: too many nodes");
  }
  auto id = static_cast<NodeId>(names_.size());
  names_.push_back(key);
  adj_.emplace_back();
  index_.emplace(std::move(key), id);
  return id;
}

void CapacityGraph::add_edge(std::string_view u, std::string_view v, Cap capacity) {
  Capacity c(capacity);
  // Overflow is checked against the existing nodes before new ones are created.
  auto fu = find(u);
  auto fv = find(v);
  if (fu && fv) {
    add_edge(*fu, *fv, c.value());
    return;
  }
  check_accumulate(fu, fv, c.value(), u, v);
  NodeId a = add_node(u);
  NodeId b = add_node(v);
  add_edge(a, b, c.value());
}

void CapacityGraph::add_edge(NodeId u, NodeId v, Cap capacity) {
  Capacity c(capacity);
  check_node(u, "add_edge: source");
  check_node(v, "add_edge: target");
  check_accumulate(u, v, c.value(), names_[static_cast<std::size_t>(u)],
                   names_[static_cast<std::size_t>(v)]);
  auto& row = adj_[static_cast<std::size_t>(u)];
  auto [it, inserted] = row.try_emplace(v, 0);
  if (inserted) ++num_edges_;
  it->second += c.value();
}

// Bounds per-node out/in capacity and per-pair capacity. A solve's total flow
// and min cut never exceed the source's out-capacity, and a residual arc never
// exceeds the capacity of its pair.
void CapacityGraph::check_accumulate(std::optional<NodeId> u, std::optional<NodeId> v, Cap c,
                                     std::string_view u_name, std::string_view v_name) const {
  constexpr Cap kMax = std::numeric_limits<Cap>::max();
  auto overflow = [&](const std::string& where) {
    return InvalidCapacity("capacity overflow on edge " + std::string(u_name) + "->" +
                           std::string(v_name) + ": " + where);
  };
  if (u && c > kMax - out_capacity(*u)) {
    throw overflow("out-capacity of " + std::string(u_name));
  }
  if (v && c > kMax - in_capacity(*v)) {
    throw overflow("in-capacity of " + std::string(v_name));
  }
  if (u && v && *u != *v && c > kMax - capacity(*u, *v) - capacity(*v, *u)) {
    throw overflow("opposite-edge pair");
  }
}

const std::string& CapacityGraph::name(NodeId u) const {
  check_node(u, "name");
  return names_[static_cast<std::size_t>(u)];
}

std::optional<NodeId> CapacityGraph::find(std::string_view name) const {
  auto it = index_.find(std::string(name));
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

NodeId CapacityGraph::id(std::string_view name) const {
  auto found = find(name);
  if (!found) {
    throw std::out_of_range("unknown node '" + std::string(name) + "'");
  }
  return *found;
}

const std::map<NodeId, Cap>& CapacityGraph::out_edges(NodeId u) const {
  check_node(u, "out_edges");
  return adj_[static_cast<std::size_t>(u)];
}

Cap CapacityGraph::capacity(NodeId u, NodeId v) const noexcept {
  if (!contains(u)) return 0;
  const auto& row = adj_[static_cast<std::size_t>(u)];
  auto it = row.find(v);
  return it == row.end() ? 0 : it->second;
}

bool CapacityGraph::has_edge(NodeId u, NodeId v) const noexcept {
  return contains(u) && adj_[static_cast<std::size_t>(u)].count(v) > 0;
}

Cap CapacityGraph::out_capacity(NodeId u) const {
  Cap sum = 0;
  for (auto const& [v, c] : out_edges(u)) sum += c;
  return sum;
}

Cap CapacityGraph::in_capacity(NodeId v) const {
  check_node(v, "in_capacity");
  Cap sum = 0;
  for (auto const& row : adj_) {
    auto it = row.find(v);
    if (it != row.end()) sum += it->second;
  }
  return sum;
}

std::vector<EdgeCapacity> CapacityGraph::edges() const {
  std::vector<EdgeCapacity> out;
  out.reserve(static_cast<std::size_t>(num_edges_));
  for (std::size_t u = 0; u < adj_.size(); ++u) {
    for (auto const& [v, c] : adj_[u]) {
      out.push_back(EdgeCapacity{static_cast<NodeId>(u), v, c});
    }
  }
  return out;
}

void CapacityGraph::check_node(NodeId u, const char* what) const {
  if (!contains(u)) {
    throw std::out_of_range(std::string("CapacityGraph::") + what +
                            ": node id " + std::to_string(u) + " out of range");
  }
}

} // namespace tierflow::core
