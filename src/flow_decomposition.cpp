/*
  decompose_flows — proportional source -> consumer attribution through hubs.

  Per hub: collect inflow by source, normalize into shares, then split every
  outgoing delivery by those shares. Results accumulate across hubs that feed
  the same consumer.
*/
#include "tierflow/core/flow_decomposition.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "absl/log/log.h"

namespace tierflow::core {

namespace {

void check_flow(const EdgeFlow& ef, const char* side) {
  if (ef.flow < 0) {
    throw std::invalid_argument(std::string("decompose_flows: negative ") + side + " flow " +
                                std::to_string(ef.flow) + " on " + std::to_string(ef.from) +
                                "->" + std::to_string(ef.to));
  }
}

} // namespace

AttributionTable decompose_flows(std::span<const EdgeFlow> upstream,
                                 std::span<const EdgeFlow> downstream) {
  for (auto const& ef : upstream) check_flow(ef, "upstream");
  for (auto const& ef : downstream) check_flow(ef, "downstream");

  // hub -> (source -> inflow), hub -> (consumer -> outflow)
  std::map<NodeId, std::map<NodeId, Flow>> inflow;
  std::map<NodeId, std::map<NodeId, Flow>> outflow;
  for (auto const& ef : upstream) inflow[ef.to][ef.from] += ef.flow;
  for (auto const& ef : downstream) outflow[ef.from][ef.to] += ef.flow;

  AttributionTable out;
  for (auto const& [hub, deliveries] : outflow) {
    auto it = inflow.find(hub);
    if (it == inflow.end()) continue;
    Flow total_in = 0;
    for (auto const& [src, f] : it->second) total_in += f;
    if (total_in == 0) continue;

    Flow total_out = 0;
    for (auto const& [dst, f] : deliveries) total_out += f;
    if (total_out > total_in) {
      LOG(WARNING) << "hub " << hub << " delivers " << total_out
                   << " but receives only " << total_in
                   << "; attribution scaled by inflow shares anyway";
    }

    for (auto const& [dst, f] : deliveries) {
      if (f == 0) continue;
      for (auto const& [src, in] : it->second) {
        if (in == 0) continue;
        Share share = static_cast<Share>(in) / static_cast<Share>(total_in);
        out[src][dst] += static_cast<Share>(f) * share;
      }
    }
  }
  return out;
}

std::vector<EdgeFlow> tier_flows(const FlowMatrix& flows,
                                 std::span<const NodeId> from_tier,
                                 std::span<const NodeId> to_tier) {
  std::vector<EdgeFlow> out;
  for (auto u : from_tier) {
    auto row = flows.find(u);
    if (row == flows.end()) continue;
    for (auto v : to_tier) {
      auto cell = row->second.find(v);
      if (cell == row->second.end()) continue;
      out.push_back(EdgeFlow{u, v, cell->second});
    }
  }
  std::sort(out.begin(), out.end(), [](auto const& a, auto const& b) {
    if (a.from != b.from) return a.from < b.from;
    return a.to < b.to;
  });
  return out;
}

std::map<NodeId, Share> attributed_totals(const AttributionTable& table) {
  std::map<NodeId, Share> out;
  for (auto const& [src, row] : table) {
    Share sum = 0.0;
    for (auto const& [dst, v] : row) sum += v;
    out[src] = sum;
  }
  return out;
}

} // namespace tierflow::core
