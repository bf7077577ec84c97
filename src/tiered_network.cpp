/*
  TieredNetwork — sources -> hubs -> consumers closed by a super source/sink.

  build() lays nodes out tier by tier (super source first, super sink last) so
  NodeIds follow the declaration order. solve() runs the max-flow and
  attributes every consumer's intake back to the sources through the hubs.
*/
#include "tierflow/core/tiered_network.hpp"
#include "tierflow/core/error.hpp"
#include "tierflow/core/flow_decomposition.hpp"

#include <limits>
#include <stdexcept>

#include "absl/log/log.h"

namespace tierflow::core {

namespace {

using Links = std::vector<std::pair<std::pair<std::string, std::string>, Cap>>;

[[noreturn]] void throw_link_overflow(std::string_view node) {
  throw InvalidCapacity("TieredNetwork: link capacities of '" + std::string(node) + "' overflow");
}

// Sum of every link leaving (match_from) or entering `node`.
Cap sum_links(const Links& links, std::string_view node, bool match_from) {
  Cap sum = 0;
  for (auto const& [ends, c] : links) {
    if ((match_from ? ends.first : ends.second) != node) continue;
    if (c > std::numeric_limits<Cap>::max() - sum) throw_link_overflow(node);
    sum += c;
  }
  return sum;
}

// Throws InvalidCapacity when one more link of capacity `c` would overflow
// the link sum of `node`.
void check_link_sum(const Links& links, std::string_view node, bool match_from, Cap c) {
  if (c > std::numeric_limits<Cap>::max() - sum_links(links, node, match_from)) {
    throw_link_overflow(node);
  }
}

} // namespace

const char* TieredNetwork::tier_name(Tier tier) {
  switch (tier) {
    case Tier::Source: return "source";
    case Tier::Hub: return "hub";
    case Tier::Consumer: return "consumer";
  }
  return "unknown";
}

TieredNetwork::TieredNetwork(std::vector<std::string> sources,
                             std::vector<std::string> hubs,
                             std::vector<std::string> consumers,
                             TieredNetworkOptions opts)
  : sources_(std::move(sources)), hubs_(std::move(hubs)),
    consumers_(std::move(consumers)), opts_(std::move(opts)) {
  if (opts_.super_source.empty() || opts_.super_sink.empty() ||
      opts_.super_source == opts_.super_sink) {
    throw std::invalid_argument("TieredNetwork: super source and sink names must be distinct and non-empty");
  }
  opts_.unbounded_demand = Capacity(opts_.unbounded_demand).value();
  auto declare = [this](const std::vector<std::string>& names, Tier tier) {
    for (auto const& n : names) {
      if (n.empty()) {
        throw std::invalid_argument("TieredNetwork: empty node name");
      }
      if (n == opts_.super_source || n == opts_.super_sink) {
        throw std::invalid_argument("TieredNetwork: '" + n + "' is reserved for the super source/sink");
      }
      auto [it, inserted] = tier_of_.emplace(n, tier);
      if (!inserted) {
        throw std::invalid_argument("TieredNetwork: '" + n + "' declared twice (as " +
                                    tier_name(it->second) + ")");
      }
    }
  };
  declare(sources_, Tier::Source);
  declare(hubs_, Tier::Hub);
  declare(consumers_, Tier::Consumer);
}

void TieredNetwork::expect_tier(std::string_view name, Tier tier, const char* role) const {
  auto it = tier_of_.find(std::string(name));
  if (it == tier_of_.end() || it->second != tier) {
    throw std::invalid_argument(std::string("TieredNetwork: ") + role + " '" + std::string(name) +
                                "' is not a declared " + tier_name(tier));
  }
}

void TieredNetwork::add_supply_link(std::string_view source, std::string_view hub, Cap capacity) {
  Capacity c(capacity);
  expect_tier(source, Tier::Source, "supply link source");
  expect_tier(hub, Tier::Hub, "supply link target");
  // Default super-edge capacities and hub totals are link sums; they must fit.
  check_link_sum(supply_links_, source, true, c.value());
  check_link_sum(supply_links_, hub, false, c.value());
  supply_links_.push_back({{std::string(source), std::string(hub)}, c.value()});
}

void TieredNetwork::add_delivery_link(std::string_view hub, std::string_view consumer, Cap capacity) {
  Capacity c(capacity);
  expect_tier(hub, Tier::Hub, "delivery link source");
  expect_tier(consumer, Tier::Consumer, "delivery link target");
  check_link_sum(delivery_links_, hub, true, c.value());
  check_link_sum(delivery_links_, consumer, false, c.value());
  delivery_links_.push_back({{std::string(hub), std::string(consumer)}, c.value()});
}

void TieredNetwork::set_supply(std::string_view source, Cap capacity) {
  Capacity c(capacity);
  expect_tier(source, Tier::Source, "supply");
  supply_override_[std::string(source)] = c.value();
}

void TieredNetwork::set_demand(std::string_view consumer, Cap capacity) {
  Capacity c(capacity);
  expect_tier(consumer, Tier::Consumer, "demand");
  demand_override_[std::string(consumer)] = c.value();
}

CapacityGraph TieredNetwork::build() const {
  CapacityGraph g;
  const NodeId s = g.add_node(opts_.super_source);
  for (auto const& n : sources_) (void)g.add_node(n);
  for (auto const& n : hubs_) (void)g.add_node(n);
  for (auto const& n : consumers_) (void)g.add_node(n);
  const NodeId t = g.add_node(opts_.super_sink);

  for (auto const& n : sources_) {
    auto ov = supply_override_.find(n);
    Cap supply = ov != supply_override_.end() ? ov->second : sum_links(supply_links_, n, true);
    g.add_edge(s, g.id(n), supply);
  }
  for (auto const& [ends, c] : supply_links_) g.add_edge(ends.first, ends.second, c);
  for (auto const& [ends, c] : delivery_links_) g.add_edge(ends.first, ends.second, c);
  for (auto const& n : consumers_) {
    auto ov = demand_override_.find(n);
    Cap demand = 0;
    if (ov != demand_override_.end()) {
      demand = ov->second;
    } else {
      demand = sum_links(delivery_links_, n, false);
      if (demand == 0) demand = opts_.unbounded_demand;
    }
    g.add_edge(g.id(n), t, demand);
  }
  return g;
}

TieredFlowReport TieredNetwork::solve(const MaxFlowOptions& opts) const {
  TieredFlowReport report;
  report.graph = build();
  const auto& g = report.graph;

  MaxFlowOptions run = opts;
  run.with_flow_matrix = true;
  run.with_min_cut = true;
  auto [total, summary] = calc_max_flow(g, opts_.super_source, opts_.super_sink, run);
  report.total_flow = total;

  auto ids = [&g](const std::vector<std::string>& names) {
    std::vector<NodeId> out;
    out.reserve(names.size());
    for (auto const& n : names) out.push_back(g.id(n));
    return out;
  };
  const auto src_ids = ids(sources_);
  const auto hub_ids = ids(hubs_);
  const auto con_ids = ids(consumers_);

  auto upstream = tier_flows(summary.flow_matrix, src_ids, hub_ids);
  auto downstream = tier_flows(summary.flow_matrix, hub_ids, con_ids);
  auto table = decompose_flows(upstream, downstream);
  for (auto const& [u, row] : table) {
    auto& named = report.attribution[g.name(u)];
    for (auto const& [d, v] : row) named[g.name(d)] = v;
  }

  for (auto const& n : sources_) report.source_totals[n] = 0.0;
  for (auto const& [u, v] : attributed_totals(table)) report.source_totals[g.name(u)] = v;

  const NodeId t = g.id(opts_.super_sink);
  for (auto const id : con_ids) {
    report.consumer_intake[g.name(id)] = summary.flow_matrix.at(id).at(t);
  }
  for (auto const& [u, v] : summary.min_cut.edges) {
    report.bottlenecks.emplace_back(g.name(u), g.name(v));
  }
  VLOG(1) << "tiered network: " << sources_.size() << " sources, " << hubs_.size()
          << " hubs, " << consumers_.size() << " consumers, total flow " << total
          << ", " << report.bottlenecks.size() << " cut edges";

  if (!opts.with_flow_matrix) summary.flow_matrix.clear();
  if (!opts.with_min_cut) summary.min_cut = MinCut{};
  report.summary = std::move(summary);
  return report;
}

} // namespace tierflow::core
