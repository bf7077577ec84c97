/* Three-tier network (sources -> hubs -> consumers) with super source/sink. */
#pragma once

#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "tierflow/core/capacity_graph.hpp"
#include "tierflow/core/max_flow.hpp"
#include "tierflow/core/options.hpp"
#include "tierflow/core/types.hpp"

namespace tierflow::core {

struct TieredFlowReport {
  Flow total_flow {0};
  CapacityGraph graph;
  FlowSummary summary;
  // attribution[source][consumer]
  std::map<std::string, std::map<std::string, Share>> attribution;
  std::map<std::string, Share> source_totals;
  std::map<std::string, Flow> consumer_intake;
  // Min-cut edges by name, super source/sink edges included.
  std::vector<std::pair<std::string, std::string>> bottlenecks;
};

// Describes a sources -> hubs -> consumers network. build() closes it with a
// super source feeding every source and a super sink fed by every consumer.
// Super edge capacities default to the sum of the node's tier links and can
// be overridden with set_supply()/set_demand().
class TieredNetwork {
public:
  TieredNetwork(std::vector<std::string> sources,
                std::vector<std::string> hubs,
                std::vector<std::string> consumers,
                TieredNetworkOptions opts = {});

  // Links accumulate. A link that would push the summed link capacity of
  // either endpoint past Cap throws InvalidCapacity and is not recorded.
  void add_supply_link(std::string_view source, std::string_view hub, Cap capacity);
  void add_delivery_link(std::string_view hub, std::string_view consumer, Cap capacity);
  void set_supply(std::string_view source, Cap capacity);
  void set_demand(std::string_view consumer, Cap capacity);

  [[nodiscard]] const std::vector<std::string>& sources() const noexcept { return sources_; }
  [[nodiscard]] const std::vector<std::string>& hubs() const noexcept { return hubs_; }
  [[nodiscard]] const std::vector<std::string>& consumers() const noexcept { return consumers_; }
  [[nodiscard]] const TieredNetworkOptions& options() const noexcept { return opts_; }

  [[nodiscard]] CapacityGraph build() const;
  [[nodiscard]] TieredFlowReport solve(const MaxFlowOptions& opts = {}) const;

private:
  enum class Tier { Source, Hub, Consumer };

  static const char* tier_name(Tier tier);

  void expect_tier(std::string_view name, Tier tier, const char* role) const;

  std::vector<std::string> sources_;
  std::vector<std::string> hubs_;
  std::vector<std::string> consumers_;
  TieredNetworkOptions opts_;
  std::unordered_map<std::string, Tier> tier_of_;
  // Links in insertion order; duplicates accumulate once added to the graph.
  std::vector<std::pair<std::pair<std::string, std::string>, Cap>> supply_links_;
  std::vector<std::pair<std::pair<std::string, std::string>, Cap>> delivery_links_;
  std::map<std::string, Cap> supply_override_;
  std::map<std::string, Cap> demand_override_;
};

} // namespace tierflow::core
