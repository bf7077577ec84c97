/*
  Pybind11 module exposing TierFlow-Core C++ APIs to Python.

  Notes:
    - Nodes are addressed by name on the Python side; ids are still reported
      in FlowSummary so results can be joined against CapacityGraph.name().
    - Reachability flags are returned as a uint8 NumPy array.
    - InvalidCapacity and InvalidEndpoints surface as ValueError subclasses.
*/
#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <cstring>

#include "tierflow/core/capacity_graph.hpp"
#include "tierflow/core/error.hpp"
#include "tierflow/core/flow_decomposition.hpp"
#include "tierflow/core/max_flow.hpp"
#include "tierflow/core/options.hpp"
#include "tierflow/core/residual_graph.hpp"
#include "tierflow/core/tiered_network.hpp"
#include "tierflow/core/types.hpp"

namespace py = pybind11;
using namespace tierflow::core;

// Helpers to convert adjacency maps into nested dicts
template <typename T>
static py::dict to_dict(const std::map<NodeId, std::map<NodeId, T>>& m) {
  py::dict out;
  for (auto const& [u, row] : m) {
    py::dict inner;
    for (auto const& [v, x] : row) inner[py::int_(v)] = x;
    out[py::int_(u)] = inner;
  }
  return out;
}

static std::vector<EdgeFlow> as_edge_flows(const std::vector<std::tuple<NodeId, NodeId, Flow>>& rows) {
  std::vector<EdgeFlow> out;
  out.reserve(rows.size());
  for (auto const& [u, v, f] : rows) out.push_back(EdgeFlow{u, v, f});
  return out;
}

PYBIND11_MODULE(_tierflow_core, m) {
  m.doc() = "TierFlow-Core C++ bindings";

  py::register_exception<InvalidCapacity>(m, "InvalidCapacity", PyExc_ValueError);
  py::register_exception<InvalidEndpoints>(m, "InvalidEndpoints", PyExc_ValueError);

  py::class_<CapacityGraph>(m, "CapacityGraph")
      .def(py::init<>())
      .def("add_node", &CapacityGraph::add_node, py::arg("name"))
      .def("add_edge",
           py::overload_cast<std::string_view, std::string_view, Cap>(&CapacityGraph::add_edge),
           py::arg("u"), py::arg("v"), py::arg("capacity"))
      .def("num_nodes", &CapacityGraph::num_nodes)
      .def("num_edges", &CapacityGraph::num_edges)
      .def("name", &CapacityGraph::name, py::arg("node_id"))
      .def("find", &CapacityGraph::find, py::arg("name"))
      .def("id", &CapacityGraph::id, py::arg("name"))
      .def("capacity", [](const CapacityGraph& g, std::string_view u, std::string_view v){
        return g.capacity(g.id(u), g.id(v));
      }, py::arg("u"), py::arg("v"))
      .def("edges", [](const CapacityGraph& g){
        py::list out;
        for (auto const& e : g.edges()) {
          out.append(py::make_tuple(g.name(e.from), g.name(e.to), e.capacity));
        }
        return out;
      });

  py::class_<MaxFlowOptions>(m, "MaxFlowOptions")
      .def(py::init([](bool with_flow_matrix, bool with_residual, bool with_min_cut, bool with_reachable){
        MaxFlowOptions o;
        o.with_flow_matrix = with_flow_matrix;
        o.with_residual = with_residual;
        o.with_min_cut = with_min_cut;
        o.with_reachable = with_reachable;
        return o;
      }),
        py::kw_only(),
        py::arg("with_flow_matrix") = true,
        py::arg("with_residual") = true,
        py::arg("with_min_cut") = true,
        py::arg("with_reachable") = false)
      .def_readwrite("with_flow_matrix", &MaxFlowOptions::with_flow_matrix)
      .def_readwrite("with_residual", &MaxFlowOptions::with_residual)
      .def_readwrite("with_min_cut", &MaxFlowOptions::with_min_cut)
      .def_readwrite("with_reachable", &MaxFlowOptions::with_reachable);

  py::class_<MinCut>(m, "MinCut")
      .def_readonly("edges", &MinCut::edges)
      .def_readonly("capacity", &MinCut::capacity);

  py::class_<FlowSummary>(m, "FlowSummary")
      .def_readonly("total_flow", &FlowSummary::total_flow)
      .def_readonly("augmentations", &FlowSummary::augmentations)
      .def_readonly("min_cut", &FlowSummary::min_cut)
      .def_property_readonly("flow_matrix", [](const FlowSummary& s){ return to_dict(s.flow_matrix); })
      .def_property_readonly("residual", [](const FlowSummary& s) -> py::object {
        if (!s.residual) return py::none();
        py::dict out;
        for (NodeId u = 0; u < s.residual->num_nodes(); ++u) {
          py::dict inner;
          for (auto const& [v, c] : s.residual->arcs(u)) inner[py::int_(v)] = c;
          out[py::int_(u)] = inner;
        }
        return out;
      })
      .def_property_readonly("reachable_nodes", [](const FlowSummary& s){
        py::array_t<std::uint8_t> arr(s.reachable_nodes.size());
        if (!s.reachable_nodes.empty()) {
          std::memcpy(arr.mutable_data(), s.reachable_nodes.data(), s.reachable_nodes.size());
        }
        return arr;
      });

  m.def("calc_max_flow",
        [](const CapacityGraph& g, std::string_view src, std::string_view dst, const MaxFlowOptions& opts){
          py::gil_scoped_release release;
          return calc_max_flow(g, src, dst, opts);
        }, py::arg("g"), py::arg("src"), py::arg("dst"), py::kw_only(),
        py::arg("options") = MaxFlowOptions{});

  m.def("batch_max_flow",
        [](const CapacityGraph& g, const std::vector<std::pair<std::string, std::string>>& pairs,
           const MaxFlowOptions& opts){
          std::vector<std::pair<NodeId, NodeId>> ids;
          ids.reserve(pairs.size());
          for (auto const& [s, t] : pairs) {
            auto fs = g.find(s);
            auto ft = g.find(t);
            if (!fs || !ft) throw InvalidEndpoints("unknown endpoint in pair (" + s + ", " + t + ")");
            ids.emplace_back(*fs, *ft);
          }
          py::gil_scoped_release release;
          return batch_max_flow(g, ids, opts);
        }, py::arg("g"), py::arg("pairs"), py::kw_only(), py::arg("options") = MaxFlowOptions{});

  m.def("decompose_flows",
        [](const std::vector<std::tuple<NodeId, NodeId, Flow>>& upstream,
           const std::vector<std::tuple<NodeId, NodeId, Flow>>& downstream){
          auto up = as_edge_flows(upstream);
          auto down = as_edge_flows(downstream);
          return to_dict(decompose_flows(up, down));
        }, py::arg("upstream"), py::arg("downstream"),
        "Proportional attribution; inputs are lists of (from, to, flow) tuples.");

  py::class_<TieredNetworkOptions>(m, "TieredNetworkOptions")
      .def(py::init<>())
      .def_readwrite("super_source", &TieredNetworkOptions::super_source)
      .def_readwrite("super_sink", &TieredNetworkOptions::super_sink)
      .def_readwrite("unbounded_demand", &TieredNetworkOptions::unbounded_demand);

  py::class_<TieredFlowReport>(m, "TieredFlowReport")
      .def_readonly("total_flow", &TieredFlowReport::total_flow)
      .def_readonly("graph", &TieredFlowReport::graph)
      .def_readonly("summary", &TieredFlowReport::summary)
      .def_readonly("attribution", &TieredFlowReport::attribution)
      .def_readonly("source_totals", &TieredFlowReport::source_totals)
      .def_readonly("consumer_intake", &TieredFlowReport::consumer_intake)
      .def_readonly("bottlenecks", &TieredFlowReport::bottlenecks);

  py::class_<TieredNetwork>(m, "TieredNetwork")
      .def(py::init<std::vector<std::string>, std::vector<std::string>, std::vector<std::string>,
                    TieredNetworkOptions>(),
           py::arg("sources"), py::arg("hubs"), py::arg("consumers"),
           py::arg("options") = TieredNetworkOptions{})
      .def("add_supply_link", &TieredNetwork::add_supply_link,
           py::arg("source"), py::arg("hub"), py::arg("capacity"))
      .def("add_delivery_link", &TieredNetwork::add_delivery_link,
           py::arg("hub"), py::arg("consumer"), py::arg("capacity"))
      .def("set_supply", &TieredNetwork::set_supply, py::arg("source"), py::arg("capacity"))
      .def("set_demand", &TieredNetwork::set_demand, py::arg("consumer"), py::arg("capacity"))
      .def("build", &TieredNetwork::build)
      .def("solve", [](const TieredNetwork& net, const MaxFlowOptions& opts){
        py::gil_scoped_release release;
        return net.solve(opts);
      }, py::kw_only(), py::arg("options") = MaxFlowOptions{});
}
