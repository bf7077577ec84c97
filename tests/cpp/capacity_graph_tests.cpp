#include <gtest/gtest.h>
#include <limits>
#include "tierflow/core/capacity_graph.hpp"
#include "tierflow/core/error.hpp"
#include "test_utils.hpp"

using namespace tierflow::core;
using namespace tierflow::core::test;

TEST(CapacityGraph, AddNodeIsIdempotent) {
  CapacityGraph g;
  auto a = g.add_node("A");
  auto b = g.add_node("B");
  EXPECT_EQ(a, 0);
  EXPECT_EQ(b, 1);
  EXPECT_EQ(g.add_node("A"), a);
  EXPECT_EQ(g.num_nodes(), 2);
  EXPECT_EQ(g.name(b), "B");
}

TEST(CapacityGraph, EndpointsGetAdjacencyEntries) {
  CapacityGraph g;
  g.add_edge("u", "v", 4);
  auto v = g.id("v");
  // v has no outgoing edges but is still a valid lookup key.
  EXPECT_TRUE(g.out_edges(v).empty());
  EXPECT_EQ(g.num_nodes(), 2);
}

TEST(CapacityGraph, RepeatedEdgeAccumulates) {
  CapacityGraph g;
  g.add_edge("u", "v", 7);
  g.add_edge("u", "v", 7);
  EXPECT_EQ(g.num_edges(), 1) << "Same ordered pair must stay one edge";
  EXPECT_EQ(g.capacity(g.id("u"), g.id("v")), 14);
}

TEST(CapacityGraph, OppositeDirectionsAreDistinctEdges) {
  CapacityGraph g;
  g.add_edge("u", "v", 3);
  g.add_edge("v", "u", 2);
  EXPECT_EQ(g.num_edges(), 2);
  EXPECT_EQ(g.capacity(g.id("u"), g.id("v")), 3);
  EXPECT_EQ(g.capacity(g.id("v"), g.id("u")), 2);
}

TEST(CapacityGraph, ZeroCapacityEdgeIsRegistered) {
  CapacityGraph g;
  g.add_edge("u", "v", 0);
  EXPECT_TRUE(g.has_edge(g.id("u"), g.id("v")));
  EXPECT_EQ(g.capacity(g.id("u"), g.id("v")), 0);
}

TEST(CapacityGraph, NegativeCapacityThrowsAndLeavesGraphUnchanged) {
  CapacityGraph g;
  g.add_edge("u", "v", 5);
  EXPECT_THROW(g.add_edge("u", "w", -1), InvalidCapacity);
  EXPECT_THROW(g.add_edge("u", "v", -1), InvalidCapacity);
  EXPECT_EQ(g.num_nodes(), 2) << "Rejected insert must not create nodes";
  EXPECT_FALSE(g.find("w").has_value());
  EXPECT_EQ(g.num_edges(), 1);
  EXPECT_EQ(g.capacity(g.id("u"), g.id("v")), 5);
}

TEST(CapacityGraph, InvalidCapacityIsInvalidArgument) {
  CapacityGraph g;
  EXPECT_THROW(g.add_edge("a", "b", -3), std::invalid_argument);
}

TEST(CapacityGraph, AccumulationOverflowThrows) {
  CapacityGraph g;
  g.add_edge("u", "v", std::numeric_limits<Cap>::max());
  EXPECT_THROW(g.add_edge("u", "v", 1), InvalidCapacity);
  EXPECT_EQ(g.capacity(g.id("u"), g.id("v")), std::numeric_limits<Cap>::max());
}

TEST(CapacityGraph, OutCapacityOverflowThrows) {
  constexpr Cap kMax = std::numeric_limits<Cap>::max();
  CapacityGraph g;
  g.add_edge("s", "a", kMax);
  // Two parallel branches out of s would sum past Cap during a solve.
  EXPECT_THROW(g.add_edge("s", "b", 1), InvalidCapacity);
  EXPECT_FALSE(g.find("b").has_value()) << "Rejected insert must not create nodes";
  EXPECT_EQ(g.num_edges(), 1);
  EXPECT_EQ(g.out_capacity(g.id("s")), kMax);
}

TEST(CapacityGraph, InCapacityOverflowThrows) {
  constexpr Cap kMax = std::numeric_limits<Cap>::max();
  CapacityGraph g;
  g.add_edge("a", "t", kMax);
  g.add_node("b");
  EXPECT_THROW(g.add_edge(g.id("b"), g.id("t"), 1), InvalidCapacity);
  EXPECT_THROW(g.add_edge("c", "t", 1), InvalidCapacity);
  EXPECT_FALSE(g.find("c").has_value());
  EXPECT_FALSE(g.has_edge(g.id("b"), g.id("t")));
  EXPECT_EQ(g.in_capacity(g.id("t")), kMax);
}

TEST(CapacityGraph, OppositeEdgePairOverflowThrows) {
  constexpr Cap kMax = std::numeric_limits<Cap>::max();
  CapacityGraph g;
  g.add_edge("u", "v", 5);
  // The residual arc v->u carries both capacities once u->v is saturated.
  EXPECT_THROW(g.add_edge("v", "u", kMax - 4), InvalidCapacity);
  EXPECT_FALSE(g.has_edge(g.id("v"), g.id("u")));
  g.add_edge("v", "u", kMax - 5);
  EXPECT_EQ(g.capacity(g.id("v"), g.id("u")), kMax - 5);
}

TEST(CapacityGraph, SelfLoopIsBoundedByOutCapacity) {
  constexpr Cap kMax = std::numeric_limits<Cap>::max();
  CapacityGraph g;
  g.add_edge("u", "u", kMax);
  EXPECT_THROW(g.add_edge("u", "w", 1), InvalidCapacity);
  EXPECT_EQ(g.num_nodes(), 1);
}

TEST(CapacityGraph, CapacityTypeRejectsNegative) {
  EXPECT_THROW(Capacity(-1), InvalidCapacity);
  EXPECT_EQ(Capacity(0).value(), 0);
  EXPECT_EQ(Capacity(42).value(), 42);
}

TEST(CapacityGraph, UnknownIdsAndNames) {
  auto g = make_line_graph(3);
  EXPECT_THROW(g.add_edge(0, 7, 1), std::out_of_range);
  EXPECT_THROW(g.add_edge(-1, 1, 1), std::out_of_range);
  EXPECT_THROW((void)g.id("missing"), std::out_of_range);
  EXPECT_THROW((void)g.name(3), std::out_of_range);
  EXPECT_FALSE(g.find("missing").has_value());
  EXPECT_EQ(g.capacity(0, 7), 0);
}

TEST(CapacityGraph, InAndOutCapacity) {
  auto g = make_diamond_graph();
  EXPECT_EQ(g.out_capacity(g.id("s")), 10);
  EXPECT_EQ(g.in_capacity(g.id("t")), 13);
  EXPECT_EQ(g.in_capacity(g.id("s")), 0);
}

TEST(CapacityGraph, EdgesAreOrderedByEndpoints) {
  CapacityGraph g;
  g.add_edge("b", "c", 2);  // b=0 c=1
  g.add_edge("a", "b", 1);  // a=2
  g.add_edge("b", "a", 3);
  auto edges = g.edges();
  ASSERT_EQ(edges.size(), 3u);
  EXPECT_EQ(edges[0].from, 0); EXPECT_EQ(edges[0].to, 1);
  EXPECT_EQ(edges[1].from, 0); EXPECT_EQ(edges[1].to, 2);
  EXPECT_EQ(edges[2].from, 2); EXPECT_EQ(edges[2].to, 0);
  EXPECT_EQ(edges[1].capacity, 3);
}
