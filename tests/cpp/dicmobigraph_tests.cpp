#include <gtest/gtest.h>
#include <algorithm>
#include <vector>
#include "bigraph/core/dicmobigraph.hpp"
#include "bigraph/core/error.hpp"
#include "bigraph/core/maximum_matching.hpp"
#include "bigraph/core/simple_digraph.hpp"
#include "test_utils.hpp"

using namespace bigraph::core;
using namespace bigraph::core::test;

namespace {

// Triangular 3x3 graph with its diagonal matching, both completed.
DiCMOBiGraph make_triangular_view() {
  auto g = make_triangular_graph(3);
  g.complete();
  auto m = maximum_matching(g);
  m.complete(g.nsrcs());
  return DiCMOBiGraph(g, m);
}

// Underlying edges whose destination is matched to some other source.
EdgeCount count_oriented_edges(const BipartiteGraph& g, const Matching& m) {
  EdgeCount n = 0;
  for (const auto& e : g.edges()) {
    const auto& entry = m[e.dst];
    if (is_matched(entry) && matched_vertex(entry) != e.src) ++n;
  }
  return n;
}

std::vector<DiEdge> sorted(std::vector<DiEdge> edges) {
  std::sort(edges.begin(), edges.end(), [](const DiEdge& a, const DiEdge& b) {
    return a.src != b.src ? a.src < b.src : a.dst < b.dst;
  });
  return edges;
}

} // namespace

TEST(DiCMOBiGraph, OutNeighborsFollowMatchedEdges) {
  auto dg = make_triangular_view();
  EXPECT_EQ(dg.nv(), 3);
  EXPECT_TRUE(to_vector(dg.out_neighbors(1)).empty());
  EXPECT_EQ(to_vector(dg.out_neighbors(2)), (std::vector<VertexId>{1}));
  EXPECT_EQ(to_vector(dg.out_neighbors(3)), (std::vector<VertexId>{1, 2}));
}

TEST(DiCMOBiGraph, InNeighborsUseInverse) {
  auto dg = make_triangular_view();
  EXPECT_EQ(to_vector(dg.in_neighbors(1)), (std::vector<VertexId>{2, 3}));
  EXPECT_EQ(to_vector(dg.in_neighbors(2)), (std::vector<VertexId>{3}));
  EXPECT_TRUE(dg.in_neighbors(3).empty());
}

TEST(DiCMOBiGraph, InAndOutAgree) {
  auto g = make_docs_graph();
  g.complete();
  auto m = maximum_matching(g);
  m.complete(g.nsrcs());
  DiCMOBiGraph dg(g, m);
  for (VertexId a : dg.vertices()) {
    for (VertexId b : dg.out_neighbors(a)) {
      EXPECT_TRUE(dg.in_neighbors(b).contains(a)) << a << " -> " << b;
    }
    for (VertexId b : dg.in_neighbors(a)) {
      EXPECT_TRUE(dg.out_neighbors(b).contains(a)) << b << " -> " << a;
    }
  }
}

TEST(DiCMOBiGraph, NoSelfLoops) {
  for (VertexId n : {3, 5, 7}) {
    auto g = make_cycle_graph(n);
    g.complete();
    auto m = maximum_matching(g);
    m.complete(g.nsrcs());
    DiCMOBiGraph dg(g, m);
    for (VertexId v : dg.vertices()) {
      EXPECT_FALSE(dg.out_neighbors(v).contains(v)) << "vertex " << v;
      EXPECT_FALSE(dg.in_neighbors(v).contains(v)) << "vertex " << v;
      EXPECT_FALSE(dg.has_edge(v, v));
    }
  }
}

TEST(DiCMOBiGraph, EdgeCountIsNonMatchedNonDanglingEdges) {
  auto g = make_docs_graph();
  g.complete();
  auto m = maximum_matching(g);
  DiCMOBiGraph dg(g, m);
  EXPECT_EQ(dg.num_edges(), 5);
  EXPECT_EQ(dg.num_edges(), count_oriented_edges(g, m));
  EXPECT_EQ(static_cast<EdgeCount>(dg.edges().size()), dg.num_edges());
}

TEST(DiCMOBiGraph, DanglingDestinationsContributeNothing) {
  auto g = BipartiteGraph::from_adjacency(AdjTable{{1, 2}, {2}}, 2);
  auto m = make_matching({1, 0});
  DiCMOBiGraph dg(g, m);
  EXPECT_EQ(dg.num_edges(), 0);
  EXPECT_TRUE(dg.out_neighbors(2).empty());
}

TEST(DiCMOBiGraph, GraphOnlyHasNoEdges) {
  auto g = make_docs_graph();
  DiCMOBiGraph dg(g);
  EXPECT_EQ(dg.matching().size(), 2u);
  EXPECT_EQ(dg.num_edges(), 0);
  EXPECT_TRUE(dg.edges().empty());
}

TEST(DiCMOBiGraph, HasEdge) {
  auto dg = make_triangular_view();
  EXPECT_TRUE(dg.has_edge(3, 1));
  EXPECT_TRUE(dg.has_edge(2, 1));
  EXPECT_FALSE(dg.has_edge(1, 3));
  EXPECT_FALSE(dg.has_edge(0, 1));
  EXPECT_FALSE(dg.has_edge(1, 4));
}

TEST(DiCMOBiGraph, EdgesInVertexOrder) {
  auto dg = make_triangular_view();
  EXPECT_EQ(dg.edges(), (std::vector<DiEdge>{{2, 1}, {3, 1}, {3, 2}}));
}

TEST(DiCMOBiGraph, EdgeCountIsMemoized) {
  auto dg = make_triangular_view();
  EXPECT_EQ(dg.num_edges(), 3);
  auto g = dg.graph();
  g.set_neighbors(1, {1, 2});
  EXPECT_EQ(to_vector(dg.out_neighbors(1)), (std::vector<VertexId>{2}));
  EXPECT_EQ(dg.num_edges(), 3);  // stale until invalidated
  dg.invalidate_edge_count();
  EXPECT_EQ(dg.num_edges(), 4);
}

TEST(DiCMOBiGraph, RequiresCompletionForInNeighbors) {
  auto g = make_docs_graph();
  auto m = maximum_matching(g);
  DiCMOBiGraph incomplete_graph(g, m);
  EXPECT_NO_THROW((void)incomplete_graph.out_neighbors(6));
  EXPECT_THROW((void)incomplete_graph.in_neighbors(1), IncompleteError);

  auto h = make_docs_graph();
  h.complete();
  DiCMOBiGraph incomplete_matching(h, maximum_matching(h));
  EXPECT_THROW((void)incomplete_matching.in_neighbors(1), IncompleteError);
}

TEST(DiCMOBiGraph, ValidatesConstruction) {
  auto g = make_docs_graph();
  EXPECT_THROW((void)DiCMOBiGraph(g, Matching(1)), std::invalid_argument);
  DiCMOBiGraph dg(g);
  EXPECT_THROW((void)dg.out_neighbors(0), std::out_of_range);
  EXPECT_THROW((void)dg.out_neighbors(7), std::out_of_range);
}

//=============================================================================
// Transposed orientation
//=============================================================================

TEST(TransposedDiCMOBiGraph, ContractsThroughMatchedSource) {
  auto g = make_triangular_graph(3);
  g.complete();
  auto m = maximum_matching(g);
  m.complete(g.nsrcs());
  TransposedDiCMOBiGraph dg(g, m);
  static_assert(decltype(dg)::transposed);
  EXPECT_EQ(dg.nv(), 3);
  EXPECT_TRUE(dg.in_neighbors(1).empty());
  EXPECT_EQ(to_vector(dg.in_neighbors(2)), (std::vector<VertexId>{1}));
  EXPECT_EQ(to_vector(dg.in_neighbors(3)), (std::vector<VertexId>{1, 2}));
  EXPECT_EQ(to_vector(dg.out_neighbors(1)), (std::vector<VertexId>{2, 3}));
  EXPECT_EQ(to_vector(dg.out_neighbors(2)), (std::vector<VertexId>{3}));
  EXPECT_TRUE(dg.out_neighbors(3).empty());
  EXPECT_EQ(dg.num_edges(), 3);
  EXPECT_TRUE(dg.has_edge(1, 3));
  EXPECT_FALSE(dg.has_edge(3, 1));
}

TEST(TransposedDiCMOBiGraph, UnmatchedDestinationHasNoInNeighbors) {
  auto g = make_docs_graph();
  g.complete();
  TransposedDiCMOBiGraph dg(g);
  EXPECT_TRUE(dg.in_neighbors(1).empty());
  EXPECT_TRUE(dg.in_neighbors(2).empty());
}

TEST(TransposedDiCMOBiGraph, CountsAndListsEdgesWithoutInverse) {
  // Destination 1 matched to source 6, destination 2 to source 3.
  auto g = make_docs_graph();
  TransposedDiCMOBiGraph dg(g, make_matching({6, 3}));
  EXPECT_FALSE(dg.matching().has_inverse());
  EXPECT_EQ(dg.num_edges(), 1);
  EXPECT_EQ(dg.edges(), (std::vector<DiEdge>{{2, 1}}));
  EXPECT_TRUE(dg.has_edge(2, 1));
  EXPECT_THROW((void)dg.out_neighbors(2), IncompleteError);
}

TEST(TransposedDiCMOBiGraph, EdgesMatchNeighborLists) {
  auto g = make_cycle_graph(5);
  g.complete();
  auto m = maximum_matching(g);
  m.complete(g.nsrcs());
  TransposedDiCMOBiGraph dg(g, m);
  std::vector<DiEdge> from_out;
  for (VertexId v : dg.vertices()) {
    for (VertexId w : dg.out_neighbors(v)) from_out.push_back({v, w});
  }
  const auto listed = dg.edges();
  EXPECT_EQ(sorted(listed), sorted(from_out));
  EXPECT_EQ(dg.num_edges(), static_cast<EdgeCount>(listed.size()));
}

//=============================================================================
// invview
//=============================================================================

TEST(DiCMOBiGraph, InvviewIsSameDirectedGraph) {
  auto g = BipartiteGraph::from_adjacency(AdjTable{{1, 2}, {2, 3}}, 3);
  g.complete();
  auto m = make_matching({1, 2, 0});
  m.complete(g.nsrcs());
  DiCMOBiGraph dg(g, m);
  ASSERT_EQ(dg.nv(), 2);
  ASSERT_EQ(dg.num_edges(), 1);
  ASSERT_TRUE(dg.has_edge(1, 2));

  auto tg = dg.invview();
  static_assert(decltype(tg)::transposed);
  EXPECT_EQ(tg.nv(), dg.nv());
  EXPECT_EQ(tg.num_edges(), dg.num_edges());
  for (VertexId a : dg.vertices()) {
    for (VertexId b : dg.vertices()) {
      EXPECT_EQ(tg.has_edge(a, b), dg.has_edge(a, b)) << a << " -> " << b;
    }
    EXPECT_EQ(to_vector(tg.out_neighbors(a)), to_vector(dg.out_neighbors(a)));
    EXPECT_EQ(to_vector(tg.in_neighbors(a)), to_vector(dg.in_neighbors(a)));
  }
  EXPECT_EQ(tg.edges(), (std::vector<DiEdge>{{1, 2}}));
}

TEST(DiCMOBiGraph, InvviewKeepsTriangularEdges) {
  auto dg = make_triangular_view();
  auto tg = dg.invview();
  EXPECT_EQ(tg.nv(), 3);
  EXPECT_EQ(tg.num_edges(), dg.num_edges());
  EXPECT_EQ(sorted(tg.edges()), sorted(dg.edges()));
}

TEST(DiCMOBiGraph, InvviewCarriesMemoizedCount) {
  auto dg = make_triangular_view();
  ASSERT_EQ(dg.num_edges(), 3);
  auto m = dg.matching();
  m.set(1, unassigned);
  auto tg = dg.invview();
  EXPECT_EQ(tg.num_edges(), 3);
  tg.invalidate_edge_count();
  EXPECT_EQ(tg.num_edges(), 1);
}

TEST(DiCMOBiGraph, InvviewRequiresCompletion) {
  auto g = make_triangular_graph(3);
  g.complete();
  DiCMOBiGraph uncompleted_matching(g, maximum_matching(g));
  EXPECT_THROW((void)uncompleted_matching.invview(), IncompleteError);

  auto m = make_matching({1, 2, 3});
  m.complete(3);
  DiCMOBiGraph uncompleted_graph(make_triangular_graph(3), m);
  EXPECT_THROW((void)uncompleted_graph.invview(), IncompleteError);
}

TEST(TransposedDiCMOBiGraph, InvviewAliases) {
  auto dg = make_triangular_view();
  auto back = dg.invview().invview();
  static_assert(!decltype(back)::transposed);
  EXPECT_TRUE(back.graph().aliases(dg.graph()));
  EXPECT_TRUE(back.matching().aliases(dg.matching()));
  EXPECT_EQ(back.edges(), dg.edges());
}

//=============================================================================
// Materialization
//=============================================================================

TEST(DiCMOBiGraph, EmptyGraphIsSimpleDiGraph) {
  auto sg = DiCMOBiGraph::empty_graph(4);
  EXPECT_EQ(sg.nv(), 4);
  EXPECT_EQ(sg.num_edges(), 0);
}

TEST(DiCMOBiGraph, InducedSubgraph) {
  auto dg = make_triangular_view();
  std::vector<VertexId> keep{3, 1};
  auto [sub, vmap] = induced_subgraph(dg, keep);
  EXPECT_EQ(sub.nv(), 2);
  EXPECT_EQ(vmap, keep);
  EXPECT_EQ(sub.edges(), (std::vector<DiEdge>{{1, 2}}));
}
