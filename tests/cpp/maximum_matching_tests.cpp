#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>
#include "bigraph/core/maximum_matching.hpp"
#include "test_utils.hpp"

using namespace bigraph::core;
using namespace bigraph::core::test;

//=============================================================================
// Whole-graph matcher
//=============================================================================

TEST(MaximumMatching, DocsGraphMatchesBothDestinations) {
  auto g = make_docs_graph();
  auto m = maximum_matching(g);
  EXPECT_EQ(m.size(), 6u);  // max(nsrcs, ndsts)
  EXPECT_FALSE(m.has_inverse());
  EXPECT_EQ(m.matched_count(), 2u);
  ASSERT_TRUE(is_matched(m[1]));
  ASSERT_TRUE(is_matched(m[2]));
  const VertexId s1 = matched_vertex(m[1]);
  const VertexId s2 = matched_vertex(m[2]);
  EXPECT_NE(s1, s2);
  EXPECT_TRUE(s1 == 1 || s1 == 2 || s1 == 5 || s1 == 6);
  EXPECT_TRUE(s2 == 3 || s2 == 4 || s2 == 6);
  // Sources are tried in ascending order.
  EXPECT_EQ(as_ids(m), (std::vector<VertexId>{1, 3, 0, 0, 0, 0}));
}

TEST(MaximumMatching, ResultCompletesConsistently) {
  auto g = make_docs_graph();
  auto m = maximum_matching(g);
  m.complete(g.nsrcs());
  expect_matching_consistent(m, g);
  EXPECT_EQ(m.inverse_entries().size(), 6u);
}

TEST(MaximumMatching, CardinalityBound) {
  for (VertexId n : {1, 2, 5, 8}) {
    auto g = make_triangular_graph(n);
    auto m = maximum_matching(g);
    EXPECT_LE(m.matched_count(), static_cast<std::size_t>(std::min(g.nsrcs(), g.ndsts())));
    EXPECT_EQ(m.matched_count(), static_cast<std::size_t>(n)) << "triangular graph " << n << " is perfect";
  }
}

TEST(MaximumMatching, CycleGraphIsPerfect) {
  auto g = make_cycle_graph(5);
  auto m = maximum_matching(g);
  EXPECT_EQ(m.matched_count(), 5u);
  m.complete();
  expect_matching_consistent(m, g);
}

TEST(MaximumMatching, ReroutesAlongAugmentingPath) {
  auto g = BipartiteGraph::from_adjacency(AdjTable{{1, 2}, {1}}, 2);
  auto m = maximum_matching(g);
  EXPECT_EQ(as_ids(m), (std::vector<VertexId>{2, 1}));
}

TEST(MaximumMatching, ReroutesThroughTwoHops) {
  auto g = BipartiteGraph::from_adjacency(AdjTable{{1, 2}, {2, 3}, {1}}, 3);
  auto m = maximum_matching(g);
  EXPECT_EQ(as_ids(m), (std::vector<VertexId>{3, 1, 2}));
}

TEST(MaximumMatching, MoreDestinationsThanSources) {
  auto g = BipartiteGraph::from_adjacency(AdjTable{{2, 4}}, 5);
  auto m = maximum_matching(g);
  EXPECT_EQ(m.size(), 5u);
  EXPECT_EQ(as_ids(m), (std::vector<VertexId>{0, 1, 0, 0, 0}));
}

TEST(MaximumMatching, EmptyGraph) {
  BipartiteGraph g(0, 0);
  auto m = maximum_matching(g);
  EXPECT_EQ(m.size(), 0u);
}

TEST(MaximumMatching, LongChainNeedsNoRecursion) {
  // Source i touches destinations i and i+1; trying sources in order forces
  // a full-length reroute for the last source.
  const VertexId n = 2000;
  AdjTable fadj(static_cast<std::size_t>(n));
  for (VertexId i = 1; i < n; ++i) fadj[static_cast<std::size_t>(i - 1)] = {i, i + 1};
  fadj[static_cast<std::size_t>(n - 1)] = {1};
  auto g = BipartiteGraph::from_adjacency(std::move(fadj), n);
  auto m = maximum_matching(g);
  EXPECT_EQ(m.matched_count(), static_cast<std::size_t>(n));
  EXPECT_EQ(matched_vertex(m[1]), n);
}

//=============================================================================
// Filters and masks
//=============================================================================

TEST(MaximumMatching, DestinationFilter) {
  auto g = make_docs_graph();
  auto m = maximum_matching(g, AcceptAll{}, [](VertexId d) { return d != 1; });
  EXPECT_EQ(as_ids(m), (std::vector<VertexId>{0, 3, 0, 0, 0, 0}));
}

TEST(MaximumMatching, SourceFilter) {
  auto g = make_docs_graph();
  auto m = maximum_matching(g, [](VertexId s) { return s != 1 && s != 3; });
  EXPECT_EQ(as_ids(m), (std::vector<VertexId>{2, 4, 0, 0, 0, 0}));
}

TEST(MaximumMatching, MaskOptions) {
  auto g = make_docs_graph();
  auto src_mask = make_bool_mask(6, false);
  src_mask[5] = true;  // only source 6
  MatchingOptions opts;
  opts.src_mask = std::span<const bool>(src_mask.get(), 6);
  auto m = maximum_matching(g, opts);
  EXPECT_EQ(as_ids(m), (std::vector<VertexId>{6, 0, 0, 0, 0, 0}));

  auto dst_mask = make_bool_mask(2, true);
  dst_mask[0] = false;
  opts.dst_mask = std::span<const bool>(dst_mask.get(), 2);
  m = maximum_matching(g, opts);
  EXPECT_EQ(as_ids(m), (std::vector<VertexId>{0, 6, 0, 0, 0, 0}));
}

TEST(MaximumMatching, EmptyMasksAllowEverything) {
  auto g = make_docs_graph();
  EXPECT_EQ(maximum_matching(g, MatchingOptions{}), maximum_matching(g));
}

TEST(MaximumMatching, MaskLengthMismatch) {
  auto g = make_docs_graph();
  auto mask = make_bool_mask(3);
  MatchingOptions opts;
  opts.src_mask = std::span<const bool>(mask.get(), 3);
  EXPECT_THROW((void)maximum_matching(g, opts), std::invalid_argument);
  opts.src_mask = {};
  opts.dst_mask = std::span<const bool>(mask.get(), 3);
  EXPECT_THROW((void)maximum_matching(g, opts), std::invalid_argument);
}

//=============================================================================
// Single augmentation
//=============================================================================

TEST(TryAugment, GrowsByOne) {
  auto g = BipartiteGraph::from_adjacency(AdjTable{{1, 2}, {1}}, 2);
  Matching m(2);
  std::vector<std::uint8_t> dcolor(2, 0);
  EXPECT_TRUE(try_augment(m, g, 1, AcceptAll{}, dcolor));
  std::fill(dcolor.begin(), dcolor.end(), std::uint8_t{0});
  EXPECT_TRUE(try_augment(m, g, 2, AcceptAll{}, dcolor));
  EXPECT_EQ(as_ids(m), (std::vector<VertexId>{2, 1}));
}

TEST(TryAugment, FailureLeavesMatchingUnchanged) {
  auto g = make_docs_graph();
  auto m = maximum_matching(g);
  auto before = m.clone();
  std::vector<std::uint8_t> dcolor(2, 0);
  EXPECT_FALSE(try_augment(m, g, 5, AcceptAll{}, dcolor));
  EXPECT_EQ(m, before);
}

TEST(TryAugment, RecordsVisitedSources) {
  auto g = BipartiteGraph::from_adjacency(AdjTable{{1, 2}, {2, 3}, {1}}, 3);
  auto m = make_matching({1, 2, 0});
  std::vector<std::uint8_t> dcolor(3, 0), scolor(3, 0);
  EXPECT_TRUE(try_augment(m, g, 3, AcceptAll{}, dcolor, scolor));
  EXPECT_EQ(scolor, (std::vector<std::uint8_t>{1, 1, 1}));
  EXPECT_EQ(as_ids(m), (std::vector<VertexId>{3, 1, 2}));
}

TEST(TryAugment, UsesMatchingInverseWhenComplete) {
  auto g = BipartiteGraph::from_adjacency(AdjTable{{1, 2}, {1}}, 2);
  auto m = make_matching({1, 0});
  m.complete(2);
  std::vector<std::uint8_t> dcolor(2, 0);
  EXPECT_TRUE(try_augment(m, g, 2, AcceptAll{}, dcolor));
  m.complete();
  expect_matching_consistent(m, g);
  EXPECT_EQ(matched_vertex(m.inverse_entries()[0]), 2);
}

TEST(TryAugment, ValidatesArguments) {
  auto g = make_docs_graph();
  Matching m(2);
  std::vector<std::uint8_t> dcolor(2, 0), short_color(1, 0);
  EXPECT_THROW((void)try_augment(m, g, 0, AcceptAll{}, dcolor), std::out_of_range);
  EXPECT_THROW((void)try_augment(m, g, 7, AcceptAll{}, dcolor), std::out_of_range);
  EXPECT_THROW((void)try_augment(m, g, 1, AcceptAll{}, short_color), std::invalid_argument);
  EXPECT_THROW((void)try_augment(m, g, 1, AcceptAll{}, dcolor, short_color), std::invalid_argument);
  Matching small(1);
  EXPECT_THROW((void)try_augment(small, g, 1, AcceptAll{}, dcolor), std::invalid_argument);
}

struct Singular {
  std::string reason;
};

TEST(TryAugment, PayloadDestinationsAreNotFree) {
  auto g = make_docs_graph();
  BasicMatching<Singular> m(2);
  m.set(1, Singular{"pivot too small"});
  std::vector<std::uint8_t> dcolor(2, 0);
  EXPECT_FALSE(try_augment(m, g, 1, AcceptAll{}, dcolor));
  std::fill(dcolor.begin(), dcolor.end(), std::uint8_t{0});
  EXPECT_TRUE(try_augment(m, g, 6, AcceptAll{}, dcolor));
  EXPECT_EQ(matched_vertex(m[2]), 6);
  EXPECT_EQ(std::get<Singular>(m[1]).reason, "pivot too small");
}

TEST(TryAugment, PayloadMatcher) {
  auto g = make_cycle_graph(3);
  auto m = maximum_matching<Singular>(g);
  EXPECT_EQ(m.matched_count(), 3u);
}
