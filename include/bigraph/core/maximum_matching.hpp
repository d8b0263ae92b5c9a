/* Augmenting-path maximum-cardinality bipartite matching. */
#pragma once

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "bigraph/core/bipartite_graph.hpp"
#include "bigraph/core/logging.hpp"
#include "bigraph/core/matching.hpp"
#include "bigraph/core/options.hpp"
#include "bigraph/core/types.hpp"

namespace bigraph::core {

// Vertex filter admitting every vertex.
struct AcceptAll {
  constexpr bool operator()(VertexId) const noexcept { return true; }
};

template <typename F>
concept VertexFilter = std::predicate<F&, VertexId>;

namespace detail {

struct AugmentFrame {
  VertexId src;        // source whose neighbors are being scanned
  std::size_t next;    // next neighbor position to try
  VertexId via;        // destination through which the child frame was entered
};

// First phase of a search step: match s to any admissible free destination.
// Destinations holding a payload entry are not free.
template <typename U, typename DstFilter>
bool assign_free_neighbor(BasicMatching<U>& matching, const BipartiteGraph& g, VertexId s,
                          DstFilter& dst_filter, std::span<std::uint8_t> scolor) {
  if (!scolor.empty()) scolor[static_cast<std::size_t>(s - 1)] = 1;
  const auto match = matching.entries();
  for (VertexId d : g.src_neighbors(s)) {
    if (dst_filter(d) && is_unassigned(match[static_cast<std::size_t>(d - 1)])) {
      matching.set(d, s);
      return true;
    }
  }
  return false;
}

} // namespace detail

// Try to grow `matching` by one pair along an augmenting path rooted at
// source `src`. Returns true and updates the matching on success; on failure
// the matching is unchanged.
//
// The search first scans src's neighbors (ascending) for an admissible
// unassigned destination. Failing that it rescans, and for each admissible
// destination not yet coloured in `dcolor` it colours it and tries to re-route
// the source currently matched to it, recursively. This order decides which
// of several maximum matchings is produced.
//
// dcolor (length >= ndsts) and scolor (empty, or length >= nsrcs) are
// caller-owned scratch indexed by id - 1. They are not cleared here; reset
// dcolor before searching from an unrelated root. scolor, when given, records
// every source visited.
//
// The search uses an explicit stack, so its depth is bounded by heap memory
// rather than by the call stack.
template <typename U, typename DstFilter>
  requires VertexFilter<DstFilter>
bool try_augment(BasicMatching<U>& matching, const BipartiteGraph& g, VertexId src,
                 DstFilter&& dst_filter, std::span<std::uint8_t> dcolor,
                 std::span<std::uint8_t> scolor = {}) {
  if (!g.has_src_vertex(src)) {
    throw std::out_of_range("try_augment: source " + std::to_string(src) + " out of range");
  }
  if (dcolor.size() < static_cast<std::size_t>(g.ndsts())) {
    throw std::invalid_argument("try_augment: dcolor must have at least ndsts entries");
  }
  if (!scolor.empty() && scolor.size() < static_cast<std::size_t>(g.nsrcs())) {
    throw std::invalid_argument("try_augment: scolor must be empty or have at least nsrcs entries");
  }
  if (matching.size() < static_cast<std::size_t>(g.ndsts())) {
    throw std::invalid_argument("try_augment: matching has fewer entries than ndsts");
  }

  if (detail::assign_free_neighbor(matching, g, src, dst_filter, scolor)) return true;

  std::vector<detail::AugmentFrame> stack;
  stack.push_back({src, 0, 0});
  while (!stack.empty()) {
    auto& top = stack.back();
    const auto nbrs = g.src_neighbors(top.src);
    const auto match = matching.entries();
    VertexId next_src = 0;
    while (top.next < nbrs.size()) {
      const VertexId d = nbrs[top.next++];
      auto& color = dcolor[static_cast<std::size_t>(d - 1)];
      if (!dst_filter(d) || color) continue;
      color = 1;
      const auto& e = match[static_cast<std::size_t>(d - 1)];
      if (!is_matched(e)) continue;
      top.via = d;
      next_src = matched_vertex(e);
      break;
    }
    if (next_src == 0) {
      // Exhausted: this source cannot be re-routed; the parent resumes.
      stack.pop_back();
      continue;
    }
    if (detail::assign_free_neighbor(matching, g, next_src, dst_filter, scolor)) {
      // Flip the path, innermost first.
      for (auto it = stack.rbegin(); it != stack.rend(); ++it) matching.set(it->via, it->src);
      return true;
    }
    stack.push_back({next_src, 0, 0});
  }
  return false;
}

// Maximum-cardinality matching of destinations to sources.
//
// Sources admitted by src_filter are tried in ascending id order, each with a
// fresh destination colouring; a source stays unmatched only if no augmenting
// path exists when it is tried. Destinations rejected by dst_filter are never
// matched. The result has max(nsrcs, ndsts) entries and no inverse.
//
// In the literature on block-triangular decomposition this is often called a
// "maximal" matching; the augmenting-path process guarantees maximum
// cardinality, which is the stronger property. O(V * (V + E)).
template <typename U = Unassigned, typename SrcFilter = AcceptAll, typename DstFilter = AcceptAll>
  requires VertexFilter<SrcFilter> && VertexFilter<DstFilter>
[[nodiscard]] BasicMatching<U> maximum_matching(const BipartiteGraph& g,
                                                SrcFilter&& src_filter = {},
                                                DstFilter&& dst_filter = {}) {
  BasicMatching<U> matching(static_cast<std::size_t>(std::max(g.nsrcs(), g.ndsts())));
  std::vector<std::uint8_t> dcolor(static_cast<std::size_t>(g.ndsts()), 0);
  std::size_t tried = 0;
  for (VertexId s : g.src_vertices()) {
    if (!src_filter(s)) continue;
    std::fill(dcolor.begin(), dcolor.end(), std::uint8_t{0});
    (void)try_augment(matching, g, s, dst_filter, dcolor);
    ++tried;
  }
  BIGRAPH_LOG_DEBUG("maximum_matching: {} of {} admitted sources matched ({} sources, {} destinations)",
                    matching.matched_count(), tried, g.nsrcs(), g.ndsts());
  return matching;
}

// Mask-driven variant; see MatchingOptions.
[[nodiscard]] Matching maximum_matching(const BipartiteGraph& g, const MatchingOptions& opts);

} // namespace bigraph::core
