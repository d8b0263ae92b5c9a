/* Directed, contracted view of a bipartite graph oriented by a matching. */
#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <ranges>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "bigraph/core/bipartite_graph.hpp"
#include "bigraph/core/matching.hpp"
#include "bigraph/core/simple_digraph.hpp"
#include "bigraph/core/types.hpp"

namespace bigraph::core {

enum class NeighborMode : std::uint8_t {
  Oriented = 1,    // each list element x yields table[x] when matched and not self
  Contracted = 2   // each list element x yields x when not self
};

// Lazy neighbor enumeration over one adjacency list of a BipartiteGraph.
// Holds spans into graph and matching storage: invalidated by any mutation.
template <NeighborMode Mode, typename Entry>
class MatchedNeighborRange {
public:
  class iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = VertexId;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = VertexId;

    iterator() = default;

    [[nodiscard]] VertexId operator*() const {
      const VertexId x = list_[pos_];
      if constexpr (Mode == NeighborMode::Oriented) {
        return matched_vertex(table_[static_cast<std::size_t>(x - 1)]);
      } else {
        return x;
      }
    }
    iterator& operator++() {
      ++pos_;
      settle();
      return *this;
    }
    iterator operator++(int) { auto tmp = *this; ++(*this); return tmp; }
    friend bool operator==(const iterator& a, const iterator& b) noexcept { return a.pos_ == b.pos_; }

  private:
    friend class MatchedNeighborRange;
    iterator(const MatchedNeighborRange* r, std::size_t pos)
        : list_(r->list_), table_(r->table_), self_(r->self_), pos_(pos) {
      settle();
    }

    [[nodiscard]] bool admissible(VertexId x) const noexcept {
      if constexpr (Mode == NeighborMode::Oriented) {
        const auto i = static_cast<std::size_t>(x - 1);
        return i < table_.size() && is_matched(table_[i]) && matched_vertex(table_[i]) != self_;
      } else {
        return x != self_;
      }
    }
    void settle() noexcept {
      while (pos_ < list_.size() && !admissible(list_[pos_])) ++pos_;
    }

    std::span<const VertexId> list_ {};
    std::span<const Entry> table_ {};
    VertexId self_ {0};
    std::size_t pos_ {0};
  };

  MatchedNeighborRange() = default;
  MatchedNeighborRange(std::span<const VertexId> list, std::span<const Entry> table, VertexId self) noexcept
      : list_(list), table_(table), self_(self) {}

  [[nodiscard]] iterator begin() const { return iterator(this, 0); }
  [[nodiscard]] iterator end() const { return iterator(this, list_.size()); }
  [[nodiscard]] bool empty() const { return begin() == end(); }
  [[nodiscard]] std::size_t count() const {
    return static_cast<std::size_t>(std::distance(begin(), end()));
  }
  [[nodiscard]] bool contains(VertexId w) const {
    for (VertexId x : *this) {
      if (x == w) return true;
    }
    return false;
  }

private:
  std::span<const VertexId> list_ {};
  std::span<const Entry> table_ {};
  VertexId self_ {0};
};

// BasicDiCMOBiGraph is a directed graph derived, without materialization,
// from a BipartiteGraph g and a matching of destinations to sources.
//
// Transposed == false: vertices are the sources of g. For each edge (v, d)
// of g with d matched to a source s != v, there is an edge v -> s; the matched
// edge of d is read as pointing from d back to its source, and d is contracted
// into s. in_neighbors needs a completed graph and a completed matching.
//
// Transposed == true: vertices are the destinations of g. A matched
// destination v is contracted with its source s = match[v]; every other
// destination of s is an in-neighbor of v. out_neighbors needs a completed
// graph and a completed matching.
//
// invview() returns the same directed graph (same vertices, same edges)
// expressed in the other orientation, over the inverted graph and matching.
//
// Graph and matching are held as handles, so the view follows later
// mutations. The edge count is memoized on first use; after mutating the
// graph or matching call invalidate_edge_count().
template <bool Transposed, typename U = Unassigned>
class BasicDiCMOBiGraph {
public:
  using matching_type = BasicMatching<U>;
  using entry_type = typename matching_type::entry_type;
  using VertexRange = std::ranges::iota_view<VertexId, VertexId>;
  using OutRange = MatchedNeighborRange<NeighborMode::Oriented, entry_type>;
  using InRange = MatchedNeighborRange<NeighborMode::Contracted, entry_type>;

  static constexpr bool transposed = Transposed;

  // All destinations unassigned: the view has no edges until matched.
  explicit BasicDiCMOBiGraph(BipartiteGraph g);
  // matching must cover every destination of g.
  BasicDiCMOBiGraph(BipartiteGraph g, matching_type matching);

  // Empty directed graph with n vertices, for callers that materialize
  // subgraphs of this view.
  [[nodiscard]] static SimpleDiGraph empty_graph(VertexId n) { return SimpleDiGraph(n); }

  [[nodiscard]] VertexId nv() const noexcept { return Transposed ? g_.ndsts() : g_.nsrcs(); }
  [[nodiscard]] VertexRange vertices() const noexcept { return VertexRange(1, nv() + 1); }
  [[nodiscard]] bool has_vertex(VertexId v) const noexcept { return v >= 1 && v <= nv(); }

  [[nodiscard]] OutRange out_neighbors(VertexId v) const;
  [[nodiscard]] InRange in_neighbors(VertexId v) const;

  [[nodiscard]] EdgeCount num_edges() const;
  void invalidate_edge_count() noexcept { ne_.reset(); }
  // False when either endpoint is out of range.
  [[nodiscard]] bool has_edge(VertexId a, VertexId b) const;
  // Grouped by tail vertex, or by head vertex when Transposed.
  [[nodiscard]] std::vector<DiEdge> edges() const;

  // Aliasing view of this directed graph with the other orientation, over
  // the inverted graph and matching. Both must be completed. Carries the
  // memoized edge count.
  [[nodiscard]] BasicDiCMOBiGraph<!Transposed, U> invview() const {
    return BasicDiCMOBiGraph<!Transposed, U>(g_.invview(), matching_.invview(), ne_);
  }

  [[nodiscard]] const BipartiteGraph& graph() const noexcept { return g_; }
  [[nodiscard]] const matching_type& matching() const noexcept { return matching_; }

private:
  template <bool, typename>
  friend class BasicDiCMOBiGraph;

  // Inverted handles: the inverse table may be shorter than the vertex
  // class it indexes, so no size check.
  BasicDiCMOBiGraph(BipartiteGraph g, matching_type matching, std::optional<EdgeCount> ne)
      : g_(std::move(g)), matching_(std::move(matching)), ne_(ne) {}

  void check_vertex(VertexId v, const char* what) const;
  // Source matched to destination d, or 0.
  [[nodiscard]] VertexId match_of(VertexId d) const;
  // Destination matched to source s, or 0. Requires a completed matching.
  [[nodiscard]] VertexId inverse_match_of(VertexId s) const;

  BipartiteGraph g_;
  matching_type matching_;
  mutable std::optional<EdgeCount> ne_ {};
};

using DiCMOBiGraph = BasicDiCMOBiGraph<false, Unassigned>;
using TransposedDiCMOBiGraph = BasicDiCMOBiGraph<true, Unassigned>;

template <bool Transposed, typename U>
BasicDiCMOBiGraph<Transposed, U>::BasicDiCMOBiGraph(BipartiteGraph g)
    : BasicDiCMOBiGraph(g, matching_type(static_cast<std::size_t>(g.ndsts()))) {}

template <bool Transposed, typename U>
BasicDiCMOBiGraph<Transposed, U>::BasicDiCMOBiGraph(BipartiteGraph g, matching_type matching)
    : g_(std::move(g)), matching_(std::move(matching)) {
  if (matching_.size() < static_cast<std::size_t>(g_.ndsts())) {
    throw std::invalid_argument("DiCMOBiGraph: matching has " + std::to_string(matching_.size()) +
                                " entries but the graph has " + std::to_string(g_.ndsts()) + " destinations");
  }
}

template <bool Transposed, typename U>
void BasicDiCMOBiGraph<Transposed, U>::check_vertex(VertexId v, const char* what) const {
  if (!has_vertex(v)) {
    throw std::out_of_range(std::string("DiCMOBiGraph::") + what + ": vertex " + std::to_string(v) +
                            " out of range");
  }
}

template <bool Transposed, typename U>
VertexId BasicDiCMOBiGraph<Transposed, U>::match_of(VertexId d) const {
  const auto match = matching_.entries();
  const auto i = static_cast<std::size_t>(d - 1);
  if (i >= match.size() || !is_matched(match[i])) return 0;
  return matched_vertex(match[i]);
}

template <bool Transposed, typename U>
VertexId BasicDiCMOBiGraph<Transposed, U>::inverse_match_of(VertexId s) const {
  const auto inverse = matching_.inverse_entries();
  const auto i = static_cast<std::size_t>(s - 1);
  if (i >= inverse.size() || !is_matched(inverse[i])) return 0;
  return matched_vertex(inverse[i]);
}

template <bool Transposed, typename U>
typename BasicDiCMOBiGraph<Transposed, U>::OutRange
BasicDiCMOBiGraph<Transposed, U>::out_neighbors(VertexId v) const {
  check_vertex(v, "out_neighbors");
  if constexpr (Transposed) {
    // Sources adjacent to v, each mapped to the destination it is matched to.
    return OutRange(g_.dst_neighbors(v), matching_.inverse_entries(), v);
  } else {
    return OutRange(g_.src_neighbors(v), matching_.entries(), v);
  }
}

template <bool Transposed, typename U>
typename BasicDiCMOBiGraph<Transposed, U>::InRange
BasicDiCMOBiGraph<Transposed, U>::in_neighbors(VertexId v) const {
  check_vertex(v, "in_neighbors");
  if constexpr (Transposed) {
    const VertexId s = match_of(v);
    if (s == 0 || !g_.has_src_vertex(s)) return InRange({}, {}, v);
    return InRange(g_.src_neighbors(s), {}, v);
  } else {
    g_.require_complete();
    const VertexId d = inverse_match_of(v);
    if (d == 0 || !g_.has_dst_vertex(d)) return InRange({}, {}, v);
    return InRange(g_.dst_neighbors(d), {}, v);
  }
}

template <bool Transposed, typename U>
EdgeCount BasicDiCMOBiGraph<Transposed, U>::num_edges() const {
  if (!ne_) {
    // Count through the side that needs no completion.
    EdgeCount n = 0;
    for (VertexId v : vertices()) {
      if constexpr (Transposed) {
        n += static_cast<EdgeCount>(in_neighbors(v).count());
      } else {
        n += static_cast<EdgeCount>(out_neighbors(v).count());
      }
    }
    ne_ = n;
  }
  return *ne_;
}

template <bool Transposed, typename U>
bool BasicDiCMOBiGraph<Transposed, U>::has_edge(VertexId a, VertexId b) const {
  if (!has_vertex(a) || !has_vertex(b)) return false;
  if constexpr (Transposed) {
    return in_neighbors(b).contains(a);
  } else {
    return out_neighbors(a).contains(b);
  }
}

template <bool Transposed, typename U>
std::vector<DiEdge> BasicDiCMOBiGraph<Transposed, U>::edges() const {
  std::vector<DiEdge> out;
  for (VertexId v : vertices()) {
    if constexpr (Transposed) {
      for (VertexId w : in_neighbors(v)) out.push_back({w, v});
    } else {
      for (VertexId w : out_neighbors(v)) out.push_back({v, w});
    }
  }
  return out;
}

extern template class BasicDiCMOBiGraph<false, Unassigned>;
extern template class BasicDiCMOBiGraph<true, Unassigned>;

} // namespace bigraph::core
