/* Bipartite graph with sorted dual adjacency and lazy backward completion. */
#pragma once

#include <array>
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <span>
#include <vector>

#include "bigraph/core/types.hpp"

namespace bigraph::core {

class BipartiteEdgeRange;

// BipartiteGraph maps source vertices 1..nsrcs to the destination vertices
// 1..ndsts they are incident to.
//
// Storage is a forward table (per source, the sorted destination ids) and an
// optional backward table (per destination, the sorted source ids). Without a
// backward table only the destination count is kept and every backward query
// throws IncompleteError; complete() materializes it in O(E).
//
// A BipartiteGraph is a handle: copies alias the same storage, and invview()
// returns a handle over the same storage with sources and destinations
// swapped. Mutating through any handle is visible through all of them. Use
// clone() for an independent copy.
//
// Optional per-edge metadata (EdgeValue) is aligned with the source-side
// lists of the storage and kept in lockstep by every mutation.
class BipartiteGraph {
public:
  using VertexRange = std::ranges::iota_view<VertexId, VertexId>;

  BipartiteGraph() : BipartiteGraph(0, 0) {}
  // Empty graph. Completed by default; pass with_backedges=false to keep only
  // the destination count.
  BipartiteGraph(VertexId nsrcs, VertexId ndsts, bool with_backedges = true);
  ~BipartiteGraph() noexcept = default;

  // Build from a forward table only. ndsts defaults to the largest
  // destination id present. The result is not complete.
  [[nodiscard]] static BipartiteGraph from_adjacency(
      AdjTable fadj,
      std::optional<VertexId> ndsts = std::nullopt,
      std::optional<EdgeValueTable> metadata = std::nullopt);

  // Build from both tables; badj must be the transpose of fadj.
  [[nodiscard]] static BipartiteGraph from_adjacency(
      AdjTable fadj,
      AdjTable badj,
      std::optional<EdgeValueTable> metadata = std::nullopt);

  // As above with an explicit edge count, which must match the tables.
  [[nodiscard]] static BipartiteGraph from_adjacency(
      EdgeCount num_edges,
      AdjTable fadj,
      std::optional<VertexId> ndsts = std::nullopt,
      std::optional<EdgeValueTable> metadata = std::nullopt);
  [[nodiscard]] static BipartiteGraph from_adjacency(
      EdgeCount num_edges,
      AdjTable fadj,
      AdjTable badj,
      std::optional<EdgeValueTable> metadata = std::nullopt);

  // Independent deep copy (same orientation).
  [[nodiscard]] BipartiteGraph clone() const;

  // Completion
  BipartiteGraph& complete();
  [[nodiscard]] bool is_complete() const noexcept { return s_->complete; }
  void require_complete() const;

  // Aliasing view with sources and destinations swapped. Requires completion.
  [[nodiscard]] BipartiteGraph invview() const;
  [[nodiscard]] bool is_inverted() const noexcept { return fwd_ != 0; }
  // True when both handles refer to the same storage.
  [[nodiscard]] bool aliases(const BipartiteGraph& other) const noexcept { return s_ == other.s_; }

  // Vertex queries
  [[nodiscard]] VertexId nsrcs() const noexcept { return static_cast<VertexId>(fwd().size()); }
  [[nodiscard]] VertexId ndsts() const noexcept;
  [[nodiscard]] VertexId nv() const noexcept { return nsrcs() + ndsts(); }
  [[nodiscard]] EdgeCount num_edges() const noexcept { return s_->num_edges; }
  [[nodiscard]] VertexRange src_vertices() const noexcept { return VertexRange(1, nsrcs() + 1); }
  [[nodiscard]] VertexRange dst_vertices() const noexcept { return VertexRange(1, ndsts() + 1); }
  [[nodiscard]] bool has_src_vertex(VertexId s) const noexcept { return s >= 1 && s <= nsrcs(); }
  [[nodiscard]] bool has_dst_vertex(VertexId d) const noexcept { return d >= 1 && d <= ndsts(); }
  [[nodiscard]] bool has_edge(VertexId s, VertexId d) const noexcept;
  [[nodiscard]] bool has_edge(const BipartiteEdge& e) const noexcept { return has_edge(e.src, e.dst); }

  // Neighbor queries. Spans are invalidated by any mutation of the graph.
  [[nodiscard]] std::span<const VertexId> src_neighbors(VertexId s) const;
  [[nodiscard]] std::span<const VertexId> dst_neighbors(VertexId d) const;

  // Metadata. Available on handles that are not inverted.
  [[nodiscard]] bool has_metadata() const noexcept { return s_->metadata.has_value() && fwd_ == 0; }
  [[nodiscard]] std::span<const EdgeValue> edge_values(VertexId s) const;
  void attach_metadata(EdgeValueTable metadata);

  // Edge mutation
  // Returns false (and changes nothing) when the edge is already present.
  bool add_edge(VertexId s, VertexId d, std::optional<EdgeValue> value = std::nullopt);
  bool add_edge(const BipartiteEdge& e, std::optional<EdgeValue> value = std::nullopt) {
    return add_edge(e.src, e.dst, value);
  }
  void rem_edge(VertexId s, VertexId d);
  void rem_edge(const BipartiteEdge& e) { rem_edge(e.src, e.dst); }

  // Vertex mutation
  VertexId add_vertex(VertexKind kind);
  // Replace the neighbors of source s. new_neighbors need not be sorted;
  // duplicates are dropped. All ids are validated before anything changes.
  void set_neighbors(VertexId s, std::vector<VertexId> new_neighbors);
  // Drop every edge incident on the given sources; with remove_vertices the
  // sources themselves are removed and the remaining ones renumbered.
  void delete_srcs(std::span<const VertexId> srcs, bool remove_vertices = false);
  // Destination counterpart of delete_srcs. Requires completion.
  void delete_dsts(std::span<const VertexId> dsts, bool remove_vertices = false);
  // Remove all edges, keep all vertices.
  void clear() noexcept;

  // Edge iteration: by source then destination, or by destination then source.
  [[nodiscard]] BipartiteEdgeRange edges() const;
  [[nodiscard]] BipartiteEdgeRange src_edges() const;
  [[nodiscard]] BipartiteEdgeRange dst_edges() const;

  // Equal edge count, forward table and backward table (or destination count).
  friend bool operator==(const BipartiteGraph& a, const BipartiteGraph& b);

private:
  struct Storage {
    std::array<AdjTable, 2> adj {};   // adj[0]: per source, adj[1]: per destination
    bool complete {false};            // adj[1] materialized
    VertexId ndsts {0};               // destination count while !complete
    EdgeCount num_edges {0};
    std::optional<EdgeValueTable> metadata {};  // shaped like adj[0]
  };

  BipartiteGraph(std::shared_ptr<Storage> s, int fwd) : s_(std::move(s)), fwd_(fwd) {}

  [[nodiscard]] static BipartiteGraph build(std::optional<EdgeCount> num_edges,
                                            AdjTable fadj,
                                            std::optional<AdjTable> badj,
                                            std::optional<VertexId> ndsts,
                                            std::optional<EdgeValueTable> metadata);

  [[nodiscard]] const AdjTable& fwd() const noexcept { return s_->adj[static_cast<std::size_t>(fwd_)]; }
  [[nodiscard]] AdjTable& fwd() noexcept { return s_->adj[static_cast<std::size_t>(fwd_)]; }
  [[nodiscard]] const AdjTable& bwd() const noexcept { return s_->adj[static_cast<std::size_t>(1 - fwd_)]; }
  [[nodiscard]] AdjTable& bwd() noexcept { return s_->adj[static_cast<std::size_t>(1 - fwd_)]; }
  // Metadata row aligned with list `id` of storage side `side`, if any.
  [[nodiscard]] std::vector<EdgeValue>* meta_row(int side, VertexId id) noexcept;

  void check_edge_range(VertexId s, VertexId d, const char* what) const;

  std::shared_ptr<Storage> s_;
  int fwd_ {0};  // index of the forward table in s_->adj
};

// Lazy, deterministic edge enumeration of a BipartiteGraph. Holds a handle to
// the graph; iterators are invalidated by mutation.
class BipartiteEdgeRange {
public:
  class iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = BipartiteEdge;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = BipartiteEdge;

    iterator() = default;

    [[nodiscard]] BipartiteEdge operator*() const;
    iterator& operator++();
    iterator operator++(int) { auto tmp = *this; ++(*this); return tmp; }
    friend bool operator==(const iterator& a, const iterator& b) noexcept {
      return a.outer_ == b.outer_ && a.inner_ == b.inner_;
    }

  private:
    friend class BipartiteEdgeRange;
    iterator(const BipartiteGraph& g, VertexKind order, VertexId outer, VertexId last);
    [[nodiscard]] std::span<const VertexId> list() const;
    void settle();

    // Handle, so the iterator outlives the range it came from.
    BipartiteGraph g_ {};
    VertexKind order_ {VertexKind::Src};
    VertexId outer_ {1};
    VertexId last_ {0};
    std::size_t inner_ {0};
  };

  BipartiteEdgeRange(BipartiteGraph g, VertexKind order);

  [[nodiscard]] iterator begin() const;
  [[nodiscard]] iterator end() const;
  [[nodiscard]] std::size_t size() const noexcept { return static_cast<std::size_t>(g_.num_edges()); }
  [[nodiscard]] VertexKind order() const noexcept { return order_; }

private:
  BipartiteGraph g_;
  VertexKind order_;
};

} // namespace bigraph::core
