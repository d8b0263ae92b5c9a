/* Plain directed graph with sorted in/out adjacency, and induced subgraphs. */
#pragma once

#include <cstddef>
#include <ranges>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "bigraph/core/types.hpp"

namespace bigraph::core {

// SimpleDiGraph is a materialized directed graph on vertices 1..nv without
// parallel edges. It is the concrete graph produced when a derived view has
// to be copied out, e.g. by induced_subgraph.
class SimpleDiGraph {
public:
  using VertexRange = std::ranges::iota_view<VertexId, VertexId>;

  SimpleDiGraph() = default;
  explicit SimpleDiGraph(VertexId n);

  [[nodiscard]] static SimpleDiGraph empty_graph(VertexId n) { return SimpleDiGraph(n); }

  [[nodiscard]] VertexId nv() const noexcept { return static_cast<VertexId>(out_.size()); }
  [[nodiscard]] EdgeCount num_edges() const noexcept { return ne_; }
  [[nodiscard]] VertexRange vertices() const noexcept { return VertexRange(1, nv() + 1); }
  [[nodiscard]] bool has_vertex(VertexId v) const noexcept { return v >= 1 && v <= nv(); }
  [[nodiscard]] bool has_edge(VertexId a, VertexId b) const noexcept;

  [[nodiscard]] std::span<const VertexId> out_neighbors(VertexId v) const;
  [[nodiscard]] std::span<const VertexId> in_neighbors(VertexId v) const;
  [[nodiscard]] std::vector<DiEdge> edges() const;

  VertexId add_vertex();
  // Returns false when the edge already exists.
  bool add_edge(VertexId a, VertexId b);

  friend bool operator==(const SimpleDiGraph&, const SimpleDiGraph&) = default;

private:
  AdjTable out_ {};
  AdjTable in_ {};
  EdgeCount ne_ {0};
};

// Copy out the subgraph of g induced by `vertices`. Vertex i of the result is
// vertices[i - 1]; the returned map holds exactly that (new id -> old id).
// G must provide nv(), out_neighbors(v) and a static empty_graph(n).
template <typename G>
[[nodiscard]] auto induced_subgraph(const G& g, std::span<const VertexId> vertices) {
  const VertexId n = g.nv();
  std::vector<VertexId> old_to_new(static_cast<std::size_t>(n), 0);
  for (std::size_t i = 0; i < vertices.size(); ++i) {
    const VertexId v = vertices[i];
    if (v < 1 || v > n) {
      throw std::out_of_range("induced_subgraph: vertex " + std::to_string(v) + " out of range");
    }
    auto& slot = old_to_new[static_cast<std::size_t>(v - 1)];
    if (slot != 0) {
      throw std::invalid_argument("induced_subgraph: vertex " + std::to_string(v) + " listed twice");
    }
    slot = static_cast<VertexId>(i + 1);
  }
  auto sub = G::empty_graph(static_cast<VertexId>(vertices.size()));
  for (std::size_t i = 0; i < vertices.size(); ++i) {
    for (VertexId w : g.out_neighbors(vertices[i])) {
      const VertexId nw = old_to_new[static_cast<std::size_t>(w - 1)];
      if (nw != 0) sub.add_edge(static_cast<VertexId>(i + 1), nw);
    }
  }
  std::vector<VertexId> vmap(vertices.begin(), vertices.end());
  return std::make_pair(std::move(sub), std::move(vmap));
}

} // namespace bigraph::core
