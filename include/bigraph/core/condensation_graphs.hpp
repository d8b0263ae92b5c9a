/* Condensation views over a partition of vertices into components. */
#pragma once

#include <cstddef>
#include <ranges>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "bigraph/core/bipartite_graph.hpp"
#include "bigraph/core/logging.hpp"
#include "bigraph/core/types.hpp"

namespace bigraph::core {

// A component is a single vertex, stored unboxed, or a list of vertices.
using Component = std::variant<VertexId, std::vector<VertexId>>;

// Components and the derived vertex -> component membership. Component ids
// are 1-based positions in the component list; membership 0 means the
// vertex is not covered by any component.
class CondensationBase {
public:
  using VertexRange = std::ranges::iota_view<VertexId, VertexId>;

  [[nodiscard]] VertexId nv() const noexcept { return static_cast<VertexId>(components_.size()); }
  [[nodiscard]] VertexRange vertices() const noexcept { return VertexRange(1, nv() + 1); }
  [[nodiscard]] bool has_vertex(VertexId c) const noexcept { return c >= 1 && c <= nv(); }
  [[nodiscard]] std::span<const Component> components() const noexcept { return components_; }
  // Component holding underlying vertex v, or 0.
  [[nodiscard]] VertexId component_of(VertexId v) const;
  [[nodiscard]] std::span<const VertexId> members(VertexId c) const;
  [[nodiscard]] std::span<const VertexId> assignment() const noexcept { return assignment_; }

protected:
  CondensationBase(std::vector<Component> components, VertexId underlying_nv, const char* what);

  // Lists of length one become singletons.
  [[nodiscard]] static std::vector<Component> from_lists(std::vector<std::vector<VertexId>> lists);

  void check_component(VertexId c, const char* what) const;
  [[nodiscard]] VertexId assigned(VertexId v) const noexcept {
    return assignment_[static_cast<std::size_t>(v - 1)];
  }

private:
  std::vector<Component> components_;
  std::vector<VertexId> assignment_;  // [v - 1] => component id or 0
};

// Condensation of a DiCMOBiGraph (either orientation, any payload). An edge
// c -> k is reported once per underlying edge from a member of c to a
// member of k != c: the view is a multigraph and nothing is deduplicated.
template <typename G>
class MatchedCondensationGraph : public CondensationBase {
public:
  MatchedCondensationGraph(G graph, std::vector<Component> components)
      : CondensationBase(std::move(components), graph.nv(), "MatchedCondensationGraph"),
        graph_(std::move(graph)) {}
  MatchedCondensationGraph(G graph, std::vector<std::vector<VertexId>> components)
      : MatchedCondensationGraph(std::move(graph), from_lists(std::move(components))) {}

  template <typename F>
  void for_each_out_neighbor(VertexId c, F&& f) const {
    check_component(c, "for_each_out_neighbor");
    for (VertexId v : members(c)) {
      for (VertexId w : graph_.out_neighbors(v)) {
        const VertexId k = assigned(w);
        if (k != 0 && k != c) f(k);
      }
    }
  }

  template <typename F>
  void for_each_in_neighbor(VertexId c, F&& f) const {
    check_component(c, "for_each_in_neighbor");
    for (VertexId v : members(c)) {
      for (VertexId w : graph_.in_neighbors(v)) {
        const VertexId k = assigned(w);
        if (k != 0 && k != c) f(k);
      }
    }
  }

  [[nodiscard]] std::vector<VertexId> out_neighbors(VertexId c) const {
    std::vector<VertexId> out;
    for_each_out_neighbor(c, [&out](VertexId k) { out.push_back(k); });
    return out;
  }
  [[nodiscard]] std::vector<VertexId> in_neighbors(VertexId c) const {
    std::vector<VertexId> out;
    for_each_in_neighbor(c, [&out](VertexId k) { out.push_back(k); });
    return out;
  }

  [[nodiscard]] const G& graph() const noexcept { return graph_; }

private:
  G graph_;
};

// Condensation of the destinations of a completed BipartiteGraph, with the
// components listed in topological order. Two components are adjacent when
// a destination of one shares a source with a destination of the other;
// the edge points from the lower component id to the higher. The order is
// trusted, not checked. Multiplicity is kept as in MatchedCondensationGraph.
class InducedCondensationGraph : public CondensationBase {
public:
  InducedCondensationGraph(BipartiteGraph graph, std::vector<Component> components);
  InducedCondensationGraph(BipartiteGraph graph, std::vector<std::vector<VertexId>> components);

  template <typename F>
  void for_each_out_neighbor(VertexId c, F&& f) const {
    check_component(c, "for_each_out_neighbor");
    visit_adjacent(c, [c, &f](VertexId k) { if (k > c) f(k); });
  }

  template <typename F>
  void for_each_in_neighbor(VertexId c, F&& f) const {
    check_component(c, "for_each_in_neighbor");
    visit_adjacent(c, [c, &f](VertexId k) { if (k < c) f(k); });
  }

  [[nodiscard]] std::vector<VertexId> out_neighbors(VertexId c) const;
  [[nodiscard]] std::vector<VertexId> in_neighbors(VertexId c) const;

  [[nodiscard]] const BipartiteGraph& graph() const noexcept { return graph_; }

private:
  // Every covered destination two hops away from a member of c, as a component id.
  template <typename F>
  void visit_adjacent(VertexId c, F&& f) const {
    for (VertexId d : members(c)) {
      for (VertexId s : graph_.dst_neighbors(d)) {
        for (VertexId n : graph_.src_neighbors(s)) {
          const VertexId k = assigned(n);
          if (k != 0) f(k);
        }
      }
    }
  }

  BipartiteGraph graph_;
};

} // namespace bigraph::core
