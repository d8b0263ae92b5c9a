/*
  Condensation graphs — component bookkeeping shared by both variants.

  Members are validated against the underlying vertex count and must not
  appear in two components. Vertices left out of every component keep
  membership 0 and are skipped by neighbor enumeration.
*/
#include "bigraph/core/condensation_graphs.hpp"

namespace bigraph::core {

namespace {

std::span<const VertexId> component_members(const Component& c) noexcept {
  if (const auto* v = std::get_if<VertexId>(&c)) return std::span<const VertexId>(v, 1);
  return std::get<std::vector<VertexId>>(c);
}

} // namespace

CondensationBase::CondensationBase(std::vector<Component> components, VertexId underlying_nv, const char* what)
    : components_(std::move(components)), assignment_(static_cast<std::size_t>(underlying_nv), 0) {
  for (std::size_t i = 0; i < components_.size(); ++i) {
    for (VertexId v : component_members(components_[i])) {
      if (v < 1 || v > underlying_nv) {
        throw std::out_of_range(std::string(what) + ": vertex " + std::to_string(v) +
                                " out of range 1.." + std::to_string(underlying_nv));
      }
      auto& slot = assignment_[static_cast<std::size_t>(v - 1)];
      if (slot != 0) {
        throw std::invalid_argument(std::string(what) + ": vertex " + std::to_string(v) +
                                    " appears in components " + std::to_string(slot) + " and " +
                                    std::to_string(i + 1));
      }
      slot = static_cast<VertexId>(i + 1);
    }
  }
  BIGRAPH_LOG_TRACE("{}: {} components over {} vertices", what, components_.size(), underlying_nv);
}

std::vector<Component> CondensationBase::from_lists(std::vector<std::vector<VertexId>> lists) {
  std::vector<Component> out;
  out.reserve(lists.size());
  for (auto& list : lists) {
    if (list.size() == 1) {
      out.emplace_back(std::in_place_type<VertexId>, list.front());
    } else {
      out.emplace_back(std::in_place_type<std::vector<VertexId>>, std::move(list));
    }
  }
  return out;
}

void CondensationBase::check_component(VertexId c, const char* what) const {
  if (!has_vertex(c)) {
    throw std::out_of_range(std::string("condensation ") + what + ": component " + std::to_string(c) +
                            " out of range");
  }
}

VertexId CondensationBase::component_of(VertexId v) const {
  if (v < 1 || static_cast<std::size_t>(v) > assignment_.size()) {
    throw std::out_of_range("condensation component_of: vertex " + std::to_string(v) + " out of range");
  }
  return assigned(v);
}

std::span<const VertexId> CondensationBase::members(VertexId c) const {
  check_component(c, "members");
  return component_members(components_[static_cast<std::size_t>(c - 1)]);
}

namespace {

const BipartiteGraph& require_completed(const BipartiteGraph& g) {
  g.require_complete();
  return g;
}

} // namespace

InducedCondensationGraph::InducedCondensationGraph(BipartiteGraph graph, std::vector<Component> components)
    : CondensationBase(std::move(components), require_completed(graph).ndsts(), "InducedCondensationGraph"),
      graph_(std::move(graph)) {}

InducedCondensationGraph::InducedCondensationGraph(BipartiteGraph graph,
                                                   std::vector<std::vector<VertexId>> components)
    : InducedCondensationGraph(std::move(graph), from_lists(std::move(components))) {}

std::vector<VertexId> InducedCondensationGraph::out_neighbors(VertexId c) const {
  std::vector<VertexId> out;
  for_each_out_neighbor(c, [&out](VertexId k) { out.push_back(k); });
  return out;
}

std::vector<VertexId> InducedCondensationGraph::in_neighbors(VertexId c) const {
  std::vector<VertexId> out;
  for_each_in_neighbor(c, [&out](VertexId k) { out.push_back(k); });
  return out;
}

} // namespace bigraph::core
