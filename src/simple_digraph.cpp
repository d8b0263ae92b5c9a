/*
  SimpleDiGraph — sorted out/in adjacency lists, no parallel edges.
*/
#include "bigraph/core/simple_digraph.hpp"

#include <algorithm>

namespace bigraph::core {

SimpleDiGraph::SimpleDiGraph(VertexId n) {
  if (n < 0) throw std::invalid_argument("SimpleDiGraph: vertex count must be >= 0");
  out_.resize(static_cast<std::size_t>(n));
  in_.resize(static_cast<std::size_t>(n));
}

bool SimpleDiGraph::has_edge(VertexId a, VertexId b) const noexcept {
  if (!has_vertex(a) || !has_vertex(b)) return false;
  const auto& list = out_[static_cast<std::size_t>(a - 1)];
  return std::binary_search(list.begin(), list.end(), b);
}

std::span<const VertexId> SimpleDiGraph::out_neighbors(VertexId v) const {
  if (!has_vertex(v)) throw std::out_of_range("SimpleDiGraph::out_neighbors: vertex " + std::to_string(v) + " out of range");
  return out_[static_cast<std::size_t>(v - 1)];
}

std::span<const VertexId> SimpleDiGraph::in_neighbors(VertexId v) const {
  if (!has_vertex(v)) throw std::out_of_range("SimpleDiGraph::in_neighbors: vertex " + std::to_string(v) + " out of range");
  return in_[static_cast<std::size_t>(v - 1)];
}

std::vector<DiEdge> SimpleDiGraph::edges() const {
  std::vector<DiEdge> out;
  out.reserve(static_cast<std::size_t>(ne_));
  for (VertexId a = 1; a <= nv(); ++a) {
    for (VertexId b : out_[static_cast<std::size_t>(a - 1)]) out.push_back({a, b});
  }
  return out;
}

VertexId SimpleDiGraph::add_vertex() {
  out_.emplace_back();
  in_.emplace_back();
  return nv();
}

bool SimpleDiGraph::add_edge(VertexId a, VertexId b) {
  if (!has_vertex(a) || !has_vertex(b)) {
    throw std::out_of_range("SimpleDiGraph::add_edge: edge (" + std::to_string(a) + ", " +
                            std::to_string(b) + ") out of range");
  }
  auto& out = out_[static_cast<std::size_t>(a - 1)];
  auto it = std::lower_bound(out.begin(), out.end(), b);
  if (it != out.end() && *it == b) return false;
  out.insert(it, b);
  auto& in = in_[static_cast<std::size_t>(b - 1)];
  in.insert(std::lower_bound(in.begin(), in.end(), a), a);
  ++ne_;
  return true;
}

} // namespace bigraph::core
