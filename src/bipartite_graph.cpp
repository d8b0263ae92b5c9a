/*
  BipartiteGraph — dual sorted adjacency over two vertex classes.

  Every list is kept sorted and duplicate-free, so membership tests and
  insertion points are binary searches. The backward table, when present,
  is the exact transpose of the forward table; all mutations update both
  sides (and the metadata rows aligned with the source side) together.
  Handles created by invview() share storage with their origin and only
  differ in which table plays the forward role.
*/
#include "bigraph/core/bipartite_graph.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include "bigraph/core/error.hpp"
#include "bigraph/core/logging.hpp"

namespace bigraph::core {

namespace {

inline std::size_t idx(VertexId v) noexcept { return static_cast<std::size_t>(v - 1); }

void check_sorted_unique(const AdjTable& table, VertexId max_id, const char* what) {
  for (const auto& list : table) {
    for (std::size_t i = 0; i < list.size(); ++i) {
      if (list[i] < 1 || list[i] > max_id) {
        throw std::out_of_range(std::string(what) + ": vertex id " + std::to_string(list[i]) +
                                " out of range 1.." + std::to_string(max_id));
      }
      if (i > 0 && list[i - 1] >= list[i]) {
        throw std::invalid_argument(std::string(what) + ": adjacency lists must be strictly ascending");
      }
    }
  }
}

EdgeCount total_length(const AdjTable& table) noexcept {
  EdgeCount n = 0;
  for (const auto& list : table) n += static_cast<EdgeCount>(list.size());
  return n;
}

constexpr std::size_t kPresent = static_cast<std::size_t>(-1);

// Insert v into a sorted list; returns the insertion index, or kPresent if v is already there.
std::size_t insert_sorted(AdjList& list, VertexId v) {
  auto it = std::lower_bound(list.begin(), list.end(), v);
  if (it != list.end() && *it == v) return kPresent;
  auto pos = static_cast<std::size_t>(it - list.begin());
  list.insert(it, v);
  return pos;
}

// Erase v from a sorted list; returns the erased index, or kPresent if v is absent.
std::size_t erase_sorted(AdjList& list, VertexId v) {
  auto it = std::lower_bound(list.begin(), list.end(), v);
  if (it == list.end() || *it != v) return kPresent;
  auto pos = static_cast<std::size_t>(it - list.begin());
  list.erase(it);
  return pos;
}

} // namespace

BipartiteGraph::BipartiteGraph(VertexId nsrcs, VertexId ndsts, bool with_backedges)
  : s_(std::make_shared<Storage>()), fwd_(0) {
  if (nsrcs < 0 || ndsts < 0) {
    throw std::invalid_argument("BipartiteGraph: vertex counts must be >= 0");
  }
  s_->adj[0].resize(static_cast<std::size_t>(nsrcs));
  if (with_backedges) {
    s_->adj[1].resize(static_cast<std::size_t>(ndsts));
    s_->complete = true;
  }
  s_->ndsts = ndsts;
}

BipartiteGraph BipartiteGraph::from_adjacency(AdjTable fadj, std::optional<VertexId> ndsts,
                                              std::optional<EdgeValueTable> metadata) {
  return build(std::nullopt, std::move(fadj), std::nullopt, ndsts, std::move(metadata));
}

BipartiteGraph BipartiteGraph::from_adjacency(AdjTable fadj, AdjTable badj,
                                              std::optional<EdgeValueTable> metadata) {
  return build(std::nullopt, std::move(fadj), std::move(badj), std::nullopt, std::move(metadata));
}

BipartiteGraph BipartiteGraph::from_adjacency(EdgeCount num_edges, AdjTable fadj,
                                              std::optional<VertexId> ndsts,
                                              std::optional<EdgeValueTable> metadata) {
  return build(num_edges, std::move(fadj), std::nullopt, ndsts, std::move(metadata));
}

BipartiteGraph BipartiteGraph::from_adjacency(EdgeCount num_edges, AdjTable fadj, AdjTable badj,
                                              std::optional<EdgeValueTable> metadata) {
  return build(num_edges, std::move(fadj), std::move(badj), std::nullopt, std::move(metadata));
}

BipartiteGraph BipartiteGraph::build(std::optional<EdgeCount> num_edges,
                                     AdjTable fadj,
                                     std::optional<AdjTable> badj,
                                     std::optional<VertexId> ndsts,
                                     std::optional<EdgeValueTable> metadata) {
  const auto nsrcs = static_cast<VertexId>(fadj.size());
  VertexId nd = 0;
  if (badj) {
    nd = static_cast<VertexId>(badj->size());
  } else if (ndsts) {
    if (*ndsts < 0) throw std::invalid_argument("from_adjacency: ndsts must be >= 0");
    nd = *ndsts;
  } else {
    for (const auto& list : fadj) {
      if (!list.empty()) nd = std::max(nd, *std::max_element(list.begin(), list.end()));
    }
  }
  check_sorted_unique(fadj, nd, "from_adjacency(fadj)");

  const EdgeCount ne = total_length(fadj);
  if (num_edges && *num_edges != ne) {
    throw std::invalid_argument("from_adjacency: num_edges (" + std::to_string(*num_edges) +
                                ") does not match adjacency (" + std::to_string(ne) + ")");
  }

  if (badj) {
    check_sorted_unique(*badj, nsrcs, "from_adjacency(badj)");
    bool transposed = total_length(*badj) == ne;
    for (VertexId s = 1; transposed && s <= nsrcs; ++s) {
      for (VertexId d : fadj[idx(s)]) {
        const auto& back = (*badj)[idx(d)];
        if (!std::binary_search(back.begin(), back.end(), s)) { transposed = false; break; }
      }
    }
    if (!transposed) {
      throw std::invalid_argument("from_adjacency: badj is not the transpose of fadj");
    }
  }

  auto st = std::make_shared<Storage>();
  st->adj[0] = std::move(fadj);
  if (badj) {
    st->adj[1] = std::move(*badj);
    st->complete = true;
  }
  st->ndsts = nd;
  st->num_edges = ne;
  BipartiteGraph g(std::move(st), 0);
  if (metadata) g.attach_metadata(std::move(*metadata));
  return g;
}

BipartiteGraph BipartiteGraph::clone() const {
  return BipartiteGraph(std::make_shared<Storage>(*s_), fwd_);
}

BipartiteGraph& BipartiteGraph::complete() {
  if (s_->complete) return *this;
  // Only a non-inverted handle can exist while the backward table is absent.
  AdjTable back(static_cast<std::size_t>(s_->ndsts));
  const auto& fadj = s_->adj[0];
  for (std::size_t i = 0; i < fadj.size(); ++i) {
    const auto s = static_cast<VertexId>(i + 1);
    for (VertexId d : fadj[i]) back[idx(d)].push_back(s);
  }
  s_->adj[1] = std::move(back);
  s_->complete = true;
  BIGRAPH_LOG_DEBUG("BipartiteGraph::complete: {} sources, {} destinations, {} edges",
                    fadj.size(), s_->ndsts, s_->num_edges);
  return *this;
}

void BipartiteGraph::require_complete() const {
  if (!s_->complete) {
    throw IncompleteError("BipartiteGraph has no backward adjacency; call complete() first");
  }
}

BipartiteGraph BipartiteGraph::invview() const {
  require_complete();
  return BipartiteGraph(s_, 1 - fwd_);
}

VertexId BipartiteGraph::ndsts() const noexcept {
  return s_->complete ? static_cast<VertexId>(bwd().size()) : s_->ndsts;
}

bool BipartiteGraph::has_edge(VertexId s, VertexId d) const noexcept {
  if (!has_src_vertex(s) || !has_dst_vertex(d)) return false;
  const auto& list = fwd()[idx(s)];
  return std::binary_search(list.begin(), list.end(), d);
}

std::span<const VertexId> BipartiteGraph::src_neighbors(VertexId s) const {
  if (!has_src_vertex(s)) {
    throw std::out_of_range("src_neighbors: source " + std::to_string(s) + " out of range");
  }
  return fwd()[idx(s)];
}

std::span<const VertexId> BipartiteGraph::dst_neighbors(VertexId d) const {
  require_complete();
  if (!has_dst_vertex(d)) {
    throw std::out_of_range("dst_neighbors: destination " + std::to_string(d) + " out of range");
  }
  return bwd()[idx(d)];
}

std::span<const EdgeValue> BipartiteGraph::edge_values(VertexId s) const {
  if (!has_metadata()) {
    throw std::invalid_argument("edge_values: graph handle carries no source-aligned metadata");
  }
  if (!has_src_vertex(s)) {
    throw std::out_of_range("edge_values: source " + std::to_string(s) + " out of range");
  }
  return (*s_->metadata)[idx(s)];
}

void BipartiteGraph::attach_metadata(EdgeValueTable metadata) {
  const auto& src_side = s_->adj[0];
  if (metadata.size() != src_side.size()) {
    throw std::invalid_argument("attach_metadata: expected one row per source vertex");
  }
  for (std::size_t i = 0; i < src_side.size(); ++i) {
    if (metadata[i].size() != src_side[i].size()) {
      throw std::invalid_argument("attach_metadata: row " + std::to_string(i + 1) +
                                  " does not match the adjacency list length");
    }
  }
  s_->metadata = std::move(metadata);
}

std::vector<EdgeValue>* BipartiteGraph::meta_row(int side, VertexId id) noexcept {
  if (side != 0 || !s_->metadata) return nullptr;
  return &(*s_->metadata)[idx(id)];
}

void BipartiteGraph::check_edge_range(VertexId s, VertexId d, const char* what) const {
  if (!has_src_vertex(s) || !has_dst_vertex(d)) {
    throw std::out_of_range(std::string(what) + ": edge (" + std::to_string(s) + ", " +
                            std::to_string(d) + ") out of range");
  }
}

bool BipartiteGraph::add_edge(VertexId s, VertexId d, std::optional<EdgeValue> value) {
  check_edge_range(s, d, "add_edge");
  const auto pos = insert_sorted(fwd()[idx(s)], d);
  if (pos == kPresent) return false;
  const EdgeValue v = value.value_or(EdgeValue{});
  if (auto* row = meta_row(fwd_, s)) row->insert(row->begin() + static_cast<std::ptrdiff_t>(pos), v);
  ++s_->num_edges;
  if (s_->complete) {
    const auto bpos = insert_sorted(bwd()[idx(d)], s);
    if (auto* row = meta_row(1 - fwd_, d)) row->insert(row->begin() + static_cast<std::ptrdiff_t>(bpos), v);
  }
  return true;
}

void BipartiteGraph::rem_edge(VertexId s, VertexId d) {
  check_edge_range(s, d, "rem_edge");
  const auto pos = erase_sorted(fwd()[idx(s)], d);
  if (pos == kPresent) {
    throw EdgeNotFoundError("rem_edge: graph has no edge (" + std::to_string(s) + ", " +
                            std::to_string(d) + ")");
  }
  if (auto* row = meta_row(fwd_, s)) row->erase(row->begin() + static_cast<std::ptrdiff_t>(pos));
  --s_->num_edges;
  if (s_->complete) {
    const auto bpos = erase_sorted(bwd()[idx(d)], s);
    if (auto* row = meta_row(1 - fwd_, d)) row->erase(row->begin() + static_cast<std::ptrdiff_t>(bpos));
  }
}

VertexId BipartiteGraph::add_vertex(VertexKind kind) {
  switch (kind) {
    case VertexKind::Src: {
      fwd().emplace_back();
      if (fwd_ == 0 && s_->metadata) s_->metadata->emplace_back();
      return nsrcs();
    }
    case VertexKind::Dst: {
      if (s_->complete) {
        bwd().emplace_back();
        if (fwd_ == 1 && s_->metadata) s_->metadata->emplace_back();
      } else {
        ++s_->ndsts;
      }
      return ndsts();
    }
  }
  throw std::invalid_argument("add_vertex: vertex kind must be VertexKind::Src or VertexKind::Dst");
}

void BipartiteGraph::set_neighbors(VertexId s, std::vector<VertexId> new_neighbors) {
  if (!has_src_vertex(s)) {
    throw std::out_of_range("set_neighbors: source " + std::to_string(s) + " out of range");
  }
  const VertexId nd = ndsts();
  for (VertexId d : new_neighbors) {
    if (d < 1 || d > nd) {
      throw std::out_of_range("set_neighbors: destination " + std::to_string(d) + " out of range");
    }
  }
  std::sort(new_neighbors.begin(), new_neighbors.end());
  new_neighbors.erase(std::unique(new_neighbors.begin(), new_neighbors.end()), new_neighbors.end());

  // Nothing below can throw except on allocation failure.
  auto& old_neighbors = fwd()[idx(s)];
  if (s_->complete) {
    for (VertexId d : old_neighbors) {
      if (std::binary_search(new_neighbors.begin(), new_neighbors.end(), d)) continue;
      const auto bpos = erase_sorted(bwd()[idx(d)], s);
      if (auto* row = meta_row(1 - fwd_, d); row && bpos != kPresent) {
        row->erase(row->begin() + static_cast<std::ptrdiff_t>(bpos));
      }
    }
    for (VertexId d : new_neighbors) {
      if (std::binary_search(old_neighbors.begin(), old_neighbors.end(), d)) continue;
      const auto bpos = insert_sorted(bwd()[idx(d)], s);
      if (auto* row = meta_row(1 - fwd_, d); row && bpos != kPresent) {
        row->insert(row->begin() + static_cast<std::ptrdiff_t>(bpos), EdgeValue{});
      }
    }
  }
  if (auto* row = meta_row(fwd_, s)) {
    // Keep the values of retained neighbors.
    std::vector<EdgeValue> values;
    values.reserve(new_neighbors.size());
    for (VertexId d : new_neighbors) {
      auto it = std::lower_bound(old_neighbors.begin(), old_neighbors.end(), d);
      if (it != old_neighbors.end() && *it == d) {
        values.push_back((*row)[static_cast<std::size_t>(it - old_neighbors.begin())]);
      } else {
        values.push_back(EdgeValue{});
      }
    }
    row->swap(values);
  }
  s_->num_edges += static_cast<EdgeCount>(new_neighbors.size()) - static_cast<EdgeCount>(old_neighbors.size());
  old_neighbors = std::move(new_neighbors);
}

void BipartiteGraph::delete_srcs(std::span<const VertexId> srcs, bool remove_vertices) {
  const VertexId ns = nsrcs();
  for (VertexId s : srcs) {
    if (s < 1 || s > ns) {
      throw std::out_of_range("delete_srcs: source " + std::to_string(s) + " out of range");
    }
  }
  for (VertexId s : srcs) set_neighbors(s, {});
  if (!remove_vertices) return;

  // old id -> new id; 0 marks a removed vertex
  std::vector<VertexId> old_to_new(static_cast<std::size_t>(ns), 0);
  for (VertexId s = 1; s <= ns; ++s) old_to_new[idx(s)] = s;
  for (VertexId s : srcs) old_to_new[idx(s)] = 0;
  VertexId next = 0;
  for (auto& id : old_to_new) {
    if (id != 0) id = ++next;
  }

  if (s_->complete) {
    // Removed sources have no edges left, so renumbering keeps every
    // backward list sorted and metadata positions unchanged.
    for (auto& list : bwd()) {
      for (auto& s : list) s = old_to_new[idx(s)];
    }
  }
  auto& table = fwd();
  auto* meta = (fwd_ == 0 && s_->metadata) ? &*s_->metadata : nullptr;
  std::size_t out = 0;
  for (std::size_t i = 0; i < table.size(); ++i) {
    if (old_to_new[i] == 0) continue;
    if (out != i) {
      table[out] = std::move(table[i]);
      if (meta) (*meta)[out] = std::move((*meta)[i]);
    }
    ++out;
  }
  table.resize(out);
  if (meta) meta->resize(out);
  BIGRAPH_LOG_DEBUG("BipartiteGraph::delete_srcs: removed {} vertices, {} remain", ns - static_cast<VertexId>(out), out);
}

void BipartiteGraph::delete_dsts(std::span<const VertexId> dsts, bool remove_vertices) {
  invview().delete_srcs(dsts, remove_vertices);
}

void BipartiteGraph::clear() noexcept {
  for (auto& table : s_->adj) {
    for (auto& list : table) list.clear();
  }
  if (s_->metadata) {
    for (auto& row : *s_->metadata) row.clear();
  }
  s_->num_edges = 0;
}

BipartiteEdgeRange BipartiteGraph::edges() const { return BipartiteEdgeRange(*this, VertexKind::Src); }

BipartiteEdgeRange BipartiteGraph::src_edges() const { return BipartiteEdgeRange(*this, VertexKind::Src); }

BipartiteEdgeRange BipartiteGraph::dst_edges() const {
  require_complete();
  return BipartiteEdgeRange(*this, VertexKind::Dst);
}

bool operator==(const BipartiteGraph& a, const BipartiteGraph& b) {
  if (a.num_edges() != b.num_edges() || a.fwd() != b.fwd()) return false;
  if (a.is_complete() != b.is_complete()) return false;
  return a.is_complete() ? a.bwd() == b.bwd() : a.ndsts() == b.ndsts();
}

// BipartiteEdgeRange

BipartiteEdgeRange::BipartiteEdgeRange(BipartiteGraph g, VertexKind order)
  : g_(std::move(g)), order_(order) {}

BipartiteEdgeRange::iterator BipartiteEdgeRange::begin() const {
  const VertexId last = order_ == VertexKind::Src ? g_.nsrcs() : g_.ndsts();
  return iterator(g_, order_, 1, last);
}

BipartiteEdgeRange::iterator BipartiteEdgeRange::end() const {
  const VertexId last = order_ == VertexKind::Src ? g_.nsrcs() : g_.ndsts();
  return iterator(g_, order_, last + 1, last);
}

BipartiteEdgeRange::iterator::iterator(const BipartiteGraph& g, VertexKind order, VertexId outer, VertexId last)
  : g_(g), order_(order), outer_(outer), last_(last), inner_(0) {
  settle();
}

std::span<const VertexId> BipartiteEdgeRange::iterator::list() const {
  return order_ == VertexKind::Src ? g_.src_neighbors(outer_) : g_.dst_neighbors(outer_);
}

void BipartiteEdgeRange::iterator::settle() {
  while (outer_ <= last_ && inner_ >= list().size()) {
    ++outer_;
    inner_ = 0;
  }
  if (outer_ > last_) {
    outer_ = last_ + 1;
    inner_ = 0;
  }
}

BipartiteEdge BipartiteEdgeRange::iterator::operator*() const {
  const VertexId other = list()[inner_];
  return order_ == VertexKind::Src ? BipartiteEdge{outer_, other} : BipartiteEdge{other, outer_};
}

BipartiteEdgeRange::iterator& BipartiteEdgeRange::iterator::operator++() {
  ++inner_;
  settle();
  return *this;
}

} // namespace bigraph::core
