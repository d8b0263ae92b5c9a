/*
  Pybind11 module exposing BiGraph-Core C++ APIs to Python.

  Notes:
    - Adjacency tables are passed as lists of lists of 1-based ids.
    - Unassigned matching entries map to None.
    - Vertex masks are NumPy bool arrays, validated for dtype and length.
*/
#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include <optional>
#include <vector>

#include "bigraph/core/bipartite_graph.hpp"
#include "bigraph/core/condensation_graphs.hpp"
#include "bigraph/core/dicmobigraph.hpp"
#include "bigraph/core/error.hpp"
#include "bigraph/core/logging.hpp"
#include "bigraph/core/matching.hpp"
#include "bigraph/core/maximum_matching.hpp"
#include "bigraph/core/options.hpp"
#include "bigraph/core/types.hpp"

namespace py = pybind11;
using namespace bigraph::core;

template <typename T>
static std::span<const T> as_span(const py::array& arr, const char* name) {
  if (!py::isinstance<py::array_t<T>>(arr)) {
    throw py::type_error(std::string(name) + ": expected numpy array of correct dtype");
  }
  if (!(arr.flags() & py::array::c_style)) {
    throw py::type_error(std::string(name) + ": array must be C-contiguous (use np.ascontiguousarray)");
  }
  auto buf = arr.request();
  return std::span<const T>(static_cast<const T*>(buf.ptr), static_cast<std::size_t>(buf.size));
}

static py::object entry_to_py(const Matching::entry_type& e) {
  if (is_matched(e)) return py::int_(matched_vertex(e));
  return py::none();
}

static Matching::entry_type entry_from_py(const py::object& o) {
  if (o.is_none()) return unassigned;
  return o.cast<VertexId>();
}

static py::list entries_to_py(std::span<const Matching::entry_type> entries) {
  py::list out;
  for (const auto& e : entries) out.append(entry_to_py(e));
  return out;
}

template <typename Range>
static std::vector<VertexId> collect(const Range& r) {
  return std::vector<VertexId>(r.begin(), r.end());
}

static std::vector<std::pair<VertexId, VertexId>> as_pairs(const std::vector<DiEdge>& edges) {
  std::vector<std::pair<VertexId, VertexId>> out;
  out.reserve(edges.size());
  for (const auto& e : edges) out.emplace_back(e.src, e.dst);
  return out;
}

template <bool Transposed>
static void bind_dicmo(py::module_& m, const char* name) {
  using G = BasicDiCMOBiGraph<Transposed, Unassigned>;
  py::class_<G>(m, name)
      .def(py::init<BipartiteGraph>(), py::arg("graph"))
      .def(py::init<BipartiteGraph, Matching>(), py::arg("graph"), py::arg("matching"))
      .def("nv", &G::nv)
      .def("num_edges", &G::num_edges)
      .def("invalidate_edge_count", &G::invalidate_edge_count)
      .def("out_neighbors", [](const G& g, VertexId v) { return collect(g.out_neighbors(v)); }, py::arg("v"))
      .def("in_neighbors", [](const G& g, VertexId v) { return collect(g.in_neighbors(v)); }, py::arg("v"))
      .def("has_edge", &G::has_edge, py::arg("a"), py::arg("b"))
      .def("edges", [](const G& g) { return as_pairs(g.edges()); })
      .def("invview", &G::invview)
      .def_property_readonly("graph", &G::graph)
      .def_property_readonly("matching", &G::matching);

  using C = MatchedCondensationGraph<G>;
  py::class_<C>(m, Transposed ? "TransposedMatchedCondensationGraph" : "MatchedCondensationGraph")
      .def(py::init<G, std::vector<std::vector<VertexId>>>(), py::arg("graph"), py::arg("components"))
      .def("nv", &C::nv)
      .def("component_of", &C::component_of, py::arg("v"))
      .def("out_neighbors", &C::out_neighbors, py::arg("c"))
      .def("in_neighbors", &C::in_neighbors, py::arg("c"));
}

PYBIND11_MODULE(_bigraph_core, m) {
  m.doc() = "BiGraph-Core C++ bindings";

  py::register_exception<IncompleteError>(m, "IncompleteError");
  py::register_exception<EdgeNotFoundError>(m, "EdgeNotFoundError", PyExc_KeyError);

  py::enum_<LogLevel>(m, "LogLevel")
      .value("OFF", LogLevel::Off)
      .value("ERROR", LogLevel::Error)
      .value("WARN", LogLevel::Warn)
      .value("INFO", LogLevel::Info)
      .value("DEBUG", LogLevel::Debug)
      .value("TRACE", LogLevel::Trace);
  m.def("set_log_level", &set_log_level, py::arg("level"));
  m.def("log_level", &log_level);

  py::enum_<VertexKind>(m, "VertexKind")
      .value("SRC", VertexKind::Src)
      .value("DST", VertexKind::Dst);

  py::class_<BipartiteGraph>(m, "BipartiteGraph")
      .def(py::init<VertexId, VertexId, bool>(),
           py::arg("nsrcs") = 0, py::arg("ndsts") = 0, py::kw_only(), py::arg("with_backedges") = true)
      .def_static(
          "from_adjacency",
          [](AdjTable fadj, std::optional<VertexId> ndsts, std::optional<AdjTable> badj) {
            if (badj) {
              if (ndsts) throw py::value_error("pass either ndsts or badj, not both");
              return BipartiteGraph::from_adjacency(std::move(fadj), std::move(*badj));
            }
            return BipartiteGraph::from_adjacency(std::move(fadj), ndsts);
          },
          py::arg("fadj"), py::kw_only(), py::arg("ndsts") = py::none(), py::arg("badj") = py::none())
      .def("clone", &BipartiteGraph::clone)
      .def("complete", [](BipartiteGraph& g) { g.complete(); })
      .def("is_complete", &BipartiteGraph::is_complete)
      .def("invview", &BipartiteGraph::invview)
      .def("is_inverted", &BipartiteGraph::is_inverted)
      .def("nsrcs", &BipartiteGraph::nsrcs)
      .def("ndsts", &BipartiteGraph::ndsts)
      .def("nv", &BipartiteGraph::nv)
      .def("num_edges", &BipartiteGraph::num_edges)
      .def("has_edge", py::overload_cast<VertexId, VertexId>(&BipartiteGraph::has_edge, py::const_),
           py::arg("s"), py::arg("d"))
      .def("src_neighbors", [](const BipartiteGraph& g, VertexId s) { return collect(g.src_neighbors(s)); },
           py::arg("s"))
      .def("dst_neighbors", [](const BipartiteGraph& g, VertexId d) { return collect(g.dst_neighbors(d)); },
           py::arg("d"))
      .def("add_edge",
           [](BipartiteGraph& g, VertexId s, VertexId d, std::optional<EdgeValue> value) {
             return g.add_edge(s, d, value);
           },
           py::arg("s"), py::arg("d"), py::arg("value") = py::none())
      .def("rem_edge", py::overload_cast<VertexId, VertexId>(&BipartiteGraph::rem_edge),
           py::arg("s"), py::arg("d"))
      .def("add_vertex", &BipartiteGraph::add_vertex, py::arg("kind"))
      .def("set_neighbors", &BipartiteGraph::set_neighbors, py::arg("s"), py::arg("neighbors"))
      .def("delete_srcs",
           [](BipartiteGraph& g, std::vector<VertexId> ids, bool remove_vertices) {
             g.delete_srcs(ids, remove_vertices);
           },
           py::arg("ids"), py::kw_only(), py::arg("remove_vertices") = false)
      .def("delete_dsts",
           [](BipartiteGraph& g, std::vector<VertexId> ids, bool remove_vertices) {
             g.delete_dsts(ids, remove_vertices);
           },
           py::arg("ids"), py::kw_only(), py::arg("remove_vertices") = false)
      .def("clear", &BipartiteGraph::clear)
      .def("edges", [](const BipartiteGraph& g) {
        std::vector<std::pair<VertexId, VertexId>> out;
        for (const auto& e : g.edges()) out.emplace_back(e.src, e.dst);
        return out;
      })
      .def("__eq__", [](const BipartiteGraph& a, const BipartiteGraph& b) { return a == b; });

  py::class_<Matching>(m, "Matching")
      .def(py::init<std::size_t>(), py::arg("n") = 0)
      .def(py::init([](const py::list& entries) {
             std::vector<Matching::entry_type> v;
             v.reserve(entries.size());
             for (const auto& e : entries) v.push_back(entry_from_py(py::reinterpret_borrow<py::object>(e)));
             return Matching(std::move(v));
           }),
           py::arg("entries"))
      .def("clone", &Matching::clone)
      .def("__len__", &Matching::size)
      .def("__getitem__", [](const Matching& mt, VertexId d) { return entry_to_py(mt[d]); })
      .def("__setitem__", [](Matching& mt, VertexId d, const py::object& v) { mt.set(d, entry_from_py(v)); })
      .def("push", [](Matching& mt, const py::object& v) { mt.push(entry_from_py(v)); })
      .def("matched_count", &Matching::matched_count)
      .def("has_inverse", &Matching::has_inverse)
      .def("complete", [](Matching& mt, std::optional<VertexId> n) { mt.complete(n); }, py::arg("n") = py::none())
      .def("invview", &Matching::invview)
      .def("entries", [](const Matching& mt) { return entries_to_py(mt.entries()); })
      .def("inverse_entries", [](const Matching& mt) { return entries_to_py(mt.inverse_entries()); })
      .def("__eq__", [](const Matching& a, const Matching& b) { return a == b; });

  m.def(
      "maximum_matching",
      [](const BipartiteGraph& g, py::object src_mask, py::object dst_mask) {
        MatchingOptions opts;
        if (!src_mask.is_none()) opts.src_mask = as_span<bool>(py::cast<py::array>(src_mask), "src_mask");
        if (!dst_mask.is_none()) opts.dst_mask = as_span<bool>(py::cast<py::array>(dst_mask), "dst_mask");
        return maximum_matching(g, opts);
      },
      py::arg("graph"), py::kw_only(), py::arg("src_mask") = py::none(), py::arg("dst_mask") = py::none());

  bind_dicmo<false>(m, "DiCMOBiGraph");
  bind_dicmo<true>(m, "TransposedDiCMOBiGraph");

  py::class_<InducedCondensationGraph>(m, "InducedCondensationGraph")
      .def(py::init<BipartiteGraph, std::vector<std::vector<VertexId>>>(), py::arg("graph"), py::arg("components"))
      .def("nv", &InducedCondensationGraph::nv)
      .def("component_of", &InducedCondensationGraph::component_of, py::arg("v"))
      .def("out_neighbors", &InducedCondensationGraph::out_neighbors, py::arg("c"))
      .def("in_neighbors", &InducedCondensationGraph::in_neighbors, py::arg("c"));
}
