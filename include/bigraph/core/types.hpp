/* Core type aliases and helper structs.
 *
 * Vertex ids are 1-based: sources are numbered 1..nsrcs and destinations
 * 1..ndsts, independently. Id 0 never names a vertex.
 */
#pragma once

#include <cstdint>
#include <vector>

namespace bigraph::core {

using VertexId  = std::int32_t;
using EdgeCount = std::int64_t;
using EdgeValue = double;        // Per-edge metadata element

using AdjList  = std::vector<VertexId>;   // Sorted, duplicate-free
using AdjTable = std::vector<AdjList>;    // AdjTable[id - 1] => neighbors of id
using EdgeValueTable = std::vector<std::vector<EdgeValue>>;

// The two vertex classes of a bipartite graph.
enum class VertexKind : std::uint8_t {
  Src = 1,
  Dst = 2
};

// Undirected incidence between source `src` and destination `dst`.
struct BipartiteEdge {
  VertexId src {0};
  VertexId dst {0};
  friend bool operator==(const BipartiteEdge&, const BipartiteEdge&) = default;
};

// Directed edge of a derived (oriented or condensed) graph.
struct DiEdge {
  VertexId src {0};
  VertexId dst {0};
  friend bool operator==(const DiEdge&, const DiEdge&) = default;
};

} // namespace bigraph::core
