/* Option structs for algorithm entry points. */
#pragma once

#include <span>

namespace bigraph::core {

// Vertex masks for maximum_matching:
// - src_mask[s - 1] == true means source s may be matched.
// - dst_mask[d - 1] == true means destination d may be matched.
// Empty spans allow every vertex of that class. Non-empty spans must have
// exactly nsrcs()/ndsts() entries.
struct MatchingOptions {
  std::span<const bool> src_mask {};
  std::span<const bool> dst_mask {};
};

} // namespace bigraph::core
