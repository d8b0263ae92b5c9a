/*
  maximum_matching — mask-driven entry point.

  Validates mask lengths strictly (mismatches are user errors) and forwards
  to the filter-based template with mask lookups as the filters.
*/
#include "bigraph/core/maximum_matching.hpp"

#include <stdexcept>

namespace bigraph::core {

Matching maximum_matching(const BipartiteGraph& g, const MatchingOptions& opts) {
  if (!opts.src_mask.empty() && opts.src_mask.size() != static_cast<std::size_t>(g.nsrcs())) {
    throw std::invalid_argument("maximum_matching: src_mask length must equal nsrcs");
  }
  if (!opts.dst_mask.empty() && opts.dst_mask.size() != static_cast<std::size_t>(g.ndsts())) {
    throw std::invalid_argument("maximum_matching: dst_mask length must equal ndsts");
  }
  const auto src_mask = opts.src_mask;
  const auto dst_mask = opts.dst_mask;
  auto src_filter = [src_mask](VertexId s) {
    return src_mask.empty() || src_mask[static_cast<std::size_t>(s - 1)];
  };
  auto dst_filter = [dst_mask](VertexId d) {
    return dst_mask.empty() || dst_mask[static_cast<std::size_t>(d - 1)];
  };
  return maximum_matching<Unassigned>(g, src_filter, dst_filter);
}

} // namespace bigraph::core
