/*
  Matching — explicit instantiation of the default-payload matching.

  The member templates live in the header so that matchings with a custom
  unassigned payload can be instantiated by callers.
*/
#include "bigraph/core/matching.hpp"

namespace bigraph::core {

template class BasicMatching<Unassigned>;

} // namespace bigraph::core
