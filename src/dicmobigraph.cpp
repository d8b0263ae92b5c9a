/*
  DiCMOBiGraph — explicit instantiations for the default-payload matching,
  in both orientations.
*/
#include "bigraph/core/dicmobigraph.hpp"

namespace bigraph::core {

template class BasicDiCMOBiGraph<false, Unassigned>;
template class BasicDiCMOBiGraph<true, Unassigned>;

} // namespace bigraph::core
