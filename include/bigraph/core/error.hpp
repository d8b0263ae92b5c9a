#pragma once

#include <stdexcept>
#include <string>

namespace bigraph::core {

// Backward adjacency or an inverse matching was needed but has not been
// materialized. Recoverable by calling complete() first.
struct IncompleteError : public std::logic_error {
  using std::logic_error::logic_error;
};

// Removal of an edge that is not present.
struct EdgeNotFoundError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

} // namespace bigraph::core
