/* Partial injective destination -> source mapping with an optional inverse. */
#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "bigraph/core/error.hpp"
#include "bigraph/core/logging.hpp"
#include "bigraph/core/types.hpp"

namespace bigraph::core {

// Marker for an entry that holds no vertex.
struct Unassigned {
  friend bool operator==(Unassigned, Unassigned) noexcept { return true; }
};
inline constexpr Unassigned unassigned {};

// Entry type of a matching with payload U:
//   Unassigned | VertexId | U         (U carries extra information about an
//                                      unmatched destination)
// With the default payload the U alternative is omitted.
template <typename U>
struct MatchEntryTraits {
  using type = std::variant<Unassigned, VertexId, U>;
};
template <>
struct MatchEntryTraits<Unassigned> {
  using type = std::variant<Unassigned, VertexId>;
};
template <typename U>
using MatchEntry = typename MatchEntryTraits<U>::type;

template <typename... Ts>
[[nodiscard]] constexpr bool is_matched(const std::variant<Ts...>& e) noexcept {
  return std::holds_alternative<VertexId>(e);
}
template <typename... Ts>
[[nodiscard]] constexpr bool is_unassigned(const std::variant<Ts...>& e) noexcept {
  return std::holds_alternative<Unassigned>(e);
}
// Throws std::bad_variant_access when e is not matched.
template <typename... Ts>
[[nodiscard]] constexpr VertexId matched_vertex(const std::variant<Ts...>& e) {
  return std::get<VertexId>(e);
}

// BasicMatching stores, per destination d (1-based), either a source id or an
// unassigned marker. No two destinations map to the same source.
//
// The inverse table (per source, the destination matched to it) is optional;
// complete() builds it in one pass. While it exists, set() keeps both
// directions consistent and evicts any prior holder of the assigned source.
//
// Like BipartiteGraph, a BasicMatching is a handle: copies alias, invview()
// swaps the forward and inverse tables over the same storage, and clone()
// makes an independent copy.
template <typename U = Unassigned>
class BasicMatching {
  static_assert(!std::is_same_v<U, VertexId>, "BasicMatching payload must not be VertexId");

public:
  using payload_type = U;
  using entry_type = MatchEntry<U>;

  BasicMatching() : BasicMatching(std::size_t{0}) {}
  // n destinations, all unassigned, no inverse.
  explicit BasicMatching(std::size_t n);
  // Adopt existing forward entries; no inverse.
  explicit BasicMatching(std::vector<entry_type> match);
  ~BasicMatching() noexcept = default;

  [[nodiscard]] BasicMatching clone() const { return BasicMatching(std::make_shared<Storage>(*s_), fwd_); }

  [[nodiscard]] std::size_t size() const noexcept { return fwd().size(); }
  [[nodiscard]] const entry_type& operator[](VertexId d) const;
  [[nodiscard]] std::span<const entry_type> entries() const noexcept { return fwd(); }
  [[nodiscard]] std::span<const entry_type> inverse_entries() const;
  [[nodiscard]] std::size_t matched_count() const noexcept;

  // Assign destination d. Entries may be a VertexId, unassigned, or a payload.
  void set(VertexId d, entry_type v);
  // Append one destination entry.
  void push(entry_type v);

  [[nodiscard]] bool has_inverse() const noexcept { return s_->has_inverse; }
  void require_complete() const;
  // Build the inverse with n entries (default: the largest matched source id).
  // No-op if an inverse exists.
  BasicMatching& complete(std::optional<VertexId> n = std::nullopt);
  // Aliasing view with forward and inverse swapped. Requires completion.
  [[nodiscard]] BasicMatching invview() const;
  [[nodiscard]] bool aliases(const BasicMatching& other) const noexcept { return s_ == other.s_; }

  friend bool operator==(const BasicMatching& a, const BasicMatching& b) { return a.fwd() == b.fwd(); }

private:
  struct Storage {
    std::array<std::vector<entry_type>, 2> tables {};  // [0]: per destination, [1]: per source
    bool has_inverse {false};
  };

  BasicMatching(std::shared_ptr<Storage> s, int fwd) : s_(std::move(s)), fwd_(fwd) {}

  [[nodiscard]] const std::vector<entry_type>& fwd() const noexcept { return s_->tables[static_cast<std::size_t>(fwd_)]; }
  [[nodiscard]] std::vector<entry_type>& fwd() noexcept { return s_->tables[static_cast<std::size_t>(fwd_)]; }
  [[nodiscard]] const std::vector<entry_type>& inv() const noexcept { return s_->tables[static_cast<std::size_t>(1 - fwd_)]; }
  [[nodiscard]] std::vector<entry_type>& inv() noexcept { return s_->tables[static_cast<std::size_t>(1 - fwd_)]; }

  std::shared_ptr<Storage> s_;
  int fwd_ {0};
};

using Matching = BasicMatching<Unassigned>;

template <typename U>
BasicMatching<U>::BasicMatching(std::size_t n) : s_(std::make_shared<Storage>()), fwd_(0) {
  s_->tables[0].assign(n, entry_type{unassigned});
}

template <typename U>
BasicMatching<U>::BasicMatching(std::vector<entry_type> match) : s_(std::make_shared<Storage>()), fwd_(0) {
  for (const auto& e : match) {
    if (is_matched(e) && matched_vertex(e) < 1) {
      throw std::out_of_range("BasicMatching: matched vertex ids must be >= 1");
    }
  }
  s_->tables[0] = std::move(match);
}

template <typename U>
const typename BasicMatching<U>::entry_type& BasicMatching<U>::operator[](VertexId d) const {
  if (d < 1 || static_cast<std::size_t>(d) > size()) {
    throw std::out_of_range("BasicMatching: destination " + std::to_string(d) + " out of range");
  }
  return fwd()[static_cast<std::size_t>(d - 1)];
}

template <typename U>
std::span<const typename BasicMatching<U>::entry_type> BasicMatching<U>::inverse_entries() const {
  require_complete();
  return inv();
}

template <typename U>
std::size_t BasicMatching<U>::matched_count() const noexcept {
  return static_cast<std::size_t>(std::count_if(fwd().begin(), fwd().end(),
                                                [](const entry_type& e) { return is_matched(e); }));
}

template <typename U>
void BasicMatching<U>::set(VertexId d, entry_type v) {
  if (d < 1 || static_cast<std::size_t>(d) > size()) {
    throw std::out_of_range("BasicMatching::set: destination " + std::to_string(d) + " out of range");
  }
  if (is_matched(v) && matched_vertex(v) < 1) {
    throw std::out_of_range("BasicMatching::set: matched vertex ids must be >= 1");
  }
  auto& forward = fwd();
  const auto di = static_cast<std::size_t>(d - 1);
  if (s_->has_inverse) {
    auto& inverse = inv();
    const entry_type old = forward[di];
    // Evict the destination currently holding v, then release d's old source.
    // The order matters when d already holds v.
    if (is_matched(v)) {
      const auto vi = static_cast<std::size_t>(matched_vertex(v) - 1);
      if (vi < inverse.size() && is_matched(inverse[vi])) {
        forward[static_cast<std::size_t>(matched_vertex(inverse[vi]) - 1)] = unassigned;
      }
    }
    if (is_matched(old)) {
      inverse[static_cast<std::size_t>(matched_vertex(old) - 1)] = unassigned;
    }
    if (is_matched(v)) {
      const auto vi = static_cast<std::size_t>(matched_vertex(v) - 1);
      if (inverse.size() <= vi) inverse.resize(vi + 1, entry_type{unassigned});
      inverse[vi] = d;
    }
  }
  forward[di] = std::move(v);
}

template <typename U>
void BasicMatching<U>::push(entry_type v) {
  fwd().emplace_back(unassigned);
  set(static_cast<VertexId>(size()), std::move(v));
}

template <typename U>
void BasicMatching<U>::require_complete() const {
  if (!s_->has_inverse) {
    throw IncompleteError("Matching has no inverse; call complete() first");
  }
}

template <typename U>
BasicMatching<U>& BasicMatching<U>::complete(std::optional<VertexId> n) {
  if (s_->has_inverse) return *this;
  const auto& forward = fwd();
  VertexId largest = 0;
  for (const auto& e : forward) {
    if (is_matched(e)) largest = std::max(largest, matched_vertex(e));
  }
  const VertexId len = n.value_or(largest);
  if (len < largest) {
    throw std::invalid_argument("Matching::complete: inverse length " + std::to_string(len) +
                                " is smaller than the largest matched source " + std::to_string(largest));
  }
  std::vector<entry_type> inverse(static_cast<std::size_t>(len), entry_type{unassigned});
  for (std::size_t i = 0; i < forward.size(); ++i) {
    if (!is_matched(forward[i])) continue;
    auto& slot = inverse[static_cast<std::size_t>(matched_vertex(forward[i]) - 1)];
    if (is_matched(slot)) {
      throw std::invalid_argument("Matching::complete: source " + std::to_string(matched_vertex(forward[i])) +
                                  " is matched more than once");
    }
    slot = static_cast<VertexId>(i + 1);
  }
  inv() = std::move(inverse);
  s_->has_inverse = true;
  BIGRAPH_LOG_DEBUG("Matching::complete: {} destinations, inverse length {}", forward.size(), len);
  return *this;
}

template <typename U>
BasicMatching<U> BasicMatching<U>::invview() const {
  require_complete();
  return BasicMatching(s_, 1 - fwd_);
}

extern template class BasicMatching<Unassigned>;

} // namespace bigraph::core
