#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace tsm {

using kind_t = std::uint64_t;

// A kind packs up to eight 8-bit ids: its own id in the low byte, followed
// by the ids of every base it derives from (transitively, deduplicated).
namespace kind {
constexpr std::size_t length = 64;
constexpr std::size_t id_length = 8;
constexpr std::size_t depth_max = length / id_length;
constexpr kind_t id_mask = (kind_t{1} << id_length) - 1;

constexpr kind_t id(kind_t k) { return k & id_mask; }
}  // namespace kind

template <typename... TBases>
constexpr kind_t make_kind(kind_t id, TBases... bases) {
  static_assert((std::is_convertible_v<TBases, kind_t> && ...),
                "bases must be convertible to kind_t");

  std::array<kind_t, kind::depth_max> seen{};
  std::array<kind_t, sizeof...(bases)> base_kinds{static_cast<kind_t>(bases)...};
  std::size_t count = 0;
  kind_t result = (id + 1) & kind::id_mask;

  for (kind_t base : base_kinds) {
    for (std::size_t j = 0; j < kind::depth_max; ++j) {
      kind_t base_id = kind::id(base >> (kind::id_length * j));
      if (base_id == 0) break;

      bool duplicate = false;
      for (std::size_t k = 0; k < count; ++k) {
        if (seen[k] == base_id) {
          duplicate = true;
          break;
        }
      }
      if (duplicate || count + 1 >= kind::depth_max) continue;

      seen[count++] = base_id;
      result |= base_id << (kind::id_length * count);
    }
  }
  return result;
}

// True when `k` is `base` or derives from it.
template <typename TKind, typename TBase>
constexpr bool is_kind(TKind k, TBase base) {
  kind_t base_id = kind::id(static_cast<kind_t>(base));
  for (std::size_t i = 0; i < kind::depth_max; ++i) {
    kind_t current = kind::id(static_cast<kind_t>(k) >> (kind::id_length * i));
    if (current == base_id) return true;
    if (current == 0) break;
  }
  return false;
}

template <typename TKind, typename TBase, typename... TBases>
constexpr bool is_kind(TKind k, TBase base, TBases... bases) {
  return is_kind(k, base) || is_kind(k, bases...);
}

enum class Kind : kind_t {
  Null = 0,
  Error = make_kind(1),
  BuildError = make_kind(2, Error),
  TriggerError = make_kind(3, Error),
  DiagramError = make_kind(4, Error),
  EmptyStateSet = make_kind(5, BuildError),
  InitialStateNotSet = make_kind(6, BuildError),
  InvalidInitialState = make_kind(7, BuildError),
  NoTransition = make_kind(8, TriggerError),
  GuardRejected = make_kind(9, TriggerError),
  UnsupportedDiagramFormat = make_kind(10, DiagramError),
};

}  // namespace tsm
