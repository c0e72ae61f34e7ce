#pragma once

#include <cstddef>
#include <functional>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "tsm/detail/context.hpp"

namespace tsm {

template <typename S, typename E>
using Guard = std::function<bool(Context&, const S& from, const S& to,
                                 const E& event)>;

template <typename S, typename E>
using Hook = std::function<void(Context&, const S& from, const S& to,
                                const E& event)>;

template <typename S, typename E>
struct Transition {
  S from;
  S to;
  E event;
  Guard<S, E> guard = nullptr;
  Hook<S, E> before = nullptr;
  Hook<S, E> after = nullptr;
};

// Read-only view of one table entry: (from, event) -> to.
template <typename S, typename E>
struct TransitionInfo {
  S from;
  E event;
  S to;
};

// State set plus (from, event) -> Transition mapping. Filled by the builder
// and frozen behind a shared_ptr<const> once built.
template <typename S, typename E>
class TransitionTable {
 public:
  using state_type = S;
  using event_type = E;
  using transition_type = Transition<S, E>;

  void add_state(S state) { states_.insert(std::move(state)); }

  // One entry per (from, event); a later insert for the same pair replaces
  // the earlier one.
  void insert(transition_type transition) {
    auto& row = transitions_[transition.from];
    E key = transition.event;
    row.insert_or_assign(std::move(key), std::move(transition));
  }

  const transition_type* find(const S& from, const E& event) const {
    auto row = transitions_.find(from);
    if (row == transitions_.end()) return nullptr;
    auto it = row->second.find(event);
    if (it == row->second.end()) return nullptr;
    return &it->second;
  }

  bool contains_state(const S& state) const {
    return states_.find(state) != states_.end();
  }

  const std::unordered_set<S>& states() const { return states_; }

  std::size_t transition_count() const {
    std::size_t count = 0;
    for (const auto& [from, row] : transitions_) count += row.size();
    return count;
  }

  template <typename F>
  void for_each_transition(F&& visit) const {
    for (const auto& [from, row] : transitions_) {
      for (const auto& [event, transition] : row) {
        visit(transition);
      }
    }
  }

  std::vector<TransitionInfo<S, E>> transitions() const {
    std::vector<TransitionInfo<S, E>> out;
    out.reserve(transition_count());
    for_each_transition([&out](const transition_type& t) {
      out.push_back(TransitionInfo<S, E>{t.from, t.event, t.to});
    });
    return out;
  }

  bool empty() const { return states_.empty(); }

 private:
  std::unordered_set<S> states_;
  std::unordered_map<S, std::unordered_map<E, transition_type>> transitions_;
};

}  // namespace tsm
