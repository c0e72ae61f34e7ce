#pragma once

#include <type_traits>
#include <utility>

#include "tsm/detail/context.hpp"
#include "tsm/detail/table.hpp"

namespace tsm {
namespace detail {

// Callables are accepted either with the full (ctx, from, to, event)
// signature or with no arguments at all.
template <typename F, typename S, typename E>
inline constexpr bool full_signature_v =
    std::is_invocable_v<const F&, Context&, const S&, const S&, const E&>;

template <typename F>
inline constexpr bool nullary_v = std::is_invocable_v<const F&>;

template <typename S, typename E, typename F>
Guard<S, E> make_guard(F callable) {
  if constexpr (full_signature_v<F, S, E>) {
    return [f = std::move(callable)](Context& ctx, const S& from, const S& to,
                                     const E& event) -> bool {
      return f(ctx, from, to, event);
    };
  } else {
    static_assert(nullary_v<F>,
                  "guard must be callable as bool(Context&, const S&, const "
                  "S&, const E&) or bool()");
    return [f = std::move(callable)](Context&, const S&, const S&,
                                     const E&) -> bool { return f(); };
  }
}

template <typename S, typename E, typename F>
Hook<S, E> make_hook(F callable) {
  if constexpr (full_signature_v<F, S, E>) {
    return [f = std::move(callable)](Context& ctx, const S& from, const S& to,
                                     const E& event) {
      f(ctx, from, to, event);
    };
  } else {
    static_assert(nullary_v<F>,
                  "hook must be callable as void(Context&, const S&, const "
                  "S&, const E&) or void()");
    return [f = std::move(callable)](Context&, const S&, const S&, const E&) {
      f();
    };
  }
}

template <typename F>
struct guard_expr {
  F callable;

  template <typename S, typename E>
  void apply(Transition<S, E>& transition) const {
    transition.guard = make_guard<S, E>(callable);
  }
};

template <typename F>
struct before_expr {
  F callable;

  template <typename S, typename E>
  void apply(Transition<S, E>& transition) const {
    transition.before = make_hook<S, E>(callable);
  }
};

template <typename F>
struct after_expr {
  F callable;

  template <typename S, typename E>
  void apply(Transition<S, E>& transition) const {
    transition.after = make_hook<S, E>(callable);
  }
};

}  // namespace detail

template <typename O, typename S, typename E>
concept TransitionOption = requires(const O& option,
                                    Transition<S, E>& transition) {
  option.apply(transition);
};

// Blocks the transition when the predicate returns false.
template <typename Callable>
[[nodiscard]] auto guard(Callable&& callable) {
  return detail::guard_expr<std::decay_t<Callable>>{
      std::forward<Callable>(callable)};
}

// Runs after the guard passed, before the new state is committed.
template <typename Callable>
[[nodiscard]] auto before(Callable&& callable) {
  return detail::before_expr<std::decay_t<Callable>>{
      std::forward<Callable>(callable)};
}

// Runs once the new state is committed.
template <typename Callable>
[[nodiscard]] auto after(Callable&& callable) {
  return detail::after_expr<std::decay_t<Callable>>{
      std::forward<Callable>(callable)};
}

}  // namespace tsm
