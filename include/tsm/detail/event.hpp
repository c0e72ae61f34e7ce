#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <utility>

#include "tsm/detail/context.hpp"
#include "tsm/detail/format.hpp"

namespace tsm {

// An event type is before-capable (after-capable) when its values expose
// before_transition(Context&) (after_transition(Context&)). The engine calls
// them on the exact value passed to trigger().
template <typename E>
concept BeforeCapable = requires(const E& event, Context& ctx) {
  event.before_transition(ctx);
};

template <typename E>
concept AfterCapable = requires(const E& event, Context& ctx) {
  event.after_transition(ctx);
};

// Event wrapper whose instances opt into hooks one by one. Identity
// (equality, hashing, display) is the key alone, so a hooked instance
// matches transitions registered with the bare key.
template <typename Key>
struct HookedEvent {
  using key_type = Key;
  using Hook = std::function<void(Context&)>;

  Key key;
  Hook before;
  Hook after;

  HookedEvent(Key k) : key(std::move(k)) {}
  HookedEvent(Key k, Hook before_hook, Hook after_hook = nullptr)
      : key(std::move(k)),
        before(std::move(before_hook)),
        after(std::move(after_hook)) {}

  void before_transition(Context& ctx) const {
    if (before) before(ctx);
  }

  void after_transition(Context& ctx) const {
    if (after) after(ctx);
  }

  bool has_before() const { return static_cast<bool>(before); }
  bool has_after() const { return static_cast<bool>(after); }

  friend bool operator==(const HookedEvent& lhs, const HookedEvent& rhs) {
    return lhs.key == rhs.key;
  }

  friend std::string to_string(const HookedEvent& event) {
    return detail::to_display_string(event.key);
  }
};

namespace detail {

template <typename E>
void invoke_before(const E& event, Context& ctx) {
  if constexpr (BeforeCapable<E>) {
    event.before_transition(ctx);
  }
}

template <typename E>
void invoke_after(const E& event, Context& ctx) {
  if constexpr (AfterCapable<E>) {
    event.after_transition(ctx);
  }
}

}  // namespace detail
}  // namespace tsm

namespace std {
template <typename Key>
struct hash<tsm::HookedEvent<Key>> {
  std::size_t operator()(const tsm::HookedEvent<Key>& event) const {
    return std::hash<Key>{}(event.key);
  }
};
}  // namespace std
