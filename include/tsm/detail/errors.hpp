#pragma once

#include <string>
#include <variant>

#include "tsm/detail/format.hpp"
#include "tsm/detail/kind.hpp"

namespace tsm {

// Build-time errors

struct EmptyStateSet {
  static constexpr Kind kind() { return Kind::EmptyStateSet; }
  std::string message() const {
    return "state machine must have at least one state";
  }
  bool operator==(const EmptyStateSet&) const = default;
};

struct InitialStateNotSet {
  static constexpr Kind kind() { return Kind::InitialStateNotSet; }
  std::string message() const { return "initial state must be set"; }
  bool operator==(const InitialStateNotSet&) const = default;
};

template <typename S>
struct InvalidInitialState {
  S state;

  static constexpr Kind kind() { return Kind::InvalidInitialState; }
  std::string message() const {
    return "initial state must be a valid state (state: " +
           detail::to_display_string(state) + ")";
  }
  bool operator==(const InvalidInitialState&) const = default;
};

template <typename S>
using BuildError =
    std::variant<EmptyStateSet, InitialStateNotSet, InvalidInitialState<S>>;

// Trigger-time errors. `from` is always the state the machine is still in.

template <typename S, typename E>
struct NoTransition {
  S from;
  E event;

  static constexpr Kind kind() { return Kind::NoTransition; }
  std::string message() const {
    return "no transition found (from: " + detail::to_display_string(from) +
           ", event: " + detail::to_display_string(event) + ")";
  }
  bool operator==(const NoTransition&) const = default;
};

template <typename S, typename E>
struct GuardRejected {
  S from;
  S to;
  E event;

  static constexpr Kind kind() { return Kind::GuardRejected; }
  std::string message() const {
    return "guard condition not met (from: " +
           detail::to_display_string(from) +
           ", to: " + detail::to_display_string(to) +
           ", event: " + detail::to_display_string(event) + ")";
  }
  bool operator==(const GuardRejected&) const = default;
};

template <typename S, typename E>
using TriggerError = std::variant<NoTransition<S, E>, GuardRejected<S, E>>;

// Diagram errors

struct UnsupportedDiagramFormat {
  int format;

  static constexpr Kind kind() { return Kind::UnsupportedDiagramFormat; }
  std::string message() const { return "unsupported diagram format"; }
  bool operator==(const UnsupportedDiagramFormat&) const = default;
};

template <typename... Ts>
constexpr Kind kind_of(const std::variant<Ts...>& error) {
  return std::visit([](const auto& e) { return e.kind(); }, error);
}

template <typename... Ts>
std::string to_string(const std::variant<Ts...>& error) {
  return std::visit([](const auto& e) { return e.message(); }, error);
}

}  // namespace tsm
