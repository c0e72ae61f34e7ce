#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "tsm/detail/errors.hpp"
#include "tsm/detail/logger.hpp"
#include "tsm/detail/options.hpp"
#include "tsm/detail/result.hpp"
#include "tsm/detail/table.hpp"
#include "tsm/machine.hpp"

namespace tsm {

// Accumulates states and transitions, then validates and snapshots them.
// build() and build_stateful() leave the builder untouched and can be called
// any number of times; every machine gets its own copy of the table.
template <typename S, typename E>
class Builder {
 public:
  using machine_type = Machine<S, E>;
  using stateful_type = StatefulMachine<S, E>;
  using error_type = BuildError<S>;

  Builder() : logger_(default_logger()) {}

  Builder& add_state(S state) {
    table_.add_state(std::move(state));
    return *this;
  }

  // Checked against the state set by build_stateful() only.
  Builder& set_initial_state(S state) {
    initial_state_ = std::move(state);
    return *this;
  }

  // Registers from --event--> to. Replaces any earlier transition for the
  // same (from, event); neither state has to be registered.
  template <typename... Options>
    requires(TransitionOption<Options, S, E> && ...)
  Builder& add_transition(S from, S to, E event, Options&&... options) {
    Transition<S, E> transition{std::move(from), std::move(to),
                                std::move(event)};
    (options.apply(transition), ...);
    table_.insert(std::move(transition));
    return *this;
  }

  Builder& set_name(std::string name) {
    name_ = std::move(name);
    return *this;
  }

  // nullptr silences the machine.
  Builder& set_logger(std::shared_ptr<Logger> logger) {
    logger_ = logger ? std::move(logger) : std::make_shared<NullLogger>();
    return *this;
  }

  Result<machine_type, error_type> build() const {
    if (table_.empty()) {
      return fail(EmptyStateSet{});
    }
    return make_machine();
  }

  Result<std::unique_ptr<stateful_type>, error_type> build_stateful() const {
    if (table_.empty()) {
      return fail(EmptyStateSet{});
    }
    if (!initial_state_) {
      return fail(InitialStateNotSet{});
    }
    if (!table_.contains_state(*initial_state_)) {
      return fail(InvalidInitialState<S>{*initial_state_});
    }
    return std::make_unique<stateful_type>(make_machine(), *initial_state_);
  }

  const TransitionTable<S, E>& table() const { return table_; }

 private:
  machine_type make_machine() const {
    return machine_type(std::make_shared<const TransitionTable<S, E>>(table_),
                        name_, logger_);
  }

  template <typename Err>
  error_type fail(Err error) const {
    log_lazy(*logger_, LogLevel::Warn,
             [&] { return name_ + ": build failed: " + error.message(); });
    return error_type(std::move(error));
  }

  TransitionTable<S, E> table_;
  std::optional<S> initial_state_;
  std::string name_ = "tsm";
  std::shared_ptr<Logger> logger_;
};

}  // namespace tsm
