#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "tsm/detail/context.hpp"
#include "tsm/detail/errors.hpp"
#include "tsm/detail/event.hpp"
#include "tsm/detail/format.hpp"
#include "tsm/detail/logger.hpp"
#include "tsm/detail/result.hpp"
#include "tsm/detail/table.hpp"

namespace tsm {

template <typename S, typename E>
class StatefulMachine;

// Stateless engine: the caller passes the current state on every trigger.
// Immutable once built; copies share the same read-only table, so a Machine
// can be used from any number of threads without locking.
template <typename S, typename E>
class Machine {
  friend class StatefulMachine<S, E>;

 public:
  using state_type = S;
  using event_type = E;
  using table_type = TransitionTable<S, E>;
  using error_type = TriggerError<S, E>;
  using trigger_result = Result<S, error_type>;

  Machine(std::shared_ptr<const table_type> table, std::string name,
          std::shared_ptr<Logger> logger)
      : table_(std::move(table)),
        name_(std::move(name)),
        logger_(logger ? std::move(logger) : std::make_shared<NullLogger>()) {}

  // Returns the target state, or why the event was refused from `current`.
  trigger_result trigger(Context& ctx, const S& current,
                         const E& event) const {
    return evaluate(ctx, current, event, [](const S& /*target*/) {});
  }

  trigger_result trigger(const S& current, const E& event) const {
    Context ctx;
    return trigger(ctx, current, event);
  }

  // Table lookup only; the guard is not evaluated.
  bool can_trigger(const S& current, const E& event) const {
    return table_->find(current, event) != nullptr;
  }

  bool has_state(const S& state) const { return table_->contains_state(state); }

  const std::unordered_set<S>& states() const { return table_->states(); }

  std::vector<TransitionInfo<S, E>> transitions() const {
    return table_->transitions();
  }

  const table_type& table() const { return *table_; }
  const std::string& name() const { return name_; }
  Logger& logger() const { return *logger_; }

 private:
  // Lookup, guard, before hooks, commit, after hooks. `commit` receives the
  // target state and is the only step that mutates anything.
  template <typename Commit>
  trigger_result evaluate(Context& ctx, const S& current, const E& event,
                          Commit&& commit) const {
    const S from = current;
    const auto* transition = table_->find(from, event);
    if (!transition) {
      return reject(NoTransition<S, E>{from, event});
    }

    if (transition->guard && !transition->guard(ctx, from, transition->to,
                                                 event)) {
      return reject(GuardRejected<S, E>{from, transition->to, event});
    }

    if (transition->before) transition->before(ctx, from, transition->to, event);
    detail::invoke_before(event, ctx);

    commit(transition->to);

    if (transition->after) transition->after(ctx, from, transition->to, event);
    detail::invoke_after(event, ctx);

    log_lazy(*logger_, LogLevel::Trace, [&] {
      return name_ + ": " + detail::to_display_string(from) + " -> " +
             detail::to_display_string(transition->to) + " on " +
             detail::to_display_string(event);
    });
    return transition->to;
  }

  template <typename Err>
  trigger_result reject(Err error) const {
    log_lazy(*logger_, LogLevel::Debug,
             [&] { return name_ + ": " + error.message(); });
    return error_type(std::move(error));
  }

  std::shared_ptr<const table_type> table_;
  std::string name_;
  std::shared_ptr<Logger> logger_;
};

// Stateful engine: owns the current state behind a reader/writer lock.
// trigger() holds the lock exclusively for the whole evaluation, guards and
// hooks included, so they must not call back into the same machine.
template <typename S, typename E>
class StatefulMachine {
 public:
  using state_type = S;
  using event_type = E;
  using error_type = TriggerError<S, E>;
  using trigger_result = Result<void, error_type>;

  StatefulMachine(Machine<S, E> machine, S initial)
      : machine_(std::move(machine)), current_(std::move(initial)) {}

  StatefulMachine(const StatefulMachine&) = delete;
  StatefulMachine& operator=(const StatefulMachine&) = delete;
  StatefulMachine(StatefulMachine&&) = delete;
  StatefulMachine& operator=(StatefulMachine&&) = delete;

  trigger_result trigger(Context& ctx, const E& event) {
    std::unique_lock lock(mutex_);
    auto result = machine_.evaluate(
        ctx, current_, event, [this](const S& target) { current_ = target; });
    if (!result) return result.error();
    return {};
  }

  trigger_result trigger(const E& event) {
    Context ctx;
    return trigger(ctx, event);
  }

  S state() const {
    std::shared_lock lock(mutex_);
    return current_;
  }

  bool can_trigger(const E& event) const {
    std::shared_lock lock(mutex_);
    return machine_.can_trigger(current_, event);
  }

  bool has_state(const S& state) const { return machine_.has_state(state); }
  const std::unordered_set<S>& states() const { return machine_.states(); }
  std::vector<TransitionInfo<S, E>> transitions() const {
    return machine_.transitions();
  }
  const std::string& name() const { return machine_.name(); }

  // Stateless view over the same table.
  const Machine<S, E>& machine() const { return machine_; }

 private:
  Machine<S, E> machine_;
  mutable std::shared_mutex mutex_;
  S current_;
};

}  // namespace tsm
