#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <memory>
#include <string>
#include <variant>

#include "tsm/tsm.hpp"

namespace {

enum class Light { Red, Yellow, Green };
enum class Signal { Next, Reset };

std::string to_string(Light light) {
  switch (light) {
    case Light::Red:
      return "Red";
    case Light::Yellow:
      return "Yellow";
    case Light::Green:
      return "Green";
  }
  return "?";
}

tsm::Builder<Light, Signal> quiet_builder() {
  tsm::Builder<Light, Signal> builder;
  builder.set_logger(std::make_shared<tsm::NullLogger>());
  return builder;
}

}  // namespace

TEST_CASE("Builder - empty state set") {
  auto builder = quiet_builder();

  SUBCASE("stateless build fails") {
    auto machine = builder.build();
    REQUIRE_FALSE(machine);
    CHECK(std::holds_alternative<tsm::EmptyStateSet>(machine.error()));
  }

  SUBCASE("stateful build fails even with an initial state") {
    builder.set_initial_state(Light::Red);
    auto machine = builder.build_stateful();
    REQUIRE_FALSE(machine);
    CHECK(std::holds_alternative<tsm::EmptyStateSet>(machine.error()));
  }

  SUBCASE("transitions alone do not register states") {
    builder.add_transition(Light::Red, Light::Green, Signal::Next);
    auto machine = builder.build();
    REQUIRE_FALSE(machine);
    CHECK(std::holds_alternative<tsm::EmptyStateSet>(machine.error()));
  }
}

TEST_CASE("Builder - stateless build needs one state") {
  auto builder = quiet_builder();
  builder.add_state(Light::Red);

  auto machine = builder.build();
  REQUIRE(machine);
  CHECK(machine->has_state(Light::Red));
  CHECK_FALSE(machine->has_state(Light::Green));
  CHECK(machine->states().size() == 1);
}

TEST_CASE("Builder - add_state is idempotent") {
  auto builder = quiet_builder();
  builder.add_state(Light::Red).add_state(Light::Red).add_state(Light::Green);

  auto machine = builder.build();
  REQUIRE(machine);
  CHECK(machine->states().size() == 2);
}

TEST_CASE("Builder - stateful validation") {
  auto builder = quiet_builder();
  builder.add_state(Light::Red).add_state(Light::Green);

  SUBCASE("initial state not set") {
    auto machine = builder.build_stateful();
    REQUIRE_FALSE(machine);
    CHECK(std::holds_alternative<tsm::InitialStateNotSet>(machine.error()));
  }

  SUBCASE("initial state outside the state set") {
    builder.set_initial_state(Light::Yellow);
    auto machine = builder.build_stateful();
    REQUIRE_FALSE(machine);
    auto* invalid =
        std::get_if<tsm::InvalidInitialState<Light>>(&machine.error());
    REQUIRE(invalid != nullptr);
    CHECK(invalid->state == Light::Yellow);
    CHECK(invalid->message() ==
          "initial state must be a valid state (state: Yellow)");
  }

  SUBCASE("valid initial state") {
    builder.set_initial_state(Light::Green);
    auto machine = builder.build_stateful();
    REQUIRE(machine);
    CHECK((*machine)->state() == Light::Green);
  }

  SUBCASE("last initial state wins") {
    builder.set_initial_state(Light::Yellow).set_initial_state(Light::Red);
    auto machine = builder.build_stateful();
    REQUIRE(machine);
    CHECK((*machine)->state() == Light::Red);
  }

  SUBCASE("stateless build ignores the initial state") {
    builder.set_initial_state(Light::Yellow);
    CHECK(builder.build());
  }
}

TEST_CASE("Builder - duplicate (from, event) keeps the last transition") {
  auto builder = quiet_builder();
  builder.add_state(Light::Red)
      .add_state(Light::Yellow)
      .add_state(Light::Green)
      .add_transition(Light::Red, Light::Yellow, Signal::Next)
      .add_transition(Light::Red, Light::Green, Signal::Next);

  auto machine = builder.build();
  REQUIRE(machine);
  CHECK(machine->transitions().size() == 1);

  auto next = machine->trigger(Light::Red, Signal::Next);
  REQUIRE(next);
  CHECK(*next == Light::Green);
}

TEST_CASE("Builder - overwriting drops the earlier options too") {
  bool first_guard_called = false;
  auto builder = quiet_builder();
  builder.add_state(Light::Red)
      .add_state(Light::Green)
      .add_transition(Light::Red, Light::Green, Signal::Next,
                      tsm::guard([&first_guard_called] {
                        first_guard_called = true;
                        return false;
                      }))
      .add_transition(Light::Red, Light::Green, Signal::Next);

  auto machine = builder.build();
  REQUIRE(machine);
  CHECK(machine->trigger(Light::Red, Signal::Next));
  CHECK_FALSE(first_guard_called);
}

TEST_CASE("Builder - last option of a kind wins") {
  int called = 0;
  auto builder = quiet_builder();
  builder.add_state(Light::Red).add_transition(
      Light::Red, Light::Green, Signal::Next,
      tsm::guard([] { return false; }), tsm::guard([] { return true; }),
      tsm::before([&called] { called += 1; }),
      tsm::before([&called] { called += 10; }));

  auto machine = builder.build();
  REQUIRE(machine);
  CHECK(machine->trigger(Light::Red, Signal::Next));
  CHECK(called == 10);
}

TEST_CASE("Builder - unregistered target states are accepted") {
  auto builder = quiet_builder();
  builder.add_state(Light::Red).add_transition(Light::Red, Light::Yellow,
                                               Signal::Next);

  auto machine = builder.build();
  REQUIRE(machine);
  CHECK_FALSE(machine->has_state(Light::Yellow));

  auto next = machine->trigger(Light::Red, Signal::Next);
  REQUIRE(next);
  CHECK(*next == Light::Yellow);
}

TEST_CASE("Builder - repeated builds are independent") {
  auto builder = quiet_builder();
  builder.add_state(Light::Red)
      .add_state(Light::Green)
      .set_initial_state(Light::Red)
      .add_transition(Light::Red, Light::Green, Signal::Next);

  auto first = builder.build_stateful();
  auto second = builder.build_stateful();
  REQUIRE(first);
  REQUIRE(second);

  CHECK((*first)->trigger(Signal::Next));
  CHECK((*first)->state() == Light::Green);
  CHECK((*second)->state() == Light::Red);

  SUBCASE("later registrations do not leak into built machines") {
    auto stateless = builder.build();
    REQUIRE(stateless);
    builder.add_transition(Light::Green, Light::Red, Signal::Reset);

    CHECK_FALSE(stateless->can_trigger(Light::Green, Signal::Reset));
    auto rebuilt = builder.build();
    REQUIRE(rebuilt);
    CHECK(rebuilt->can_trigger(Light::Green, Signal::Reset));
  }
}

TEST_CASE("Builder - table introspection") {
  auto builder = quiet_builder();
  builder.add_state(Light::Red)
      .add_state(Light::Green)
      .add_transition(Light::Red, Light::Green, Signal::Next)
      .add_transition(Light::Green, Light::Red, Signal::Next);

  CHECK(builder.table().transition_count() == 2);
  REQUIRE(builder.table().find(Light::Green, Signal::Next) != nullptr);
  CHECK(builder.table().find(Light::Green, Signal::Next)->to == Light::Red);
  CHECK(builder.table().find(Light::Green, Signal::Reset) == nullptr);
}
