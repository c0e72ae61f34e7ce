#include <iostream>
#include <memory>
#include <string>

#include "tsm/tsm.hpp"

namespace {

enum class OrderState { Created, Paid, Shipped, Delivered, Cancelled };
enum class OrderEvent { Pay, Ship, Deliver, Cancel };

std::string to_string(OrderState state) {
  switch (state) {
    case OrderState::Created:
      return "Created";
    case OrderState::Paid:
      return "Paid";
    case OrderState::Shipped:
      return "Shipped";
    case OrderState::Delivered:
      return "Delivered";
    case OrderState::Cancelled:
      return "Cancelled";
  }
  return "Unknown";
}

std::string to_string(OrderEvent event) {
  switch (event) {
    case OrderEvent::Pay:
      return "Pay";
    case OrderEvent::Ship:
      return "Ship";
    case OrderEvent::Deliver:
      return "Deliver";
    case OrderEvent::Cancel:
      return "Cancel";
  }
  return "Unknown";
}

}  // namespace

// Stateless use: the caller owns the current state and stores it wherever
// it likes, here a local variable. Transitions are traced to stderr.
int main() {
  double balance = 250.0;
  const double price = 120.0;

  tsm::Builder<OrderState, OrderEvent> builder;
  builder.set_name("order")
      .set_logger(std::make_shared<tsm::StderrLogger>(tsm::LogLevel::Trace));
  for (auto state : {OrderState::Created, OrderState::Paid,
                     OrderState::Shipped, OrderState::Delivered,
                     OrderState::Cancelled}) {
    builder.add_state(state);
  }
  builder
      .add_transition(OrderState::Created, OrderState::Paid, OrderEvent::Pay,
                      tsm::guard([&] { return balance >= price; }),
                      tsm::before([&] { balance -= price; }))
      .add_transition(OrderState::Paid, OrderState::Shipped, OrderEvent::Ship)
      .add_transition(OrderState::Shipped, OrderState::Delivered,
                      OrderEvent::Deliver)
      .add_transition(OrderState::Created, OrderState::Cancelled,
                      OrderEvent::Cancel);

  auto machine = builder.build();
  if (!machine) {
    std::cerr << tsm::to_string(machine.error()) << std::endl;
    return 1;
  }

  OrderState state = OrderState::Created;
  for (auto event : {OrderEvent::Pay, OrderEvent::Cancel, OrderEvent::Ship,
                     OrderEvent::Deliver}) {
    auto next = machine->trigger(state, event);
    if (!next) {
      std::cout << to_string(event) << ": " << tsm::to_string(next.error())
                << std::endl;
      continue;
    }
    state = *next;
  }

  std::cout << "Final state: " << to_string(state) << ", balance " << balance
            << std::endl;
  auto diagram =
      tsm::generate_diagram(*machine, tsm::DiagramFormat::Mermaid, state);
  if (diagram) std::cout << *diagram;
  return 0;
}
