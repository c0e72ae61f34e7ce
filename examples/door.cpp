#include <iostream>
#include <string>

#include "tsm/tsm.hpp"

// Door with a lock flag checked by a guard, driven through the stateful
// engine.
int main() {
  bool key_turned = false;

  tsm::Builder<std::string, std::string> builder;
  auto built =
      builder.set_name("door")
          .add_state("Closed")
          .add_state("Open")
          .add_state("Locked")
          .set_initial_state("Closed")
          .add_transition("Closed", "Open", "OpenDoor")
          .add_transition("Open", "Closed", "CloseDoor")
          .add_transition("Closed", "Locked", "LockDoor",
                          tsm::guard([&key_turned] { return key_turned; }),
                          tsm::after([](tsm::Context&, const std::string& from,
                                        const std::string& to,
                                        const std::string&) {
                            std::cout << "locked: " << from << " -> " << to
                                      << std::endl;
                          }))
          .add_transition("Locked", "Closed", "UnlockDoor")
          .build_stateful();
  if (!built) {
    std::cerr << tsm::to_string(built.error()) << std::endl;
    return 1;
  }
  auto& door = **built;

  for (const char* event : {"OpenDoor", "LockDoor", "CloseDoor", "LockDoor"}) {
    auto result = door.trigger(event);
    if (!result) {
      std::cout << event << " refused: " << tsm::to_string(result.error())
                << std::endl;
    }
  }

  key_turned = true;
  if (!door.trigger("LockDoor")) return 1;
  std::cout << "State: " << door.state() << std::endl;

  auto diagram = tsm::generate_diagram(door, tsm::DiagramFormat::Dot);
  if (!diagram) {
    std::cerr << diagram.error().message() << std::endl;
    return 1;
  }
  std::cout << *diagram << std::endl;
  return 0;
}
