#pragma once

#include <algorithm>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

#include "tsm/detail/errors.hpp"
#include "tsm/detail/format.hpp"
#include "tsm/detail/result.hpp"
#include "tsm/machine.hpp"

namespace tsm {

enum class DiagramFormat { Mermaid = 0, Dot = 1 };

// Everything a generator needs, already rendered as text.
struct DiagramSnapshot {
  struct Edge {
    std::string from;
    std::string to;
    std::string event;

    bool operator==(const Edge&) const = default;
  };

  std::vector<std::string> states;
  std::vector<Edge> transitions;
  std::string current;
};

namespace detail {

inline std::vector<std::string> sorted_states(const DiagramSnapshot& snapshot) {
  std::vector<std::string> states = snapshot.states;
  std::sort(states.begin(), states.end());
  states.erase(std::unique(states.begin(), states.end()), states.end());
  return states;
}

// Ordered by (from, to, event) so output can be diffed against stored text.
inline std::vector<DiagramSnapshot::Edge> sorted_edges(
    const DiagramSnapshot& snapshot) {
  auto edges = snapshot.transitions;
  std::sort(edges.begin(), edges.end(), [](const auto& a, const auto& b) {
    if (a.from != b.from) return a.from < b.from;
    if (a.to != b.to) return a.to < b.to;
    return a.event < b.event;
  });
  edges.erase(std::unique(edges.begin(), edges.end()), edges.end());
  return edges;
}

}  // namespace detail

struct DiagramGenerator {
  virtual ~DiagramGenerator() = default;
  virtual std::string generate(const DiagramSnapshot& snapshot) const = 0;
};

class MermaidGenerator : public DiagramGenerator {
 public:
  std::string generate(const DiagramSnapshot& snapshot) const override {
    std::string out = "stateDiagram-v2\n";
    for (const auto& state : detail::sorted_states(snapshot)) {
      if (state == snapshot.current) {
        out += "    " + state + " : [*] " + state + "\n";
      } else {
        out += "    " + state + "\n";
      }
    }
    for (const auto& edge : detail::sorted_edges(snapshot)) {
      out += "    " + edge.from + " --> " + edge.to + " : " + edge.event + "\n";
    }
    return out;
  }
};

class DotGenerator : public DiagramGenerator {
 public:
  std::string generate(const DiagramSnapshot& snapshot) const override {
    std::string out = "digraph StateMachine {\n";
    for (const auto& state : detail::sorted_states(snapshot)) {
      if (state == snapshot.current) {
        out += "    \"" + state +
               "\" [shape=doublecircle, style=filled, fillcolor=lightblue];\n";
      } else {
        out += "    \"" + state + "\" [shape=circle];\n";
      }
    }
    for (const auto& edge : detail::sorted_edges(snapshot)) {
      out += "    \"" + edge.from + "\" -> \"" + edge.to + "\" [label=\"" +
             edge.event + "\"];\n";
    }
    out += "}";
    return out;
  }
};

inline std::unique_ptr<DiagramGenerator> make_generator(DiagramFormat format) {
  switch (format) {
    case DiagramFormat::Mermaid:
      return std::make_unique<MermaidGenerator>();
    case DiagramFormat::Dot:
      return std::make_unique<DotGenerator>();
  }
  return nullptr;
}

template <typename S, typename E>
DiagramSnapshot snapshot(const Machine<S, E>& machine,
                         const std::type_identity_t<S>& current) {
  DiagramSnapshot out;
  out.current = detail::to_display_string(current);
  for (const auto& state : machine.states()) {
    out.states.push_back(detail::to_display_string(state));
  }
  machine.table().for_each_transition([&out](const Transition<S, E>& t) {
    out.transitions.push_back({detail::to_display_string(t.from),
                               detail::to_display_string(t.to),
                               detail::to_display_string(t.event)});
  });
  return out;
}

template <typename S, typename E>
Result<std::string, UnsupportedDiagramFormat> generate_diagram(
    const Machine<S, E>& machine, DiagramFormat format,
    const std::type_identity_t<S>& current) {
  auto generator = make_generator(format);
  if (!generator) {
    return UnsupportedDiagramFormat{static_cast<int>(format)};
  }
  return generator->generate(snapshot(machine, current));
}

template <typename S, typename E>
Result<std::string, UnsupportedDiagramFormat> generate_diagram(
    const StatefulMachine<S, E>& machine, DiagramFormat format,
    const std::type_identity_t<S>& current) {
  return generate_diagram(machine.machine(), format, current);
}

// Highlights the machine's own current state.
template <typename S, typename E>
Result<std::string, UnsupportedDiagramFormat> generate_diagram(
    const StatefulMachine<S, E>& machine, DiagramFormat format) {
  return generate_diagram(machine.machine(), format, machine.state());
}

}  // namespace tsm
