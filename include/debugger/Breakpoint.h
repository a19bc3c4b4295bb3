/***
 * Name: unihir::debugger::Breakpoint
 * Purpose: Condition on which `continue` stops.
 * Theory of Operation:
 *   BoundaryElimination stops after a step that eliminated at least one
 *   boundary. Phase(name) stops when the named phase is entered. Function
 *   breakpoints are accepted and listed but never stop execution.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace unihir::debugger {

struct Breakpoint {
  enum class Kind { BoundaryElimination, Phase, Function };

  Kind kind{Kind::BoundaryElimination};
  std::string name{};

  static Breakpoint boundary() { return Breakpoint{Kind::BoundaryElimination, {}}; }
  static Breakpoint phase(std::string n) { return Breakpoint{Kind::Phase, std::move(n)}; }
  static Breakpoint function(std::string n) { return Breakpoint{Kind::Function, std::move(n)}; }

  bool operator==(const Breakpoint& other) const { return kind == other.kind && name == other.name; }

  // "Boundary Elimination", "Phase: Optimized", "Function: foo"
  std::string describe() const;
};

// `--break=` spelling: "boundary", "phase:<name>", "function:<name>" or
// "fn:<name>". Returns nullopt and sets err when malformed.
std::optional<Breakpoint> parseBreakpointSpec(std::string_view spec, std::string& err);

} // namespace unihir::debugger
