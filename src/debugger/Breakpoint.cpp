/***
 * Name: unihir::debugger::Breakpoint (impl)
 * Purpose: Parse breakpoint specs and describe breakpoints for listings.
 */
#include "debugger/Breakpoint.h"

#include <optional>
#include <string>
#include <string_view>

namespace unihir::debugger {

std::string Breakpoint::describe() const {
  switch (kind) {
    case Kind::BoundaryElimination: return "Boundary Elimination";
    case Kind::Phase: return "Phase: " + name;
    case Kind::Function: return "Function: " + name;
    default: return "?";
  }
}

std::optional<Breakpoint> parseBreakpointSpec(const std::string_view spec, std::string& err) {
  const auto colon = spec.find(':');
  const std::string_view kind = spec.substr(0, colon);
  const std::string name = colon == std::string_view::npos ? std::string() : std::string(spec.substr(colon + 1));
  if (kind == "boundary") {
    if (!name.empty()) { err = "boundary breakpoints take no name"; return std::nullopt; }
    return Breakpoint::boundary();
  }
  if (kind == "phase" || kind == "function" || kind == "fn") {
    if (name.empty()) { err = std::string("break ") + std::string(kind) + " requires a name"; return std::nullopt; }
    return kind == "phase" ? Breakpoint::phase(name) : Breakpoint::function(name);
  }
  err = "Unknown breakpoint type: '" + std::string(kind) + "'";
  return std::nullopt;
}

} // namespace unihir::debugger
