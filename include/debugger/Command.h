/***
 * Name: unihir::debugger::Command / parseCommand
 * Purpose: Parse one line of debugger input.
 * Inputs: Raw input line
 * Outputs: Command (or an error message)
 * Theory of Operation:
 *   The command word is matched case-insensitively; an empty line means
 *   `step`. Arguments keep their spelling. Breakpoint numbers are the
 *   zero-based indices shown by `list`.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "debugger/Breakpoint.h"

namespace unihir::debugger {

struct Command {
  enum class Kind { Step, Continue, Visualize, Inspect, Break, List, Clear, Help, Quit };

  Kind kind{Kind::Step};
  std::string target{};                  // Inspect
  std::optional<Breakpoint> breakpoint{}; // Break
  size_t index{0};                        // Clear
};

bool parseCommand(std::string_view line, Command& out, std::string& err);

} // namespace unihir::debugger
