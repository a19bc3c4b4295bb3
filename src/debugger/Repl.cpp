/***
 * Name: unihir::debugger::Repl (impl)
 * Purpose: Read-eval loop over the Stepper with optional ANSI coloring.
 */
#include "debugger/Repl.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace unihir::debugger {

// ANSI fragments
static constexpr std::string_view kRed = "\033[31m";
static constexpr std::string_view kGreen = "\033[32m";
static constexpr std::string_view kBold = "\033[1m";
static constexpr std::string_view kReset = "\033[0m";

static constexpr std::string_view kHelp =
    "Available commands:\n"
    "  step, s (or empty line)   Step to the next phase\n"
    "  continue, c               Continue until a breakpoint or completion\n"
    "  visualize, v              Show the whole transpilation state\n"
    "  inspect, i <target>       Show python | c | unified | optimized | rust\n"
    "  break, b <type>           boundary | phase <name> | function <name>\n"
    "  list, l                   List breakpoints\n"
    "  clear <n>                 Remove breakpoint n\n"
    "  help, h, ?                Show this help\n"
    "  quit, q, exit             Leave the debugger\n";

void Repl::printError(const std::string& msg) {
  if (color_) { out_ << kRed << kBold << "Error:" << kReset << " " << msg << "\n"; }
  else { out_ << "Error: " << msg << "\n"; }
}

void Repl::printHelp() { out_ << kHelp; }

void Repl::report(const StepOutcome& outcome) {
  const auto& state = stepper_.state();
  switch (outcome.status) {
    case StepStatus::Advanced:
      if (color_) { out_ << kGreen; }
      out_ << "=== Step " << state.stepCount << " ===";
      if (color_) { out_ << kReset; }
      out_ << "\nPhase: " << to_string(outcome.phase) << "\n  " << outcome.message << "\n";
      if (outcome.breakpointHit) {
        out_ << "Breakpoint hit: [" << *outcome.breakpointHit << "] "
             << stepper_.breakpoints()[*outcome.breakpointHit].describe() << "\n";
      }
      break;
    case StepStatus::NothingToDo:
      out_ << "Transpilation already complete; nothing to do.\n";
      break;
    case StepStatus::Failed:
      printError(std::string("phase '") + to_string(outcome.phase) + "' failed:\n" + outcome.message);
      stepper_.acknowledgeError();
      break;
    case StepStatus::Blocked:
      printError("stepper is blocked by an unacknowledged error");
      stepper_.acknowledgeError();
      break;
    default:
      break;
  }
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
bool Repl::handle(const Command& cmd) {
  switch (cmd.kind) {
    case Command::Kind::Step:
      report(stepper_.step());
      break;
    case Command::Kind::Continue: {
      const StepOutcome outcome = stepper_.continueUntilBreakpoint();
      report(outcome);
      if (outcome.ok()) {
        out_ << "Step: " << stepper_.state().stepCount << "  Phase: " << to_string(stepper_.state().phase) << "\n";
      }
      break;
    }
    case Command::Kind::Visualize:
      out_ << stepper_.visualize();
      break;
    case Command::Kind::Inspect: {
      std::string text;
      if (stepper_.inspect(cmd.target, text)) { out_ << text; }
      else { printError(text.substr(0, text.size() - 1)); }
      break;
    }
    case Command::Kind::Break:
      stepper_.addBreakpoint(*cmd.breakpoint);
      out_ << "Breakpoint added: " << cmd.breakpoint->describe() << "\n";
      if (cmd.breakpoint->kind == Breakpoint::Kind::Function) {
        out_ << "  (function breakpoints are recorded but never stop execution)\n";
      }
      break;
    case Command::Kind::List: {
      const auto& bps = stepper_.breakpoints();
      if (bps.empty()) {
        out_ << "No breakpoints set.\n";
        break;
      }
      out_ << "Breakpoints:\n";
      for (size_t i = 0; i < bps.size(); ++i) { out_ << "  [" << i << "]: " << bps[i].describe() << "\n"; }
      break;
    }
    case Command::Kind::Clear:
      if (stepper_.clearBreakpoint(cmd.index)) { out_ << "Cleared breakpoint: " << cmd.index << "\n"; }
      else { printError("Invalid breakpoint: " + std::to_string(cmd.index)); }
      break;
    case Command::Kind::Help:
      printHelp();
      break;
    case Command::Kind::Quit:
      return true;
    default:
      break;
  }
  return false;
}

int Repl::run() {
  out_ << "unihir interactive debugger\n";
  out_ << "Type 'help' for help, 'step' to step, 'quit' to quit\n";
  int executed = 0;
  std::string line;
  while (true) {
    out_ << "(unihir-debug) " << std::flush;
    if (!std::getline(in_, line)) { break; }
    Command cmd;
    std::string err;
    if (!parseCommand(line, cmd, err)) {
      printError(err);
      continue;
    }
    ++executed;
    if (handle(cmd)) { break; }
  }
  out_ << "\nExiting debugger.\n";
  return executed;
}

} // namespace unihir::debugger
