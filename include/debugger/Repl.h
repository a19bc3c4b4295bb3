/***
 * Name: unihir::debugger::Repl
 * Purpose: Interactive command loop over a Stepper.
 * Inputs: Lines from any std::istream
 * Outputs: Prompts, results and errors to any std::ostream
 * Theory of Operation:
 *   Reads until `quit` or end of input. Parse errors and failed steps are
 *   reported and the loop continues; a failed step is acknowledged once it
 *   has been shown, so the next `step` retries the same phase.
 */
#pragma once

#include <istream>
#include <ostream>

#include "debugger/Command.h"
#include "debugger/Stepper.h"

namespace unihir::debugger {

class Repl {
 public:
  Repl(Stepper& stepper, std::istream& in, std::ostream& out, bool color = false)
      : stepper_(stepper), in_(in), out_(out), color_(color) {}

  // Returns the number of commands executed.
  int run();

 private:
  Stepper& stepper_;
  std::istream& in_;
  std::ostream& out_;
  bool color_;

  bool handle(const Command& cmd); // true to quit
  void report(const StepOutcome& outcome);
  void printHelp();
  void printError(const std::string& msg);
};

} // namespace unihir::debugger
