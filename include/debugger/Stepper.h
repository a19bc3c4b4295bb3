/***
 * Name: unihir::debugger::Stepper
 * Purpose: Drive the transpilation pipeline one phase at a time.
 * Inputs:
 *   - Python and C file names (sources loaded at their Parsed phases, or
 *     supplied up front), frontends, breakpoints.
 * Outputs:
 *   - StepOutcome per step; the accumulated TranspilationState.
 * Theory of Operation:
 *   step() runs the work of the next phase and only then commits: the phase
 *   advances by exactly one, stepCount grows, and one Transformation is
 *   appended. A failing phase commits nothing and blocks the stepper until
 *   acknowledgeError(). Environment failures (files, frontends, optimizer
 *   passes) arrive as exceptions and are turned into failed outcomes here.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "debugger/Breakpoint.h"
#include "debugger/Phase.h"
#include "debugger/TranspilationState.h"
#include "frontend/Frontend.h"

namespace unihir::debugger {

enum class StepStatus { Advanced, NothingToDo, Failed, Blocked };

inline const char* to_string(const StepStatus s) {
  switch (s) {
    case StepStatus::Advanced: return "advanced";
    case StepStatus::NothingToDo: return "nothing to do";
    case StepStatus::Failed: return "failed";
    case StepStatus::Blocked: return "blocked";
    default: return "unknown";
  }
}

struct StepOutcome {
  StepStatus status{StepStatus::Advanced};
  Phase phase{Phase::Start};          // entered phase, or the phase that failed
  std::string message{};              // summary or error text
  std::optional<size_t> breakpointHit{}; // index into breakpoints()

  bool ok() const { return status == StepStatus::Advanced || status == StepStatus::NothingToDo; }
};

class Stepper {
 public:
  Stepper(std::string pythonFile, std::string cFile,
          std::unique_ptr<frontend::PythonFrontend> pythonFrontend = nullptr,
          std::unique_ptr<frontend::CFrontend> cFrontend = nullptr);

  // Sources given here are used at the Parsed phases instead of reading files.
  static Stepper fromSources(std::string pythonFile, std::string pythonSource, std::string cFile,
                             std::string cSource);

  const TranspilationState& state() const { return state_; }

  StepOutcome step();
  // Steps until Complete, a failure, or a breakpoint matching the
  // transition just made.
  StepOutcome continueUntilBreakpoint();

  bool blocked() const { return pendingError_.has_value(); }
  const std::optional<StepOutcome>& pendingError() const { return pendingError_; }
  void acknowledgeError() { pendingError_.reset(); }

  void addBreakpoint(Breakpoint bp) { breakpoints_.push_back(std::move(bp)); }
  const std::vector<Breakpoint>& breakpoints() const { return breakpoints_; }
  bool clearBreakpoint(size_t index);

  std::string visualize() const;
  // Text of an artifact; false for an unknown target.
  bool inspect(std::string_view target, std::string& out) const;

 private:
  TranspilationState state_{};
  std::unique_ptr<frontend::PythonFrontend> pythonFrontend_;
  std::unique_ptr<frontend::CFrontend> cFrontend_;
  std::optional<std::string> presetPython_{};
  std::optional<std::string> presetC_{};
  std::vector<Breakpoint> breakpoints_{};
  std::optional<StepOutcome> pendingError_{};

  struct PhaseResult {
    std::string error{};
    std::string summary{};
    size_t boundariesEliminated{0};
  };

  PhaseResult runPhase(Phase target);
  PhaseResult loadPython();
  PhaseResult lowerPython();
  PhaseResult loadC();
  PhaseResult lowerC();
  PhaseResult unify();
  PhaseResult optimize();
  PhaseResult generate();

  std::optional<size_t> matchBreakpoint(const Transformation& t) const;
};

} // namespace unihir::debugger
