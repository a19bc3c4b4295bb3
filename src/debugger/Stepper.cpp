/***
 * Name: unihir::debugger::Stepper (impl)
 * Purpose: Per-phase work, commit rules and breakpoint matching.
 */
#include "debugger/Stepper.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "codegen/RustCodegen.h"
#include "frontend/TracerCFrontend.h"
#include "frontend/TracerPythonFrontend.h"
#include "opt/OptimizationPipeline.h"
#include "unify/PatternRegistry.h"
#include "unify/Unifier.h"
#include "unihir/exceptions/unihir_exception.h"
#include "unihir/support/fs.h"

namespace unihir::debugger {

Stepper::Stepper(std::string pythonFile, std::string cFile, std::unique_ptr<frontend::PythonFrontend> pythonFrontend,
                 std::unique_ptr<frontend::CFrontend> cFrontend)
    : pythonFrontend_(std::move(pythonFrontend)), cFrontend_(std::move(cFrontend)) {
  state_.pythonFile = std::move(pythonFile);
  state_.cFile = std::move(cFile);
  if (!pythonFrontend_) { pythonFrontend_ = std::make_unique<frontend::TracerPythonFrontend>(); }
  if (!cFrontend_) { cFrontend_ = std::make_unique<frontend::TracerCFrontend>(); }
}

Stepper Stepper::fromSources(std::string pythonFile, std::string pythonSource, std::string cFile,
                             std::string cSource) {
  Stepper stepper(std::move(pythonFile), std::move(cFile));
  stepper.presetPython_ = std::move(pythonSource);
  stepper.presetC_ = std::move(cSource);
  return stepper;
}

bool Stepper::clearBreakpoint(const size_t index) {
  if (index >= breakpoints_.size()) { return false; }
  breakpoints_.erase(breakpoints_.begin() + static_cast<std::ptrdiff_t>(index));
  return true;
}

Stepper::PhaseResult Stepper::loadPython() {
  PhaseResult r;
  std::string text = presetPython_ ? *presetPython_ : support::LoadFile(state_.pythonFile);
  r.summary = "read " + std::to_string(text.size()) + " bytes from " + state_.pythonFile;
  state_.pythonSource = std::move(text);
  return r;
}

Stepper::PhaseResult Stepper::lowerPython() {
  PhaseResult r;
  auto module = pythonFrontend_->lower(*state_.pythonSource, state_.pythonFile);
  const pyhir::Call* call = pyhir::firstCall(*module);
  r.summary = "lowered module '" + module->name + "' (" + std::to_string(module->body.size()) + " top-level items)";
  if (call != nullptr) { r.summary += ", call " + hir::to_string(call->id) + " selected"; }
  state_.pythonHir = std::move(module);
  return r;
}

Stepper::PhaseResult Stepper::loadC() {
  PhaseResult r;
  std::string text = presetC_ ? *presetC_ : support::LoadFile(state_.cFile);
  r.summary = "read " + std::to_string(text.size()) + " bytes from " + state_.cFile;
  state_.cSource = std::move(text);
  return r;
}

Stepper::PhaseResult Stepper::lowerC() {
  PhaseResult r;
  auto unit = cFrontend_->lower(*state_.cSource, state_.cFile);
  const chir::Function* fn = chir::firstFunction(*unit);
  r.summary = "lowered translation unit '" + unit->name + "' (" + std::to_string(unit->declarations.size()) +
              " declarations)";
  if (fn != nullptr) { r.summary += ", function '" + fn->name + "' selected"; }
  state_.cHir = std::move(unit);
  return r;
}

Stepper::PhaseResult Stepper::unify() {
  PhaseResult r;
  const pyhir::Call* call = pyhir::firstCall(*state_.pythonHir);
  if (call == nullptr) { r.error = "no call found in " + state_.pythonFile; return r; }
  const chir::Function* fn = chir::firstFunction(*state_.cHir);
  if (fn == nullptr) { r.error = "no function found in " + state_.cFile; return r; }

  const unify::Unifier unifier;
  auto result = unifier.unify(*call, *fn);
  if (!result.ok()) {
    r.error = result.error ? result.error->render() : std::string("unification failed");
    return r;
  }
  const auto pattern = result.call->crossMapping->pattern();
  const unify::PatternEntry* entry = unify::PatternRegistry::byPattern(pattern);
  r.summary = "unified " + (entry != nullptr ? entry->describe() : std::string(hir::to_string(pattern)));
  for (auto& d : result.diagnostics) { state_.diagnostics.push_back(std::move(d)); }
  state_.unifiedHir = std::move(result.call);
  return r;
}

Stepper::PhaseResult Stepper::optimize() {
  PhaseResult r;
  auto copy = state_.unifiedHir->clone();
  auto pipeline = opt::OptimizationPipeline::standard();
  r.boundariesEliminated = pipeline.run(*copy);
  r.summary = std::to_string(pipeline.passCount()) + " pass(es), " + std::to_string(r.boundariesEliminated) +
              " boundary(ies) eliminated";
  for (const auto& [key, value] : pipeline.stats()) { state_.optimizerStats[key] = value; }
  state_.optimizedHir = std::move(copy);
  return r;
}

Stepper::PhaseResult Stepper::generate() {
  PhaseResult r;
  const codegen::RustCodegen gen;
  std::string text;
  r.error = gen.emit(*state_.optimizedHir, text);
  if (!r.error.empty()) { return r; }
  r.summary = "emitted: " + text;
  state_.generatedText = std::move(text);
  return r;
}

Stepper::PhaseResult Stepper::runPhase(const Phase target) {
  try {
    switch (target) {
      case Phase::PythonParsed: return loadPython();
      case Phase::PythonHIR: return lowerPython();
      case Phase::CParsed: return loadC();
      case Phase::CHIR: return lowerC();
      case Phase::UnifiedHIR: return unify();
      case Phase::Optimized: return optimize();
      case Phase::RustGenerated: return generate();
      case Phase::Complete: {
        PhaseResult r;
        r.summary = "transpilation complete";
        return r;
      }
      default: {
        PhaseResult r;
        r.error = std::string("cannot enter phase ") + to_string(target);
        return r;
      }
    }
  } catch (const exceptions::UnihirException& ex) {
    PhaseResult r;
    r.error = ex.what();
    return r;
  }
}

StepOutcome Stepper::step() {
  if (pendingError_) {
    StepOutcome blockedOutcome = *pendingError_;
    blockedOutcome.status = StepStatus::Blocked;
    return blockedOutcome;
  }
  const auto target = next(state_.phase);
  if (!target) { return StepOutcome{StepStatus::NothingToDo, state_.phase, "nothing to do", std::nullopt}; }

  PhaseResult result = runPhase(*target);
  if (!result.error.empty()) {
    StepOutcome failed{StepStatus::Failed, *target, std::move(result.error), std::nullopt};
    pendingError_ = failed;
    return failed;
  }
  const Phase from = state_.phase;
  state_.phase = *target;
  ++state_.stepCount;
  state_.history.push_back(Transformation{from, *target, state_.stepCount, result.summary, result.boundariesEliminated});
  return StepOutcome{StepStatus::Advanced, *target, std::move(result.summary), std::nullopt};
}

std::optional<size_t> Stepper::matchBreakpoint(const Transformation& t) const {
  for (size_t i = 0; i < breakpoints_.size(); ++i) {
    const auto& bp = breakpoints_[i];
    switch (bp.kind) {
      case Breakpoint::Kind::BoundaryElimination:
        if (t.boundariesEliminated > 0) { return i; }
        break;
      case Breakpoint::Kind::Phase:
        if (phaseNameMatches(t.to, bp.name)) { return i; }
        break;
      case Breakpoint::Kind::Function:
        // Accepted for listing; never stops execution.
        break;
      default:
        break;
    }
  }
  return std::nullopt;
}

StepOutcome Stepper::continueUntilBreakpoint() {
  StepOutcome last = step();
  while (last.status == StepStatus::Advanced) {
    last.breakpointHit = matchBreakpoint(state_.history.back());
    if (last.breakpointHit || state_.complete()) { return last; }
    last = step();
  }
  return last;
}

} // namespace unihir::debugger
