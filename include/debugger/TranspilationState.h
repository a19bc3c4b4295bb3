/***
 * Name: unihir::debugger::TranspilationState
 * Purpose: Everything the pipeline has produced so far, one field per phase.
 * Theory of Operation:
 *   Owned exclusively by a Stepper. Created at Phase::Start, filled in place
 *   as phases complete and never rolled back. Fields of phases not reached
 *   yet are empty.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "chir/Nodes.h"
#include "debugger/Phase.h"
#include "diag/Diagnostic.h"
#include "hir/Node.h"
#include "pyhir/Nodes.h"

namespace unihir::debugger {

struct Transformation {
  Phase from;
  Phase to;
  size_t stepNumber{0};
  std::string summary{};
  size_t boundariesEliminated{0};
};

struct TranspilationState {
  Phase phase{Phase::Start};
  std::string pythonFile{};
  std::string cFile{};
  std::optional<std::string> pythonSource{};
  std::unique_ptr<pyhir::Module> pythonHir{};
  std::optional<std::string> cSource{};
  std::unique_ptr<chir::TranslationUnit> cHir{};
  std::unique_ptr<hir::Node> unifiedHir{};
  std::unique_ptr<hir::Node> optimizedHir{};
  std::map<std::string, uint64_t> optimizerStats{}; // "<pass>.<counter>"
  std::optional<std::string> generatedText{};
  size_t stepCount{0};
  std::vector<Transformation> history{};
  std::vector<diag::Diagnostic> diagnostics{};

  bool complete() const { return phase == Phase::Complete; }
};

} // namespace unihir::debugger
