/***
 * Name: unihir::debugger::Stepper::visualize / inspect
 * Purpose: Read-only renderings of the transpilation state.
 */
#include "debugger/Stepper.h"

#include <cctype>
#include <sstream>
#include <string>
#include <string_view>

#include "hir/Equality.h"
#include "observability/HirPrinter.h"

namespace unihir::debugger {

static std::string lower(const std::string_view s) {
  std::string out;
  for (const char c : s) { out += static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }
  return out;
}

static void section(std::ostringstream& oss, const char* title, const std::string& body) {
  oss << "\n-- " << title << " --\n" << body;
  if (!body.empty() && body.back() != '\n') { oss << "\n"; }
}

std::string Stepper::visualize() const {
  std::ostringstream oss;
  oss << "=== State at Step " << state_.stepCount << " ===\n";
  oss << "Phase: " << to_string(state_.phase) << "\n";
  oss << "Python: " << state_.pythonFile << "\n";
  oss << "C:      " << state_.cFile << "\n";
  if (state_.pythonHir) { section(oss, "Python HIR", pyhir::dump(*state_.pythonHir)); }
  if (state_.cHir) { section(oss, "C HIR", chir::dump(*state_.cHir)); }
  obs::HirPrinter printer;
  if (state_.unifiedHir) {
    section(oss, "Unified HIR", printer.print(*state_.unifiedHir));
  }
  if (state_.optimizedHir) {
    section(oss, "Optimized HIR", printer.print(*state_.optimizedHir));
    if (state_.unifiedHir && !hir::equals(*state_.unifiedHir, *state_.optimizedHir)) {
      oss << "(optimizer changed the tree)\n";
    }
  }
  if (state_.generatedText) { section(oss, "Rust", *state_.generatedText); }
  if (!state_.diagnostics.empty()) {
    std::string diags;
    for (const auto& d : state_.diagnostics) { diags += std::string(diag::to_string(d.severity)) + ": " + d.message + "\n"; }
    section(oss, "Diagnostics", diags);
  }
  if (!state_.history.empty()) {
    std::string hist;
    for (const auto& t : state_.history) {
      hist += std::to_string(t.stepNumber) + ". " + to_string(t.from) + " -> " + to_string(t.to) + ": " + t.summary + "\n";
    }
    section(oss, "Transformations", hist);
  }
  return oss.str();
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
bool Stepper::inspect(const std::string_view target, std::string& out) const {
  const std::string t = lower(target);
  if (t == "python" || t == "dynamic" || t == "python_hir") {
    out = state_.pythonHir ? pyhir::dump(*state_.pythonHir) : "Python HIR not yet available\n";
    return true;
  }
  if (t == "c" || t == "systems" || t == "c_hir") {
    out = state_.cHir ? chir::dump(*state_.cHir) : "C HIR not yet available\n";
    return true;
  }
  obs::HirPrinter printer;
  if (t == "unified") {
    out = state_.unifiedHir ? printer.print(*state_.unifiedHir) : "Unified HIR not yet available\n";
    return true;
  }
  if (t == "optimized") {
    out = state_.optimizedHir ? printer.print(*state_.optimizedHir) : "Optimized HIR not yet available\n";
    return true;
  }
  if (t == "rust" || t == "target") {
    out = state_.generatedText ? *state_.generatedText + "\n" : "Rust code not yet generated\n";
    return true;
  }
  out = "Unknown target: " + std::string(target) + "\n";
  return false;
}

} // namespace unihir::debugger
