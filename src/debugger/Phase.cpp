/***
 * Name: unihir::debugger::Phase (impl)
 * Purpose: Phase ordering, display names and case-insensitive name lookup.
 */
#include "debugger/Phase.h"

#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace unihir::debugger {

static std::string normalize(const std::string_view text) {
  std::string out;
  for (const char c : text) {
    if (c == ' ' || c == '_' || c == '-') { continue; }
    out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::optional<Phase> next(const Phase phase) {
  switch (phase) {
    case Phase::Start: return Phase::PythonParsed;
    case Phase::PythonParsed: return Phase::PythonHIR;
    case Phase::PythonHIR: return Phase::CParsed;
    case Phase::CParsed: return Phase::CHIR;
    case Phase::CHIR: return Phase::UnifiedHIR;
    case Phase::UnifiedHIR: return Phase::Optimized;
    case Phase::Optimized: return Phase::RustGenerated;
    case Phase::RustGenerated: return Phase::Complete;
    default: return std::nullopt;
  }
}

bool phaseNameMatches(const Phase phase, const std::string_view name) {
  const std::string wanted = normalize(name);
  return !wanted.empty() && wanted == normalize(to_string(phase));
}

std::optional<Phase> phaseFromName(const std::string_view name) {
  std::optional<Phase> phase = Phase::Start;
  while (phase) {
    if (phaseNameMatches(*phase, name)) { return phase; }
    phase = next(*phase);
  }
  return std::nullopt;
}

} // namespace unihir::debugger
