/***
 * Name: unihir::unify::PatternRegistry
 * Purpose: Closed table of known Python/C operation equivalences.
 * Inputs:
 *   - Python operation name and C function name (exact strings).
 * Outputs:
 *   - The matching entry (target operation, result type, minimum arity),
 *     or suggestions for near misses.
 * Theory of Operation:
 *   The table is built once on first use and never changes afterwards.
 *   Matching is an exact lookup on the (python, c) pair; the table itself is
 *   plain data kept apart from the unifier's logic.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "hir/Pattern.h"
#include "hir/Type.h"

namespace unihir::unify {

struct PatternEntry {
  std::string pythonName;
  std::string cName;
  hir::UnificationPattern pattern;
  std::string rustOp;     // e.g. "Vec::len"
  hir::Type resultType;
  size_t minArgs;         // receiver included

  // "len() + list_length() -> Vec::len()"
  std::string describe() const;
};

class PatternRegistry {
 public:
  static const std::vector<PatternEntry>& all();

  // Null when the pair is not registered.
  static const PatternEntry* find(std::string_view pythonName, std::string_view cName);

  static const PatternEntry* byPattern(hir::UnificationPattern pattern);

  // Entries whose names overlap the requested ones (either containing the
  // other), in declaration order without duplicates and capped at `limit`;
  // the first three entries when nothing overlaps.
  static std::vector<const PatternEntry*> suggestionsFor(std::string_view pythonName, std::string_view cName,
                                                         size_t limit = 5);
};

} // namespace unihir::unify
