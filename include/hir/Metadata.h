/***
 * Name: unihir::hir::Metadata
 * Purpose: Per-node provenance consumed by the debugger's inspect/visualize.
 * Theory of Operation:
 *   Attached when a node is created and held const by the node afterwards.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "hir/Pattern.h"

namespace unihir::hir {

struct SourceLocation {
  std::string file{};
  int line{0};
  int col{0};
};

struct Metadata {
  std::optional<SourceLocation> source{};
  std::optional<UnificationPattern> patternUsed{};
  std::vector<std::string> debugNotes{};

  static Metadata at(std::string file, int line, int col) {
    Metadata m;
    m.source = SourceLocation{std::move(file), line, col};
    return m;
  }
};

} // namespace unihir::hir
