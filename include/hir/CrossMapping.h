/***
 * Name: unihir::hir::CrossMapping
 * Purpose: Link a unified node back to the Python and C nodes it came from.
 * Theory of Operation:
 *   The node ids point into the other graphs and are lookups only. The
 *   boundary flag starts false and can only be flipped to true through
 *   eliminateBoundary(); there is no way to reset it. Optimizer and code
 *   generator both read it.
 */
#pragma once

#include <optional>

#include "hir/NodeId.h"
#include "hir/Pattern.h"

namespace unihir::hir {

class CrossMapping {
 public:
  CrossMapping(std::optional<NodeId> pythonNode, std::optional<NodeId> cNode, UnificationPattern pattern)
      : pythonNode_(pythonNode), cNode_(cNode), pattern_(pattern) {}

  const std::optional<NodeId>& pythonNode() const { return pythonNode_; }
  const std::optional<NodeId>& cNode() const { return cNode_; }
  UnificationPattern pattern() const { return pattern_; }
  bool boundaryEliminated() const { return boundaryEliminated_; }

  // Returns true when this call performed the false -> true transition.
  bool eliminateBoundary() {
    if (boundaryEliminated_) { return false; }
    boundaryEliminated_ = true;
    return true;
  }

  bool operator==(const CrossMapping& other) const {
    return pythonNode_ == other.pythonNode_ && cNode_ == other.cNode_ && pattern_ == other.pattern_ &&
           boundaryEliminated_ == other.boundaryEliminated_;
  }

 private:
  std::optional<NodeId> pythonNode_{};
  std::optional<NodeId> cNode_{};
  UnificationPattern pattern_{UnificationPattern::Custom};
  bool boundaryEliminated_{false};
};

} // namespace unihir::hir
