/***
 * Name: unihir::opt::BoundaryElimination
 * Purpose: Remove the Python/C call boundary from unified calls.
 * Inputs:
 *   - hir::Node (mutable)
 * Outputs:
 *   - Number of boundaries eliminated.
 * Theory of Operation:
 *   Every Call with a cross mapping whose boundary is still present is
 *   retargeted to Rust and its mapping marked eliminated. Recurses through
 *   call arguments and function/module bodies. Already eliminated calls are
 *   left alone, so a second run reports zero.
 */
#pragma once

#include <cstddef>

#include "opt/Pass.h"

namespace unihir::opt {

class BoundaryElimination : public Pass {
 public:
  size_t run(hir::Node& root) override;
  const char* name() const override { return "boundary_elimination"; }
};

} // namespace unihir::opt
