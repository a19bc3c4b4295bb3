/***
 * Name: unihir::opt::OptimizationPipeline
 * Purpose: Ordered list of passes applied to a unified tree.
 * Inputs:
 *   - hir::Node (mutable)
 * Outputs:
 *   - Total rewrites applied; aggregated per-pass stats.
 * Theory of Operation:
 *   Passes run once each, in registration order. An OptimizeError thrown by
 *   a pass propagates to the caller unchanged.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "opt/Pass.h"

namespace unihir::opt {

class OptimizationPipeline {
 public:
  // Exactly one pass: BoundaryElimination.
  static OptimizationPipeline standard();

  void addPass(std::unique_ptr<Pass> pass);
  size_t passCount() const { return passes_.size(); }

  size_t run(hir::Node& root);

  // "<pass>.<counter>" -> value, summed over every run so far.
  std::unordered_map<std::string, uint64_t> stats() const;

 private:
  std::vector<std::unique_ptr<Pass>> passes_{};
};

} // namespace unihir::opt
