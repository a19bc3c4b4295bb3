/***
 * Name: unihir::opt::OptimizationPipeline (impl)
 */
#include "opt/OptimizationPipeline.h"

#include <memory>
#include <string>
#include <utility>

#include "opt/BoundaryElimination.h"
#include "unihir/exceptions/optimize_error.h"

namespace unihir::opt {

OptimizationPipeline OptimizationPipeline::standard() {
  OptimizationPipeline pipeline;
  pipeline.addPass(std::make_unique<BoundaryElimination>());
  return pipeline;
}

void OptimizationPipeline::addPass(std::unique_ptr<Pass> pass) {
  if (!pass) { throw exceptions::OptimizeError("cannot register a null optimizer pass"); }
  passes_.push_back(std::move(pass));
}

size_t OptimizationPipeline::run(hir::Node& root) {
  size_t total = 0;
  for (const auto& pass : passes_) { total += pass->run(root); }
  return total;
}

std::unordered_map<std::string, uint64_t> OptimizationPipeline::stats() const {
  std::unordered_map<std::string, uint64_t> out;
  for (const auto& pass : passes_) {
    for (const auto& [key, value] : pass->stats()) { out[std::string(pass->name()) + "." + key] += value; }
  }
  return out;
}

} // namespace unihir::opt
