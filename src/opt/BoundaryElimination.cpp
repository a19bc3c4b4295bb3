/***
 * Name: unihir::opt::BoundaryElimination (impl)
 * Purpose: Mutating visitor marking cross-language calls as Rust-native.
 */
#include "opt/BoundaryElimination.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "hir/Nodes.h"
#include "hir/Visitor.h"

namespace unihir::opt {

namespace {

struct EliminateVisitor {
  std::unordered_map<std::string, uint64_t>& stats;
  size_t changes{0};

  explicit EliminateVisitor(std::unordered_map<std::string, uint64_t>& s) : stats(s) {}

  void walk(std::vector<std::unique_ptr<hir::Node>>& nodes) {
    for (auto& node : nodes) {
      if (node) { hir::dispatch(*node, *this); }
    }
  }

  void visit(hir::Module& m) { walk(m.declarations); }
  void visit(hir::Function& f) { walk(f.body); }
  void visit(hir::Call& call) {
    ++stats["calls_visited"];
    if (call.crossMapping && call.crossMapping->eliminateBoundary()) {
      call.targetLanguage = hir::Language::Rust;
      ++stats["boundaries_eliminated"];
      ++changes;
    }
    walk(call.args);
  }
  void visit(hir::Variable&) {}
  void visit(hir::Literal&) {}
};

} // namespace

size_t BoundaryElimination::run(hir::Node& root) {
  EliminateVisitor v(stats_);
  hir::dispatch(root, v);
  return v.changes;
}

} // namespace unihir::opt
