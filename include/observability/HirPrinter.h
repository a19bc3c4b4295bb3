/***
 * Name: unihir::obs::HirPrinter
 * Purpose: Visitor-based unified HIR pretty-printer for inspect/visualize/logs.
 * Inputs:
 *   - hir::Node (any root)
 * Outputs:
 *   - Formatted string with node kinds and salient fields.
 * Theory of Operation:
 *   Implements hir::VisitorBase to traverse nodes, collecting a textual
 *   representation with indentation reflecting tree depth. Cross mappings
 *   print the linked Python/C ids, the pattern and the boundary state.
 */
#pragma once

#include <optional>
#include <sstream>
#include <string>
#include "hir/Nodes.h"
#include "hir/VisitorBase.h"

namespace unihir::obs {

class HirPrinter : public hir::VisitorBase {
 public:
  std::string print(const hir::Node& root) {
    ss_.str(""); ss_.clear(); depth_ = 0;
    root.accept(*this);
    return ss_.str();
  }

  void visit(const hir::Module& m) override {
    line("Module " + m.name + " " + hir::to_string(m.id));
    depth_++;
    for (const auto& d : m.declarations) { if (d) d->accept(*this); }
    depth_--;
  }
  void visit(const hir::Function& f) override {
    std::string params;
    for (const auto& p : f.params) { params += (params.empty() ? "" : ", ") + p.name + ": " + hir::to_string(p.type); }
    line("Function " + f.name + "(" + params + ") -> " + hir::to_string(f.returnType) + " " + hir::to_string(f.id) +
         " [" + hir::to_string(f.sourceLanguage) + "]");
    depth_++;
    mapping(f.crossMapping);
    for (const auto& s : f.body) { if (s) s->accept(*this); }
    depth_--;
  }
  void visit(const hir::Call& c) override {
    line("Call " + c.callee + " " + hir::to_string(c.id) + " [" + hir::to_string(c.sourceLanguage) + " -> " +
         hir::to_string(c.targetLanguage) + "] : " + hir::to_string(c.inferredType));
    depth_++;
    mapping(c.crossMapping);
    for (const auto& a : c.args) { if (a) a->accept(*this); }
    depth_--;
  }
  void visit(const hir::Variable& v) override {
    line("Variable " + v.name + " " + hir::to_string(v.id) + " : " + hir::to_string(v.varType));
  }
  void visit(const hir::Literal& l) override {
    line("Literal " + hir::to_string(l.value) + " " + hir::to_string(l.id) + " : " + hir::to_string(l.litType));
  }

 private:
  void mapping(const std::optional<hir::CrossMapping>& cm) {
    if (!cm) { return; }
    const auto id = [](const std::optional<hir::NodeId>& n) { return n ? hir::to_string(*n) : std::string("-"); };
    line(std::string("CrossMapping python=") + id(cm->pythonNode()) + " c=" + id(cm->cNode()) +
         " pattern=" + hir::to_string(cm->pattern()) + " boundary=" + (cm->boundaryEliminated() ? "eliminated" : "present"));
  }
  void indent() { for (int i = 0; i < depth_; ++i) ss_ << "  "; }
  void line(const std::string& s) { indent(); ss_ << s << "\n"; }
  std::ostringstream ss_{};
  int depth_{0};
};

} // namespace unihir::obs
