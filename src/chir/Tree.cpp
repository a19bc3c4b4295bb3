/***
 * Name: unihir::chir tree queries
 * Purpose: Locate the unifiable function, resolve ids, and dump the tree.
 */
#include "chir/Nodes.h"

#include <memory>
#include <sstream>
#include <string>

namespace unihir::chir {

const Function* firstFunction(const TranslationUnit& unit) {
  const Function* prototype = nullptr;
  for (const auto& decl : unit.declarations) {
    if (!decl || decl->kind != NodeKind::Function) { continue; }
    const auto* fn = static_cast<const Function*>(decl.get());
    if (fn->hasBody) { return fn; }
    if (prototype == nullptr) { prototype = fn; }
  }
  return prototype;
}

const Node* findById(const Node& root, const hir::NodeId id) {
  if (root.id == id) { return &root; }
  if (root.kind != NodeKind::TranslationUnit) { return nullptr; }
  for (const auto& decl : static_cast<const TranslationUnit&>(root).declarations) {
    if (decl && decl->id == id) { return decl.get(); }
  }
  return nullptr;
}

static std::string describe(const Node& node) {
  std::ostringstream oss;
  oss << to_string(node.kind) << " " << hir::to_string(node.id);
  switch (node.kind) {
    case NodeKind::TranslationUnit: oss << " name=" << static_cast<const TranslationUnit&>(node).name; break;
    case NodeKind::Function: {
      const auto& fn = static_cast<const Function&>(node);
      oss << " ";
      if (fn.storage != StorageClass::None) { oss << to_string(fn.storage) << " "; }
      oss << hir::to_string(fn.returnType) << " " << fn.name << "(";
      for (size_t i = 0; i < fn.params.size(); ++i) {
        if (i != 0) { oss << ", "; }
        oss << hir::to_string(fn.params[i].type);
        if (!fn.params[i].name.empty()) { oss << " " << fn.params[i].name; }
      }
      oss << ")";
      if (isCPythonApi(fn.name)) { oss << " [cpython-api]"; }
      if (!fn.hasBody) { oss << " [prototype]"; }
      break;
    }
    case NodeKind::Variable: {
      const auto& var = static_cast<const Variable&>(node);
      oss << " " << hir::to_string(var.varType) << " " << var.name;
      break;
    }
    case NodeKind::Literal: oss << " value=" << hir::to_string(static_cast<const Literal&>(node).value); break;
    default: break;
  }
  if (node.meta.source) { oss << " @L" << node.meta.source->line; }
  return oss.str();
}

std::string dump(const Node& root) {
  std::ostringstream oss;
  oss << describe(root) << "\n";
  if (root.kind == NodeKind::TranslationUnit) {
    for (const auto& decl : static_cast<const TranslationUnit&>(root).declarations) {
      if (decl) { oss << "  " << describe(*decl) << "\n"; }
    }
  }
  return oss.str();
}

} // namespace unihir::chir
