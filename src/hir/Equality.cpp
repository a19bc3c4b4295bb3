/***
 * Name: unihir::hir::equals (impl)
 */
#include "hir/Equality.h"
#include "hir/Nodes.h"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <vector>

namespace unihir::hir {

static bool sameChildren(const std::vector<std::unique_ptr<Node>>& lhs, const std::vector<std::unique_ptr<Node>>& rhs) {
  if (lhs.size() != rhs.size()) { return false; }
  for (size_t i = 0; i < lhs.size(); ++i) {
    if (!lhs[i] || !rhs[i]) {
      if (lhs[i] != rhs[i]) { return false; }
      continue;
    }
    if (!equals(*lhs[i], *rhs[i])) { return false; }
  }
  return true;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
bool equals(const Node& lhs, const Node& rhs) {
  if (lhs.kind != rhs.kind || lhs.id != rhs.id || lhs.sourceLanguage != rhs.sourceLanguage) { return false; }
  if (lhs.meta.patternUsed != rhs.meta.patternUsed) { return false; }
  switch (lhs.kind) {
    case NodeKind::Call: {
      const auto& a = static_cast<const Call&>(lhs);
      const auto& b = static_cast<const Call&>(rhs);
      return a.targetLanguage == b.targetLanguage && a.callee == b.callee && a.inferredType == b.inferredType &&
             a.crossMapping == b.crossMapping && a.receiverDropped == b.receiverDropped && sameChildren(a.args, b.args);
    }
    case NodeKind::Variable: {
      const auto& a = static_cast<const Variable&>(lhs);
      const auto& b = static_cast<const Variable&>(rhs);
      return a.name == b.name && a.varType == b.varType;
    }
    case NodeKind::Literal: {
      const auto& a = static_cast<const Literal&>(lhs);
      const auto& b = static_cast<const Literal&>(rhs);
      return a.value == b.value && a.litType == b.litType;
    }
    case NodeKind::Function: {
      const auto& a = static_cast<const Function&>(lhs);
      const auto& b = static_cast<const Function&>(rhs);
      return a.name == b.name && a.params == b.params && a.returnType == b.returnType &&
             a.crossMapping == b.crossMapping && sameChildren(a.body, b.body);
    }
    case NodeKind::Module: {
      const auto& a = static_cast<const Module&>(lhs);
      const auto& b = static_cast<const Module&>(rhs);
      return a.name == b.name && sameChildren(a.declarations, b.declarations);
    }
    default:
      return false;
  }
}

static const std::vector<std::unique_ptr<Node>>* childrenOf(const Node& node) {
  switch (node.kind) {
    case NodeKind::Call: return &static_cast<const Call&>(node).args;
    case NodeKind::Function: return &static_cast<const Function&>(node).body;
    case NodeKind::Module: return &static_cast<const Module&>(node).declarations;
    default: return nullptr;
  }
}

const Node* findById(const Node& root, const NodeId id) {
  if (root.id == id) { return &root; }
  const auto* children = childrenOf(root);
  if (children == nullptr) { return nullptr; }
  for (const auto& child : *children) {
    if (!child) { continue; }
    if (const Node* hit = findById(*child, id)) { return hit; }
  }
  return nullptr;
}

size_t countNodes(const Node& root) {
  size_t total = 1;
  if (const auto* children = childrenOf(root)) {
    for (const auto& child : *children) {
      if (child) { total += countNodes(*child); }
    }
  }
  return total;
}

size_t maxDepth(const Node& root) {
  size_t deepest = 0;
  if (const auto* children = childrenOf(root)) {
    for (const auto& child : *children) {
      if (child) { deepest = std::max(deepest, maxDepth(*child)); }
    }
  }
  return deepest + 1;
}

} // namespace unihir::hir
