/***
 * Name: unihir::hir::*::clone
 * Purpose: Deep-copy unified HIR nodes (the optimizer works on a copy so the
 *   debugger can keep the pre-optimization tree).
 */
#include "hir/Nodes.h"

#include <memory>
#include <utility>
#include <vector>

namespace unihir::hir {

static std::vector<std::unique_ptr<Node>> cloneAll(const std::vector<std::unique_ptr<Node>>& nodes) {
  std::vector<std::unique_ptr<Node>> out;
  out.reserve(nodes.size());
  for (const auto& node : nodes) {
    if (node) { out.emplace_back(node->clone()); }
  }
  return out;
}

std::unique_ptr<Node> Call::clone() const {
  auto copy = std::make_unique<Call>(id, sourceLanguage, targetLanguage, callee, meta);
  copy->args = cloneAll(args);
  copy->inferredType = inferredType;
  copy->crossMapping = crossMapping;
  copy->receiverDropped = receiverDropped;
  return copy;
}

std::unique_ptr<Node> Variable::clone() const {
  return std::make_unique<Variable>(id, name, varType, sourceLanguage, meta);
}

std::unique_ptr<Node> Literal::clone() const {
  return std::make_unique<Literal>(id, value, litType, sourceLanguage, meta);
}

std::unique_ptr<Node> Function::clone() const {
  auto copy = std::make_unique<Function>(id, name, sourceLanguage, meta);
  copy->params = params;
  copy->returnType = returnType;
  copy->body = cloneAll(body);
  copy->crossMapping = crossMapping;
  return copy;
}

std::unique_ptr<Node> Module::clone() const {
  auto copy = std::make_unique<Module>(id, name, sourceLanguage, meta);
  copy->declarations = cloneAll(declarations);
  return copy;
}

} // namespace unihir::hir
