/***
 * Name: unihir::pyhir tree queries
 * Purpose: Locate the unifiable call, resolve ids, and dump the tree.
 */
#include "pyhir/Nodes.h"

#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace unihir::pyhir {

const Call* firstCall(const Module& module) {
  for (const auto& item : module.body) {
    if (!item || item->kind != NodeKind::Function) { continue; }
    const auto& fn = static_cast<const Function&>(*item);
    for (const auto& stmt : fn.body) {
      if (!stmt || stmt->kind != NodeKind::Return) { continue; }
      const auto& ret = static_cast<const Return&>(*stmt);
      if (ret.value && ret.value->kind == NodeKind::Call) { return static_cast<const Call*>(ret.value.get()); }
    }
  }
  for (const auto& item : module.body) {
    if (item && item->kind == NodeKind::Call) { return static_cast<const Call*>(item.get()); }
  }
  return nullptr;
}

static std::vector<const Node*> childrenOf(const Node& node) {
  std::vector<const Node*> out;
  switch (node.kind) {
    case NodeKind::Module:
      for (const auto& c : static_cast<const Module&>(node).body) { out.push_back(c.get()); }
      break;
    case NodeKind::Function:
      for (const auto& c : static_cast<const Function&>(node).body) { out.push_back(c.get()); }
      break;
    case NodeKind::Return:
      out.push_back(static_cast<const Return&>(node).value.get());
      break;
    case NodeKind::Call: {
      const auto& call = static_cast<const Call&>(node);
      out.push_back(call.callee.get());
      for (const auto& a : call.args) { out.push_back(a.get()); }
      break;
    }
    case NodeKind::Attribute:
      out.push_back(static_cast<const Attribute&>(node).object.get());
      break;
    default:
      break;
  }
  return out;
}

const Node* findById(const Node& root, const hir::NodeId id) {
  if (root.id == id) { return &root; }
  for (const Node* child : childrenOf(root)) {
    if (child == nullptr) { continue; }
    if (const Node* hit = findById(*child, id)) { return hit; }
  }
  return nullptr;
}

static std::string describe(const Node& node) {
  std::string out = std::string(to_string(node.kind)) + " " + hir::to_string(node.id);
  switch (node.kind) {
    case NodeKind::Module: out += " name=" + static_cast<const Module&>(node).name; break;
    case NodeKind::Function: {
      const auto& fn = static_cast<const Function&>(node);
      out += " name=" + fn.name + " params=(";
      for (size_t i = 0; i < fn.params.size(); ++i) {
        if (i != 0) { out += ", "; }
        out += fn.params[i].name;
      }
      out += ")";
      break;
    }
    case NodeKind::Variable: out += " name=" + static_cast<const Variable&>(node).name; break;
    case NodeKind::Literal: out += " value=" + hir::to_string(static_cast<const Literal&>(node).value); break;
    case NodeKind::Attribute: out += " attr=" + static_cast<const Attribute&>(node).attr; break;
    default: break;
  }
  if (node.meta.source) { out += " @L" + std::to_string(node.meta.source->line); }
  return out;
}

static void dumpInto(const Node& node, const int depth, std::ostringstream& oss) {
  oss << std::string(static_cast<size_t>(depth) * 2, ' ') << describe(node) << "\n";
  for (const Node* child : childrenOf(node)) {
    if (child != nullptr) { dumpInto(*child, depth + 1, oss); }
  }
}

std::string dump(const Node& root) {
  std::ostringstream oss;
  dumpInto(root, 0, oss);
  return oss.str();
}

} // namespace unihir::pyhir
