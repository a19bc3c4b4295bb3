/***
 * Name: unihir::pyhir
 * Purpose: Python-side HIR as handed to the unifier by a Python frontend.
 * Theory of Operation:
 *   A plain owning tree. Only the shapes the unifier consumes are modeled:
 *   modules of functions, single-expression returns, calls, names,
 *   attributes and literals. Ids come from the frontend's IdAllocator.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "hir/LiteralValue.h"
#include "hir/Metadata.h"
#include "hir/NodeId.h"
#include "hir/Type.h"
#include "pyhir/NodeKind.h"

namespace unihir::pyhir {

struct Node {
  NodeKind kind;
  hir::NodeId id;
  hir::Metadata meta;
  Node(const NodeKind k, const hir::NodeId i, hir::Metadata m) : kind(k), id(i), meta(std::move(m)) {}
  virtual ~Node() = default;
};

struct Variable final : Node {
  std::string name;
  std::optional<hir::Type> inferredType{};
  Variable(const hir::NodeId i, std::string n, hir::Metadata m = {})
      : Node(NodeKind::Variable, i, std::move(m)), name(std::move(n)) {}
};

struct Literal final : Node {
  hir::LiteralValue value;
  Literal(const hir::NodeId i, hir::LiteralValue v, hir::Metadata m = {})
      : Node(NodeKind::Literal, i, std::move(m)), value(std::move(v)) {}
};

struct Attribute final : Node {
  std::unique_ptr<Node> object; // receiver expression
  std::string attr;
  Attribute(const hir::NodeId i, std::unique_ptr<Node> obj, std::string a, hir::Metadata m = {})
      : Node(NodeKind::Attribute, i, std::move(m)), object(std::move(obj)), attr(std::move(a)) {}
};

struct Call final : Node {
  std::unique_ptr<Node> callee; // Variable or Attribute
  std::vector<std::unique_ptr<Node>> args{};
  Call(const hir::NodeId i, std::unique_ptr<Node> c, hir::Metadata m = {})
      : Node(NodeKind::Call, i, std::move(m)), callee(std::move(c)) {}
};

struct Return final : Node {
  std::unique_ptr<Node> value; // may be null for a bare `return`
  Return(const hir::NodeId i, std::unique_ptr<Node> v, hir::Metadata m = {})
      : Node(NodeKind::Return, i, std::move(m)), value(std::move(v)) {}
};

struct Param {
  std::string name;
  std::optional<hir::Type> annotation{};
};

struct Function final : Node {
  std::string name;
  std::vector<Param> params{};
  std::vector<std::unique_ptr<Node>> body{};
  Function(const hir::NodeId i, std::string n, hir::Metadata m = {})
      : Node(NodeKind::Function, i, std::move(m)), name(std::move(n)) {}
};

struct Module final : Node {
  std::string name;
  std::vector<std::unique_ptr<Node>> body{};
  Module(const hir::NodeId i, std::string n, hir::Metadata m = {})
      : Node(NodeKind::Module, i, std::move(m)), name(std::move(n)) {}
};

// First call a stepper can unify: the value of the first function's first
// `return`, or else the first module-level call. Null when there is none.
const Call* firstCall(const Module& module);

const Node* findById(const Node& root, hir::NodeId id);

// Indented tree dump for inspect/visualize.
std::string dump(const Node& root);

} // namespace unihir::pyhir
