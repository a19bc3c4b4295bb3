/***
 * Name: unihir::chir
 * Purpose: C-side HIR as handed to the unifier by a C frontend.
 * Theory of Operation:
 *   Function bodies are not modeled; unification only needs the name,
 *   signature and storage class of a function. CPython API functions are
 *   recognized by name prefix.
 */
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "hir/LiteralValue.h"
#include "hir/Metadata.h"
#include "hir/NodeId.h"
#include "hir/Type.h"
#include "chir/NodeKind.h"

namespace unihir::chir {

enum class StorageClass { None, Static, Extern };

struct Node {
  NodeKind kind;
  hir::NodeId id;
  hir::Metadata meta;
  Node(const NodeKind k, const hir::NodeId i, hir::Metadata m) : kind(k), id(i), meta(std::move(m)) {}
  virtual ~Node() = default;
};

struct Variable final : Node {
  std::string name;
  hir::Type varType{};
  Variable(const hir::NodeId i, std::string n, hir::Type t, hir::Metadata m = {})
      : Node(NodeKind::Variable, i, std::move(m)), name(std::move(n)), varType(std::move(t)) {}
};

struct Literal final : Node {
  hir::LiteralValue value;
  Literal(const hir::NodeId i, hir::LiteralValue v, hir::Metadata m = {})
      : Node(NodeKind::Literal, i, std::move(m)), value(std::move(v)) {}
};

struct Param {
  std::string name;
  hir::Type type{};
};

struct Function final : Node {
  std::string name;
  hir::Type returnType{};
  std::vector<Param> params{};
  StorageClass storage{StorageClass::None};
  bool hasBody{false}; // definition vs prototype
  Function(const hir::NodeId i, std::string n, hir::Type ret, hir::Metadata m = {})
      : Node(NodeKind::Function, i, std::move(m)), name(std::move(n)), returnType(std::move(ret)) {}
};

struct TranslationUnit final : Node {
  std::string name;
  std::vector<std::unique_ptr<Node>> declarations{};
  TranslationUnit(const hir::NodeId i, std::string n, hir::Metadata m = {})
      : Node(NodeKind::TranslationUnit, i, std::move(m)), name(std::move(n)) {}
};

inline bool isCPythonApi(const std::string_view name) {
  return name.rfind("Py", 0) == 0 || name.rfind("_Py", 0) == 0;
}

inline const char* to_string(const StorageClass sc) {
  switch (sc) {
    case StorageClass::Static: return "static";
    case StorageClass::Extern: return "extern";
    default: return "";
  }
}

const Function* firstFunction(const TranslationUnit& unit);

const Node* findById(const Node& root, hir::NodeId id);

std::string dump(const Node& root);

} // namespace unihir::chir
