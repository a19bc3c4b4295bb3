/***
 * Name: unihir::codegen::RustCodegen (impl)
 * Purpose: Template-driven Rust emission for boundary-free unified HIR.
 */
#include "codegen/RustCodegen.h"

#include <cstddef>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace unihir::codegen {

using hir::TypeKind;
using hir::UnificationPattern;

static constexpr std::string_view kReceiverSlot = "{r}";
static constexpr const char* kFallbackReceiver = "x";
static constexpr int kIndentWidth = 4;

static std::string indent(const int depth) { return std::string(static_cast<size_t>(depth * kIndentWidth), ' '); }

std::optional<std::string_view> RustCodegen::templateFor(const UnificationPattern pattern) {
  switch (pattern) {
    case UnificationPattern::Len: return std::string_view{"{r}.len()"};
    case UnificationPattern::Append: return std::string_view{"{r}.push(item)"};
    case UnificationPattern::DictGet: return std::string_view{"{r}.get(&key)"};
    case UnificationPattern::Reverse: return std::string_view{"{r}.reverse()"};
    case UnificationPattern::Clear: return std::string_view{"{r}.clear()"};
    case UnificationPattern::Pop: return std::string_view{"{r}.pop()"};
    case UnificationPattern::Insert: return std::string_view{"{r}.insert(index, item)"};
    case UnificationPattern::Extend: return std::string_view{"{r}.extend(other)"};
    case UnificationPattern::DictPop: return std::string_view{"{r}.remove(&key)"};
    case UnificationPattern::DictClear: return std::string_view{"{r}.clear()"};
    case UnificationPattern::DictKeys: return std::string_view{"{r}.keys()"};
    default: return std::nullopt;
  }
}

std::string RustCodegen::extractReceiverName(const std::vector<std::unique_ptr<hir::Node>>& args) {
  if (!args.empty() && args.front() && args.front()->kind == hir::NodeKind::Variable) {
    return static_cast<const hir::Variable&>(*args.front()).name;
  }
  return kFallbackReceiver;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::string RustCodegen::rustType(const hir::Type& type) {
  auto param = [&type](const size_t i) { return i < type.params.size() ? rustType(type.params[i]) : std::string("_"); };
  switch (type.kind) {
    case TypeKind::Unknown: return "_";
    case TypeKind::PyInt: return "i64";
    case TypeKind::PyFloat: return "f64";
    case TypeKind::PyStr: return "String";
    case TypeKind::PyBool: return "bool";
    case TypeKind::PyNone: case TypeKind::CVoid: return "()";
    case TypeKind::PyList: return "Vec<" + param(0) + ">";
    case TypeKind::PyDict: return "HashMap<" + param(0) + ", " + param(1) + ">";
    case TypeKind::PyClass: case TypeKind::CStruct: return type.name;
    case TypeKind::CChar: return "i8";
    case TypeKind::CInt: return "i32";
    case TypeKind::CLong: return "i64";
    case TypeKind::CSizeT: return "usize";
    case TypeKind::CPySsizeT: return "isize";
    case TypeKind::CFloat: return "f32";
    case TypeKind::CDouble: return "f64";
    case TypeKind::CPointer: return "&mut " + param(0);
    case TypeKind::CPyListObject: return "Vec<_>";
    case TypeKind::CPyDictObject: return "HashMap<_, _>";
    case TypeKind::CPyObject: return "_";
    default: return hir::to_string(type);
  }
}

static std::string rustLiteral(const hir::LiteralValue& value) {
  switch (value.kind) {
    case hir::LiteralValue::Kind::Int: return std::to_string(value.intValue);
    case hir::LiteralValue::Kind::Float: {
      std::ostringstream oss;
      oss << value.floatValue;
      std::string text = oss.str();
      if (text.find_first_of(".eE") == std::string::npos) { text += ".0"; }
      return text;
    }
    case hir::LiteralValue::Kind::Str: return "\"" + value.strValue + "\"";
    case hir::LiteralValue::Kind::Bool: return value.boolValue ? "true" : "false";
    default: return "None";
  }
}

std::string RustCodegen::emitCall(const hir::Call& call, std::string& out) const {
  if (!call.crossMapping) { return "call '" + call.callee + "' " + hir::to_string(call.id) + " has no cross mapping"; }
  if (!call.crossMapping->boundaryEliminated()) {
    return "call '" + call.callee + "' " + hir::to_string(call.id) + " still crosses the Python/C boundary";
  }
  const auto tmpl = templateFor(call.crossMapping->pattern());
  if (!tmpl) {
    return std::string("no Rust template for pattern ") + hir::to_string(call.crossMapping->pattern());
  }
  std::string text(*tmpl);
  const auto slot = text.find(kReceiverSlot);
  if (slot != std::string::npos) {
    const std::string receiver = call.receiverDropped ? std::string(kFallbackReceiver) : extractReceiverName(call.args);
    text.replace(slot, kReceiverSlot.size(), receiver);
  }
  out += text;
  return {};
}

std::string RustCodegen::emitFunction(const hir::Function& fn, const int depth, std::string& out) const {
  out += indent(depth) + "fn " + fn.name + "(";
  for (size_t i = 0; i < fn.params.size(); ++i) {
    if (i != 0) { out += ", "; }
    out += fn.params[i].name + ": " + rustType(fn.params[i].type);
  }
  out += ")";
  const std::string ret = rustType(fn.returnType);
  if (ret != "()" && ret != "_") { out += " -> " + ret; }
  out += " {\n";
  for (const auto& stmt : fn.body) {
    if (!stmt) { continue; }
    if (stmt->kind == hir::NodeKind::Function) {
      if (auto err = emitFunction(static_cast<const hir::Function&>(*stmt), depth + 1, out); !err.empty()) { return err; }
      continue;
    }
    out += indent(depth + 1);
    if (auto err = emitNode(*stmt, depth + 1, out); !err.empty()) { return err; }
    out += "\n";
  }
  out += indent(depth) + "}\n";
  return {};
}

std::string RustCodegen::emitNode(const hir::Node& node, const int depth, std::string& out) const {
  switch (node.kind) {
    case hir::NodeKind::Call: return emitCall(static_cast<const hir::Call&>(node), out);
    case hir::NodeKind::Variable: out += static_cast<const hir::Variable&>(node).name; return {};
    case hir::NodeKind::Literal: out += rustLiteral(static_cast<const hir::Literal&>(node).value); return {};
    case hir::NodeKind::Function: return emitFunction(static_cast<const hir::Function&>(node), depth, out);
    case hir::NodeKind::Module: {
      const auto& mod = static_cast<const hir::Module&>(node);
      bool first = true;
      for (const auto& decl : mod.declarations) {
        if (!decl) { continue; }
        if (!first) { out += "\n"; }
        first = false;
        if (decl->kind == hir::NodeKind::Function) {
          if (auto err = emitFunction(static_cast<const hir::Function&>(*decl), depth, out); !err.empty()) { return err; }
        } else {
          out += indent(depth);
          if (auto err = emitNode(*decl, depth, out); !err.empty()) { return err; }
          out += "\n";
        }
      }
      return {};
    }
    default: return std::string("cannot emit node kind ") + hir::to_string(node.kind);
  }
}

std::string RustCodegen::emit(const hir::Node& node, std::string& text) const {
  std::string out;
  if (auto err = emitNode(node, 0, out); !err.empty()) { return err; }
  text = std::move(out);
  return {};
}

} // namespace unihir::codegen
