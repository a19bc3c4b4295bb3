/***
 * Name: unihir::unify::Unifier (impl)
 * Purpose: Registry-driven unification of Python calls with C functions.
 */
#include "unify/Unifier.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "unify/PatternRegistry.h"

namespace unihir::unify {

namespace {

hir::Type literalType(const hir::LiteralValue& value) {
  switch (value.kind) {
    case hir::LiteralValue::Kind::Int: return hir::Type::pyInt();
    case hir::LiteralValue::Kind::Float: return hir::Type::pyFloat();
    case hir::LiteralValue::Kind::Str: return hir::Type::pyStr();
    case hir::LiteralValue::Kind::Bool: return hir::Type::pyBool();
    default: return hir::Type::pyNone();
  }
}

bool isConvertible(const pyhir::Node* arg) {
  return arg != nullptr && (arg->kind == pyhir::NodeKind::Variable || arg->kind == pyhir::NodeKind::Literal);
}

hir::Metadata carryLocation(const hir::Metadata& from) {
  hir::Metadata m;
  m.source = from.source;
  return m;
}

void report(std::vector<diag::Diagnostic>& diags, std::string msg, const hir::Metadata& at) {
  if (at.source) {
    diag::addDiag(diags, std::move(msg), at.source->file, at.source->line, at.source->col);
  } else {
    diag::addDiag(diags, std::move(msg));
  }
}

} // namespace

std::string Unifier::operationName(const pyhir::Call& call) {
  if (!call.callee) { return {}; }
  if (call.callee->kind == pyhir::NodeKind::Variable) {
    return static_cast<const pyhir::Variable&>(*call.callee).name;
  }
  if (call.callee->kind == pyhir::NodeKind::Attribute) {
    return static_cast<const pyhir::Attribute&>(*call.callee).attr;
  }
  return {};
}

std::vector<std::unique_ptr<hir::Node>> Unifier::convertArgs(const std::vector<const pyhir::Node*>& args,
                                                             hir::IdAllocator& ids,
                                                             std::vector<diag::Diagnostic>& diags) {
  std::vector<std::unique_ptr<hir::Node>> out;
  for (size_t i = 0; i < args.size(); ++i) {
    const pyhir::Node* arg = args[i];
    if (arg == nullptr) { continue; }
    switch (arg->kind) {
      case pyhir::NodeKind::Variable: {
        const auto& var = static_cast<const pyhir::Variable&>(*arg);
        out.emplace_back(std::make_unique<hir::Variable>(ids.next(), var.name, hir::Type::unknown(),
                                                         hir::Language::Python, carryLocation(var.meta)));
        break;
      }
      case pyhir::NodeKind::Literal: {
        const auto& lit = static_cast<const pyhir::Literal&>(*arg);
        out.emplace_back(std::make_unique<hir::Literal>(ids.next(), lit.value, literalType(lit.value),
                                                        hir::Language::Python, carryLocation(lit.meta)));
        break;
      }
      default:
        report(diags, "argument " + std::to_string(i + 1) + " (" + pyhir::to_string(arg->kind) + ") dropped",
               arg->meta);
        break;
    }
  }
  return out;
}

UnifyResult Unifier::unify(const pyhir::Node& python, const chir::Node& c) const {
  UnifyResult result;
  if (python.kind != pyhir::NodeKind::Call || c.kind != chir::NodeKind::Function) {
    result.error = UnificationError::incompatibleNodes(pyhir::to_string(python.kind), chir::to_string(c.kind));
    return result;
  }
  const auto& call = static_cast<const pyhir::Call&>(python);
  const auto& fn = static_cast<const chir::Function&>(c);

  const std::string pyName = operationName(call);
  if (pyName.empty()) {
    const char* calleeKind = call.callee ? pyhir::to_string(call.callee->kind) : "empty callee";
    result.error = UnificationError::unsupportedConstruct(hir::Language::Python, calleeKind);
    return result;
  }

  const PatternEntry* entry = PatternRegistry::find(pyName, fn.name);
  if (entry == nullptr) {
    result.error = UnificationError::noPatternMatch(pyName, fn.name, PatternRegistry::suggestionsFor(pyName, fn.name));
    return result;
  }

  std::vector<const pyhir::Node*> args;
  if (call.callee->kind == pyhir::NodeKind::Attribute) {
    args.push_back(static_cast<const pyhir::Attribute&>(*call.callee).object.get());
  }
  for (const auto& a : call.args) { args.push_back(a.get()); }

  hir::IdAllocator ids;
  hir::Metadata meta = carryLocation(call.meta);
  meta.patternUsed = entry->pattern;
  meta.debugNotes.push_back("unified " + entry->describe());
  auto unified = std::make_unique<hir::Call>(ids.next(), hir::Language::Python, hir::Language::Rust, entry->rustOp,
                                             std::move(meta));
  unified->args = convertArgs(args, ids, result.diagnostics);
  unified->receiverDropped = !args.empty() && !isConvertible(args.front());
  unified->inferredType = entry->resultType;
  unified->crossMapping = hir::CrossMapping(call.id, fn.id, entry->pattern);

  if (args.size() < entry->minArgs) {
    report(result.diagnostics,
           entry->rustOp + " expects at least " + std::to_string(entry->minArgs) + " argument(s) including the receiver, got " +
               std::to_string(args.size()),
           call.meta);
  }
  result.call = std::move(unified);
  return result;
}

} // namespace unihir::unify
