/***
 * Name: unihir::codegen::RustCodegen
 * Purpose: Render optimized unified HIR as Rust source text.
 * Inputs:
 *   - hir::Node (Call, Function, Module, Variable or Literal)
 * Outputs:
 *   - Rust text; an error string when a call still crosses a boundary.
 * Theory of Operation:
 *   A Call is rendered through the per-pattern template of its cross
 *   mapping, with `{r}` replaced by the receiver name. Only calls whose
 *   boundary has been eliminated are emitted. Functions and modules render
 *   a signature line plus a body indented four spaces per depth level.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hir/Nodes.h"

namespace unihir::codegen {

class RustCodegen {
 public:
  // Returns empty error string on success; non-empty error on failure.
  std::string emit(const hir::Node& node, std::string& text) const;

  // Template with `{r}` receiver placeholder; nullopt for Custom.
  static std::optional<std::string_view> templateFor(hir::UnificationPattern pattern);

  // First argument's name when it is a Variable, else "x". emit() uses "x"
  // outright when the call's original first argument was dropped.
  static std::string extractReceiverName(const std::vector<std::unique_ptr<hir::Node>>& args);

  // Rust spelling of any domain type (Python/C types mapped to their Rust
  // counterparts); "_" when unknown.
  static std::string rustType(const hir::Type& type);

 private:
  std::string emitNode(const hir::Node& node, int depth, std::string& out) const;
  std::string emitCall(const hir::Call& call, std::string& out) const;
  std::string emitFunction(const hir::Function& fn, int depth, std::string& out) const;
};

} // namespace unihir::codegen
