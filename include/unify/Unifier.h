/***
 * Name: unihir::unify::Unifier
 * Purpose: Merge a Python call and a C function implementing the same
 *   operation into one unified call targeting Rust.
 * Inputs:
 *   - pyhir::Node expected to be a Call; chir::Node expected to be a Function.
 * Outputs:
 *   - UnifyResult: the unified Call or a UnificationError, plus recoverable
 *     diagnostics (dropped arguments, arity shortfalls).
 * Theory of Operation:
 *   Extract the Python operation name (a method receiver becomes the first
 *   argument) and the C function name, look the pair up in PatternRegistry,
 *   and build the unified node with a CrossMapping back to both inputs.
 *   Ids of the unified graph come from an allocator local to each call, so
 *   the same inputs always produce the same tree.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "chir/Nodes.h"
#include "diag/Diagnostic.h"
#include "hir/Nodes.h"
#include "pyhir/Nodes.h"
#include "unify/UnificationError.h"

namespace unihir::unify {

struct UnifyResult {
  std::unique_ptr<hir::Call> call{};
  std::optional<UnificationError> error{};
  std::vector<diag::Diagnostic> diagnostics{};

  bool ok() const { return call != nullptr; }
};

class Unifier {
 public:
  UnifyResult unify(const pyhir::Node& python, const chir::Node& c) const;

  // Python operation name of a call: the callee name, or the attribute of a
  // method call. Empty when the callee is neither.
  static std::string operationName(const pyhir::Call& call);

  // Variables and literals carry over; anything else is dropped and reported.
  static std::vector<std::unique_ptr<hir::Node>> convertArgs(const std::vector<const pyhir::Node*>& args,
                                                             hir::IdAllocator& ids,
                                                             std::vector<diag::Diagnostic>& diags);
};

} // namespace unihir::unify
