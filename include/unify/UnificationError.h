/***
 * Name: unihir::unify::UnificationError
 * Purpose: Structured, user-facing failure of a unification attempt.
 * Inputs:
 *   - Built via noPatternMatch / incompatibleNodes / unsupportedConstruct.
 * Outputs:
 *   - render(): multi-line message with the attempted names, supported
 *     alternatives and a documentation pointer.
 * Theory of Operation:
 *   A value, not an exception: the unifier returns it inside UnifyResult and
 *   the stepper/driver decide how to surface it.
 */
#pragma once

#include <string>
#include <utility>
#include <vector>

#include "hir/Language.h"

namespace unihir::unify {

struct PatternEntry;

enum class UnificationErrorKind { NoPatternMatch, IncompatibleNodes, UnsupportedConstruct };

inline const char* to_string(const UnificationErrorKind k) {
  switch (k) {
    case UnificationErrorKind::NoPatternMatch: return "NoPatternMatch";
    case UnificationErrorKind::IncompatibleNodes: return "IncompatibleNodes";
    case UnificationErrorKind::UnsupportedConstruct: return "UnsupportedConstruct";
    default: return "unknown";
  }
}

class UnificationError {
 public:
  static UnificationError noPatternMatch(std::string pythonFn, std::string cFn,
                                         std::vector<const PatternEntry*> suggestions);
  static UnificationError incompatibleNodes(std::string pythonKind, std::string cKind);
  static UnificationError unsupportedConstruct(hir::Language domain, std::string nodeKind);

  UnificationErrorKind kind() const { return kind_; }
  const std::string& pythonName() const { return first_; }
  const std::string& cName() const { return second_; }
  const std::vector<const PatternEntry*>& suggestions() const { return suggestions_; }
  hir::Language domain() const { return domain_; }

  // First line of render(), for one-line summaries.
  std::string summary() const;
  std::string render() const;

 private:
  UnificationError(UnificationErrorKind k, std::string a, std::string b) : kind_(k), first_(std::move(a)), second_(std::move(b)) {}

  UnificationErrorKind kind_;
  std::string first_;  // python fn, python kind, or unsupported node kind
  std::string second_; // c fn or c kind
  std::vector<const PatternEntry*> suggestions_{};
  hir::Language domain_{hir::Language::Python};
};

} // namespace unihir::unify
