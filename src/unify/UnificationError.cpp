/***
 * Name: unihir::unify::UnificationError (impl)
 * Purpose: Construction and rendering of unification failures.
 */
#include "unify/UnificationError.h"

#include <cstddef>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "unify/PatternRegistry.h"

namespace unihir::unify {

static constexpr size_t kMaxListed = 5;
static constexpr const char* kPatternsDoc = "docs/patterns.md";

UnificationError UnificationError::noPatternMatch(std::string pythonFn, std::string cFn,
                                                  std::vector<const PatternEntry*> suggestions) {
  UnificationError err(UnificationErrorKind::NoPatternMatch, std::move(pythonFn), std::move(cFn));
  if (suggestions.size() > kMaxListed) { suggestions.resize(kMaxListed); }
  err.suggestions_ = std::move(suggestions);
  return err;
}

UnificationError UnificationError::incompatibleNodes(std::string pythonKind, std::string cKind) {
  return UnificationError(UnificationErrorKind::IncompatibleNodes, std::move(pythonKind), std::move(cKind));
}

UnificationError UnificationError::unsupportedConstruct(const hir::Language domain, std::string nodeKind) {
  UnificationError err(UnificationErrorKind::UnsupportedConstruct, std::move(nodeKind), {});
  err.domain_ = domain;
  return err;
}

std::string UnificationError::summary() const {
  switch (kind_) {
    case UnificationErrorKind::NoPatternMatch:
      return "Cannot match Python function '" + first_ + "' with C function '" + second_ + "'";
    case UnificationErrorKind::IncompatibleNodes:
      return "Cannot unify incompatible node types: Python " + first_ + " with C " + second_;
    case UnificationErrorKind::UnsupportedConstruct:
      return std::string("Unsupported ") + hir::to_string(domain_) + " HIR node: " + first_;
    default:
      return "unification failed";
  }
}

std::string UnificationError::render() const {
  std::ostringstream oss;
  oss << summary() << "\n\n";
  switch (kind_) {
    case UnificationErrorKind::NoPatternMatch:
      oss << "Tried to unify:\n";
      oss << "  Python: " << first_ << "()\n";
      oss << "  C:      " << second_ << "()\n\n";
      oss << "No known pattern matches this combination.\n\n";
      if (!suggestions_.empty()) {
        oss << "Supported patterns:\n";
        for (size_t i = 0; i < suggestions_.size(); ++i) {
          oss << "  " << (i + 1) << ". " << suggestions_[i]->describe() << "\n";
        }
        oss << "\n";
      }
      oss << "For custom patterns, see: " << kPatternsDoc << "\n";
      break;
    case UnificationErrorKind::IncompatibleNodes:
      oss << "Both nodes must be callable: a Python call and a C function.\n";
      oss << "Ensure the Python and C code represent the same operation.\n";
      break;
    case UnificationErrorKind::UnsupportedConstruct:
      if (domain_ == hir::Language::C) {
        oss << "Supported C constructs: function definitions and prototypes.\n";
      } else {
        oss << "Supported Python constructs: calls to known operations by name or method.\n";
      }
      break;
    default:
      break;
  }
  return oss.str();
}

} // namespace unihir::unify
