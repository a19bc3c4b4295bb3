/***
 * Name: unihir::frontend::TracerCFrontend
 * Purpose: Declaration-level C reader covering the shapes the unifier needs.
 * Theory of Operation:
 *   Recognizes function definitions and prototypes
 *   `[static|extern|inline] <type> name(<params>)` and file-scope variables.
 *   Preprocessor lines, comments, typedefs, struct/enum definitions and
 *   function bodies are skipped (bodies by brace matching).
 */
#pragma once

#include <memory>
#include <string>

#include "frontend/Frontend.h"

namespace unihir::frontend {

class TracerCFrontend : public CFrontend {
 public:
  std::unique_ptr<chir::TranslationUnit> lower(const std::string& source, const std::string& file) override;
};

} // namespace unihir::frontend
