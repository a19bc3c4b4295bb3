/***
 * Name: unihir::frontend::TracerPythonFrontend
 * Purpose: Line-oriented Python reader covering the shapes the unifier needs.
 * Theory of Operation:
 *   module := { import-line | funcdef | expr-stmt }
 *   funcdef := 'def' IDENT '(' [param {',' param}] ')' ['->' annot] ':' NEWLINE
 *              { deeper-indented return | expr-stmt | 'pass' }
 *   param := IDENT [':' annot] ;  annot := IDENT ['[' annot {',' annot} ']']
 *   expr := atom { '.' IDENT | '(' [expr {',' expr}] ')' }
 *   atom := IDENT | INT | FLOAT | STRING | '-' number | True | False | None
 *   Function bodies are the lines indented deeper than their `def`.
 *   Expression statements are kept only when they are calls.
 */
#pragma once

#include <memory>
#include <string>

#include "frontend/Frontend.h"

namespace unihir::frontend {

class TracerPythonFrontend : public PythonFrontend {
 public:
  std::unique_ptr<pyhir::Module> lower(const std::string& source, const std::string& file) override;
};

} // namespace unihir::frontend
