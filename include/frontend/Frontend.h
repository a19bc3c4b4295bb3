/***
 * Name: unihir::frontend::PythonFrontend / CFrontend
 * Purpose: Contracts through which source text becomes Python or C HIR.
 * Inputs: Source string and the file name used in locations
 * Outputs: Owning tree with ids allocated from 1 within that tree
 * Theory of Operation:
 *   The stepper only sees these interfaces, so a full parser can replace
 *   the tracer implementations without touching the pipeline. Malformed
 *   input throws exceptions::FrontendError with "file:line:col".
 */
#pragma once

#include <memory>
#include <string>

#include "chir/Nodes.h"
#include "pyhir/Nodes.h"

namespace unihir::frontend {

class PythonFrontend {
 public:
  virtual ~PythonFrontend() = default;
  virtual std::unique_ptr<pyhir::Module> lower(const std::string& source, const std::string& file) = 0;
};

class CFrontend {
 public:
  virtual ~CFrontend() = default;
  virtual std::unique_ptr<chir::TranslationUnit> lower(const std::string& source, const std::string& file) = 0;
};

} // namespace unihir::frontend
