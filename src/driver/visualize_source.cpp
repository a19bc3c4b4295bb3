/***
 * Name: unihir::driver::Transpiler::visualize_source
 * Purpose: Text for `--visualize=<file>`: listing, tree and CPython API use.
 * Inputs: A .py, .c or .h file
 * Outputs: Report text; throws FileReadError, FrontendError or ConfigError
 * Theory of Operation:
 *   The file is read and lowered with the same tracer frontends the stepper
 *   uses. C functions are matched against the pattern registry by C name;
 *   any other `Py`/`_Py` name is reported as an unmapped CPython API.
 */
#include "driver/Transpiler.h"
#include "chir/Nodes.h"
#include "frontend/TracerCFrontend.h"
#include "frontend/TracerPythonFrontend.h"
#include "pyhir/Nodes.h"
#include "unify/PatternRegistry.h"
#include "unihir/exceptions/config_error.h"
#include "unihir/support/fs.h"

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>

namespace unihir::driver {

namespace {

void append_listing(const std::string& source, std::ostringstream& oss) {
  std::istringstream lines(source);
  std::string line;
  size_t count = 0;
  std::ostringstream body;
  while (std::getline(lines, line)) { body << std::setw(4) << ++count << " | " << line << "\n"; }
  oss << "Size: " << count << " lines\n\n== Source ==\n" << body.str() << "\n";
}

const unify::PatternEntry* entry_for_c_name(const std::string& name) {
  for (const auto& entry : unify::PatternRegistry::all()) {
    if (entry.cName == name) { return &entry; }
  }
  return nullptr;
}

void append_cpython_analysis(const chir::TranslationUnit& unit, std::ostringstream& oss) {
  oss << "== CPython API analysis ==\n";
  size_t reported = 0;
  for (const auto& decl : unit.declarations) {
    if (!decl || decl->kind != chir::NodeKind::Function) { continue; }
    const auto& fn = static_cast<const chir::Function&>(*decl);
    if (const auto* entry = entry_for_c_name(fn.name)) {
      oss << "  " << fn.name << " -> " << hir::to_string(entry->pattern) << " (" << entry->describe() << ")\n";
      ++reported;
    } else if (chir::isCPythonApi(fn.name)) {
      oss << "  " << fn.name << " -> no registered pattern\n";
      ++reported;
    }
  }
  if (reported == 0) { oss << "  No CPython API use detected\n"; }
}

} // namespace

std::string Transpiler::visualize_source(const std::string& path) {
  const auto ext = std::filesystem::path(path).extension().string();
  const bool python = ext == ".py";
  if (!python && ext != ".c" && ext != ".h") {
    throw exceptions::ConfigError("unsupported file extension '" + ext + "' (expected .py, .c or .h)");
  }
  const std::string source = support::LoadFile(path);

  std::ostringstream oss;
  oss << "== " << (python ? "Python" : "C") << " HIR visualization ==\n";
  oss << "File: " << path << "\n";
  append_listing(source, oss);
  oss << "== Tree ==\n";
  if (python) {
    frontend::TracerPythonFrontend frontend;
    const auto module = frontend.lower(source, path);
    oss << pyhir::dump(*module) << "\n";
    const pyhir::Call* call = pyhir::firstCall(*module);
    oss << "== Statistics ==\n";
    oss << "  Top-level items: " << module->body.size() << "\n";
    oss << "  Unifiable call: " << (call != nullptr ? hir::to_string(call->id) : std::string("none")) << "\n";
  } else {
    frontend::TracerCFrontend frontend;
    const auto unit = frontend.lower(source, path);
    oss << chir::dump(*unit) << "\n";
    append_cpython_analysis(*unit, oss);
  }
  return oss.str();
}

}  // namespace unihir::driver
