/***
 * Name: unihir::driver::Transpiler::patterns_listing
 * Purpose: Text for `--patterns`: one numbered line per registry entry.
 */
#include "driver/Transpiler.h"
#include "hir/Type.h"
#include "unify/PatternRegistry.h"

#include <sstream>
#include <string>

namespace unihir::driver {

std::string Transpiler::patterns_listing() {
  std::ostringstream oss;
  oss << "Supported patterns:\n";
  size_t index = 1;
  for (const auto& entry : unify::PatternRegistry::all()) {
    oss << "  " << index++ << ". " << entry.describe() << " : " << hir::to_string(entry.resultType)
        << " (min args " << entry.minArgs << ")\n";
  }
  return oss.str();
}

}  // namespace unihir::driver
