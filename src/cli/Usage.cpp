#include "cli/Usage.h"
#include <string>
#include <string_view>
namespace unihir::cli {

namespace {
constexpr std::string_view kUsageText = R"(unihir [options] <file.py> <file.c>

Options:
  -h, --help             Print this help and exit
  -o <file>              Write the generated Rust to <file> (default: stdout)
  --output=<file>        Same as -o
  --debug                Step through the phases interactively
  --break=<spec>         Breakpoint for --debug: boundary|phase:<name>|function:<name>
  --visualize=<file>     Show the listing, tree and CPython API use of a .py/.c/.h file
  --patterns             List the supported Python/C patterns and exit
  --metrics              Print per-phase metrics summary
  --metrics-json         Print per-phase metrics in JSON
  --hir-log[=<mode>]     Dump unified HIR: before|after|both (default: before)
  --log-path=<dir>       Directory where logs are written (default: .)
  --log-hir              Write unified HIR logs to files (see --log-path)
  --color=<mode>         Color diagnostics: always|never|auto (default: auto)
  --diag-context=<N>     Lines of context to show around errors (default: 1)
  --                     End of options
)";
} // namespace

std::string Usage() { return std::string(kUsageText); }
} // namespace unihir::cli
