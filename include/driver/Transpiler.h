#pragma once

/***
 * Name: unihir::driver::Transpiler
 * Purpose: Orchestrate a whole Python + C to Rust run from the command line.
 * Inputs:
 *   - CLI options; stdin for the interactive debugger
 * Outputs:
 *   - Rust text on stdout or in a file; diagnostics on stderr; exit code
 * Theory of Operation:
 *   Drives a debugger::Stepper through every phase, timing each one, then
 *   prints the collected diagnostics, optional HIR dumps and metrics. With
 *   --debug the same stepper is handed to the interactive Repl instead.
 *   Exit codes: 0 success, 1 pipeline failure, 2 usage error.
 */

#include <iosfwd>
#include <string>

#include "cli/ColorMode.h"

// Forward declarations to reduce header coupling
namespace unihir { namespace cli { struct Options; } }
namespace unihir { namespace diag { struct Diagnostic; } }

namespace unihir::driver {
    class Transpiler {
    public:
        static int run(const cli::Options &opts);

        static int run(const cli::Options &opts, std::istream &in, std::ostream &out, std::ostream &err);

        static bool use_env_color();

        // Always/Never as given; Auto means stderr is a terminal or UNIHIR_COLOR is set.
        static bool resolve_color(cli::ColorMode mode);

        static void print_error(const diag::Diagnostic &diag, bool color, int context, std::ostream &err);

        // Splits a leading "file:line:col: " off a message when one is present.
        static diag::Diagnostic diagnostic_from_message(const std::string &message);

        // Numbered listing of every registered pattern.
        static std::string patterns_listing();

        // Source listing, lowered tree and CPython API use for one .py/.c/.h file.
        static std::string visualize_source(const std::string &path);

        static bool write_file_or_report(const std::string &path, const std::string &data, std::ostream &err);
    };
} // namespace unihir::driver
