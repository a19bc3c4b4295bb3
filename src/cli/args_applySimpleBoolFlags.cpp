#include "cli/ParseArgsInternals.h"

namespace unihir::cli::detail {
    /***
     * Name: unihir::cli::detail::applySimpleBoolFlags
     * Purpose: Handle flag-only boolean options and set outputs.
     */
    bool applySimpleBoolFlags(std::string_view arg, Options &out) {
        if (isFlag(arg, "-h")) {
            out.showHelp = true;
            return true;
        }
        if (isFlag(arg, "--help")) {
            out.showHelp = true;
            return true;
        }
        if (isFlag(arg, "--debug")) {
            out.debug = true;
            return true;
        }
        if (isFlag(arg, "--patterns")) {
            out.listPatterns = true;
            return true;
        }
        if (isFlag(arg, "--metrics")) {
            out.metrics = true;
            return true;
        }
        if (isFlag(arg, "--metrics-json")) {
            out.metricsJson = true;
            return true;
        }
        if (isFlag(arg, "--log-hir")) {
            out.logHir = true;
            return true;
        }
        if (isFlag(arg, "--hir-log")) {
            out.hirLog = HirLogMode::Before;
            return true;
        }
        return false;
    }
} // namespace unihir::cli::detail
