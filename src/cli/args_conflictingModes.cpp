#include "cli/ParseArgsInternals.h"

namespace unihir::cli::detail {
    /***
     * Name: unihir::cli::detail::conflictingModes
     * Purpose: Reject option combinations that cannot be honored together.
     */
    std::string conflictingModes(const Options &opts) {
        if (opts.debug && !opts.outputFile.empty()) { return "cannot use --debug and -o together"; }
        if (!opts.visualizeFile.empty() && (opts.debug || !opts.outputFile.empty())) {
            return "--visualize cannot be combined with --debug or -o";
        }
        if (!opts.debug && !opts.breakpoints.empty()) { return "--break requires --debug"; }
        return {};
    }
} // namespace unihir::cli::detail
