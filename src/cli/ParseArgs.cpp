#include "cli/ParseArgs.h"
#include "cli/ColorMode.h"
#include "cli/Options.h"
#include "cli/ParseArgsInternals.h"
#include "unihir/exceptions/config_error.h"
#include <iostream>

namespace unihir::cli {
    /***
     * Name: unihir::cli::ParseArgs
     * Purpose: GCC-like CLI argument parser for unihir.
     * Theory of Operation:
     *   Each argument is offered to the flag handlers in turn; anything left
     *   that starts with '-' is an unknown option, everything else is an input.
     *   Bad option values arrive as ConfigError and become usage errors.
     */
    bool ParseArgs(const int argc, char **argv, Options &out) {
        try {
            for (int i = 1; i < argc; ++i) {
                // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
                const std::string_view arg{argv[i]};
                if (detail::isFlag(arg, "--")) {
                    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
                    for (int j = i + 1; j < argc; ++j) { out.inputs.emplace_back(argv[j]); }
                    break;
                }
                if (detail::handleOutputFileFlag(i, argc, argv, out)) { continue; }
                if (detail::applySimpleBoolFlags(arg, out)) { continue; }
                if (detail::applyPrefixedOptions(arg, out)) { continue; }

                // Positional
                if (detail::isUnknownOptionArg(arg)) {
                    std::cerr << "unihir: unknown option '" << arg << "'\n";
                    return false;
                }
                out.inputs.emplace_back(std::string(arg));
            }
            // --help and --patterns need no inputs.
            if (out.showHelp || out.listPatterns) { return true; }
            if (out.visualizeFile.empty()) {
                detail::classifyInputs(out);
            } else if (!out.inputs.empty()) {
                throw exceptions::ConfigError("--visualize takes no other inputs");
            }
        } catch (const exceptions::ConfigError &ex) {
            std::cerr << "unihir: " << ex.what() << "\n";
            return false;
        }

        if (const auto conflict = detail::conflictingModes(out); !conflict.empty()) {
            std::cerr << "unihir: " << conflict << "\n";
            return false;
        }

        return true;
    }
} // namespace unihir::cli
