#include "cli/ParseArgsInternals.h"
#include "unihir/exceptions/config_error.h"

#include <filesystem>

namespace unihir::cli::detail {
    /***
     * Name: unihir::cli::detail::classifyInputs
     * Purpose: Assign the positional inputs to the Python and C slots.
     * Theory of Operation:
     *   `.py` selects the Python side, `.c` or `.h` the C side. Exactly one of
     *   each is required; order on the command line does not matter.
     */
    void classifyInputs(Options &out) {
        for (const auto &input : out.inputs) {
            const auto ext = std::filesystem::path(input).extension().string();
            std::string *slot = nullptr;
            if (ext == ".py") {
                slot = &out.pythonFile;
            } else if (ext == ".c" || ext == ".h") {
                slot = &out.cFile;
            } else {
                throw exceptions::ConfigError("unrecognized input '" + input + "' (expected .py or .c)");
            }
            if (!slot->empty()) { throw exceptions::ConfigError("more than one " + ext + " input given"); }
            *slot = input;
        }
        if (out.pythonFile.empty() || out.cFile.empty()) {
            throw exceptions::ConfigError("expected one .py file and one .c file");
        }
    }
} // namespace unihir::cli::detail
