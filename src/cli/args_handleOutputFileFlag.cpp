#include "cli/ParseArgsInternals.h"
#include "unihir/exceptions/config_error.h"

#include <string>

namespace unihir::cli::detail {
    /***
     * Name: unihir::cli::detail::handleOutputFileFlag
     * Purpose: Recognize the output-file option in its three spellings.
     * Theory of Operation:
     *   "-o <file>" consumes the following argument; "-o<file>" and
     *   "--output=<file>" carry the name inline. An empty name is a usage error.
     */
    bool handleOutputFileFlag(int &idx, const int argc, char **argv, Options &out) {
        constexpr std::string_view kLong{"--output="};
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        const std::string_view arg{argv[idx]};
        std::string_view name;
        if (arg.rfind(kLong, 0) == 0) {
            name = arg.substr(kLong.size());
        } else if (isFlag(arg, "-o")) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            if (idx + 1 < argc) { name = argv[++idx]; }
        } else if (arg.rfind("-o", 0) == 0) {
            name = arg.substr(2);
        } else {
            return false;
        }
        if (name.empty()) { throw exceptions::ConfigError("-o requires a file name"); }
        out.outputFile = std::string(name);
        return true;
    }
} // namespace unihir::cli::detail
