#include "cli/ParseArgsInternals.h"
#include "debugger/Breakpoint.h"
#include "unihir/exceptions/config_error.h"

#include <filesystem>
#include <string>

namespace unihir::cli::detail {
    /***
     * Name: unihir::cli::detail::applyPrefixedOptions
     * Purpose: Parse and apply --key=value options like hir-log/color/diag-context/visualize/break.
     */
    bool applyPrefixedOptions(std::string_view arg, Options &out) {
        if (constexpr std::string_view hirLogPrefix{"--hir-log="}; arg.rfind(hirLogPrefix, 0) == 0) {
            out.hirLog = parseHirLogValue(arg.substr(hirLogPrefix.size()));
            return true;
        }

        if (constexpr std::string_view logPathPrefix{"--log-path="}; arg.rfind(logPathPrefix, 0) == 0) {
            out.logPath = std::string(arg.substr(logPathPrefix.size()));
            return true;
        }

        if (constexpr std::string_view colorPrefix{"--color="}; arg.rfind(colorPrefix, 0) == 0) {
            out.color = parseColorValue(arg.substr(colorPrefix.size()));
            return true;
        }

        if (constexpr std::string_view diagPrefix{"--diag-context="}; arg.rfind(diagPrefix, 0) == 0) {
            out.diagContext = parseDiagContextValue(arg.substr(diagPrefix.size()));
            return true;
        }

        if (constexpr std::string_view visualizePrefix{"--visualize="}; arg.rfind(visualizePrefix, 0) == 0) {
            const auto file = arg.substr(visualizePrefix.size());
            const auto ext = std::filesystem::path(std::string(file)).extension().string();
            if (ext != ".py" && ext != ".c" && ext != ".h") {
                throw exceptions::ConfigError("invalid --visualize value '" + std::string(file) +
                                              "' (expected a .py, .c or .h file)");
            }
            out.visualizeFile = std::string(file);
            return true;
        }

        if (constexpr std::string_view breakPrefix{"--break="}; arg.rfind(breakPrefix, 0) == 0) {
            const auto spec = arg.substr(breakPrefix.size());
            std::string err;
            if (!debugger::parseBreakpointSpec(spec, err)) {
                throw exceptions::ConfigError("invalid --break value '" + std::string(spec) + "': " + err);
            }
            out.breakpoints.emplace_back(spec);
            return true;
        }
        return false;
    }
} // namespace unihir::cli::detail
