/**
 * @file
 * @brief Declarations for unihir CLI argument parsing helpers.
 */
#pragma once

#include <string>
#include <string_view>

#include "cli/Options.h"
#include "cli/ColorMode.h"

namespace unihir::cli::detail {

inline bool isFlag(const std::string_view arg, const std::string_view flag) { return arg == flag; }

// A lone "-" is not an option.
inline bool isUnknownOptionArg(const std::string_view arg) { return arg.size() > 1 && arg[0] == '-'; }

/** Parse `--hir-log=<value>`; throws exceptions::ConfigError on an unknown value. */
HirLogMode parseHirLogValue(std::string_view value);

/** Parse `--color=<value>`; throws exceptions::ConfigError on an unknown value. */
ColorMode parseColorValue(std::string_view value);

/** Parse `--diag-context=<N>`; throws exceptions::ConfigError unless N is a non-negative integer. */
int parseDiagContextValue(std::string_view value);

/** Sort inputs into pythonFile/cFile by extension; throws exceptions::ConfigError on a bad set. */
void classifyInputs(Options& out);

/** Return a message for option combinations that cannot be honored, or empty. */
std::string conflictingModes(const Options& opts);

/** Handle boolean, flag-only options like -h, --debug, --metrics, etc. */
bool applySimpleBoolFlags(std::string_view arg, Options& out);

/** Handle `--key=value` style options (hir-log, log-path, color, diag-context, visualize, break). */
bool applyPrefixedOptions(std::string_view arg, Options& out);

/** Handle `-o <file>`, `-o<file>` and `--output=<file>`; may consume the next argv item.
 *  Throws exceptions::ConfigError when no file name follows. */
bool handleOutputFileFlag(int& idx, int argc, char** argv, Options& out);

} // namespace unihir::cli::detail
