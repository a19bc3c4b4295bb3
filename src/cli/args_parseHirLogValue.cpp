#include "cli/ParseArgsInternals.h"
#include "unihir/exceptions/config_error.h"

namespace unihir::cli::detail {

/***
 * Name: unihir::cli::detail::parseHirLogValue
 * Purpose: Parse --hir-log value into HirLogMode.
 */
HirLogMode parseHirLogValue(std::string_view value) {
    if (value == "before") { return HirLogMode::Before; }
    if (value == "after") { return HirLogMode::After; }
    if (value == "both") { return HirLogMode::Both; }
    throw exceptions::ConfigError("invalid --hir-log value '" + std::string(value) + "' (expected before|after|both)");
}

} // namespace unihir::cli::detail
