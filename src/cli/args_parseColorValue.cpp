#include "cli/ParseArgsInternals.h"
#include "unihir/exceptions/config_error.h"

namespace unihir::cli::detail {

/***
 * Name: unihir::cli::detail::parseColorValue
 * Purpose: Parse --color value into ColorMode.
 */
ColorMode parseColorValue(std::string_view value) {
    if (value == "always") { return ColorMode::Always; }
    if (value == "never") { return ColorMode::Never; }
    if (value == "auto") { return ColorMode::Auto; }
    throw exceptions::ConfigError("invalid --color value '" + std::string(value) + "' (expected always|never|auto)");
}

} // namespace unihir::cli::detail
