#include "cli/ParseArgsInternals.h"
#include "unihir/exceptions/config_error.h"

#include <charconv>
#include <system_error>

namespace unihir::cli::detail {

/***
 * Name: unihir::cli::detail::parseDiagContextValue
 * Purpose: Parse --diag-context value as a non-negative line count.
 */
int parseDiagContextValue(std::string_view value) {
    int lines = 0;
    const auto* first = value.data();
    const auto* last = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(first, last, lines);
    if (value.empty() || ec != std::errc() || ptr != last || lines < 0) {
        throw exceptions::ConfigError("invalid --diag-context value '" + std::string(value) + "'");
    }
    return lines;
}

} // namespace unihir::cli::detail
