/***
 * Name: unihir::diag::Diagnostic
 * Purpose: Carry a diagnostic message with optional source location.
 * Theory of Operation:
 *   Used for recoverable findings (dropped arguments, arity shortfalls,
 *   frontend warnings). Rendered by driver::Transpiler::print_error.
 */
#pragma once

#include <string>
#include <utility>
#include <vector>

namespace unihir::diag {
    enum class Severity { Warning, Error };

    struct Diagnostic {
        std::string message;
        std::string file;
        int line{0};
        int col{0};
        Severity severity{Severity::Warning};
    };

    inline const char *to_string(const Severity s) {
        return s == Severity::Error ? "error" : "warning";
    }

    inline void addDiag(std::vector<Diagnostic> &diags, std::string msg, std::string file = {}, int line = 0,
                        int col = 0, Severity sev = Severity::Warning) {
        diags.push_back(Diagnostic{std::move(msg), std::move(file), line, col, sev});
    }
} // namespace unihir::diag
