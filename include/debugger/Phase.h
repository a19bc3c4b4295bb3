/**
 * @file
 * @brief Transpilation phases in their fixed order.
 */
#pragma once

#include <optional>
#include <string_view>

namespace unihir::debugger {
    enum class Phase {
        Start,
        PythonParsed,
        PythonHIR,
        CParsed,
        CHIR,
        UnifiedHIR,
        Optimized,
        RustGenerated,
        Complete
    };

    inline const char *to_string(const Phase element) {
        switch (element) {
            case Phase::Start: return "Start";
            case Phase::PythonParsed: return "Python Parsed";
            case Phase::PythonHIR: return "Python HIR";
            case Phase::CParsed: return "C Parsed";
            case Phase::CHIR: return "C HIR";
            case Phase::UnifiedHIR: return "Unified HIR";
            case Phase::Optimized: return "Optimized";
            case Phase::RustGenerated: return "Rust Generated";
            case Phase::Complete: return "Complete";
            default: return "unknown";
        }
    }

    // Nothing follows Complete.
    std::optional<Phase> next(Phase phase);

    // Case-insensitive, ignoring spaces and underscores: "unified_hir",
    // "UnifiedHIR" and "Unified HIR" all name Phase::UnifiedHIR.
    bool phaseNameMatches(Phase phase, std::string_view name);

    std::optional<Phase> phaseFromName(std::string_view name);
} // namespace unihir::debugger
