#pragma once

namespace unihir::chir {
    enum class NodeKind {
        TranslationUnit,
        Function,
        Variable,
        Literal
    };

    inline const char *to_string(const NodeKind element) {
        switch (element) {
            case NodeKind::TranslationUnit: return "TranslationUnit";
            case NodeKind::Function: return "Function";
            case NodeKind::Variable: return "Variable";
            case NodeKind::Literal: return "Literal";
            default: return "unknown";
        }
    }
} // namespace unihir::chir
