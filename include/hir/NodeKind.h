#pragma once

namespace unihir::hir {
    enum class NodeKind {
        Module,
        Function,
        Call,
        Variable,
        Literal
    };

    inline const char *to_string(const NodeKind element) {
        switch (element) {
            case NodeKind::Module: return "Module";
            case NodeKind::Function: return "Function";
            case NodeKind::Call: return "Call";
            case NodeKind::Variable: return "Variable";
            case NodeKind::Literal: return "Literal";
            default: return "unknown";
        }
    }
} // namespace unihir::hir
