#pragma once

namespace unihir::pyhir {
    enum class NodeKind {
        Module,
        Function,
        Return,
        Call,
        Variable,
        Literal,
        Attribute
    };

    inline const char *to_string(const NodeKind element) {
        switch (element) {
            case NodeKind::Module: return "Module";
            case NodeKind::Function: return "Function";
            case NodeKind::Return: return "Return";
            case NodeKind::Call: return "Call";
            case NodeKind::Variable: return "Variable";
            case NodeKind::Literal: return "Literal";
            case NodeKind::Attribute: return "Attribute";
            default: return "unknown";
        }
    }
} // namespace unihir::pyhir
