#pragma once

#include "hir/Nodes.h"

namespace unihir::hir {

template <typename V>
void dispatch(Node& n, V& v) {
    switch (n.kind) {
        case NodeKind::Module: v.visit(static_cast<Module&>(n)); break;
        case NodeKind::Function: v.visit(static_cast<Function&>(n)); break;
        case NodeKind::Call: v.visit(static_cast<Call&>(n)); break;
        case NodeKind::Variable: v.visit(static_cast<Variable&>(n)); break;
        case NodeKind::Literal: v.visit(static_cast<Literal&>(n)); break;
        default: break;
    }
}

template <typename V>
void dispatch(const Node& n, V& v) {
    switch (n.kind) {
        case NodeKind::Module: v.visit(static_cast<const Module&>(n)); break;
        case NodeKind::Function: v.visit(static_cast<const Function&>(n)); break;
        case NodeKind::Call: v.visit(static_cast<const Call&>(n)); break;
        case NodeKind::Variable: v.visit(static_cast<const Variable&>(n)); break;
        case NodeKind::Literal: v.visit(static_cast<const Literal&>(n)); break;
        default: break;
    }
}

} // namespace unihir::hir
