#pragma once

#include "hir/LiteralValue.h"
#include "hir/Node.h"
#include "hir/Type.h"

namespace unihir::hir {

    struct Literal final : Node {
        LiteralValue value;
        Type litType{};

        Literal(const NodeId i, LiteralValue v, Type t, const Language source, Metadata m = {})
            : Node(NodeKind::Literal, i, source, std::move(m)), value(std::move(v)), litType(std::move(t)) {}

        std::unique_ptr<Node> clone() const override;
    };

} // namespace unihir::hir
