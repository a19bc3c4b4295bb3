#pragma once

#include <string>

#include "hir/Node.h"
#include "hir/Type.h"

namespace unihir::hir {

    struct Variable final : Node {
        std::string name;
        Type varType{};

        Variable(const NodeId i, std::string n, Type t, const Language source, Metadata m = {})
            : Node(NodeKind::Variable, i, source, std::move(m)), name(std::move(n)), varType(std::move(t)) {}

        std::unique_ptr<Node> clone() const override;
    };

} // namespace unihir::hir
