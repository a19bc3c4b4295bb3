/**
 * @file
 * @brief Unified HIR module (compilation unit) node.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "hir/Node.h"

namespace unihir::hir {

    struct Module final : Node {
        std::string name;
        std::vector<std::unique_ptr<Node>> declarations{};

        Module(const NodeId i, std::string n, const Language source, Metadata m = {})
            : Node(NodeKind::Module, i, source, std::move(m)), name(std::move(n)) {}

        std::unique_ptr<Node> clone() const override;
    };

} // namespace unihir::hir
