#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "hir/CrossMapping.h"
#include "hir/Node.h"
#include "hir/Type.h"

namespace unihir::hir {

    struct Call final : Node {
        Language targetLanguage;
        std::string callee;                      // target operation, e.g. "Vec::len"
        std::vector<std::unique_ptr<Node>> args; // owned
        Type inferredType{};
        std::optional<CrossMapping> crossMapping{};
        bool receiverDropped{false};             // args[0] is not the original first argument

        Call(const NodeId i, const Language source, const Language target, std::string c, Metadata m = {})
            : Node(NodeKind::Call, i, source, std::move(m)), targetLanguage(target), callee(std::move(c)) {}

        std::unique_ptr<Node> clone() const override;
    };

} // namespace unihir::hir
