#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "hir/CrossMapping.h"
#include "hir/Node.h"
#include "hir/Type.h"

namespace unihir::hir {

    struct Param {
        std::string name;
        Type type{};
        Language sourceLanguage{Language::Python};

        bool operator==(const Param& other) const {
            return name == other.name && type == other.type && sourceLanguage == other.sourceLanguage;
        }
    };

    struct Function final : Node {
        std::string name;
        std::vector<Param> params{};
        Type returnType{};
        std::vector<std::unique_ptr<Node>> body{};
        std::optional<CrossMapping> crossMapping{};

        Function(const NodeId i, std::string n, const Language source, Metadata m = {})
            : Node(NodeKind::Function, i, source, std::move(m)), name(std::move(n)) {}

        std::unique_ptr<Node> clone() const override;
    };

} // namespace unihir::hir
