/**
 * @file
 * @brief Unified HIR base node declarations.
 */
#pragma once

#include <memory>

#include "hir/Language.h"
#include "hir/Metadata.h"
#include "hir/NodeId.h"
#include "hir/NodeKind.h"

namespace unihir::hir {

    struct VisitorBase; // fwd

    struct Node {
        NodeKind kind;
        NodeId id;
        Language sourceLanguage;
        const Metadata meta;

        Node(const NodeKind k, const NodeId i, const Language lang, Metadata m)
            : kind(k), id(i), sourceLanguage(lang), meta(std::move(m)) {}
        virtual ~Node() = default;

        // Polymorphic dispatch entrypoint (central switch, see Visitor.h)
        virtual void accept(VisitorBase& v) const;

        // Deep copy of this node and everything it owns.
        virtual std::unique_ptr<Node> clone() const = 0;
    };

} // namespace unihir::hir
