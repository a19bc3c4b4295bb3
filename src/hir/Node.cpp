/**
 * @file
 * @brief Unified HIR base Node default accept implementation.
 */
#include "hir/Node.h"
#include "hir/Visitor.h"
#include "hir/VisitorBase.h"

namespace unihir::hir {

void Node::accept(VisitorBase& visitor) const {
    dispatch(*this, visitor);
}

} // namespace unihir::hir
