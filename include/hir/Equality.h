/***
 * Name: unihir::hir::equals / findById / countNodes / maxDepth
 * Purpose: Structural queries over a unified HIR tree.
 * Theory of Operation:
 *   equals() compares kind, id, languages, payload, types, cross mappings,
 *   metadata pattern tags and children recursively. findById() is a
 *   depth-first lookup used to resolve cross-graph references.
 */
#pragma once

#include <cstddef>

#include "hir/Node.h"

namespace unihir::hir {

bool equals(const Node& lhs, const Node& rhs);

const Node* findById(const Node& root, NodeId id);

// Number of nodes in the tree rooted at `root` (root included).
size_t countNodes(const Node& root);

// Length of the longest root-to-leaf path; 1 for a leaf.
size_t maxDepth(const Node& root);

} // namespace unihir::hir
