/***
 * Name: unihir::hir::NodeId
 * Purpose: Identify a node inside one graph (Python HIR, C HIR or unified HIR).
 * Theory of Operation:
 *   Each graph is its own id space. Ids are handed out by an IdAllocator owned
 *   by whoever builds the graph, starting at 1; 0 is never allocated. An id
 *   held by another graph (see CrossMapping) is a lookup key, never ownership.
 */
#pragma once

#include <cstdint>
#include <string>

namespace unihir::hir {

struct NodeId {
  uint64_t value{0};

  bool valid() const { return value != 0; }
  bool operator==(const NodeId& other) const { return value == other.value; }
  bool operator!=(const NodeId& other) const { return value != other.value; }
};

inline std::string to_string(const NodeId id) { return "#" + std::to_string(id.value); }

class IdAllocator {
 public:
  NodeId next() { return NodeId{next_++}; }
  uint64_t issued() const { return next_ - 1; }

 private:
  uint64_t next_{1};
};

} // namespace unihir::hir
