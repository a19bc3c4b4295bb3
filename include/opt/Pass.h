/***
 * Name: unihir::opt::Pass
 * Purpose: Base interface for optimizer passes over the unified HIR.
 * Inputs:
 *   - hir::Node (mutable root: Call, Function or Module)
 * Outputs:
 *   - Count of transformations performed.
 * Theory of Operation:
 *   A pass that cannot complete throws exceptions::OptimizeError.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

#include "hir/Node.h"

namespace unihir::opt {
    class Pass {
    public:
        virtual ~Pass() = default;

        virtual size_t run(hir::Node &root) = 0;

        virtual const char *name() const = 0;

        const std::unordered_map<std::string, uint64_t> &stats() const { return stats_; }

    protected:
        std::unordered_map<std::string, uint64_t> stats_{};
    };
} // namespace unihir::opt
