#pragma once
/*
===============================================================================
DIAGNOSTICS — Model analysis and status strings
===============================================================================

Overview
--------
Utilities for looking into a built OptimizationModel before solving it:

    * Model statistics (variable/constraint counts, non-zeros, pruned pairs)
    * One-line model summary for logs
    * Human-readable status strings

Design Philosophy
-----------------
1. Free functions operating on OptimizationModel, not tied to a backend
2. Lightweight result structs for returning diagnostic data
3. Optional include: solving does not depend on this header

Typical Usage
-------------
    auto model = assign::build(catalog, matrix);

    auto stats = assign::computeStatistics(model);
    std::cout << "Variables: " << stats.numVars
              << " (" << stats.numPruned << " incompatible pairs pruned)\n";

    LOG(INFO) << assign::modelSummary(model);

===============================================================================
*/

#include <cstddef>
#include <sstream>
#include <string>

#include "optimization_model.h"
#include "solution.h"

namespace assign {

    // =========================================================================
    // STATUS STRING CONVERSION
    // =========================================================================

    /**
     * @brief Status name as used in reports ("optimal", "feasible", ...)
     */
    inline std::string statusString(SolveStatus status) {
        return std::string(enum_name(status));
    }

    // =========================================================================
    // MODEL STATISTICS
    // =========================================================================

    /**
     * @brief Snapshot of model size and composition
     */
    struct ModelStatistics {
        std::size_t numItems = 0;
        std::size_t numSlots = 0;
        std::size_t numVars = 0;                ///< compatible pairs
        std::size_t numPruned = 0;              ///< incompatible pairs (no variable)
        std::size_t numCoverage = 0;            ///< cover[i] constraints
        std::size_t numCapacity = 0;            ///< cap[s] constraints
        std::size_t numNonZeros = 0;            ///< coefficients in all constraints
        std::size_t maxCandidates = 0;          ///< largest compatible-slot list
        double totalSize = 0.0;
        double totalCapacity = 0.0;

        /// @brief Fraction of (item, slot) pairs that are compatible
        double density() const {
            const std::size_t pairs = numItems * numSlots;
            return pairs ? static_cast<double>(numVars) / static_cast<double>(pairs) : 0.0;
        }
    };

    /**
     * @brief Compute statistics for a built model
     */
    inline ModelStatistics computeStatistics(const OptimizationModel& model) {
        ModelStatistics stats;
        stats.numItems = model.catalog().numItems();
        stats.numSlots = model.catalog().numSlots();
        stats.numVars = model.numVariables();
        stats.numPruned = stats.numItems * stats.numSlots - stats.numVars;
        stats.totalSize = model.catalog().totalSize();
        stats.totalCapacity = model.catalog().totalCapacity();

        for (const LinearConstraint& c : model.constraints()) {
            if (c.kind == ConstraintKind::Coverage)
                ++stats.numCoverage;
            else
                ++stats.numCapacity;
            stats.numNonZeros += c.terms.size();
        }
        for (std::size_t i = 0; i < stats.numItems; ++i) {
            if (model.itemVariables(i).size() > stats.maxCandidates)
                stats.maxCandidates = model.itemVariables(i).size();
        }
        return stats;
    }

    /**
     * @brief One-line description of a model, e.g.
     *        "4 items, 3 slots, 6 vars (6 pruned), 7 constraints, cover = 1"
     */
    inline std::string modelSummary(const OptimizationModel& model) {
        const ModelStatistics stats = computeStatistics(model);
        std::ostringstream out;
        out << stats.numItems << " items, " << stats.numSlots << " slots, "
            << stats.numVars << " vars (" << stats.numPruned << " pruned), "
            << model.numConstraints() << " constraints, cover "
            << (model.options().allow_unassigned ? "<= 1" : "= 1");
        if (model.options().allow_unassigned && model.options().unassigned_penalty > 0.0)
            out << ", penalty " << model.options().unassigned_penalty;
        return out.str();
    }

} // namespace assign
