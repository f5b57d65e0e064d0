#pragma once
/*
===============================================================================
PRESOLVE — Cheap infeasibility proofs run before any search
===============================================================================

Overview
--------
When every item must be placed, some instances can be shown to have no
feasible assignment without searching. Each proof below is a necessary
condition for feasibility; a violated condition is a proof of
infeasibility, reported with the item or constraint responsible.

    1. oversized item: an item is larger than every slot it is compatible
       with (identifier = item, constraint = cover[item])

    2. group demand: for the compatible-slot set C of some item, the items
       whose compatible slots all lie inside C need more volume than the
       slots of C provide (identifier = first such item by id,
       constraint = "capacity")

Condition 2 with C = all slots is the aggregate check "total demand exceeds
total compatible capacity". Conditions are only evaluated for models that do
not allow unassigned items; with partial coverage, leaving everything
unplaced is always feasible.

===============================================================================
*/

#include <algorithm>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "naming.h"
#include "optimization_model.h"

namespace assign {

    /**
     * @brief Explanation of a proven infeasibility
     */
    struct InfeasibilityProof {
        std::string identifier;     ///< offending item id (may be empty)
        std::string constraint;     ///< violated constraint name
        std::string message;
    };

    namespace presolve_detail {

        inline std::optional<InfeasibilityProof> oversizedItem(const OptimizationModel& model)
        {
            const auto& items = model.catalog().items();
            const auto& slots = model.catalog().slots();

            for (std::size_t i : model.itemOrder()) {
                double largest = 0.0;
                for (std::size_t v : model.itemVariables(i))
                    largest = std::max(largest, slots[model.variables()[v].slot].capacity);
                if (items[i].size > largest + OptimizationModel::kCapacityTolerance) {
                    return InfeasibilityProof{
                        items[i].id, names::coverage(items[i].id),
                        "item '" + items[i].id + "' (size " + std::to_string(items[i].size)
                            + ") does not fit any compatible slot (largest capacity "
                            + std::to_string(largest) + ")" };
                }
            }
            return std::nullopt;
        }

        inline std::optional<InfeasibilityProof> groupDemand(const OptimizationModel& model)
        {
            const auto& items = model.catalog().items();
            const auto& slots = model.catalog().slots();

            // Compatible-slot set of every item.
            std::vector<std::set<std::size_t>> sets(items.size());
            std::set<std::size_t> all;
            for (std::size_t i = 0; i < items.size(); ++i) {
                for (std::size_t v : model.itemVariables(i))
                    sets[i].insert(model.variables()[v].slot);
                all.insert(sets[i].begin(), sets[i].end());
            }

            std::set<std::set<std::size_t>> candidates(sets.begin(), sets.end());
            candidates.insert(all);

            for (const auto& group : candidates) {
                double capacity = 0.0;
                for (std::size_t s : group)
                    capacity += slots[s].capacity;

                double demand = 0.0;
                std::optional<std::size_t> first;
                for (std::size_t i : model.itemOrder()) {
                    if (std::includes(group.begin(), group.end(), sets[i].begin(), sets[i].end())) {
                        demand += items[i].size;
                        if (!first)
                            first = i;
                    }
                }

                if (first && demand > capacity + OptimizationModel::kCapacityTolerance) {
                    return InfeasibilityProof{
                        items[*first].id, "capacity",
                        "items restricted to " + std::to_string(group.size())
                            + " slot(s) need volume " + std::to_string(demand)
                            + " but those slots hold " + std::to_string(capacity) };
                }
            }
            return std::nullopt;
        }

    } // namespace presolve_detail

    /**
     * @brief Try to prove that no complete assignment exists
     *
     * @return A proof, or std::nullopt if none of the cheap conditions fails
     *         (which does not imply feasibility). Always std::nullopt for
     *         models that allow unassigned items.
     */
    inline std::optional<InfeasibilityProof> proveInfeasible(const OptimizationModel& model)
    {
        if (model.options().allow_unassigned)
            return std::nullopt;
        if (auto proof = presolve_detail::oversizedItem(model))
            return proof;
        return presolve_detail::groupDemand(model);
    }

} // namespace assign
