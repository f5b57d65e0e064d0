#pragma once
/*
===============================================================================
SOLUTION — Immutable result of one solve
===============================================================================

Overview
--------
A Solution maps every item identifier to a slot identifier or to "unassigned"
and records how good and how trustworthy that mapping is:

    status               optimal | feasible | infeasible | unsolved
    objective            sum of frequency * slot cost over placed items
    penalizedObjective   objective + unassigned penalty (what was minimized)
    statistics           backend name, effective parameters, search counters

Status semantics:

    optimal     search completed; no better assignment exists
    feasible    assignment satisfies every constraint, optimality not proven
                (heuristic result, or exact search stopped by a limit)
    infeasible  no complete assignment exists (only returned instead of
                InfeasibleError when SolverConfig::raise_infeasible is false)
    unsolved    no assignment satisfying the coverage policy was found before
                the solver gave up; the mapping may be partial

A new solve always produces a new Solution; nothing mutates an existing one.

===============================================================================
*/

#include <cstddef>
#include <map>
#include <stdexcept>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "data_store.h"
#include "enum_utils.h"
#include "optimization_model.h"

namespace assign {

    ASSIGN_DECLARE_ENUM_WITH_COUNT(SolveStatus, Optimal, Feasible, Infeasible, Unsolved);

} // namespace assign

ASSIGN_DECLARE_ENUM_NAMES(assign::SolveStatus, "optimal", "feasible", "infeasible", "unsolved");

namespace assign {

    /**
     * @class Solution
     * @brief Item-to-slot mapping, objective and status of one solve
     */
    class Solution {
    public:
        using Assignments = std::map<std::string, std::optional<std::string>, std::less<>>;

        Solution(SolveStatus status, Assignments assignments, double objective,
                 double penalized_objective, DataStore statistics = {})
            : status_(status),
              assignments_(std::move(assignments)),
              objective_(objective),
              penalized_objective_(penalized_objective),
              statistics_(std::move(statistics))
        {
        }

        /**
         * @brief Build a Solution from slot indices of a model's catalog
         */
        static Solution fromPlacement(const OptimizationModel& model, const Placement& placement,
                                      SolveStatus status, DataStore statistics = {})
        {
            const auto& items = model.catalog().items();
            const auto& slots = model.catalog().slots();
            Assignments assignments;
            for (std::size_t i = 0; i < items.size(); ++i) {
                const std::size_t s = i < placement.size() ? placement[i] : kUnassigned;
                if (s == kUnassigned)
                    assignments.emplace(items[i].id, std::nullopt);
                else
                    assignments.emplace(items[i].id, slots[s].id);
            }
            Placement full = placement;
            full.resize(items.size(), kUnassigned);
            return Solution(status, std::move(assignments), model.placementCost(full),
                            model.penalizedCost(full), std::move(statistics));
        }

        /// @brief Solution carrying no mapping (infeasible or nothing found)
        static Solution empty(const OptimizationModel& model, SolveStatus status,
                              DataStore statistics = {})
        {
            return fromPlacement(model, Placement(model.catalog().numItems(), kUnassigned),
                                 status, std::move(statistics));
        }

        SolveStatus status() const noexcept { return status_; }
        bool isOptimal() const noexcept { return status_ == SolveStatus::Optimal; }

        /// @brief True if the mapping satisfies every model constraint
        bool hasSolution() const noexcept {
            return status_ == SolveStatus::Optimal || status_ == SolveStatus::Feasible;
        }

        double objective() const noexcept { return objective_; }
        double penalizedObjective() const noexcept { return penalized_objective_; }

        /// @brief Item id -> slot id (std::nullopt when unassigned), by item id
        const Assignments& assignments() const noexcept { return assignments_; }

        /**
         * @brief Slot of an item
         * @throws std::out_of_range if the item is not part of the solution
         */
        const std::optional<std::string>& slotOf(std::string_view item_id) const {
            auto it = assignments_.find(item_id);
            if (it == assignments_.end()) {
                throw std::out_of_range("Solution: unknown item '" + std::string(item_id) + "'");
            }
            return it->second;
        }

        /// @brief Identifiers of unassigned items, ascending
        std::vector<std::string> unassigned() const {
            std::vector<std::string> out;
            for (const auto& [item, slot] : assignments_) {
                if (!slot)
                    out.push_back(item);
            }
            return out;
        }

        std::size_t numUnassigned() const {
            std::size_t n = 0;
            for (const auto& entry : assignments_) {
                if (!entry.second)
                    ++n;
            }
            return n;
        }

        /// @brief Backend name, "param:*" settings and "stat:*" counters
        const DataStore& statistics() const noexcept { return statistics_; }

        /// @brief Name of the backend that produced the solution
        std::string strategy() const {
            return statistics_.get_or<std::string>("strategy", "");
        }

    private:
        SolveStatus status_;
        Assignments assignments_;
        double objective_;
        double penalized_objective_;
        DataStore statistics_;
    };

} // namespace assign
