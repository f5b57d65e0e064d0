#pragma once
/*
===============================================================================
HEURISTIC — Greedy construction with repair and local search
===============================================================================

Overview
--------
GreedySolver produces a good assignment quickly without proving optimality.
It is the "heuristic" strategy and the warm start of the branch-and-bound.

Construction
------------
    1. Items by frequency descending (ties by identifier ascending)
    2. Each item goes to its cheapest compatible slot with room left
       (ties by slot identifier)
    3. Unassigned items allowed: an item stays unplaced when every slot with
       room costs more than its unassigned penalty
    4. Dead end for a required item: relocate one already placed item out of
       one of its candidate slots, choosing the relocation with the smallest
       cost increase

Local search (SolverConfig::local_search)
-----------------------------------------
First-improvement passes until no move improves the penalized objective:

    relocate  move one item to another compatible slot with room (or out of
              its slot when unassigned items are allowed)
    swap      exchange the slots of two items when both fit

Every step is taken in identifier order and only strict improvements are
accepted, so the result is deterministic. No randomness is involved.

Status
------
    feasible   every required item is placed
    unsolved   some required item could not be placed (the mapping is
               partial; infeasibility is not proven by this backend)

===============================================================================
*/

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>
#include <vector>

#include <absl/log/log.h>

#include "callbacks.h"
#include "optimization_model.h"
#include "solution.h"
#include "solver_backend.h"

namespace assign {

    /**
     * @class GreedySolver
     * @brief Heuristic backend: greedy construction, repair, local search
     */
    class GreedySolver : public SolverBackend {
    public:
        std::string_view name() const noexcept override { return "greedy"; }
        bool isExact() const noexcept override { return false; }

        /**
         * @brief Outcome of construct()
         */
        struct Result {
            Placement placement;
            std::size_t unplaced = 0;       ///< required items left unplaced
            std::int64_t repairs = 0;       ///< dead ends resolved by relocation
            std::int64_t moves = 0;         ///< improving local-search steps
        };

        /**
         * @brief Build (and optionally improve) an assignment
         *
         * @param limit Local search stops when the limit is reached; the
         *              construction itself always completes.
         */
        static Result construct(const OptimizationModel& model, bool local_search,
                                const TimeLimit& limit)
        {
            Search s(model);
            s.run();
            if (local_search)
                s.improve(limit);
            return s.result;
        }

    protected:
        Solution search(const OptimizationModel& model, const SolverConfig& config,
                        SearchCallback* callback, DataStore& statistics) override
        {
            TimeLimit limit(config.time_limit_seconds);
            Result r = construct(model, config.local_search, limit);

            statistics["stat:Repairs"] = r.repairs;
            statistics["stat:Moves"] = r.moves;
            statistics["stat:Unplaced"] = static_cast<std::int64_t>(r.unplaced);
            statistics["stat:Runtime"] = limit.elapsed();

            if (r.unplaced > 0) {
                LOG(WARNING) << "Greedy construction left " << r.unplaced
                             << " required item(s) unplaced";
                return Solution::fromPlacement(model, r.placement, SolveStatus::Unsolved,
                                               std::move(statistics));
            }

            if (callback) {
                Progress p;
                p.runtime = limit.elapsed();
                p.bestObj = model.penalizedCost(r.placement);
                p.solutionCount = 1;
                std::size_t unassigned = static_cast<std::size_t>(
                    std::count(r.placement.begin(), r.placement.end(), kUnassigned));
                callback->notifyIncumbent(IncumbentView{
                    r.placement, model.placementCost(r.placement), p.bestObj, unassigned, p });
            }
            return Solution::fromPlacement(model, r.placement, SolveStatus::Feasible,
                                           std::move(statistics));
        }

    private:
        static constexpr double kEps = 1e-9;
        static constexpr int kMaxPasses = 100;

        /// @brief Mutable working state of one construction
        struct Search {
            const OptimizationModel& model;
            const std::vector<Item>& items;
            const std::vector<Slot>& slots;
            Result result;
            std::vector<double> residual;

            explicit Search(const OptimizationModel& m)
                : model(m), items(m.catalog().items()), slots(m.catalog().slots())
            {
                result.placement.assign(items.size(), kUnassigned);
                residual.reserve(slots.size());
                for (const Slot& slot : slots)
                    residual.push_back(slot.capacity);
            }

            bool allowUnassigned() const { return model.options().allow_unassigned; }

            bool fits(std::size_t slot, double size) const {
                return residual[slot] + OptimizationModel::kCapacityTolerance >= size;
            }

            /// @brief Objective contribution of item i in slot s (penalty if unassigned)
            double cost(std::size_t i, std::size_t s) const {
                if (s == kUnassigned) {
                    return allowUnassigned() ? model.unassignedCost(i)
                                             : std::numeric_limits<double>::infinity();
                }
                return static_cast<double>(items[i].frequency) * slots[s].cost;
            }

            void place(std::size_t i, std::size_t s) {
                const std::size_t from = result.placement[i];
                if (from != kUnassigned)
                    residual[from] += items[i].size;
                if (s != kUnassigned)
                    residual[s] -= items[i].size;
                result.placement[i] = s;
            }

            /// @brief Candidate slots of an item, cheapest first (ties by identifier)
            std::vector<std::size_t> candidates(std::size_t i) const {
                std::vector<std::size_t> out;
                for (std::size_t v : model.itemVariables(i))
                    out.push_back(model.variables()[v].slot);
                std::stable_sort(out.begin(), out.end(), [&](std::size_t a, std::size_t b) {
                    return slots[a].cost < slots[b].cost;
                });
                return out;
            }

            void run() {
                std::vector<std::size_t> order = model.itemOrder();
                std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
                    return items[a].frequency > items[b].frequency;
                });

                for (std::size_t i : order) {
                    std::size_t best = kUnassigned;
                    for (std::size_t s : candidates(i)) {
                        if (fits(s, items[i].size)) {
                            best = s;
                            break;
                        }
                    }

                    if (allowUnassigned()) {
                        if (best != kUnassigned && cost(i, best) <= model.unassignedCost(i) + kEps)
                            place(i, best);
                        continue;
                    }

                    if (best != kUnassigned) {
                        place(i, best);
                    } else if (repair(i)) {
                        ++result.repairs;
                    } else {
                        ++result.unplaced;
                        VLOG(1) << "Greedy: no room for required item '" << items[i].id << "'";
                    }
                }
            }

            /**
             * @brief Make room for item i by relocating one placed item
             * @return true if item i was placed
             */
            bool repair(std::size_t i) {
                double best_delta = std::numeric_limits<double>::infinity();
                std::size_t best_slot = kUnassigned, moved = kUnassigned, target = kUnassigned;

                for (std::size_t s : candidates(i)) {
                    for (std::size_t v : model.slotVariables(s)) {
                        const std::size_t j = model.variables()[v].item;
                        if (j == i || result.placement[j] != s)
                            continue;
                        if (residual[s] + items[j].size + OptimizationModel::kCapacityTolerance < items[i].size)
                            continue;
                        for (std::size_t w : model.itemVariables(j)) {
                            const std::size_t t = model.variables()[w].slot;
                            if (t == s || !fits(t, items[j].size))
                                continue;
                            const double delta = cost(j, t) - cost(j, s) + cost(i, s);
                            if (delta < best_delta - kEps) {
                                best_delta = delta;
                                best_slot = s;
                                moved = j;
                                target = t;
                            }
                        }
                    }
                }

                if (best_slot == kUnassigned)
                    return false;
                place(moved, target);
                place(i, best_slot);
                return true;
            }

            /// @brief Best single-item relocation; returns true if one was applied
            bool relocate(std::size_t i) {
                const std::size_t current = result.placement[i];
                const double current_cost = cost(i, current);
                double best_delta = 0.0;
                std::size_t best = current;

                for (std::size_t v : model.itemVariables(i)) {
                    const std::size_t t = model.variables()[v].slot;
                    if (t == current || !fits(t, items[i].size))
                        continue;
                    const double delta = cost(i, t) - current_cost;
                    // Placing an unassigned item at equal cost still wins: fewer unassigned.
                    const bool better = delta < best_delta - kEps
                        || (current == kUnassigned && best == current && delta <= kEps);
                    if (better) {
                        best_delta = delta;
                        best = t;
                    }
                }
                if (allowUnassigned() && current != kUnassigned) {
                    const double delta = model.unassignedCost(i) - current_cost;
                    if (delta < best_delta - kEps) {
                        best_delta = delta;
                        best = kUnassigned;
                    }
                }

                if (best == current)
                    return false;
                place(i, best);
                return true;
            }

            /// @brief Relocate and swap passes; stops mid-pass once the deadline is reached
            void passes(const TimeLimit& limit) {
                const auto& order = model.itemOrder();
                bool improved = true;
                for (int pass = 0; improved && pass < kMaxPasses; ++pass) {
                    improved = false;
                    for (std::size_t i : order) {
                        if (limit.reached())
                            return;
                        if (relocate(i)) {
                            improved = true;
                            ++result.moves;
                        }
                    }
                    for (std::size_t x = 0; x < order.size(); ++x) {
                        if (limit.reached())
                            return;
                        for (std::size_t y = x + 1; y < order.size(); ++y) {
                            if (swap(order[x], order[y])) {
                                improved = true;
                                ++result.moves;
                            }
                        }
                    }
                }
            }

            /// @brief Exchange the slots of items a and b if that is strictly better
            bool swap(std::size_t a, std::size_t b) {
                const std::size_t sa = result.placement[a];
                const std::size_t sb = result.placement[b];
                if (sa == kUnassigned || sb == kUnassigned || sa == sb)
                    return false;
                if (!model.matrix().compatible(a, sb) || !model.matrix().compatible(b, sa))
                    return false;

                const double tol = OptimizationModel::kCapacityTolerance;
                if (residual[sa] + items[a].size - items[b].size < -tol)
                    return false;
                if (residual[sb] + items[b].size - items[a].size < -tol)
                    return false;

                const double delta = cost(a, sb) + cost(b, sa) - cost(a, sa) - cost(b, sb);
                if (delta >= -kEps)
                    return false;

                residual[sa] += items[a].size - items[b].size;
                residual[sb] += items[b].size - items[a].size;
                result.placement[a] = sb;
                result.placement[b] = sa;
                return true;
            }

            void improve(const TimeLimit& limit) {
                passes(limit);
                if (!allowUnassigned()) {
                    result.unplaced = static_cast<std::size_t>(std::count(
                        result.placement.begin(), result.placement.end(), kUnassigned));
                }
            }
        };
    };

} // namespace assign
