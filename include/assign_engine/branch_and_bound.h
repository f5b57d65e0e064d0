#pragma once
/*
===============================================================================
BRANCH AND BOUND — Built-in exact backend
===============================================================================

Overview
--------
Depth-first enumeration of item placements with bound pruning. The backend
needs no external solver and is the default "exact" strategy.

Search tree
-----------
    depth d     the d-th item by ascending identifier
    branches    each compatible slot with room, by ascending slot identifier,
                then "unassigned" when the model allows it

Visiting the branches in this order enumerates placements in lexicographic
order (items by identifier, slots by identifier, unassigned last), which is
what gives the deterministic tie-break:

    key(placement) = (penalized objective, number of unassigned items)

    a leaf replaces the incumbent if its key is smaller, or if the key is
    equal and the leaf is lexicographically smaller

Bound
-----
    lb(node) = cost of the items placed so far
             + sum over remaining items of their cheapest option among
               slots that still have room (and the penalty, if allowed)

A remaining required item with no slot left prunes the node. A node is
pruned when lb exceeds the incumbent, or when lb equals it and the node can
no longer produce a leaf that wins the tie-break.

Limits
------
TimeLimit, SolverConfig::node_limit and SearchCallback::abort() are checked
at every node. When one triggers, the search unwinds and the best incumbent
is returned with status "feasible" (or "unsolved" if there is none).

Warm start
----------
With SolverConfig::warm_start the greedy heuristic runs first and its
assignment, if it satisfies the model, becomes the initial incumbent.

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include <absl/log/log.h>

#include "callbacks.h"
#include "heuristic.h"
#include "optimization_model.h"
#include "presolve.h"
#include "solution.h"
#include "solver_backend.h"

namespace assign {

    /**
     * @class BranchAndBoundSolver
     * @brief Exact depth-first branch-and-bound over the assignment model
     */
    class BranchAndBoundSolver : public SolverBackend {
    public:
        std::string_view name() const noexcept override { return "branch-and-bound"; }
        bool isExact() const noexcept override { return true; }

    protected:
        Solution search(const OptimizationModel& model, const SolverConfig& config,
                        SearchCallback* callback, DataStore& statistics) override
        {
            Search s(model, config, callback);

            s.progress.bestBound = s.rootBound();
            if (config.warm_start)
                s.warmStart();

            if (std::isfinite(s.progress.bestBound))
                s.dfs(0, 0.0, 0);

            statistics["stat:Nodes"] = s.progress.nodeCount;
            statistics["stat:Incumbents"] = static_cast<std::int64_t>(s.progress.solutionCount);
            statistics["stat:BestBound"] = s.progress.bestBound;
            statistics["stat:LimitReached"] = std::string(s.stop.empty() ? "none" : s.stop);
            statistics["stat:Runtime"] = s.limit.elapsed();

            VLOG(1) << "Branch-and-bound explored " << s.progress.nodeCount << " nodes, "
                    << s.progress.solutionCount << " incumbent(s), stop: "
                    << (s.stop.empty() ? "none" : s.stop);

            if (s.stop.empty()) {
                if (s.has_incumbent) {
                    return Solution::fromPlacement(model, s.incumbent, SolveStatus::Optimal,
                                                   std::move(statistics));
                }
                return infeasible(model, config,
                                  InfeasibilityProof{ "", "search",
                                      "exhaustive search found no assignment covering every item" },
                                  std::move(statistics));
            }

            if (s.has_incumbent) {
                return Solution::fromPlacement(model, s.incumbent, SolveStatus::Feasible,
                                               std::move(statistics));
            }
            return Solution::empty(model, SolveStatus::Unsolved, std::move(statistics));
        }

    private:
        static constexpr double kEps = 1e-9;

        struct Search {
            const OptimizationModel& model;
            const SolverConfig& config;
            SearchCallback* callback;
            const std::vector<Item>& items;
            const std::vector<Slot>& slots;
            const std::vector<std::size_t>& order;
            TimeLimit limit;

            Placement current;
            std::vector<double> residual;

            Placement incumbent;
            bool has_incumbent = false;
            double incumbent_cost = std::numeric_limits<double>::infinity();
            std::size_t incumbent_unassigned = 0;

            // Set once a leaf of this search matched or beat the incumbent key:
            // every later leaf with that key is lexicographically larger.
            bool prune_equal = false;

            Progress progress;
            std::string stop;

            Search(const OptimizationModel& m, const SolverConfig& c, SearchCallback* cb)
                : model(m), config(c), callback(cb),
                  items(m.catalog().items()), slots(m.catalog().slots()),
                  order(m.itemOrder()), limit(c.time_limit_seconds),
                  current(m.catalog().numItems(), kUnassigned)
            {
                residual.reserve(slots.size());
                for (const Slot& slot : slots)
                    residual.push_back(slot.capacity);
            }

            bool allowUnassigned() const { return model.options().allow_unassigned; }

            double placedCost(std::size_t i, std::size_t s) const {
                return static_cast<double>(items[i].frequency) * slots[s].cost;
            }

            void warmStart() {
                GreedySolver::Result r = GreedySolver::construct(model, config.local_search, limit);
                if (!model.isFeasible(r.placement)) {
                    VLOG(1) << "Warm start rejected: greedy assignment is incomplete";
                    return;
                }
                std::size_t unassigned = 0;
                for (std::size_t s : r.placement)
                    unassigned += (s == kUnassigned);
                accept(r.placement, model.penalizedCost(r.placement), unassigned);
            }

            /// @brief Bound of the remaining items from position depth on
            double remainingBound(std::size_t depth) const {
                double bound = 0.0;
                for (std::size_t d = depth; d < order.size(); ++d) {
                    const std::size_t i = order[d];
                    double best = allowUnassigned() ? model.unassignedCost(i)
                                                    : std::numeric_limits<double>::infinity();
                    for (std::size_t v : model.itemVariables(i)) {
                        const std::size_t s = model.variables()[v].slot;
                        if (residual[s] + OptimizationModel::kCapacityTolerance >= items[i].size)
                            best = std::min(best, placedCost(i, s));
                    }
                    if (!std::isfinite(best))
                        return best;
                    bound += best;
                }
                return bound;
            }

            double rootBound() const { return remainingBound(0); }

            /// @brief Lexicographic order of placements (unassigned sorts last)
            bool lexLess(const Placement& a, const Placement& b) const {
                for (std::size_t i : order) {
                    if (a[i] == b[i])
                        continue;
                    if (a[i] == kUnassigned)
                        return false;
                    if (b[i] == kUnassigned)
                        return true;
                    return model.slotRank(a[i]) < model.slotRank(b[i]);
                }
                return false;
            }

            void accept(const Placement& placement, double cost, std::size_t unassigned) {
                incumbent = placement;
                incumbent_cost = cost;
                incumbent_unassigned = unassigned;
                has_incumbent = true;
                ++progress.solutionCount;
                progress.bestObj = cost;
                progress.gap = Progress::relativeGap(cost, progress.bestBound);
                progress.runtime = limit.elapsed();

                VLOG(1) << "New incumbent: objective " << cost << ", "
                        << unassigned << " unassigned, node " << progress.nodeCount;
                if (callback) {
                    callback->notifyIncumbent(IncumbentView{
                        incumbent, model.placementCost(incumbent), cost, unassigned, progress });
                }
            }

            void leaf(double cost, std::size_t unassigned) {
                bool better = !has_incumbent || cost < incumbent_cost - kEps;
                bool equal = false;
                if (!better && std::abs(cost - incumbent_cost) <= kEps) {
                    if (unassigned < incumbent_unassigned) {
                        better = true;
                    } else if (unassigned == incumbent_unassigned) {
                        equal = true;
                        better = !prune_equal && lexLess(current, incumbent);
                    }
                }
                if (better)
                    accept(current, cost, unassigned);
                if (better || equal)
                    prune_equal = true;
            }

            bool limitsReached() {
                if (callback && callback->aborted()) {
                    stop = "abort";
                } else if (config.node_limit > 0 && progress.nodeCount >= config.node_limit) {
                    stop = "node";
                } else if (limit.reached()) {
                    stop = "time";
                }
                return !stop.empty();
            }

            void reportProgress() {
                if (!callback || progress.nodeCount % callback->progressInterval() != 0)
                    return;
                progress.runtime = limit.elapsed();
                progress.gap = Progress::relativeGap(progress.bestObj, progress.bestBound);
                callback->notifyProgress(progress);
            }

            void dfs(std::size_t depth, double cost, std::size_t unassigned) {
                if (!stop.empty() || limitsReached())
                    return;
                ++progress.nodeCount;
                reportProgress();

                if (depth == order.size()) {
                    leaf(cost, unassigned);
                    return;
                }

                if (has_incumbent) {
                    const double lb = cost + remainingBound(depth);
                    if (lb > incumbent_cost + kEps)
                        return;
                    if (lb >= incumbent_cost - kEps) {
                        if (unassigned > incumbent_unassigned)
                            return;
                        if (unassigned == incumbent_unassigned && prune_equal)
                            return;
                    }
                } else if (!std::isfinite(remainingBound(depth))) {
                    return;
                }

                const std::size_t i = order[depth];
                const double size = items[i].size;
                for (std::size_t v : model.itemVariables(i)) {
                    const std::size_t s = model.variables()[v].slot;
                    if (residual[s] + OptimizationModel::kCapacityTolerance < size)
                        continue;
                    residual[s] -= size;
                    current[i] = s;
                    dfs(depth + 1, cost + placedCost(i, s), unassigned);
                    current[i] = kUnassigned;
                    residual[s] += size;
                    if (!stop.empty())
                        return;
                }

                if (allowUnassigned())
                    dfs(depth + 1, cost + model.unassignedCost(i), unassigned + 1);
            }
        };
    };

} // namespace assign
