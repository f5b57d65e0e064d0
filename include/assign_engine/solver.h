#pragma once
/*
===============================================================================
SOLVER — Strategy dispatch
===============================================================================

Overview
--------
solve() picks the built-in backend named by SolverConfig::strategy:

    Strategy::Exact      BranchAndBoundSolver   optimal unless a limit stops it
    Strategy::Heuristic  GreedySolver           feasible, fast, deterministic

solveWith() runs any SolverBackend instead, e.g. GurobiSolver from the
optional assign_engine_gurobi target.

Concurrency
-----------
A solve keeps all of its search state local. Independent solves over the
same (immutable) OptimizationModel may run on different threads; a
SearchCallback must not be shared between concurrent solves.

Typical Usage
-------------
    auto catalog = assign::load(items, slots);
    auto matrix  = assign::resolve(catalog, assign::warehouseRules());
    auto model   = assign::build(catalog, matrix);

    auto solution = assign::solve(model, assign::SolverConfig::preset(assign::Preset::Fast));
    auto report   = assign::report(solution, catalog, &matrix);

===============================================================================
*/

#include "branch_and_bound.h"
#include "callbacks.h"
#include "heuristic.h"
#include "optimization_model.h"
#include "solution.h"
#include "solver_backend.h"

namespace assign {

    /**
     * @brief Minimize the model with a given backend
     */
    inline Solution solveWith(SolverBackend& backend, const OptimizationModel& model,
                              const SolverConfig& config, SearchCallback* callback = nullptr)
    {
        return backend.solve(model, config, callback);
    }

    /**
     * @brief Minimize the model with the built-in backend of config.strategy
     *
     * @throws ModelError        config.allow_unassigned differs from the model
     * @throws InfeasibleError   no complete assignment exists (raise_infeasible)
     * @throws std::invalid_argument  malformed config
     */
    inline Solution solve(const OptimizationModel& model, const SolverConfig& config = {},
                          SearchCallback* callback = nullptr)
    {
        if (config.strategy == Strategy::Heuristic) {
            GreedySolver greedy;
            return solveWith(greedy, model, config, callback);
        }
        BranchAndBoundSolver exact;
        return solveWith(exact, model, config, callback);
    }

} // namespace assign
