#pragma once
/*
===============================================================================
GUROBI BACKEND — Exact solve through the Gurobi C++ API
===============================================================================

Overview
--------
GurobiSolver hands the OptimizationModel to Gurobi as a binary program. It is
an alternative exact backend for instances too large for the built-in
branch-and-bound; link against the assign_engine_gurobi target to use it.

    OptimizationModel              Gurobi
    -----------------              ------
    Variable x[i,s]           ->   GRB_BINARY var, name x[item,slot]
    cover[i] (= 1 or <= 1)    ->   linear constraint cover[item]
    cap[s]                    ->   linear constraint cap[slot]
    penalized objective       ->   objective 0 (priority 2)
    fewer unassigned items    ->   objective 1 (priority 1, only when
                                   unassigned items are allowed)

Variable and constraint names are set in debug builds only (make_name::).

Parameters
----------
    SolverConfig          Gurobi parameter
    time_limit_seconds    TimeLimit (not set when infinite)
    node_limit            NodeLimit (not set when 0)
    threads               Threads
    seed                  Seed
    verbose               OutputFlag

Callbacks
---------
A GRBCallback bridge forwards MIPSOL events to SearchCallback::onIncumbent()
and MIP events to onProgress(). SearchCallback::abort() is polled in every
callback and ends the optimization through GRBCallback::abort().

Status Mapping
--------------
    GRB_OPTIMAL                                     -> optimal
    TIME_LIMIT / NODE_LIMIT / INTERRUPTED + solution -> feasible
    TIME_LIMIT / NODE_LIMIT / INTERRUPTED, none      -> unsolved
    GRB_INFEASIBLE                                  -> infeasible

Limitations
-----------
The lexicographic tie-break between assignments of equal objective and equal
number of unassigned items is best effort: Gurobi returns one optimal
assignment, not necessarily the lexicographically smallest.

Gurobi failures (license, numerical trouble) are rethrown as assign::Error
with constraint "gurobi".

===============================================================================
*/

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/log/log.h>

#include "gurobi_c++.h"

#include "callbacks.h"
#include "errors.h"
#include "naming.h"
#include "optimization_model.h"
#include "presolve.h"
#include "solution.h"
#include "solver_backend.h"

namespace assign {

    /**
     * @brief Human-readable name of a Gurobi status code
     */
    inline std::string gurobiStatusString(int status) {
        switch (status) {
            case GRB_LOADED:          return "LOADED";
            case GRB_OPTIMAL:         return "OPTIMAL";
            case GRB_INFEASIBLE:      return "INFEASIBLE";
            case GRB_INF_OR_UNBD:     return "INF_OR_UNBD";
            case GRB_UNBOUNDED:       return "UNBOUNDED";
            case GRB_NODE_LIMIT:      return "NODE_LIMIT";
            case GRB_TIME_LIMIT:      return "TIME_LIMIT";
            case GRB_SOLUTION_LIMIT:  return "SOLUTION_LIMIT";
            case GRB_INTERRUPTED:     return "INTERRUPTED";
            case GRB_NUMERIC:         return "NUMERIC";
            case GRB_SUBOPTIMAL:      return "SUBOPTIMAL";
            default:                  return "UNKNOWN(" + std::to_string(status) + ")";
        }
    }

    namespace gurobi_detail {

        /// @brief Round a binary solution vector to a placement
        inline Placement toPlacement(const OptimizationModel& model, const std::vector<double>& x) {
            Placement placement(model.catalog().numItems(), kUnassigned);
            for (std::size_t v = 0; v < x.size(); ++v) {
                if (x[v] > 0.5)
                    placement[model.variables()[v].item] = model.variables()[v].slot;
            }
            return placement;
        }

        /**
         * @class CallbackBridge
         * @brief Dispatch Gurobi's where-based callback to a SearchCallback
         */
        class CallbackBridge : public GRBCallback {
        public:
            CallbackBridge(const OptimizationModel& model, const std::vector<GRBVar>& vars,
                           SearchCallback& target)
                : model_(model), vars_(vars), target_(target)
            {
            }

            std::int64_t incumbents() const noexcept { return incumbents_; }

        protected:
            void callback() override {
                try {
                    if (target_.aborted()) {
                        abort();
                        return;
                    }
                    if (where == GRB_CB_MIPSOL) {
                        std::vector<double> x;
                        x.reserve(vars_.size());
                        for (const GRBVar& v : vars_)
                            x.push_back(getSolution(v));
                        const Placement placement = toPlacement(model_, x);

                        Progress p = progress(GRB_CB_MIPSOL_OBJBST, GRB_CB_MIPSOL_OBJBND,
                                              GRB_CB_MIPSOL_NODCNT, GRB_CB_MIPSOL_SOLCNT);
                        ++incumbents_;
                        std::size_t unassigned = 0;
                        for (std::size_t s : placement)
                            unassigned += (s == kUnassigned);
                        target_.notifyIncumbent(IncumbentView{
                            placement, model_.placementCost(placement),
                            model_.penalizedCost(placement), unassigned, p });
                    } else if (where == GRB_CB_MIP) {
                        target_.notifyProgress(progress(GRB_CB_MIP_OBJBST, GRB_CB_MIP_OBJBND,
                                                        GRB_CB_MIP_NODCNT, GRB_CB_MIP_SOLCNT));
                    }
                } catch (GRBException&) {
                    throw;
                } catch (std::exception& e) {
                    throw GRBException(e.what(), GRB_ERROR_CALLBACK);
                }
            }

        private:
            Progress progress(int obj, int bound, int nodes, int solutions) {
                Progress p;
                p.runtime = getDoubleInfo(GRB_CB_RUNTIME);
                p.bestObj = getDoubleInfo(obj);
                p.bestBound = getDoubleInfo(bound);
                p.nodeCount = static_cast<std::int64_t>(getDoubleInfo(nodes));
                p.solutionCount = getIntInfo(solutions);
                if (p.solutionCount > 0)
                    p.gap = Progress::relativeGap(p.bestObj, p.bestBound);
                return p;
            }

            const OptimizationModel& model_;
            const std::vector<GRBVar>& vars_;
            SearchCallback& target_;
            std::int64_t incumbents_ = 0;
        };

    } // namespace gurobi_detail

    /**
     * @class GurobiSolver
     * @brief Exact backend delegating to Gurobi
     *
     * A fresh GRBEnv and GRBModel are created per solve, so one GurobiSolver
     * may serve consecutive solves.
     */
    class GurobiSolver : public SolverBackend {
    public:
        std::string_view name() const noexcept override { return "gurobi"; }
        bool isExact() const noexcept override { return true; }

    protected:
        Solution search(const OptimizationModel& model, const SolverConfig& config,
                        SearchCallback* callback, DataStore& statistics) override
        {
            try {
                return run(model, config, callback, statistics);
            } catch (const GRBException& e) {
                LOG(WARNING) << "Gurobi error " << e.getErrorCode() << ": " << e.getMessage();
                throw Error("Gurobi error " + std::to_string(e.getErrorCode()) + ": "
                                + e.getMessage(), "", "gurobi");
            }
        }

    private:
        Solution run(const OptimizationModel& model, const SolverConfig& config,
                     SearchCallback* callback, DataStore& statistics)
        {
            auto env = std::make_unique<GRBEnv>(true);  // defer license check and load
            env->set(GRB_IntParam_OutputFlag, config.verbose ? 1 : 0);
            env->start();
            GRBModel grb(*env);

            configure(grb, config);
            statistics["param:OutputFlag"] = config.verbose ? 1 : 0;

            const auto& items = model.catalog().items();
            const auto& slots = model.catalog().slots();

            std::vector<GRBVar> vars;
            vars.reserve(model.numVariables());
            for (const Variable& v : model.variables()) {
                vars.push_back(grb.addVar(0.0, 1.0, 0.0, GRB_BINARY,
                                          make_name::math("x", items[v.item].id, slots[v.slot].id)));
            }

            for (const LinearConstraint& c : model.constraints()) {
                GRBLinExpr lhs;
                for (const Term& t : c.terms)
                    lhs += t.coef * vars[t.var];
                const char sense = c.sense == Sense::Equal ? GRB_EQUAL : GRB_LESS_EQUAL;
                const std::string name = c.kind == ConstraintKind::Coverage
                    ? make_name::math("cover", items[c.owner].id)
                    : make_name::math("cap", slots[c.owner].id);
                grb.addConstr(lhs, sense, c.rhs, name);
            }

            GRBLinExpr objective = model.objectiveConstant();
            for (std::size_t v = 0; v < vars.size(); ++v)
                objective += model.variables()[v].objective * vars[v];

            if (model.options().allow_unassigned) {
                GRBLinExpr placed;
                for (const GRBVar& x : vars)
                    placed += x;
                grb.set(GRB_IntAttr_ModelSense, GRB_MINIMIZE);
                grb.setObjectiveN(objective, 0, 2, 1.0, 0.0, 0.0, "penalized_cost");
                grb.setObjectiveN(-placed, 1, 1, 1.0, 0.0, 0.0, "unassigned");
            } else {
                grb.setObjective(objective, GRB_MINIMIZE);
            }

            std::unique_ptr<gurobi_detail::CallbackBridge> bridge;
            if (callback) {
                bridge = std::make_unique<gurobi_detail::CallbackBridge>(model, vars, *callback);
                grb.setCallback(bridge.get());
            }

            grb.optimize();

            const int status = grb.get(GRB_IntAttr_Status);
            const int found = grb.get(GRB_IntAttr_SolCount);
            statistics["stat:GurobiStatus"] = gurobiStatusString(status);
            statistics["stat:Runtime"] = grb.get(GRB_DoubleAttr_Runtime);
            statistics["stat:Nodes"] = static_cast<std::int64_t>(grb.get(GRB_DoubleAttr_NodeCount));
            statistics["stat:Incumbents"] = static_cast<std::int64_t>(found);
            if (found > 0 && !model.options().allow_unassigned)
                statistics["stat:BestBound"] = grb.get(GRB_DoubleAttr_ObjBound);

            VLOG(1) << "Gurobi returned " << gurobiStatusString(status)
                    << " with " << found << " solution(s)";

            if (status == GRB_INFEASIBLE || status == GRB_INF_OR_UNBD) {
                return infeasible(model, config,
                                  InfeasibilityProof{ "", "search",
                                      "Gurobi proved that no assignment covers every item" },
                                  std::move(statistics));
            }

            if (found == 0)
                return Solution::empty(model, SolveStatus::Unsolved, std::move(statistics));

            std::vector<double> x;
            x.reserve(vars.size());
            for (const GRBVar& v : vars)
                x.push_back(v.get(GRB_DoubleAttr_X));
            const Placement placement = gurobi_detail::toPlacement(model, x);

            if (!model.isFeasible(placement)) {
                throw ConsistencyError("Gurobi returned an assignment violating the model",
                                       "", "gurobi");
            }
            const SolveStatus result = status == GRB_OPTIMAL ? SolveStatus::Optimal
                                                              : SolveStatus::Feasible;
            return Solution::fromPlacement(model, placement, result, std::move(statistics));
        }

        static void configure(GRBModel& grb, const SolverConfig& config) {
            if (std::isfinite(config.time_limit_seconds))
                grb.set(GRB_DoubleParam_TimeLimit, config.time_limit_seconds);
            if (config.node_limit > 0)
                grb.set(GRB_DoubleParam_NodeLimit, static_cast<double>(config.node_limit));
            grb.set(GRB_IntParam_Threads, config.threads);
            grb.set(GRB_IntParam_Seed, static_cast<int>(config.seed % 2000000000ULL));
            grb.set(GRB_IntParam_OutputFlag, config.verbose ? 1 : 0);
        }
    };

} // namespace assign
