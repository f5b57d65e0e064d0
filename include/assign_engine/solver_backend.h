#pragma once
/*
===============================================================================
SOLVER BACKEND — Configuration and the common solve workflow
===============================================================================

Overview
--------
Every solving strategy implements SolverBackend. The base class owns the
workflow that must be identical for all of them:

    solve(model, config, callback) {
        validate config
        config.allow_unassigned must match the model's coverage policy
        presolve infeasibility proofs (complete coverage only)
        solution = search(model, config, callback, statistics)   // derived
        log outcome
    }

so that errors are classified the same way whichever backend runs:

    ModelError       coverage policy of config and model differ
    InfeasibleError  infeasibility proven (presolve or exhausted search)
    std::invalid_argument  malformed configuration

Configuration
-------------
SolverConfig is a plain struct. Named presets cover common uses:

    Fast       exact, 1 s limit
    Accurate   exact, 60 s limit, no node limit
    Greedy     heuristic with local search
    Quiet      no solver output
    Debug      solver output

The effective parameters are copied into the Solution statistics under
"param:<Name>" keys.

===============================================================================
*/

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

#include <absl/log/log.h>

#include "callbacks.h"
#include "data_store.h"
#include "enum_utils.h"
#include "errors.h"
#include "optimization_model.h"
#include "presolve.h"
#include "solution.h"

namespace assign {

    ASSIGN_DECLARE_ENUM_WITH_COUNT(Strategy, Exact, Heuristic);
    ASSIGN_DECLARE_ENUM_WITH_COUNT(Preset, Fast, Accurate, Greedy, Quiet, Debug);

} // namespace assign

ASSIGN_DECLARE_ENUM_NAMES(assign::Strategy, "exact", "heuristic");
ASSIGN_DECLARE_ENUM_NAMES(assign::Preset, "fast", "accurate", "greedy", "quiet", "debug");

namespace assign {

    /**
     * @brief Solve configuration
     */
    struct SolverConfig {
        double time_limit_seconds = 10.0;   ///< wall-clock limit; infinity = none
        std::int64_t node_limit = 0;        ///< search-tree nodes; 0 = none
        bool allow_unassigned = false;      ///< must match ModelOptions::allow_unassigned
        Strategy strategy = Strategy::Exact;
        std::uint64_t seed = 0;             ///< forwarded to backends with randomized internals
        bool local_search = true;           ///< heuristic: improve the greedy assignment
        bool warm_start = true;             ///< exact: seed the incumbent with the heuristic
        int threads = 1;                    ///< Gurobi threads (0 = automatic)
        bool verbose = false;               ///< backend output
        bool raise_infeasible = true;       ///< throw InfeasibleError instead of returning "infeasible"

        /// @brief Configuration of a named preset
        static SolverConfig preset(Preset p) {
            SolverConfig config;
            config.applyPreset(p);
            return config;
        }

        /**
         * @brief Apply a predefined parameter set on top of the current values
         */
        SolverConfig& applyPreset(Preset p) {
            switch (p) {
                case Preset::Fast:
                    strategy = Strategy::Exact;
                    time_limit_seconds = 1.0;
                    break;
                case Preset::Accurate:
                    strategy = Strategy::Exact;
                    time_limit_seconds = 60.0;
                    node_limit = 0;
                    break;
                case Preset::Greedy:
                    strategy = Strategy::Heuristic;
                    local_search = true;
                    break;
                case Preset::Quiet:
                    verbose = false;
                    break;
                case Preset::Debug:
                    verbose = true;
                    break;
                default:
                    break;
            }
            return *this;
        }

        /// @throws std::invalid_argument for negative or NaN limits
        void validate() const {
            if (std::isnan(time_limit_seconds) || time_limit_seconds < 0.0) {
                throw std::invalid_argument("SolverConfig: time_limit_seconds must be >= 0");
            }
            if (node_limit < 0) {
                throw std::invalid_argument("SolverConfig: node_limit must be >= 0");
            }
            if (threads < 0) {
                throw std::invalid_argument("SolverConfig: threads must be >= 0");
            }
        }
    };

    /**
     * @class TimeLimit
     * @brief Wall-clock deadline checked cooperatively by the backends
     */
    class TimeLimit {
    public:
        using Clock = std::chrono::steady_clock;

        explicit TimeLimit(double seconds)
            : start_(Clock::now()), limit_seconds_(seconds)
        {
        }

        double elapsed() const {
            return std::chrono::duration<double>(Clock::now() - start_).count();
        }

        double remaining() const {
            if (std::isinf(limit_seconds_))
                return limit_seconds_;
            return std::max(0.0, limit_seconds_ - elapsed());
        }

        bool reached() const {
            return !std::isinf(limit_seconds_) && elapsed() >= limit_seconds_;
        }

        double limit() const noexcept { return limit_seconds_; }

    private:
        Clock::time_point start_;
        double limit_seconds_;
    };

    /**
     * @class SolverBackend
     * @brief Anything that minimizes an OptimizationModel
     */
    class SolverBackend {
    public:
        virtual ~SolverBackend() = default;

        /// @brief Short backend name ("branch-and-bound", "greedy", "gurobi")
        virtual std::string_view name() const noexcept = 0;

        /// @brief True if a completed search proves optimality
        virtual bool isExact() const noexcept = 0;

        /**
         * @brief Run the common workflow around search()
         *
         * @throws ModelError        config and model coverage policies differ
         * @throws InfeasibleError   infeasibility proven (raise_infeasible)
         * @throws std::invalid_argument  malformed config
         */
        Solution solve(const OptimizationModel& model, const SolverConfig& config,
                       SearchCallback* callback = nullptr)
        {
            config.validate();
            if (config.allow_unassigned != model.options().allow_unassigned) {
                throw ModelError(std::string("solver config ")
                    + (config.allow_unassigned ? "allows" : "forbids")
                    + " unassigned items but the model was built to "
                    + (model.options().allow_unassigned ? "allow" : "forbid") + " them",
                    "", "allow_unassigned");
            }

            DataStore statistics;
            statistics["strategy"] = std::string(name());
            statistics["param:TimeLimit"] = config.time_limit_seconds;
            statistics["param:NodeLimit"] = config.node_limit;
            statistics["param:AllowUnassigned"] = config.allow_unassigned;
            statistics["param:Penalty"] = model.options().unassigned_penalty;

            LOG(INFO) << "Solving with " << name() << ": " << model.catalog().numItems()
                      << " items, " << model.catalog().numSlots() << " slots, "
                      << model.numVariables() << " variables";

            if (auto proof = proveInfeasible(model)) {
                statistics["stat:Presolve"] = std::string("infeasible");
                return infeasible(model, config, *proof, std::move(statistics));
            }

            Solution solution = search(model, config, callback, statistics);

            if (solution.status() == SolveStatus::Feasible && isExact()) {
                LOG(WARNING) << name() << " stopped before proving optimality; objective "
                             << solution.objective() << " is the best incumbent";
            }
            LOG(INFO) << name() << " finished: " << enum_name(solution.status())
                      << ", objective " << solution.objective() << ", "
                      << solution.numUnassigned() << " unassigned";
            return solution;
        }

    protected:
        /**
         * @brief Backend-specific search
         *
         * @param statistics Prefilled store; add "stat:*" entries and pass it
         *                   into the returned Solution
         */
        virtual Solution search(const OptimizationModel& model, const SolverConfig& config,
                                SearchCallback* callback, DataStore& statistics) = 0;

        /**
         * @brief Report proven infeasibility according to the config
         *
         * @throws InfeasibleError when config.raise_infeasible is set
         */
        static Solution infeasible(const OptimizationModel& model, const SolverConfig& config,
                                   const InfeasibilityProof& proof, DataStore statistics)
        {
            LOG(WARNING) << "No complete assignment exists: " << proof.message;
            if (config.raise_infeasible) {
                throw InfeasibleError(proof.message, proof.identifier, proof.constraint);
            }
            return Solution::empty(model, SolveStatus::Infeasible, std::move(statistics));
        }
    };

} // namespace assign
