#pragma once
/*
===============================================================================
CALLBACKS — Search progress notification and cooperative abort
===============================================================================

Overview
--------
Exact backends explore a search tree that may take longer than the caller is
willing to wait. SearchCallback lets the caller observe that search and stop
it:

    * onIncumbent()  — a new best assignment was found
    * onProgress()   — periodic metrics (nodes, bound, gap, runtime)
    * abort()        — request termination; honoured at the next node

Abort is cooperative: backends only check it between search-tree nodes, so
the incumbent they return is always a complete, well-formed assignment. It
may be called from any thread.

The built-in branch-and-bound calls the hooks directly; the Gurobi backend
forwards its MIPSOL/MIP callback events to the same hooks.

Typical Usage
-------------
    class StopWhenClose : public assign::SearchCallback {
    protected:
        void onProgress(const assign::Progress& p) override {
            if (p.hasSolution() && p.gapWithin(0.01)) abort();
        }
    };

    StopWhenClose cb;
    auto solution = assign::solve(model, config, &cb);

Callback Points
---------------
| Method         | When Called                     | Common Use              |
|----------------|---------------------------------|-------------------------|
| onIncumbent()  | New incumbent found             | Logging, checkpoints    |
| onProgress()   | Every progressInterval() nodes  | Monitoring, early stop  |

Exception Safety
----------------
• Exceptions thrown from hooks propagate out of solve() unchanged (built-in
  backends) or abort the Gurobi optimization (Gurobi backend)

===============================================================================
*/

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <limits>

#include "optimization_model.h"

namespace assign {

    /**
     * @brief Search progress metrics
     *
     * @note bestObj and bestBound are penalized objective values.
     */
    struct Progress {
        double runtime = 0.0;                                          ///< seconds since solve start
        double bestObj = std::numeric_limits<double>::infinity();      ///< incumbent objective
        double bestBound = -std::numeric_limits<double>::infinity();   ///< proven lower bound
        double gap = std::numeric_limits<double>::infinity();          ///< relative gap
        std::int64_t nodeCount = 0;                                    ///< nodes explored
        int solutionCount = 0;                                         ///< incumbents found

        bool hasSolution() const noexcept { return solutionCount > 0; }

        bool gapWithin(double tolerance = 0.01) const noexcept { return gap <= tolerance; }

        /// @brief Relative gap of an incumbent against a bound
        static double relativeGap(double obj, double bound) noexcept {
            if (!std::isfinite(obj) || !std::isfinite(bound))
                return std::numeric_limits<double>::infinity();
            const double diff = std::abs(obj - bound);
            if (diff <= 1e-12)
                return 0.0;
            return diff / std::max(std::abs(obj), 1e-10);
        }
    };

    /**
     * @brief New incumbent as seen by onIncumbent()
     *
     * @note References are only valid for the duration of the call.
     */
    struct IncumbentView {
        const Placement& placement;     ///< slot index per catalog item
        double objective;               ///< placement cost
        double penalizedObjective;      ///< model objective
        std::size_t unassigned;         ///< number of unplaced items
        const Progress& progress;
    };

    /**
     * @class SearchCallback
     * @brief Base class for search observers
     */
    class SearchCallback {
    public:
        virtual ~SearchCallback() = default;

        /// @brief Request termination at the next node boundary
        void abort() noexcept { aborted_.store(true, std::memory_order_relaxed); }

        bool aborted() const noexcept { return aborted_.load(std::memory_order_relaxed); }

        /// @brief Clear a previous abort so the callback can serve another solve
        void reset() noexcept { aborted_.store(false, std::memory_order_relaxed); }

        /// @brief Nodes between two onProgress() calls
        std::int64_t progressInterval() const noexcept { return progress_interval_; }

        void setProgressInterval(std::int64_t nodes) noexcept {
            progress_interval_ = nodes > 0 ? nodes : 1;
        }

        // Entry points used by the backends.
        void notifyIncumbent(const IncumbentView& view) { onIncumbent(view); }
        void notifyProgress(const Progress& p) { onProgress(p); }

    protected:
        virtual void onIncumbent(const IncumbentView& view) { (void)view; }

        virtual void onProgress(const Progress& p) { (void)p; }

    private:
        std::atomic<bool> aborted_{ false };
        std::int64_t progress_interval_ = 1000;
    };

} // namespace assign
