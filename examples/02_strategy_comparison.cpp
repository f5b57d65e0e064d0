/*
================================================================================
EXAMPLE 02: STRATEGY COMPARISON - Greedy vs. Exact, Full vs. Partial Coverage
================================================================================
DIFFICULTY: Intermediate
PROBLEM TYPE: Binary assignment with capacities and compatibility rules

PROBLEM DESCRIPTION
-------------------
A distribution center has more stock than shelf space. The same catalog is
solved four ways:
1. Greedy heuristic (fast, no optimality proof)
2. Exact branch-and-bound with a progress callback
3. Exact search stopped early by a node limit
4. Partial coverage: some products may stay in the overflow area, at a
   penalty per unit of pick frequency

MATHEMATICAL MODEL
------------------
Variables:
    x[i,s] in {0,1}             1 if product i is stored on shelf s

Objective (partial coverage, penalty p):
    min  sum f_i * c_s * x[i,s]  +  p * sum_i f_i * (1 - sum_s x[i,s])

Constraints:
    cover[i]:  sum_s x[i,s] <= 1                      for all i
    cap[s]:    sum_i size_i * x[i,s] <= capacity_s    for all s

ENGINE FEATURES DEMONSTRATED
----------------------------
- SolverConfig presets      Greedy, Fast
- SearchCallback            Incumbent and progress hooks
- node_limit                Early termination with status "feasible"
- ModelOptions              allow_unassigned, unassigned_penalty
- raise_infeasible          Infeasibility as a status instead of an error
- computeStatistics()       Model size and pruning

================================================================================
*/

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <absl/log/initialize.h>
#include <absl/log/log.h>

#include <assign_engine/assign_engine.h>

// ============================================================================
// PROGRESS CALLBACK
// ============================================================================
class PrintProgress : public assign::SearchCallback {
public:
    PrintProgress() { setProgressInterval(500); }

protected:
    void onIncumbent(const assign::IncumbentView& view) override {
        std::cout << "    incumbent " << std::setw(8) << view.penalizedObjective
                  << "  (" << view.unassigned << " unassigned, node "
                  << view.progress.nodeCount << ")\n";
    }

    void onProgress(const assign::Progress& p) override {
        std::cout << "    node " << std::setw(6) << p.nodeCount
                  << "  best " << p.bestObj << "  bound " << p.bestBound << "\n";
    }
};

namespace {

    void printLine(const std::string& label, const assign::Solution& s) {
        std::cout << std::left << std::setw(24) << label << std::right
                  << std::setw(10) << assign::statusString(s.status())
                  << std::setw(10) << s.objective()
                  << std::setw(12) << s.penalizedObjective()
                  << std::setw(12) << s.numUnassigned() << "\n";
    }

} // namespace

// ============================================================================
// MAIN PROGRAM
// ============================================================================
int main() {
    absl::InitializeLog();

    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 02: Strategy Comparison\n";
    std::cout << "================================================================\n\n";

    try {
        // ====================================================================
        // PROBLEM DATA
        // ====================================================================
        std::vector<assign::Item> items = {
            { "P01", 9, 4.0, "regular" },   { "P02", 7, 3.0, "fragile" },
            { "P03", 6, 5.0, "regular" },   { "P04", 5, 2.0, "hazardous" },
            { "P05", 4, 6.0, "regular" },   { "P06", 3, 3.0, "fragile" },
            { "P07", 2, 4.0, "regular" },   { "P08", 2, 2.0, "regular" },
            { "P09", 1, 5.0, "regular" },   { "P10", 8, 3.0, "regular" },
            { "P11", 6, 4.0, "fragile" },   { "P12", 1, 6.0, "hazardous" },
        };

        std::vector<assign::Slot> slots = {
            { "A1", 14.0, 1.0, "safe" },    { "A2", 10.0, 1.5, "safe" },
            { "B1", 16.0, 2.0, "regular" }, { "B2", 12.0, 2.5, "regular" },
            { "C1", 10.0, 3.0, "special" },
        };

        auto catalog = assign::load(items, slots);
        auto matrix = assign::resolve(catalog, assign::warehouseRules());

        std::cout << std::left << std::setw(24) << "RUN" << std::right
                  << std::setw(10) << "STATUS" << std::setw(10) << "COST"
                  << std::setw(12) << "PENALIZED" << std::setw(12) << "UNASSIGNED" << "\n";

        // ====================================================================
        // FULL COVERAGE
        // ====================================================================
        auto model = assign::build(catalog, matrix);
        auto stats = assign::computeStatistics(model);

        auto greedy = assign::solve(model, assign::SolverConfig::preset(assign::Preset::Greedy));
        printLine("greedy", greedy);

        PrintProgress progress;
        std::cout << "  exact search:\n";
        auto exact = assign::solve(model, assign::SolverConfig::preset(assign::Preset::Fast), &progress);
        printLine("branch-and-bound", exact);

        auto limited_config = assign::SolverConfig::preset(assign::Preset::Fast);
        limited_config.node_limit = 5;
        auto limited = assign::solve(model, limited_config);
        printLine("node limit 5", limited);

        // ====================================================================
        // PARTIAL COVERAGE
        // ====================================================================
        auto partial_model = assign::build(catalog, matrix,
                                           { .allow_unassigned = true, .unassigned_penalty = 2.0 });
        assign::SolverConfig partial_config;
        partial_config.allow_unassigned = true;
        partial_config.raise_infeasible = false;
        auto partial = assign::solve(partial_model, partial_config);
        printLine("overflow penalty 2", partial);

        // ====================================================================
        // DETAILS
        // ====================================================================
        std::cout << "\nModel: " << stats.numVars << " variables, " << stats.numPruned
                  << " incompatible pairs pruned, density "
                  << std::fixed << std::setprecision(2) << stats.density()
                  << std::defaultfloat << "\n";
        std::cout << "Exact search explored "
                  << exact.statistics().get_or<std::int64_t>("stat:Nodes", 0) << " nodes\n\n";

        std::cout << assign::report(partial, catalog, &matrix).summary();
    }
    catch (const assign::Error& e) {
        LOG(ERROR) << e.what() << " [" << e.identifier() << ", " << e.constraint() << "]";
        return 1;
    }
    catch (const std::exception& e) {
        LOG(ERROR) << e.what();
        return 1;
    }

    return 0;
}
