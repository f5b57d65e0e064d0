/*
================================================================================
EXAMPLE 01: WAREHOUSE SLOTTING - Products to Storage Bins
================================================================================
DIFFICULTY: Beginner
PROBLEM TYPE: Binary assignment with capacities and compatibility rules

PROBLEM DESCRIPTION
-------------------
A warehouse stores products in bins. Frequently picked products should sit in
cheap-to-reach bins, but:
- Fragile products may only go to safe bins
- Hazardous products may only go to special bins
- The total size of the products in a bin may not exceed its capacity

MATHEMATICAL MODEL
------------------
Sets:
    I                           Products (items)
    S                           Bins (slots)
    P = {(i,s) : compatible}    Pairs allowed by the warehouse rules

Variables:
    x[i,s] in {0,1}             1 if product i is stored in bin s

Objective:
    min  sum_{(i,s) in P} frequency_i * cost_s * x[i,s]

Constraints:
    cover[i]:  sum_s x[i,s] = 1                      for all i in I
    cap[s]:    sum_i size_i * x[i,s] <= capacity_s   for all s in S

ENGINE FEATURES DEMONSTRATED
----------------------------
- load()                    Validated catalog
- warehouseRules()          Category / slot-type compatibility
- build()                   Assignment model with pruned variables
- modelSummary()            Model diagnostics
- solve()                   Built-in exact branch-and-bound
- report()                  Independent cross-check and summary

================================================================================
*/

#include <cstdint>
#include <iostream>
#include <vector>

#include <absl/log/initialize.h>
#include <absl/log/log.h>

#include <assign_engine/assign_engine.h>

// ============================================================================
// MAIN PROGRAM
// ============================================================================
int main() {
    absl::InitializeLog();

    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 01: Warehouse Slotting\n";
    std::cout << "================================================================\n\n";

    try {
        // ====================================================================
        // PROBLEM DATA
        // ====================================================================
        //            id     frequency  size   category
        std::vector<assign::Item> items = {
            { "M1", 3, 5.0, "fragile" },
            { "M2", 1, 4.0, "hazardous" },
            { "M3", 2, 6.0, "regular" },
            { "M4", 5, 3.0, "regular" },
            { "M5", 4, 2.0, "fragile" },
        };

        //            id     capacity   cost   slot type
        std::vector<assign::Slot> slots = {
            { "B1", 15.0, 1.0, "safe" },
            { "B2", 12.0, 2.0, "regular" },
            { "B3", 10.0, 3.0, "special" },
        };

        // ====================================================================
        // PIPELINE: load -> resolve -> build -> solve -> report
        // ====================================================================
        auto catalog = assign::load(items, slots);
        auto matrix = assign::resolve(catalog, assign::warehouseRules());
        auto model = assign::build(catalog, matrix);

        std::cout << "MODEL\n-----\n" << assign::modelSummary(model) << "\n\n";

        auto config = assign::SolverConfig::preset(assign::Preset::Fast);
        auto solution = assign::solve(model, config);
        auto report = assign::report(solution, catalog, &matrix);

        std::cout << "RESULT\n------\n" << report.summary() << "\n";
        std::cout << "Nodes explored: "
                  << solution.statistics().get_or<std::int64_t>("stat:Nodes", 0) << "\n";
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
