#pragma once
/*
===============================================================================
ASSIGN ENGINE — Unified Include Header
===============================================================================

OVERVIEW
--------
Single-include header of the capacitated compatibility-constrained
assignment engine. Items are placed into slots so that slot capacities hold,
every placement is permitted by the compatibility rules, and the sum of
frequency * slot cost is minimal.

PIPELINE
--------
    load       items + slots             -> Catalog            (catalog.h)
    resolve    Catalog + RuleSet          -> CompatibilityMatrix (compatibility.h)
    build      Catalog + matrix + options -> OptimizationModel  (model_builder.h)
    solve      model + SolverConfig       -> Solution           (solver.h)
    report     Solution + Catalog         -> AssignmentReport   (report.h)

QUICK START
-----------
    #include <assign_engine/assign_engine.h>

    int main() {
        auto catalog = assign::load(
            { { "M1", 3, 5.0, "fragile" } },
            { { "B1", 15.0, 1.0, "safe" }, { "B3", 10.0, 3.0, "special" } });

        auto matrix   = assign::resolve(catalog, assign::warehouseRules());
        auto model    = assign::build(catalog, matrix);
        auto solution = assign::solve(model);

        std::cout << assign::report(solution, catalog, &matrix).summary();
        // M1 -> B1, objective 3
    }

The Gurobi backend is not part of this header; include gurobi_backend.h and
link the assign_engine_gurobi target to use it.

REQUIREMENTS
------------
• C++20 compiler (GCC 10+, Clang 12+, MSVC 19.29+)
• Abseil (absl::log)

NAMESPACE
---------
All components are in the `assign::` namespace, including the
`assign::make_name::` and `assign::force_name::` naming helpers.

CONFIGURATION
-------------
Build configuration affects naming behavior:
• Debug builds (ASSIGN_DEBUG or _DEBUG defined): model element names
  from make_name::
• Release builds: make_name:: returns empty strings (names:: always names)

===============================================================================
*/

// ============================================================================
// CORE COMPONENTS (order matters for dependencies)
// ============================================================================

// Naming utilities (no dependencies)
#include "naming.h"

// Enum utilities (no dependencies)
#include "enum_utils.h"

// Data store (no dependencies, used by Solution statistics)
#include "data_store.h"

// Error taxonomy
#include "errors.h"

// Entity catalog and compatibility resolution
#include "catalog.h"
#include "compatibility.h"

// ============================================================================
// MODEL AND SOLVING
// ============================================================================

// Optimization model and its builder
#include "optimization_model.h"
#include "model_builder.h"

// Search callbacks (used by every backend)
#include "callbacks.h"

// Solution, backends and strategy dispatch
#include "solution.h"
#include "presolve.h"
#include "solver_backend.h"
#include "heuristic.h"
#include "branch_and_bound.h"
#include "solver.h"

// ============================================================================
// RESULTS
// ============================================================================

#include "report.h"
#include "diagnostics.h"
