/*
===============================================================================
TEST CALLBACKS — Tests for callbacks.h
===============================================================================

OVERVIEW
--------
Validates Progress metrics, the SearchCallback abort/reset protocol and the
way the built-in branch-and-bound drives the hooks.

TEST ORGANIZATION
-----------------
• Section A: Progress metrics
• Section B: SearchCallback state
• Section C: Hooks driven by the exact search

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• callbacks.h - System under test
• solver.h - Drives the hooks in Section C

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <assign_engine/assign_engine.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using Catch::Approx;

namespace {

    /// Records every hook call
    class Recorder : public assign::SearchCallback {
    public:
        std::vector<double> incumbents;
        std::vector<std::int64_t> progressNodes;
        bool abortOnFirstIncumbent = false;

    protected:
        void onIncumbent(const assign::IncumbentView& view) override {
            incumbents.push_back(view.penalizedObjective);
            if (abortOnFirstIncumbent)
                abort();
        }

        void onProgress(const assign::Progress& p) override {
            progressNodes.push_back(p.nodeCount);
        }
    };

    /// Catalog, matrix and model kept together; the model refers to the other two
    struct Instance {
        assign::Catalog catalog;
        assign::CompatibilityMatrix matrix;
        assign::OptimizationModel model;

        Instance(std::vector<assign::Item> items, std::vector<assign::Slot> slots)
            : catalog(assign::load(std::move(items), std::move(slots))),
              matrix(assign::resolve(catalog, assign::RuleSet{})),
              model(assign::build(catalog, matrix))
        {
        }

        Instance(const Instance&) = delete;
        Instance& operator=(const Instance&) = delete;
    };

    /// Six regular items over three slots; small enough to search exhaustively
    Instance sixItems() {
        return Instance(
            {
                { "I1", 5, 4.0, "regular" }, { "I2", 4, 3.0, "regular" },
                { "I3", 3, 5.0, "regular" }, { "I4", 2, 2.0, "regular" },
                { "I5", 2, 6.0, "regular" }, { "I6", 1, 3.0, "regular" },
            },
            {
                { "S1", 8.0, 1.0, "regular" },
                { "S2", 9.0, 2.0, "regular" },
                { "S3", 10.0, 4.0, "regular" },
            });
    }

} // namespace

// ============================================================================
// SECTION A: PROGRESS METRICS
// ============================================================================

/**
 * @test Progress::RelativeGap
 * @brief Verifies the gap formula and its degenerate cases
 */
TEST_CASE("A1: Progress::RelativeGap", "[callbacks][progress]")
{
    REQUIRE(assign::Progress::relativeGap(10.0, 8.0) == Approx(0.2));
    REQUIRE(assign::Progress::relativeGap(5.0, 5.0) == 0.0);
    REQUIRE(assign::Progress::relativeGap(0.0, 0.0) == 0.0);
    REQUIRE(std::isinf(assign::Progress::relativeGap(
        std::numeric_limits<double>::infinity(), 1.0)));

    assign::Progress p;
    REQUIRE_FALSE(p.hasSolution());
    REQUIRE_FALSE(p.gapWithin(0.5));

    p.solutionCount = 1;
    p.gap = 0.005;
    REQUIRE(p.hasSolution());
    REQUIRE(p.gapWithin());
}

// ============================================================================
// SECTION B: SEARCHCALLBACK STATE
// ============================================================================

/**
 * @test SearchCallback::AbortResetInterval
 * @brief Verifies abort flag handling and progress interval clamping
 */
TEST_CASE("B1: SearchCallback::AbortResetInterval", "[callbacks][state]")
{
    Recorder cb;
    REQUIRE_FALSE(cb.aborted());
    cb.abort();
    REQUIRE(cb.aborted());
    cb.reset();
    REQUIRE_FALSE(cb.aborted());

    REQUIRE(cb.progressInterval() == 1000);
    cb.setProgressInterval(10);
    REQUIRE(cb.progressInterval() == 10);
    cb.setProgressInterval(0);
    REQUIRE(cb.progressInterval() == 1);
}

// ============================================================================
// SECTION C: HOOKS DRIVEN BY THE EXACT SEARCH
// ============================================================================

/**
 * @test Hooks::IncumbentsImprove
 * @brief Verifies incumbents are reported in strictly improving order
 *
 * @given Exact search without warm start
 * @then Every reported incumbent beats the previous one and the last one is
 *       the returned objective
 */
TEST_CASE("C1: Hooks::IncumbentsImprove", "[callbacks][hooks]")
{
    auto inst = sixItems();
    assign::SolverConfig config;
    config.warm_start = false;

    Recorder cb;
    auto solution = assign::solve(inst.model, config, &cb);

    REQUIRE(solution.isOptimal());
    REQUIRE_FALSE(cb.incumbents.empty());
    for (std::size_t k = 1; k < cb.incumbents.size(); ++k)
        REQUIRE(cb.incumbents[k] < cb.incumbents[k - 1]);
    REQUIRE(cb.incumbents.back() == Approx(solution.penalizedObjective()));
    REQUIRE(solution.statistics().at("stat:Incumbents").get<std::int64_t>()
            == static_cast<std::int64_t>(cb.incumbents.size()));
}

/**
 * @test Hooks::ProgressEveryInterval
 * @brief Verifies onProgress fires every progressInterval() nodes
 */
TEST_CASE("C2: Hooks::ProgressEveryInterval", "[callbacks][hooks]")
{
    auto inst = sixItems();
    Recorder cb;
    cb.setProgressInterval(1);

    auto solution = assign::solve(inst.model, assign::SolverConfig{}, &cb);
    const auto nodes = solution.statistics().at("stat:Nodes").get<std::int64_t>();

    REQUIRE(nodes > 0);
    REQUIRE(static_cast<std::int64_t>(cb.progressNodes.size()) == nodes);
    REQUIRE(cb.progressNodes.front() == 1);
    REQUIRE(cb.progressNodes.back() == nodes);
}

/**
 * @test Hooks::AbortStopsSearch
 * @brief Verifies that abort() from a hook ends the search with the incumbent
 *
 * @given Warm start enabled and a callback aborting on the first incumbent
 * @then The greedy incumbent comes back as "feasible", never "optimal"
 */
TEST_CASE("C3: Hooks::AbortStopsSearch", "[callbacks][hooks]")
{
    auto inst = sixItems();
    Recorder cb;
    cb.abortOnFirstIncumbent = true;

    auto solution = assign::solve(inst.model, assign::SolverConfig{}, &cb);

    REQUIRE(solution.status() == assign::SolveStatus::Feasible);
    REQUIRE(cb.incumbents.size() == 1);
    REQUIRE(solution.statistics().at("stat:LimitReached").get<std::string>() == "abort");
    REQUIRE(inst.model.isFeasible([&] {
        assign::Placement p(inst.catalog.numItems(), assign::kUnassigned);
        for (const auto& [item, slot] : solution.assignments())
            p[inst.catalog.itemIndex(item)] = inst.catalog.slotIndex(*slot);
        return p;
    }()));
}

/**
 * @test Hooks::AbortedBeforeSolve
 * @brief Verifies that a pre-aborted callback yields "unsolved" without warm start
 */
TEST_CASE("C4: Hooks::AbortedBeforeSolve", "[callbacks][hooks]")
{
    auto inst = sixItems();
    Recorder cb;
    cb.abort();

    assign::SolverConfig config;
    config.warm_start = false;
    auto solution = assign::solve(inst.model, config, &cb);

    REQUIRE(solution.status() == assign::SolveStatus::Unsolved);
    REQUIRE_FALSE(solution.hasSolution());
    REQUIRE(solution.statistics().at("stat:Nodes").get<std::int64_t>() == 0);
}
