/*
===============================================================================
TEST MODEL_BUILDER — Tests for model_builder.h and optimization_model.h
===============================================================================

OVERVIEW
--------
Validates the template-method workflow of ModelBuilder, the assignment
formulation produced by AssignmentModelBuilder, the ModelError paths, and
the placement queries of OptimizationModel that every backend relies on.

TEST ORGANIZATION
-----------------
• Section A: Template-method workflow
• Section B: Variables (compatible pairs only, identifier order)
• Section C: Coverage and capacity constraints
• Section D: Objective and unassigned penalty
• Section E: ModelError paths
• Section F: Placement evaluation
• Section G: Input lifetimes

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• model_builder.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <assign_engine/catalog.h>
#include <assign_engine/compatibility.h>
#include <assign_engine/errors.h>
#include <assign_engine/model_builder.h>

#include <limits>
#include <type_traits>
#include <utility>
#include <string>
#include <vector>

using Catch::Approx;

namespace {

    /// Items and slots deliberately out of identifier order
    assign::Catalog unordered() {
        return assign::load(
            {
                { "M3", 2, 6.0, "regular" },
                { "M1", 3, 5.0, "fragile" },
                { "M2", 1, 4.0, "hazardous" },
            },
            {
                { "B3", 10.0, 3.0, "special" },
                { "B1", 15.0, 1.0, "safe" },
                { "B2", 12.0, 2.0, "regular" },
            });
    }

    /// Records the order in which the hooks run
    class TracingBuilder : public assign::ModelBuilder {
    public:
        using assign::ModelBuilder::ModelBuilder;
        std::vector<std::string> calls;

    protected:
        void validate() override { calls.push_back("validate"); }
        void addVariables() override {
            calls.push_back("addVariables");
            addVariable(0, 0, 1.0, 1.0);
        }
        void addConstraints() override { calls.push_back("addConstraints"); }
        void addObjective() override {
            calls.push_back("addObjective");
            setObjectiveConstant(2.5);
        }
        void finalize() override {
            calls.push_back("finalize");
            store()["variables"] = static_cast<int>(model().numVariables());
        }
    };

    template <typename C>
    concept Resolvable = requires(C&& catalog, const assign::RuleSet& rules) {
        assign::resolve(std::forward<C>(catalog), rules);
    };

    template <typename C, typename M>
    concept Buildable = requires(C&& catalog, M&& matrix) {
        assign::build(std::forward<C>(catalog), std::forward<M>(matrix));
    };

} // namespace

// ============================================================================
// SECTION A: TEMPLATE-METHOD WORKFLOW
// ============================================================================

/**
 * @test Workflow::HookOrder
 * @brief Verifies the hooks run in order and build() starts fresh each time
 *
 * @given A builder recording its hook calls
 * @when build() is called twice
 * @then Hooks run validate..finalize, and each model has one variable
 */
TEST_CASE("A1: Workflow::HookOrder", "[model_builder][workflow]")
{
    auto catalog = unordered();
    auto matrix = assign::resolve(catalog, assign::RuleSet{});
    TracingBuilder builder(catalog, matrix, {});

    auto first = builder.build();
    REQUIRE(builder.calls == std::vector<std::string>{
        "validate", "addVariables", "addConstraints", "addObjective", "finalize" });
    REQUIRE(first.numVariables() == 1);
    REQUIRE(first.objectiveConstant() == 2.5);
    REQUIRE(builder.store()["variables"].get<int>() == 1);

    auto second = builder.build();
    REQUIRE(second.numVariables() == 1);
    REQUIRE(builder.calls.size() == 10);
}

/**
 * @test Workflow::BuilderMetadata
 * @brief Verifies the metadata the assignment builder stores
 */
TEST_CASE("A2: Workflow::BuilderMetadata", "[model_builder][workflow]")
{
    auto catalog = unordered();
    auto matrix = assign::resolve(catalog, assign::warehouseRules());
    assign::AssignmentModelBuilder builder(catalog, matrix, {});
    (void)builder.build();

    REQUIRE(builder.store()["compatible_pairs"].get<int>() == 5);
    REQUIRE(builder.store()["pruned_pairs"].get<int>() == 4);
    REQUIRE(builder.store()["coverage_constraints"].get<int>() == 3);
    REQUIRE(builder.store()["capacity_constraints"].get<int>() == 3);
}

// ============================================================================
// SECTION B: VARIABLES
// ============================================================================

/**
 * @test Variables::CompatiblePairsInIdentifierOrder
 * @brief Verifies that only compatible pairs get variables, in id order
 *
 * @given Catalog whose input order differs from identifier order
 * @then itemOrder() is M1, M2, M3 and each item's variables follow slot ids
 */
TEST_CASE("B1: Variables::CompatiblePairsInIdentifierOrder", "[model_builder][variables]")
{
    auto catalog = unordered();
    auto matrix = assign::resolve(catalog, assign::warehouseRules());
    auto model = assign::build(catalog, matrix);

    REQUIRE(model.numVariables() == 5);

    std::vector<std::string> names;
    for (const auto& v : model.variables())
        names.push_back(v.name);
    REQUIRE(names == std::vector<std::string>{
        "x[M1,B1]", "x[M2,B3]", "x[M3,B1]", "x[M3,B2]", "x[M3,B3]" });

    const std::size_t m1 = catalog.itemIndex("M1");
    const std::size_t m3 = catalog.itemIndex("M3");
    REQUIRE(model.itemOrder() == std::vector<std::size_t>{ m1, catalog.itemIndex("M2"), m3 });
    REQUIRE(model.itemVariables(m3).size() == 3);
    REQUIRE(model.slotRank(catalog.slotIndex("B1")) == 0);
    REQUIRE(model.slotRank(catalog.slotIndex("B3")) == 2);

    SECTION("Incompatible pairs have no variable")
    {
        REQUIRE_FALSE(model.findVariable(m1, catalog.slotIndex("B3")).has_value());
        REQUIRE(model.findVariable(m1, catalog.slotIndex("B1")).has_value());
    }

    SECTION("Slot variables follow item identifiers")
    {
        const auto& vars = model.slotVariables(catalog.slotIndex("B1"));
        REQUIRE(vars.size() == 2);
        REQUIRE(model.variables()[vars[0]].item == m1);
        REQUIRE(model.variables()[vars[1]].item == m3);
    }
}

// ============================================================================
// SECTION C: CONSTRAINTS
// ============================================================================

/**
 * @test Constraints::CoverageAndCapacity
 * @brief Verifies cover[i] and cap[s] rows, senses and coefficients
 */
TEST_CASE("C1: Constraints::CoverageAndCapacity", "[model_builder][constraints]")
{
    auto catalog = unordered();
    auto matrix = assign::resolve(catalog, assign::warehouseRules());

    SECTION("Complete coverage uses equality")
    {
        auto model = assign::build(catalog, matrix);
        REQUIRE(model.numConstraints() == 6);

        const auto& cover = model.constraints()[0];
        REQUIRE(cover.name == "cover[M1]");
        REQUIRE(cover.kind == assign::ConstraintKind::Coverage);
        REQUIRE(cover.sense == assign::Sense::Equal);
        REQUIRE(cover.rhs == 1.0);
        REQUIRE(cover.terms.size() == 1);

        const auto& cap = model.constraints()[3];
        REQUIRE(cap.kind == assign::ConstraintKind::Capacity);
        REQUIRE(cap.name == "cap[B3]");
        REQUIRE(cap.sense == assign::Sense::LessEqual);
        REQUIRE(cap.rhs == 10.0);
        REQUIRE(cap.terms.size() == 2);
        double sizes = 0.0;
        for (const auto& t : cap.terms)
            sizes += t.coef;
        REQUIRE(sizes == Approx(4.0 + 6.0));
    }

    SECTION("Partial coverage uses at-most-one")
    {
        auto model = assign::build(catalog, matrix, { .allow_unassigned = true });
        REQUIRE(model.constraints()[0].sense == assign::Sense::LessEqual);
        REQUIRE(assign::enum_name(model.constraints()[0].sense) == "<=");
    }
}

// ============================================================================
// SECTION D: OBJECTIVE
// ============================================================================

/**
 * @test Objective::CostsAndPenalty
 * @brief Verifies frequency * cost coefficients and the penalty folding
 *
 * @scenario Penalty p = 2 with partial coverage
 * @then objective coefficient = f*c - p*f and constant = p * sum f
 */
TEST_CASE("D1: Objective::CostsAndPenalty", "[model_builder][objective]")
{
    auto catalog = unordered();
    auto matrix = assign::resolve(catalog, assign::warehouseRules());

    auto plain = assign::build(catalog, matrix);
    REQUIRE(plain.variables()[0].cost == Approx(3.0));        // M1 in B1: 3 * 1
    REQUIRE(plain.variables()[0].objective == Approx(3.0));
    REQUIRE(plain.objectiveConstant() == 0.0);

    auto penalized = assign::build(catalog, matrix,
                                   { .allow_unassigned = true, .unassigned_penalty = 2.0 });
    REQUIRE(penalized.variables()[0].cost == Approx(3.0));
    REQUIRE(penalized.variables()[0].objective == Approx(3.0 - 2.0 * 3.0));
    REQUIRE(penalized.objectiveConstant() == Approx(2.0 * (3 + 1 + 2)));
    REQUIRE(penalized.unassignedCost(catalog.itemIndex("M1")) == Approx(6.0));
}

// ============================================================================
// SECTION E: MODEL ERRORS
// ============================================================================

/**
 * @test ModelError::HazardousWithoutSpecialSlot
 * @brief Verifies the structurally infeasible coverage case is caught at build
 *
 * @given A hazardous item and no special slot, unassigned items forbidden
 * @when build() is called
 * @then ModelError names the item and its coverage constraint
 */
TEST_CASE("E1: ModelError::HazardousWithoutSpecialSlot", "[model_builder][errors]")
{
    auto catalog = assign::load({ { "H1", 1, 1.0, "hazardous" } },
                                { { "B1", 10.0, 1.0, "safe" }, { "B2", 10.0, 1.0, "regular" } });
    auto matrix = assign::resolve(catalog, assign::warehouseRules());

    try {
        (void)assign::build(catalog, matrix);
        FAIL("expected ModelError");
    } catch (const assign::ModelError& e) {
        REQUIRE(e.identifier() == "H1");
        REQUIRE(e.constraint() == "cover[H1]");
    }

    SECTION("Allowed when unassigned items are permitted")
    {
        auto model = assign::build(catalog, matrix, { .allow_unassigned = true });
        REQUIRE(model.numVariables() == 0);
    }
}

/**
 * @test ModelError::EmptyAndMismatched
 * @brief Verifies the remaining ModelError paths
 */
TEST_CASE("E2: ModelError::EmptyAndMismatched", "[model_builder][errors]")
{
    SECTION("No items")
    {
        auto catalog = assign::load({}, { { "B1", 1.0, 1.0, "safe" } });
        auto matrix = assign::resolve(catalog, {});
        REQUIRE_THROWS_AS(assign::build(catalog, matrix), assign::ModelError);
    }

    SECTION("No slots")
    {
        auto catalog = assign::load({ { "R1", 1, 1.0, "regular" } }, {});
        auto matrix = assign::resolve(catalog, {});
        REQUIRE_THROWS_AS(assign::build(catalog, matrix, { .allow_unassigned = true }),
                          assign::ModelError);
    }

    SECTION("Matrix of another catalog")
    {
        auto catalog = unordered();
        auto other = assign::load({ { "R1", 1, 1.0, "regular" } }, { { "B1", 1.0, 1.0, "safe" } });
        auto matrix = assign::resolve(other, {});
        REQUIRE_THROWS_AS(assign::build(catalog, matrix), assign::ModelError);
    }

    SECTION("Negative or non-finite penalty")
    {
        auto catalog = unordered();
        auto matrix = assign::resolve(catalog, assign::warehouseRules());
        REQUIRE_THROWS_AS(assign::build(catalog, matrix,
                              { .allow_unassigned = true, .unassigned_penalty = -1.0 }),
                          assign::ModelError);
        REQUIRE_THROWS_AS(assign::build(catalog, matrix,
                              { .allow_unassigned = true,
                                .unassigned_penalty = std::numeric_limits<double>::infinity() }),
                          assign::ModelError);
    }
}

// ============================================================================
// SECTION F: PLACEMENT EVALUATION
// ============================================================================

/**
 * @test Placement::CostAndFeasibility
 * @brief Verifies placementCost, penalizedCost and isFeasible
 */
TEST_CASE("F1: Placement::CostAndFeasibility", "[model_builder][placement]")
{
    auto catalog = unordered();
    auto matrix = assign::resolve(catalog, assign::warehouseRules());
    auto model = assign::build(catalog, matrix,
                               { .allow_unassigned = true, .unassigned_penalty = 1.0 });

    const std::size_t m1 = catalog.itemIndex("M1");
    const std::size_t m2 = catalog.itemIndex("M2");
    const std::size_t m3 = catalog.itemIndex("M3");
    const std::size_t b1 = catalog.slotIndex("B1");
    const std::size_t b2 = catalog.slotIndex("B2");
    const std::size_t b3 = catalog.slotIndex("B3");

    assign::Placement placement(3, assign::kUnassigned);
    placement[m1] = b1;
    placement[m3] = b2;

    REQUIRE(model.placementCost(placement) == Approx(3.0 * 1.0 + 2.0 * 2.0));
    REQUIRE(model.penalizedCost(placement) == Approx(7.0 + 1.0 * 1.0));
    REQUIRE(model.isFeasible(placement));

    SECTION("Incompatible placement")
    {
        placement[m2] = b1;
        REQUIRE_FALSE(model.isFeasible(placement));
    }

    SECTION("Capacity overflow")
    {
        placement[m2] = b3;
        placement[m3] = b3;
        placement[m1] = b1;
        REQUIRE(model.isFeasible(placement));   // 4 + 6 = 10 fits exactly

        auto tight = assign::load({ { "A", 1, 6.0, "regular" }, { "B", 1, 6.0, "regular" } },
                                  { { "S", 10.0, 1.0, "regular" } });
        auto tight_matrix = assign::resolve(tight, {});
        auto tight_model = assign::build(tight, tight_matrix);
        REQUIRE_FALSE(tight_model.isFeasible(assign::Placement{ 0, 0 }));
    }

    SECTION("Wrong dimension")
    {
        REQUIRE_FALSE(model.isFeasible(assign::Placement{ b1 }));
    }
}

// ============================================================================
// SECTION G: INPUT LIFETIMES
// ============================================================================

/**
 * @test Lifetimes::TemporariesRejected
 * @brief Verifies a matrix or model cannot be built from a temporary input
 *
 * @given resolve(), build() and the builder constructors
 * @when They are called with an rvalue catalog or matrix
 * @then The call does not compile, while lvalue inputs still do
 */
TEST_CASE("G1: Lifetimes::TemporariesRejected", "[model_builder][lifetimes]")
{
    using assign::Catalog;
    using assign::CompatibilityMatrix;

    static_assert(Resolvable<const Catalog&>);
    static_assert(Resolvable<Catalog&>);
    static_assert(!Resolvable<Catalog>);

    static_assert(Buildable<const Catalog&, const CompatibilityMatrix&>);
    static_assert(!Buildable<Catalog, const CompatibilityMatrix&>);
    static_assert(!Buildable<const Catalog&, CompatibilityMatrix>);
    static_assert(!Buildable<Catalog, CompatibilityMatrix>);

    static_assert(std::is_constructible_v<assign::AssignmentModelBuilder,
                                          const Catalog&, const CompatibilityMatrix&>);
    static_assert(!std::is_constructible_v<assign::AssignmentModelBuilder,
                                           Catalog, const CompatibilityMatrix&>);
    static_assert(!std::is_constructible_v<assign::AssignmentModelBuilder,
                                           const Catalog&, CompatibilityMatrix>);

    auto catalog = unordered();
    auto matrix = assign::resolve(catalog, assign::RuleSet{});
    auto model = assign::build(catalog, matrix);
    REQUIRE(&model.catalog() == &catalog);
    REQUIRE(&model.matrix() == &matrix);
}
