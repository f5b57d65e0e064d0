/*
===============================================================================
TEST ENUM_UTILS — Tests for enum_utils.h
===============================================================================

OVERVIEW
--------
Validates the enum declaration macros and the helpers built on the COUNT
sentinel and the name tables: bounds checks, conversion from integral
positions, name lookup and parsing. The engine's own enums
(SolveStatus, Strategy, Verdict, Preset) are exercised as they appear in
reports and logs.

TEST ORGANIZATION
-----------------
• Section A: ASSIGN_DECLARE_ENUM_WITH_COUNT expansion
• Section B: Bounds helpers (enum_size, is_valid_enum_value, enum_from_value)
• Section C: Name tables (enum_name, parse_enum)
• Section D: Engine enums

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• enum_utils.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <assign_engine/enum_utils.h>
#include <assign_engine/compatibility.h>
#include <assign_engine/solution.h>
#include <assign_engine/solver_backend.h>

#include <stdexcept>
#include <string>
#include <type_traits>

// ============================================================================
// TEST SUPPORT TYPES
// ============================================================================

namespace testing_enums {
    ASSIGN_DECLARE_ENUM_WITH_COUNT(Color, Red, Green, Blue);
}

ASSIGN_DECLARE_ENUM_NAMES(testing_enums::Color, "red", "green", "blue");

using testing_enums::Color;

// ============================================================================
// SECTION A: MACRO EXPANSION
// ============================================================================

/**
 * @test MacroExpansion::CreatesValidEnumClass
 * @brief Verifies the macro produces a strongly-typed enum with a COUNT sentinel
 *
 * @scenario Macro declares an enum with three values
 * @given ASSIGN_DECLARE_ENUM_WITH_COUNT(Color, Red, Green, Blue)
 * @when Inspecting type traits, values and the size constant
 * @then Values are 0..2 and COUNT equals 3
 */
TEST_CASE("A1: MacroExpansion::CreatesValidEnumClass", "[enum_utils][macro]")
{
    SECTION("Enum type is strongly typed")
    {
        REQUIRE(std::is_enum_v<Color>);
        REQUIRE_FALSE(std::is_convertible_v<Color, int>);
    }

    SECTION("Enumerators are sequential")
    {
        REQUIRE(static_cast<int>(Color::Red) == 0);
        REQUIRE(static_cast<int>(Color::Green) == 1);
        REQUIRE(static_cast<int>(Color::Blue) == 2);
        REQUIRE(static_cast<int>(Color::COUNT) == 3);
    }

    SECTION("Size constant matches the sentinel")
    {
        static_assert(testing_enums::Color_COUNT == 3, "compile-time size");
        REQUIRE(testing_enums::Color_COUNT == static_cast<std::size_t>(Color::COUNT));
    }
}

/**
 * @test MacroExpansion::FunctionScope
 * @brief Verifies the macro also works inside a function body
 */
TEST_CASE("A2: MacroExpansion::FunctionScope", "[enum_utils][macro]")
{
    ASSIGN_DECLARE_ENUM_WITH_COUNT(Local, Only);

    REQUIRE(static_cast<int>(Local::Only) == 0);
    REQUIRE(Local_COUNT == 1);
    REQUIRE(assign::enum_size_v<Local> == 1);
}

// ============================================================================
// SECTION B: BOUNDS HELPERS
// ============================================================================

/**
 * @test Bounds::ValidityAndConversion
 * @brief Verifies validity checks and checked conversion from positions
 *
 * @scenario Positions inside and outside the enumerator range
 * @then Valid positions convert, COUNT and beyond are rejected
 */
TEST_CASE("B1: Bounds::ValidityAndConversion", "[enum_utils][bounds]")
{
    SECTION("is_valid_enum_value")
    {
        REQUIRE(assign::is_valid_enum_value(Color::Red));
        REQUIRE(assign::is_valid_enum_value(Color::Blue));
        REQUIRE_FALSE(assign::is_valid_enum_value(Color::COUNT));
        REQUIRE_FALSE(assign::is_valid_enum_value(static_cast<Color>(42)));
    }

    SECTION("enum_from_value")
    {
        REQUIRE(assign::enum_from_value<Color>(1) == Color::Green);
        REQUIRE_THROWS_AS(assign::enum_from_value<Color>(3), std::out_of_range);
    }

    SECTION("enum_index")
    {
        static_assert(assign::enum_index(Color::Blue) == 2);
        REQUIRE(assign::enum_index(Color::Red) == 0);
    }
}

// ============================================================================
// SECTION C: NAME TABLES
// ============================================================================

/**
 * @test Names::LookupAndParse
 * @brief Verifies name lookup and its inverse
 *
 * @scenario Names declared for Color
 * @when Converting enumerators to names and names back
 * @then Declared names round trip; unknown text and COUNT are handled
 */
TEST_CASE("C1: Names::LookupAndParse", "[enum_utils][names]")
{
    SECTION("enum_name returns declared names")
    {
        REQUIRE(assign::enum_name(Color::Red) == "red");
        REQUIRE(assign::enum_name(Color::Blue) == "blue");
    }

    SECTION("Sentinel and invalid values name as COUNT")
    {
        REQUIRE(assign::enum_name(Color::COUNT) == "COUNT");
        REQUIRE(assign::enum_name(static_cast<Color>(99)) == "COUNT");
    }

    SECTION("parse_enum matches exactly")
    {
        REQUIRE(assign::parse_enum<Color>("green") == Color::Green);
        REQUIRE_FALSE(assign::parse_enum<Color>("Green").has_value());
        REQUIRE_FALSE(assign::parse_enum<Color>("").has_value());
        REQUIRE_FALSE(assign::parse_enum<Color>("COUNT").has_value());
    }

    SECTION("Name lookup is constexpr")
    {
        static_assert(assign::enum_name(Color::Green) == "green");
        static_assert(assign::parse_enum<Color>("blue").value() == Color::Blue);
    }
}

// ============================================================================
// SECTION D: ENGINE ENUMS
// ============================================================================

/**
 * @test EngineEnums::ReportNames
 * @brief Verifies the names used in reports and statistics
 */
TEST_CASE("D1: EngineEnums::ReportNames", "[enum_utils][engine]")
{
    REQUIRE(assign::enum_name(assign::SolveStatus::Optimal) == "optimal");
    REQUIRE(assign::enum_name(assign::SolveStatus::Feasible) == "feasible");
    REQUIRE(assign::enum_name(assign::SolveStatus::Infeasible) == "infeasible");
    REQUIRE(assign::enum_name(assign::SolveStatus::Unsolved) == "unsolved");

    REQUIRE(assign::parse_enum<assign::Strategy>("heuristic") == assign::Strategy::Heuristic);
    REQUIRE(assign::parse_enum<assign::Preset>("accurate") == assign::Preset::Accurate);
    REQUIRE(assign::enum_name(assign::Verdict::Abstain) == "abstain");
    REQUIRE(assign::enum_size_v<assign::DefaultPolicy> == 2);
}
