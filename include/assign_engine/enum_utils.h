#pragma once
/*
===============================================================================
ENUM UTILS — Compile-time enumeration utilities for the assignment engine
===============================================================================

OVERVIEW
--------
Declares strongly-typed enumerations with compile-time size information and
an optional name table. The engine uses these enums for solve status,
solving strategy, compatibility verdicts and configuration presets, and
needs to print them in logs and reports and parse them from caller input.

KEY COMPONENTS
--------------
• ASSIGN_DECLARE_ENUM_WITH_COUNT: enum class with trailing COUNT sentinel
• ASSIGN_DECLARE_ENUM_NAMES: name table specialization for an enum
• enum_size / is_valid_enum_value / enum_from_value: bounds helpers
• enum_name / parse_enum: string conversion through the name table

USAGE EXAMPLES
--------------
    ASSIGN_DECLARE_ENUM_WITH_COUNT(Strategy, Exact, Heuristic);
    ASSIGN_DECLARE_ENUM_NAMES(Strategy, "exact", "heuristic");

    std::string_view s = assign::enum_name(Strategy::Exact);     // "exact"
    auto parsed = assign::parse_enum<Strategy>("heuristic");      // Heuristic

THREAD SAFETY
-------------
• All generated code is immutable, constexpr data
• No mutable shared state

===============================================================================
*/

#include <array>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

/**
 * @macro ASSIGN_DECLARE_ENUM_WITH_COUNT
 * @brief Declares an enum class with an automatic COUNT sentinel
 *
 * @details
 * Expands to the enum class (user enumerators followed by COUNT) and a
 * constexpr <Name>_COUNT constant equal to the number of user enumerators.
 *
 * @example
 *     ASSIGN_DECLARE_ENUM_WITH_COUNT(SolveStatus, Optimal, Feasible);
 *     // enum class SolveStatus { Optimal, Feasible, COUNT };
 *     // static constexpr std::size_t SolveStatus_COUNT = 2;
 */
#define ASSIGN_DECLARE_ENUM_WITH_COUNT(Name, ...)                         \
    enum class Name { __VA_ARGS__, COUNT };                               \
    static constexpr std::size_t Name##_COUNT =                           \
        static_cast<std::size_t>(Name::COUNT)

/**
 * @macro ASSIGN_DECLARE_ENUM_NAMES
 * @brief Attaches a name table to an enum declared with a COUNT sentinel
 *
 * @details
 * Must be expanded at global scope. The number of names must equal the
 * number of user enumerators; this is checked at compile time.
 */
#define ASSIGN_DECLARE_ENUM_NAMES(Name, ...)                              \
    template<>                                                            \
    struct assign::EnumNames<Name> {                                      \
        static constexpr std::array<std::string_view,                     \
            static_cast<std::size_t>(Name::COUNT)> names{ __VA_ARGS__ };  \
        static_assert(names.back().size() > 0,                            \
            "ASSIGN_DECLARE_ENUM_NAMES: one name per enumerator");        \
    }

namespace assign {

    /**
     * @brief Compile-time enumeration size trait
     *
     * @tparam Enum Enumeration type with a COUNT sentinel
     */
    template<typename Enum>
    struct enum_size {
        static constexpr std::size_t value = static_cast<std::size_t>(Enum::COUNT);
    };

    template<typename Enum>
    inline constexpr std::size_t enum_size_v = enum_size<Enum>::value;

    /**
     * @brief Name table trait; specialize with ASSIGN_DECLARE_ENUM_NAMES
     *
     * The primary template is intentionally undefined so that enum_name()
     * fails to compile for enums without names.
     */
    template<typename Enum>
    struct EnumNames;

    /// @brief Underlying position of an enumerator (name table access)
    template<typename Enum>
    constexpr std::size_t enum_index(Enum value) noexcept {
        return static_cast<std::size_t>(value);
    }

    /**
     * @brief True if value corresponds to a user-defined enumerator
     *
     * @note COUNT and out-of-range casts are invalid.
     */
    template<typename Enum>
    constexpr bool is_valid_enum_value(Enum value) noexcept {
        return static_cast<std::size_t>(value) < enum_size_v<Enum>;
    }

    /**
     * @brief Convert an integral position into an enumerator
     *
     * @throws std::out_of_range if value >= enum_size_v<Enum>
     */
    template<typename Enum>
    constexpr Enum enum_from_value(std::size_t value) {
        if (value >= enum_size_v<Enum>) {
            throw std::out_of_range(
                "enum_from_value: " + std::to_string(value) + " is out of range");
        }
        return static_cast<Enum>(value);
    }

    /**
     * @brief Name of an enumerator from its name table
     *
     * @return The declared name, or "COUNT" for the sentinel and any
     *         out-of-range value.
     */
    template<typename Enum>
    constexpr std::string_view enum_name(Enum value) noexcept {
        if (!is_valid_enum_value(value)) {
            return "COUNT";
        }
        return EnumNames<Enum>::names[enum_index(value)];
    }

    /**
     * @brief Parse an enumerator from its declared name (exact match)
     *
     * @return The enumerator, or std::nullopt when no name matches
     */
    template<typename Enum>
    constexpr std::optional<Enum> parse_enum(std::string_view text) noexcept {
        for (std::size_t i = 0; i < enum_size_v<Enum>; ++i) {
            if (EnumNames<Enum>::names[i] == text) {
                return enum_from_value<Enum>(i);
            }
        }
        return std::nullopt;
    }

} // namespace assign
