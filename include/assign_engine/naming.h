#pragma once
/*
===============================================================================
NAMING SYSTEM — Symbolic names for assignment-model elements
===============================================================================

OVERVIEW
--------
Generates the names used for decision variables and constraints of an
OptimizationModel and for their Gurobi counterparts. Item and slot
identifiers are strings, so indices are any streamable value rather than
integers only.

Two flavours are provided:

• force_name:: always produces a name (model construction, reports, errors)
• make_name::  produces a name only in debug builds (ASSIGN_DEBUG or
               _DEBUG defined) and an empty string otherwise; used for the
               Gurobi variable and constraint names, which only matter when
               inspecting a written model

CONVENTIONS
-----------
    force_name::math("x", "M1", "B1")    -> "x[M1,B1]"
    names::variable("M1", "B1")          -> "x[M1,B1]"
    names::coverage("M1")                -> "cover[M1]"
    names::capacity("B1")                -> "cap[B1]"

EXCEPTION SAFETY
----------------
• Throws std::invalid_argument when a base name is empty but indices are
  present
• Strong guarantee otherwise

===============================================================================
*/

#include <concepts>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#if defined(ASSIGN_DEBUG) || defined(_DEBUG)
inline constexpr bool ASSIGN_DEBUG_NAMES = true;
#else
inline constexpr bool ASSIGN_DEBUG_NAMES = false;
#endif

namespace assign {

    /// @brief True in debug builds, where make_name:: produces names
    [[nodiscard]] constexpr bool naming_enabled() noexcept {
        return ASSIGN_DEBUG_NAMES;
    }

    namespace naming_detail {

        /**
         * @concept Streamable
         * @brief True if the type can be written to std::ostream
         */
        template<typename T>
        concept Streamable = requires(std::ostream & os, T && value) {
            { os << std::forward<T>(value) } -> std::same_as<std::ostream&>;
        };

        inline void check_base_name(std::string_view base, bool has_indices) {
            if (has_indices && base.empty()) {
                throw std::invalid_argument(
                    "naming: base name cannot be empty when indices are present");
            }
        }

        template<Streamable... Indices>
        inline std::string math_impl(std::string_view base, Indices&&... idx) {
            constexpr std::size_t N = sizeof...(idx);
            check_base_name(base, N > 0);
            if constexpr (N == 0) {
                return std::string(base);
            } else {
                std::ostringstream oss;
                oss << base << '[';
                bool first = true;
                ((oss << (first ? (first = false, "") : ",") << std::forward<Indices>(idx)), ...);
                oss << ']';
                return oss.str();
            }
        }

    } // namespace naming_detail

    namespace force_name {

        template<naming_detail::Streamable... Indices>
        inline std::string math(std::string_view base, Indices&&... idx) {
            return naming_detail::math_impl(base, std::forward<Indices>(idx)...);
        }

    } // namespace force_name

    namespace make_name {

        template<naming_detail::Streamable... Indices>
        inline std::string math(std::string_view base, Indices&&... idx) {
            if (!naming_enabled()) {
                return {};
            }
            return naming_detail::math_impl(base, std::forward<Indices>(idx)...);
        }

    } // namespace make_name

    /**
     * @brief Canonical names of assignment-model elements
     */
    namespace names {

        /// @brief Decision variable of the (item, slot) pair: "x[item,slot]"
        inline std::string variable(std::string_view item_id, std::string_view slot_id) {
            return force_name::math("x", item_id, slot_id);
        }

        /// @brief Coverage constraint of an item: "cover[item]"
        inline std::string coverage(std::string_view item_id) {
            return force_name::math("cover", item_id);
        }

        /// @brief Capacity constraint of a slot: "cap[slot]"
        inline std::string capacity(std::string_view slot_id) {
            return force_name::math("cap", slot_id);
        }

    } // namespace names

} // namespace assign
