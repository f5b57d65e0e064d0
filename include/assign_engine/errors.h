#pragma once
/*
===============================================================================
ERRORS — Exception taxonomy of the assignment engine
===============================================================================

Overview
--------
Every failure the engine reports to its caller is an exception derived from
assign::Error, which carries the offending identifier (item id, slot id, or
empty when the failure concerns the whole input) and the name of the violated
constraint or field.

    Error (std::runtime_error)
      ├── ValidationError   malformed catalog input
      ├── ModelError        model impossible by construction
      ├── InfeasibleError   proven absence of a complete assignment
      └── ConsistencyError  solver output disagrees with re-derivation

None of these is retried by the engine. Running out of time during a solve
is not an error: the solver returns its incumbent with a non-optimal status.

Programming errors on accessors (unknown identifier passed to Catalog::item)
throw std::out_of_range, as the standard containers do.

===============================================================================
*/

#include <stdexcept>
#include <string>
#include <utility>

namespace assign {

    /**
     * @brief Base class of all engine errors
     */
    class Error : public std::runtime_error {
    public:
        Error(const std::string& message, std::string identifier, std::string constraint)
            : std::runtime_error(message),
              identifier_(std::move(identifier)),
              constraint_(std::move(constraint))
        {
        }

        /// @brief Offending item or slot identifier (may be empty)
        const std::string& identifier() const noexcept { return identifier_; }

        /// @brief Violated constraint or field name (e.g. "cover[M1]", "size")
        const std::string& constraint() const noexcept { return constraint_; }

    private:
        std::string identifier_;
        std::string constraint_;
    };

    /// @brief Malformed catalog input: non-positive numerics, duplicate ids, unknown tags
    class ValidationError : public Error {
    public:
        using Error::Error;
    };

    /// @brief Structurally infeasible or inconsistent model, detected before solving
    class ModelError : public Error {
    public:
        using Error::Error;
    };

    /// @brief No complete assignment exists under capacity and compatibility
    class InfeasibleError : public Error {
    public:
        using Error::Error;
    };

    /// @brief Reported solution disagrees with its independent re-derivation
    class ConsistencyError : public Error {
    public:
        using Error::Error;
    };

} // namespace assign
