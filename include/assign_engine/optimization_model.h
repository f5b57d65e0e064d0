#pragma once
/*
===============================================================================
OPTIMIZATION MODEL — Solver-independent 0/1 linear program
===============================================================================

Overview
--------
OptimizationModel is the contract between the model builder and every solver
backend: binary decision variables, a linear objective to minimize and a set
of linear constraints. A backend only needs to "minimize a linear objective
subject to linear constraints over boolean variables"; the built-in
branch-and-bound, the greedy heuristic and the Gurobi backend all consume the
same model.

Mathematical Model
------------------
Sets:
    I                         items (catalog order)
    S                         slots (catalog order)
    P = {(i,s) : compatible}  compatible pairs; the only pairs with variables

Variables:
    x[i,s] in {0,1}           1 if item i is placed in slot s, (i,s) in P

Objective:
    min  sum_{(i,s) in P} f_i * c_s * x[i,s]
       + p * sum_i f_i * (1 - sum_s x[i,s])          (p = unassigned penalty)

Constraints:
    cover[i]:  sum_s x[i,s] = 1      (or <= 1 when unassigned items are allowed)
    cap[s]:    sum_i size_i * x[i,s] <= capacity_s

The penalty term is folded into the variable coefficients and a constant:
    objective coefficient of x[i,s] = f_i * c_s - p * f_i
    objective constant              = p * sum_i f_i

Ordering
--------
itemOrder() lists items by ascending identifier and itemVariables(i) lists
an item's variables by ascending slot identifier. Backends that explore in
these orders obtain the engine's deterministic tie-breaking.

Lifetime
--------
The model references its Catalog and CompatibilityMatrix; both must outlive
it. The model itself is immutable once built and may be shared by concurrent
solves.

===============================================================================
*/

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "catalog.h"
#include "compatibility.h"
#include "enum_utils.h"

namespace assign {

    ASSIGN_DECLARE_ENUM_WITH_COUNT(ConstraintKind, Coverage, Capacity);
    ASSIGN_DECLARE_ENUM_WITH_COUNT(Sense, LessEqual, Equal);

} // namespace assign

ASSIGN_DECLARE_ENUM_NAMES(assign::ConstraintKind, "coverage", "capacity");
ASSIGN_DECLARE_ENUM_NAMES(assign::Sense, "<=", "=");

namespace assign {

    /// @brief Sentinel slot index meaning "unassigned"
    inline constexpr std::size_t kUnassigned = static_cast<std::size_t>(-1);

    /// @brief Slot index per catalog item, kUnassigned for unplaced items
    using Placement = std::vector<std::size_t>;

    /**
     * @brief Coverage policy and objective shaping of a model
     */
    struct ModelOptions {
        bool allow_unassigned = false;     ///< cover[i] is "<= 1" instead of "= 1"
        double unassigned_penalty = 0.0;   ///< cost per unit of frequency left unplaced
    };

    /**
     * @brief Binary decision variable of one compatible (item, slot) pair
     */
    struct Variable {
        std::size_t item = 0;       ///< catalog item index
        std::size_t slot = 0;       ///< catalog slot index
        std::string name;           ///< "x[item,slot]"
        double cost = 0.0;          ///< frequency * slot cost (placement cost)
        double objective = 0.0;     ///< coefficient in the penalized objective
    };

    /// @brief Coefficient of one variable in a constraint
    struct Term {
        std::size_t var = 0;
        double coef = 0.0;
    };

    /**
     * @brief Linear constraint: sum(coef * x[var]) (sense) rhs
     */
    struct LinearConstraint {
        std::string name;
        ConstraintKind kind = ConstraintKind::Coverage;
        std::size_t owner = 0;      ///< item index (coverage) or slot index (capacity)
        std::vector<Term> terms;
        Sense sense = Sense::LessEqual;
        double rhs = 0.0;
    };

    class ModelBuilder;

    /**
     * @class OptimizationModel
     * @brief Variables, linear objective and linear constraints of one solve
     */
    class OptimizationModel {
    public:
        const Catalog& catalog() const noexcept { return *catalog_; }
        const CompatibilityMatrix& matrix() const noexcept { return *matrix_; }
        const ModelOptions& options() const noexcept { return options_; }

        const std::vector<Variable>& variables() const noexcept { return variables_; }
        const std::vector<LinearConstraint>& constraints() const noexcept { return constraints_; }
        double objectiveConstant() const noexcept { return objective_constant_; }

        std::size_t numVariables() const noexcept { return variables_.size(); }
        std::size_t numConstraints() const noexcept { return constraints_.size(); }

        /// @brief Item indices by ascending identifier
        const std::vector<std::size_t>& itemOrder() const noexcept { return item_order_; }

        /// @brief Variables of an item, by ascending slot identifier
        const std::vector<std::size_t>& itemVariables(std::size_t item) const {
            return item_vars_.at(item);
        }

        /// @brief Variables of a slot, by ascending item identifier
        const std::vector<std::size_t>& slotVariables(std::size_t slot) const {
            return slot_vars_.at(slot);
        }

        /// @brief Position of a slot when slots are sorted by identifier
        std::size_t slotRank(std::size_t slot) const { return slot_rank_.at(slot); }

        /// @brief Variable of the (item, slot) pair, if the pair is compatible
        std::optional<std::size_t> findVariable(std::size_t item, std::size_t slot) const {
            for (std::size_t v : itemVariables(item)) {
                if (variables_[v].slot == slot)
                    return v;
            }
            return std::nullopt;
        }

        /// @brief Penalty charged when the item is left unassigned
        double unassignedCost(std::size_t item) const {
            return options_.unassigned_penalty
                 * static_cast<double>(catalog_->items().at(item).frequency);
        }

        /**
         * @brief Sum of frequency * slot cost over placed items
         */
        double placementCost(const Placement& placement) const {
            double total = 0.0;
            for (std::size_t i = 0; i < placement.size(); ++i) {
                if (placement[i] == kUnassigned)
                    continue;
                total += static_cast<double>(catalog_->items()[i].frequency)
                       * catalog_->slots()[placement[i]].cost;
            }
            return total;
        }

        /**
         * @brief Value of the model objective (placement cost plus penalty)
         */
        double penalizedCost(const Placement& placement) const {
            double total = placementCost(placement);
            for (std::size_t i = 0; i < placement.size(); ++i) {
                if (placement[i] == kUnassigned)
                    total += unassignedCost(i);
            }
            return total;
        }

        /**
         * @brief True if the placement satisfies every model constraint
         *
         * Checks dimension, compatibility (a variable exists for each
         * placement), coverage policy and capacities.
         */
        bool isFeasible(const Placement& placement) const {
            if (placement.size() != catalog_->numItems())
                return false;
            std::vector<double> load(catalog_->numSlots(), 0.0);
            for (std::size_t i = 0; i < placement.size(); ++i) {
                std::size_t s = placement[i];
                if (s == kUnassigned) {
                    if (!options_.allow_unassigned)
                        return false;
                    continue;
                }
                if (s >= catalog_->numSlots() || !matrix_->compatible(i, s))
                    return false;
                load[s] += catalog_->items()[i].size;
            }
            for (std::size_t s = 0; s < load.size(); ++s) {
                if (load[s] > catalog_->slots()[s].capacity + kCapacityTolerance)
                    return false;
            }
            return true;
        }

        /// @brief Absolute slack allowed on capacity checks
        static constexpr double kCapacityTolerance = 1e-9;

    private:
        friend class ModelBuilder;

        OptimizationModel(const Catalog& catalog, const CompatibilityMatrix& matrix,
                          ModelOptions options)
            : catalog_(&catalog), matrix_(&matrix), options_(options)
        {
        }

        const Catalog* catalog_;
        const CompatibilityMatrix* matrix_;
        ModelOptions options_;

        std::vector<Variable> variables_;
        std::vector<LinearConstraint> constraints_;
        double objective_constant_ = 0.0;

        std::vector<std::size_t> item_order_;
        std::vector<std::size_t> slot_rank_;
        std::vector<std::vector<std::size_t>> item_vars_;
        std::vector<std::vector<std::size_t>> slot_vars_;
    };

} // namespace assign
