#pragma once
/*
===============================================================================
MODEL BUILDER — Template-method construction of an OptimizationModel
===============================================================================

Overview
--------
ModelBuilder coordinates the construction of an OptimizationModel from a
Catalog and a CompatibilityMatrix:

    build() {
        <fresh model, item order, slot ranks>
        validate();
        addVariables();
        addConstraints();
        addObjective();
        finalize();
    }

The base class owns the bookkeeping (variable indices per item and per slot,
identifier orderings, the metadata store) and exposes helpers to derived
builders; derived builders override the hooks. AssignmentModelBuilder is the
engine's formulation:

    * one binary variable per compatible pair, created item by item in
      identifier order and, within an item, slot by slot in identifier order
    * cover[i] for every item ("= 1", or "<= 1" when unassigned items are
      allowed)
    * cap[s] for every slot
    * incompatible pairs get no variable at all

Failures detected here are raised as ModelError, before any solver runs, so
that "impossible by construction" is never confused with "solver gave up".

Typical Usage
-------------
    auto model = assign::build(catalog, matrix, {.allow_unassigned = false});

    // or, with access to the builder metadata:
    assign::AssignmentModelBuilder builder(catalog, matrix, options);
    auto model = builder.build();
    int pairs = builder.store()["compatible_pairs"].get<int>();

Design Notes
------------
* No work happens in the constructor.
* build() always starts from an empty model, so a builder can be reused for
  several solve requests.
* The catalog and the matrix must outlive the models built from them.

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>
#include <utility>
#include <vector>

#include <absl/log/log.h>

#include "catalog.h"
#include "compatibility.h"
#include "data_store.h"
#include "errors.h"
#include "naming.h"
#include "optimization_model.h"

namespace assign {

    /*
    ===============================================================================
    MODEL BUILDER BASE
    ===============================================================================
    */
    class ModelBuilder {
    public:
        ModelBuilder(const Catalog& catalog, const CompatibilityMatrix& matrix,
                     ModelOptions options = {})
            : catalog_(catalog), matrix_(matrix), options_(options)
        {
        }

        // The finished model refers to both inputs.
        ModelBuilder(Catalog&&, const CompatibilityMatrix&, ModelOptions = {}) = delete;
        ModelBuilder(const Catalog&, CompatibilityMatrix&&, ModelOptions = {}) = delete;
        ModelBuilder(Catalog&&, CompatibilityMatrix&&, ModelOptions = {}) = delete;

        virtual ~ModelBuilder() = default;

        /**
         * @brief Run the template workflow and return the finished model
         *
         * @throws ModelError from validate() or any hook
         */
        OptimizationModel build()
        {
            OptimizationModel model(catalog_, matrix_, options_);
            prepare(model);
            current_ = &model;

            validate();
            addVariables();
            addConstraints();
            addObjective();
            finalize();

            current_ = nullptr;
            return model;
        }

        const Catalog& catalog() const noexcept { return catalog_; }
        const CompatibilityMatrix& matrix() const noexcept { return matrix_; }
        const ModelOptions& options() const noexcept { return options_; }

        DataStore& store() noexcept { return store_; }
        const DataStore& store() const noexcept { return store_; }

    protected:
        // -------------------------------------------------------------------------
        // Template-method hooks for derived classes
        // -------------------------------------------------------------------------

        /// @brief Reject inputs that cannot form a model (throw ModelError).
        virtual void validate() {}

        /// @brief Create decision variables with addVariable().
        virtual void addVariables() {}

        /// @brief Create constraints with addConstraint().
        virtual void addConstraints() {}

        /// @brief Set the objective constant (coefficients live on variables).
        virtual void addObjective() {}

        /// @brief Optional post-construction hook (statistics, logging).
        virtual void finalize() {}

        // -------------------------------------------------------------------------
        // Helpers available to hooks
        // -------------------------------------------------------------------------

        /// @brief Model under construction; valid only inside build()
        OptimizationModel& model() noexcept { return *current_; }

        /**
         * @brief Append a variable for (item, slot) and index it
         * @return Index of the new variable
         */
        std::size_t addVariable(std::size_t item, std::size_t slot, double cost, double objective)
        {
            OptimizationModel& m = model();
            const std::size_t index = m.variables_.size();
            m.variables_.push_back(Variable{
                item, slot,
                names::variable(catalog_.items()[item].id, catalog_.slots()[slot].id),
                cost, objective });
            m.item_vars_[item].push_back(index);
            m.slot_vars_[slot].push_back(index);
            return index;
        }

        /// @brief Append a constraint
        void addConstraint(LinearConstraint constraint)
        {
            model().constraints_.push_back(std::move(constraint));
        }

        /// @brief Constant term of the objective
        void setObjectiveConstant(double constant) noexcept
        {
            model().objective_constant_ = constant;
        }

    private:
        // Orders are part of the model contract; derived builders rely on them.
        void prepare(OptimizationModel& m) const
        {
            const auto& items = catalog_.items();
            const auto& slots = catalog_.slots();

            m.item_order_.resize(items.size());
            std::iota(m.item_order_.begin(), m.item_order_.end(), std::size_t{0});
            std::sort(m.item_order_.begin(), m.item_order_.end(),
                [&](std::size_t a, std::size_t b) { return items[a].id < items[b].id; });

            std::vector<std::size_t> slot_order(slots.size());
            std::iota(slot_order.begin(), slot_order.end(), std::size_t{0});
            std::sort(slot_order.begin(), slot_order.end(),
                [&](std::size_t a, std::size_t b) { return slots[a].id < slots[b].id; });
            m.slot_rank_.assign(slots.size(), 0);
            for (std::size_t r = 0; r < slot_order.size(); ++r)
                m.slot_rank_[slot_order[r]] = r;

            m.item_vars_.assign(items.size(), {});
            m.slot_vars_.assign(slots.size(), {});
        }

        const Catalog& catalog_;
        const CompatibilityMatrix& matrix_;
        ModelOptions options_;
        DataStore store_;
        OptimizationModel* current_ = nullptr;
    };

    /*
    ===============================================================================
    ASSIGNMENT FORMULATION
    ===============================================================================
    */
    class AssignmentModelBuilder : public ModelBuilder {
    public:
        using ModelBuilder::ModelBuilder;

    protected:
        void validate() override
        {
            if (catalog().numItems() == 0) {
                throw ModelError("catalog has no items", "", "catalog");
            }
            if (catalog().numSlots() == 0) {
                throw ModelError("catalog has no slots", "", "catalog");
            }
            if (!matrix().matches(catalog())) {
                throw ModelError("compatibility matrix does not match the catalog ("
                    + std::to_string(matrix().numItems()) + "x" + std::to_string(matrix().numSlots())
                    + " vs " + std::to_string(catalog().numItems()) + "x"
                    + std::to_string(catalog().numSlots()) + ")", "", "matrix");
            }
            const double penalty = options().unassigned_penalty;
            if (!std::isfinite(penalty) || penalty < 0.0) {
                throw ModelError("unassigned penalty must be non-negative and finite",
                                 "", "unassigned_penalty");
            }
            if (!options().allow_unassigned) {
                for (std::size_t i : model().itemOrder()) {
                    if (matrix().compatibleSlots(i).empty()) {
                        const std::string& id = catalog().items()[i].id;
                        throw ModelError("item '" + id + "' has no compatible slot and "
                            "unassigned items are not allowed", id, names::coverage(id));
                    }
                }
            }
        }

        void addVariables() override
        {
            const auto& items = catalog().items();
            const auto& slots = catalog().slots();
            const double penalty = options().unassigned_penalty;

            for (std::size_t i : model().itemOrder()) {
                std::vector<std::size_t> candidates = matrix().compatibleSlots(i);
                std::sort(candidates.begin(), candidates.end(),
                    [&](std::size_t a, std::size_t b) {
                        return model().slotRank(a) < model().slotRank(b);
                    });

                const double frequency = static_cast<double>(items[i].frequency);
                for (std::size_t s : candidates) {
                    const double cost = frequency * slots[s].cost;
                    addVariable(i, s, cost, cost - penalty * frequency);
                }
            }
        }

        void addConstraints() override
        {
            const auto& items = catalog().items();
            const auto& slots = catalog().slots();
            const Sense cover_sense = options().allow_unassigned ? Sense::LessEqual : Sense::Equal;

            for (std::size_t i : model().itemOrder()) {
                LinearConstraint c;
                c.name = names::coverage(items[i].id);
                c.kind = ConstraintKind::Coverage;
                c.owner = i;
                c.sense = cover_sense;
                c.rhs = 1.0;
                for (std::size_t v : model().itemVariables(i))
                    c.terms.push_back(Term{ v, 1.0 });
                addConstraint(std::move(c));
            }

            for (std::size_t s = 0; s < slots.size(); ++s) {
                LinearConstraint c;
                c.name = names::capacity(slots[s].id);
                c.kind = ConstraintKind::Capacity;
                c.owner = s;
                c.sense = Sense::LessEqual;
                c.rhs = slots[s].capacity;
                for (std::size_t v : model().slotVariables(s))
                    c.terms.push_back(Term{ v, items[model().variables()[v].item].size });
                addConstraint(std::move(c));
            }
        }

        void addObjective() override
        {
            double constant = 0.0;
            for (const Item& item : catalog().items())
                constant += options().unassigned_penalty * static_cast<double>(item.frequency);
            setObjectiveConstant(constant);
        }

        void finalize() override
        {
            store()["compatible_pairs"] = static_cast<int>(model().numVariables());
            store()["coverage_constraints"] = static_cast<int>(catalog().numItems());
            store()["capacity_constraints"] = static_cast<int>(catalog().numSlots());
            store()["pruned_pairs"] = static_cast<int>(
                catalog().numItems() * catalog().numSlots() - model().numVariables());

            VLOG(1) << "Model built: " << model().numVariables() << " variables, "
                    << model().numConstraints() << " constraints ("
                    << (options().allow_unassigned ? "partial" : "complete")
                    << " coverage)";
        }
    };

    /**
     * @brief Build the assignment model of a catalog
     *
     * @throws ModelError if the catalog is empty, the matrix does not match it,
     *         or (allow_unassigned == false) an item has no compatible slot
     */
    inline OptimizationModel build(const Catalog& catalog, const CompatibilityMatrix& matrix,
                                   ModelOptions options = {})
    {
        AssignmentModelBuilder builder(catalog, matrix, options);
        return builder.build();
    }

    /// @brief The model keeps references to its catalog and matrix; temporaries are rejected
    OptimizationModel build(Catalog&&, const CompatibilityMatrix&, ModelOptions = {}) = delete;
    OptimizationModel build(const Catalog&, CompatibilityMatrix&&, ModelOptions = {}) = delete;
    OptimizationModel build(Catalog&&, CompatibilityMatrix&&, ModelOptions = {}) = delete;

} // namespace assign
