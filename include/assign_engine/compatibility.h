#pragma once
/*
===============================================================================
COMPATIBILITY — Rule evaluation and the immutable compatibility matrix
===============================================================================

Overview
--------
A CompatibilityRule is a pure predicate over (item category, slot type) that
returns a Verdict:

    Allow    the rule explicitly permits the pair
    Deny     the rule explicitly forbids the pair
    Abstain  the rule does not concern the pair

A RuleSet combines the verdicts of all its rules without regard to their
order:

    any Deny                   -> incompatible
    otherwise any Allow        -> compatible
    otherwise (all Abstain)    -> RuleSet::default_policy

The default policy is declared, never implied: DefaultPolicy::Allow keeps the
warehouse behaviour (anything not special-cased may go anywhere),
DefaultPolicy::Deny gives a whitelist deployment.

resolve() evaluates the rule set for every (item, slot) pair of a catalog
and freezes the result into a CompatibilityMatrix. The matrix is a snapshot:
editing the RuleSet afterwards does not affect it, and a new matrix must be
resolved (and a new model built) for the edit to take effect.

Typical Usage
-------------
    assign::RuleSet rules = assign::warehouseRules();
    rules.add(assign::forbid("regular", "special"));

    auto matrix = assign::resolve(catalog, rules);
    if (matrix.compatible("M1", "B1")) { ... }
    for (std::size_t s : matrix.compatibleSlots(0)) { ... }

===============================================================================
*/

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/log/log.h>

#include "catalog.h"
#include "enum_utils.h"

namespace assign {

    ASSIGN_DECLARE_ENUM_WITH_COUNT(Verdict, Allow, Deny, Abstain);
    ASSIGN_DECLARE_ENUM_WITH_COUNT(DefaultPolicy, Allow, Deny);

} // namespace assign

ASSIGN_DECLARE_ENUM_NAMES(assign::Verdict, "allow", "deny", "abstain");
ASSIGN_DECLARE_ENUM_NAMES(assign::DefaultPolicy, "allow", "deny");

namespace assign {

    /**
     * @brief Named pure predicate over (category, slot_type)
     *
     * @note evaluate must be deterministic and free of side effects; the
     *       resolver may call it once per tag combination instead of once per
     *       (item, slot) pair.
     */
    struct CompatibilityRule {
        std::string name;
        std::function<Verdict(std::string_view category, std::string_view slot_type)> evaluate;
    };

    /**
     * @class RuleSet
     * @brief Order-independent collection of rules plus a default policy
     */
    class RuleSet {
    public:
        RuleSet() = default;

        explicit RuleSet(DefaultPolicy policy) : default_policy_(policy) {}

        RuleSet(std::vector<CompatibilityRule> rules, DefaultPolicy policy = DefaultPolicy::Allow)
            : default_policy_(policy)
        {
            for (auto& rule : rules)
                add(std::move(rule));
        }

        /// @throws std::invalid_argument if the rule has no predicate
        RuleSet& add(CompatibilityRule rule) {
            if (!rule.evaluate) {
                throw std::invalid_argument("RuleSet: rule '" + rule.name + "' has no predicate");
            }
            rules_.push_back(std::move(rule));
            return *this;
        }

        RuleSet& setDefaultPolicy(DefaultPolicy policy) noexcept {
            default_policy_ = policy;
            return *this;
        }

        DefaultPolicy defaultPolicy() const noexcept { return default_policy_; }
        const std::vector<CompatibilityRule>& rules() const noexcept { return rules_; }

        /**
         * @brief Combined decision for one (category, slot_type) pair
         */
        bool permits(std::string_view category, std::string_view slot_type) const {
            bool allowed = false;
            for (const auto& rule : rules_) {
                switch (rule.evaluate(category, slot_type)) {
                    case Verdict::Deny:
                        return false;
                    case Verdict::Allow:
                        allowed = true;
                        break;
                    default:
                        break;
                }
            }
            return allowed || default_policy_ == DefaultPolicy::Allow;
        }

    private:
        DefaultPolicy default_policy_ = DefaultPolicy::Allow;
        std::vector<CompatibilityRule> rules_;
    };

    // =========================================================================
    // RULE FACTORIES
    // =========================================================================

    /**
     * @brief Items of category may only be placed in the listed slot types
     *
     * Allows the listed types, denies every other type, abstains for other
     * categories.
     */
    inline CompatibilityRule requireSlotTypes(std::string category, std::vector<std::string> types) {
        std::string name = category + " requires";
        for (const auto& t : types)
            name += " " + t;
        return CompatibilityRule{
            std::move(name),
            [category = std::move(category), types = std::move(types)](
                std::string_view c, std::string_view t) {
                if (c != category)
                    return Verdict::Abstain;
                for (const auto& allowed : types) {
                    if (allowed == t)
                        return Verdict::Allow;
                }
                return Verdict::Deny;
            }};
    }

    /// @brief Explicitly allow one (category, slot_type) pair
    inline CompatibilityRule permit(std::string category, std::string slot_type) {
        std::string name = "permit " + category + " in " + slot_type;
        return CompatibilityRule{
            std::move(name),
            [category = std::move(category), slot_type = std::move(slot_type)](
                std::string_view c, std::string_view t) {
                return (c == category && t == slot_type) ? Verdict::Allow : Verdict::Abstain;
            }};
    }

    /// @brief Explicitly forbid one (category, slot_type) pair
    inline CompatibilityRule forbid(std::string category, std::string slot_type) {
        std::string name = "forbid " + category + " in " + slot_type;
        return CompatibilityRule{
            std::move(name),
            [category = std::move(category), slot_type = std::move(slot_type)](
                std::string_view c, std::string_view t) {
                return (c == category && t == slot_type) ? Verdict::Deny : Verdict::Abstain;
            }};
    }

    /**
     * @brief Warehouse rules: fragile only in safe bins, hazardous only in
     *        special bins, everything else anywhere (default allow)
     */
    inline RuleSet warehouseRules(DefaultPolicy policy = DefaultPolicy::Allow) {
        return RuleSet({ requireSlotTypes("fragile", { "safe" }),
                         requireSlotTypes("hazardous", { "special" }) },
                       policy);
    }

    // =========================================================================
    // COMPATIBILITY MATRIX
    // =========================================================================

    /**
     * @class CompatibilityMatrix
     * @brief Immutable |items| x |slots| boolean matrix
     *
     * Row i corresponds to catalog.items()[i], column s to catalog.slots()[s].
     */
    class CompatibilityMatrix {
    public:
        std::size_t numItems() const noexcept { return num_items_; }
        std::size_t numSlots() const noexcept { return num_slots_; }

        /// @throws std::out_of_range for indices outside the matrix
        bool compatible(std::size_t item, std::size_t slot) const {
            if (item >= num_items_ || slot >= num_slots_) {
                throw std::out_of_range("CompatibilityMatrix: index ("
                    + std::to_string(item) + "," + std::to_string(slot) + ") out of range");
            }
            return cells_[item * num_slots_ + slot] != 0;
        }

        /// @throws std::out_of_range for unknown identifiers
        bool compatible(std::string_view item_id, std::string_view slot_id) const {
            if (!catalog_) {
                throw std::out_of_range("CompatibilityMatrix: not resolved from a catalog");
            }
            return compatible(catalog_->itemIndex(item_id), catalog_->slotIndex(slot_id));
        }

        /// @brief Compatible slot indices of an item, ascending
        const std::vector<std::size_t>& compatibleSlots(std::size_t item) const {
            return rows_.at(item);
        }

        /// @brief Number of compatible (item, slot) pairs
        std::size_t compatibleCount() const noexcept { return compatible_count_; }

        /// @brief Indices of items with no compatible slot, ascending
        std::vector<std::size_t> itemsWithoutSlot() const {
            std::vector<std::size_t> out;
            for (std::size_t i = 0; i < num_items_; ++i) {
                if (rows_[i].empty())
                    out.push_back(i);
            }
            return out;
        }

        DefaultPolicy defaultPolicy() const noexcept { return policy_; }

        /// @brief True if the matrix was resolved from this catalog's shape
        bool matches(const Catalog& catalog) const noexcept {
            return num_items_ == catalog.numItems() && num_slots_ == catalog.numSlots();
        }

    private:
        friend CompatibilityMatrix resolve(const Catalog& catalog, const RuleSet& rules);

        CompatibilityMatrix() = default;

        const Catalog* catalog_ = nullptr;
        std::size_t num_items_ = 0;
        std::size_t num_slots_ = 0;
        std::size_t compatible_count_ = 0;
        DefaultPolicy policy_ = DefaultPolicy::Allow;
        std::vector<std::uint8_t> cells_;
        std::vector<std::vector<std::size_t>> rows_;
    };

    /**
     * @brief Evaluate the rule set for every (item, slot) pair
     *
     * @note The matrix keeps a pointer to the catalog for identifier lookups;
     *       the catalog must outlive it.
     */
    inline CompatibilityMatrix resolve(const Catalog& catalog, const RuleSet& rules)
    {
        CompatibilityMatrix m;
        m.catalog_ = &catalog;
        m.num_items_ = catalog.numItems();
        m.num_slots_ = catalog.numSlots();
        m.policy_ = rules.defaultPolicy();
        m.cells_.assign(m.num_items_ * m.num_slots_, 0);
        m.rows_.resize(m.num_items_);

        // Rules depend on tags only; evaluate each tag combination once.
        std::map<std::pair<std::string, std::string>, bool> decided;

        for (std::size_t i = 0; i < m.num_items_; ++i) {
            const Item& item = catalog.items()[i];
            for (std::size_t s = 0; s < m.num_slots_; ++s) {
                const Slot& slot = catalog.slots()[s];
                auto key = std::make_pair(item.category, slot.slot_type);
                auto it = decided.find(key);
                if (it == decided.end()) {
                    it = decided.emplace(key, rules.permits(item.category, slot.slot_type)).first;
                }
                if (it->second) {
                    m.cells_[i * m.num_slots_ + s] = 1;
                    m.rows_[i].push_back(s);
                    ++m.compatible_count_;
                }
            }
        }

        VLOG(1) << "Compatibility resolved: " << m.compatible_count_ << " of "
                << m.num_items_ * m.num_slots_ << " pairs compatible (default "
                << enum_name(m.policy_) << ")";
        return m;
    }

    /// @brief A matrix must not outlive its catalog; temporaries are rejected
    CompatibilityMatrix resolve(Catalog&& catalog, const RuleSet& rules) = delete;

} // namespace assign
