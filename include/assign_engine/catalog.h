#pragma once
/*
===============================================================================
CATALOG — Immutable item and slot records
===============================================================================

Overview
--------
The catalog is the validated input of every solve: the items (materials) to
be placed and the slots (bins) they may be placed in. It is built once by
load() and is read-only afterwards, so it can be shared by any number of
concurrent solves.

    Item  { id, frequency, size, category }
    Slot  { id, capacity, cost, slot_type }

Validation rules (ValidationError on the first violation, in input order,
items before slots):

    * identifiers are non-empty and unique (items and slots are separate
      namespaces)
    * frequency > 0, size > 0, capacity > 0, cost >= 0, all finite
    * category in CatalogOptions::categories
    * slot_type in CatalogOptions::slot_types

Typical Usage
-------------
    auto catalog = assign::load(
        {{"M1", 3, 5.0, "fragile"}, {"M2", 1, 2.0, "regular"}},
        {{"B1", 15.0, 1.0, "safe"}, {"B3", 10.0, 3.0, "special"}});

    const assign::Item& m1 = catalog.item("M1");
    for (const auto& slot : catalog.slots()) { ... }

===============================================================================
*/

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <absl/log/log.h>

#include "errors.h"

namespace assign {

    /**
     * @brief A unit of cargo to be placed in at most one slot
     */
    struct Item {
        std::string id;
        std::int64_t frequency = 1;     ///< urgency weight, higher = more urgent
        double size = 0.0;              ///< volume requirement
        std::string category;           ///< e.g. "fragile", "hazardous", "regular"
    };

    /**
     * @brief A resource with finite capacity and a placement cost
     */
    struct Slot {
        std::string id;
        double capacity = 0.0;          ///< volume limit
        double cost = 0.0;              ///< e.g. distance from dispatch, lower preferred
        std::string slot_type;          ///< e.g. "safe", "special", "regular"
    };

    /**
     * @brief Allowed category and slot-type tags
     *
     * The tag sets are extensible: callers add their own tags before load().
     */
    struct CatalogOptions {
        std::set<std::string, std::less<>> categories{ "fragile", "hazardous", "regular" };
        std::set<std::string, std::less<>> slot_types{ "safe", "special", "regular" };
    };

    /**
     * @class Catalog
     * @brief Validated, immutable collection of items and slots
     *
     * Iteration follows input order. Lookup by identifier is O(1).
     */
    class Catalog {
    public:
        const std::vector<Item>& items() const noexcept { return items_; }
        const std::vector<Slot>& slots() const noexcept { return slots_; }

        std::size_t numItems() const noexcept { return items_.size(); }
        std::size_t numSlots() const noexcept { return slots_.size(); }
        /// @brief True when there is nothing to assign or nowhere to assign it
        bool empty() const noexcept { return items_.empty() || slots_.empty(); }

        const CatalogOptions& options() const noexcept { return options_; }

        /// @throws std::out_of_range if no item has this identifier
        const Item& item(std::string_view id) const { return items_[itemIndex(id)]; }

        /// @throws std::out_of_range if no slot has this identifier
        const Slot& slot(std::string_view id) const { return slots_[slotIndex(id)]; }

        const Item* findItem(std::string_view id) const noexcept {
            auto idx = lookup(item_index_, id);
            return idx ? &items_[*idx] : nullptr;
        }

        const Slot* findSlot(std::string_view id) const noexcept {
            auto idx = lookup(slot_index_, id);
            return idx ? &slots_[*idx] : nullptr;
        }

        /// @brief Position of an item in items()
        /// @throws std::out_of_range if no item has this identifier
        std::size_t itemIndex(std::string_view id) const {
            if (auto idx = lookup(item_index_, id))
                return *idx;
            throw std::out_of_range("Catalog: unknown item '" + std::string(id) + "'");
        }

        /// @brief Position of a slot in slots()
        /// @throws std::out_of_range if no slot has this identifier
        std::size_t slotIndex(std::string_view id) const {
            if (auto idx = lookup(slot_index_, id))
                return *idx;
            throw std::out_of_range("Catalog: unknown slot '" + std::string(id) + "'");
        }

        /// @brief Sum of all item sizes
        double totalSize() const noexcept {
            double total = 0.0;
            for (const auto& it : items_) total += it.size;
            return total;
        }

        /// @brief Sum of all slot capacities
        double totalCapacity() const noexcept {
            double total = 0.0;
            for (const auto& s : slots_) total += s.capacity;
            return total;
        }

    private:
        // Transparent hashing lets string_view lookups skip the std::string copy.
        struct IdHash {
            using is_transparent = void;
            std::size_t operator()(std::string_view id) const noexcept {
                return std::hash<std::string_view>{}(id);
            }
        };

        using Index = std::unordered_map<std::string, std::size_t, IdHash, std::equal_to<>>;

        friend Catalog load(std::vector<Item> items, std::vector<Slot> slots,
                            const CatalogOptions& options);

        Catalog(std::vector<Item> items, std::vector<Slot> slots, CatalogOptions options)
            : items_(std::move(items)), slots_(std::move(slots)), options_(std::move(options))
        {
        }

        static std::optional<std::size_t> lookup(const Index& index, std::string_view id) noexcept {
            auto it = index.find(id);
            if (it == index.end())
                return std::nullopt;
            return it->second;
        }

        std::vector<Item> items_;
        std::vector<Slot> slots_;
        CatalogOptions options_;
        Index item_index_;
        Index slot_index_;
    };

    namespace catalog_detail {

        inline void require(bool condition, const std::string& id,
                            const std::string& field, const std::string& what) {
            if (!condition) {
                throw ValidationError("'" + id + "': " + what, id, field);
            }
        }

        inline void validateItem(const Item& item, const CatalogOptions& options) {
            require(!item.id.empty(), item.id, "id", "item identifier must not be empty");
            require(item.frequency > 0, item.id, "frequency",
                "frequency must be positive (got " + std::to_string(item.frequency) + ")");
            require(std::isfinite(item.size) && item.size > 0.0, item.id, "size",
                "size must be positive and finite (got " + std::to_string(item.size) + ")");
            require(options.categories.contains(item.category), item.id, "category",
                "unknown category '" + item.category + "'");
        }

        inline void validateSlot(const Slot& slot, const CatalogOptions& options) {
            require(!slot.id.empty(), slot.id, "id", "slot identifier must not be empty");
            require(std::isfinite(slot.capacity) && slot.capacity > 0.0, slot.id, "capacity",
                "capacity must be positive and finite (got " + std::to_string(slot.capacity) + ")");
            require(std::isfinite(slot.cost) && slot.cost >= 0.0, slot.id, "cost",
                "cost must be non-negative and finite (got " + std::to_string(slot.cost) + ")");
            require(options.slot_types.contains(slot.slot_type), slot.id, "slot_type",
                "unknown slot type '" + slot.slot_type + "'");
        }

    } // namespace catalog_detail

    /**
     * @brief Validate input records and build an immutable Catalog
     *
     * @param items   Items in caller order
     * @param slots   Slots in caller order
     * @param options Allowed category and slot-type tags
     *
     * @throws ValidationError on the first malformed record
     */
    inline Catalog load(std::vector<Item> items, std::vector<Slot> slots,
                        const CatalogOptions& options = {})
    {
        Catalog catalog(std::move(items), std::move(slots), options);

        for (std::size_t i = 0; i < catalog.items_.size(); ++i) {
            const Item& item = catalog.items_[i];
            catalog_detail::validateItem(item, options);
            if (!catalog.item_index_.emplace(item.id, i).second) {
                throw ValidationError("duplicate item identifier '" + item.id + "'",
                                      item.id, "id");
            }
        }

        for (std::size_t s = 0; s < catalog.slots_.size(); ++s) {
            const Slot& slot = catalog.slots_[s];
            catalog_detail::validateSlot(slot, options);
            if (!catalog.slot_index_.emplace(slot.id, s).second) {
                throw ValidationError("duplicate slot identifier '" + slot.id + "'",
                                      slot.id, "id");
            }
        }

        VLOG(1) << "Catalog loaded: " << catalog.numItems() << " items, "
                << catalog.numSlots() << " slots";
        return catalog;
    }

} // namespace assign
