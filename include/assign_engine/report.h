#pragma once
/*
===============================================================================
REPORT — Solution cross-check and presentation
===============================================================================

Overview
--------
report() maps a Solution back onto the catalog and re-derives everything the
solver claims, independently of the model the solver worked on:

    * each item's slot (or unassigned) and cost contribution
    * the objective, recomputed as sum of frequency * slot cost
    * per-slot load and utilization

Any disagreement raises ConsistencyError:

    unknown item or slot identifier in the solution
    item of the catalog missing from the solution
    |recomputed objective - reported objective| > 1e-6
    slot load above capacity
    item placed in an incompatible slot (only when a matrix is passed)

Only solutions carrying an assignment are checked for capacity and
compatibility; infeasible and unsolved results still get a report with every
item unassigned or partially placed.

Typical Usage
-------------
    auto r = assign::report(solution, catalog, &matrix);
    std::cout << r.summary();

    for (const auto& entry : r.entries)
        if (entry.slot) std::cout << entry.item << " -> " << *entry.slot << "\n";

===============================================================================
*/

#include <cmath>
#include <cstddef>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "catalog.h"
#include "compatibility.h"
#include "errors.h"
#include "naming.h"
#include "solution.h"

namespace assign {

    /// @brief One line of the report
    struct ReportEntry {
        std::string item;
        std::optional<std::string> slot;    ///< std::nullopt = unassigned
        double contribution = 0.0;          ///< frequency * slot cost (0 if unassigned)
    };

    /// @brief Load of one slot
    struct SlotLoad {
        std::string slot;
        double load = 0.0;
        double capacity = 0.0;
        std::size_t items = 0;

        double utilization() const { return capacity > 0.0 ? load / capacity : 0.0; }
    };

    /**
     * @brief Verified, presentation-ready view of a Solution
     */
    struct AssignmentReport {
        SolveStatus status = SolveStatus::Unsolved;
        std::string strategy;
        std::vector<ReportEntry> entries;       ///< by item identifier
        std::vector<std::string> unassigned;    ///< by item identifier
        std::vector<SlotLoad> slots;            ///< catalog order
        double objective = 0.0;                 ///< recomputed
        double reportedObjective = 0.0;         ///< as returned by the solver
        double penalizedObjective = 0.0;

        /// @brief Multi-line human-readable rendering
        std::string summary() const {
            std::ostringstream out;
            out << "Status: " << enum_name(status);
            if (!strategy.empty())
                out << " (" << strategy << ")";
            out << "\nObjective: " << objective;
            if (std::abs(penalizedObjective - objective) > 1e-9)
                out << " (penalized " << penalizedObjective << ")";
            out << "\n";

            out << "Assignments:\n";
            for (const auto& e : entries) {
                out << "  " << e.item << " -> ";
                if (e.slot)
                    out << *e.slot << "  (" << e.contribution << ")";
                else
                    out << "unassigned";
                out << "\n";
            }

            out << "Slots:\n";
            for (const auto& s : slots) {
                out << "  " << s.slot << ": " << s.load << " / " << s.capacity
                    << " (" << std::fixed << std::setprecision(1)
                    << 100.0 * s.utilization() << "%)" << std::defaultfloat
                    << std::setprecision(6) << ", " << s.items << " item(s)\n";
            }

            if (!unassigned.empty()) {
                out << "Unassigned:";
                for (const auto& id : unassigned)
                    out << " " << id;
                out << "\n";
            }
            return out.str();
        }
    };

    /// @brief Tolerance of the objective cross-check
    inline constexpr double kObjectiveTolerance = 1e-6;

    /**
     * @brief Build and verify the report of a solution
     *
     * @param matrix Optional; when given, every placement is checked against it
     * @throws ConsistencyError if the solution disagrees with the catalog
     */
    inline AssignmentReport report(const Solution& solution, const Catalog& catalog,
                                   const CompatibilityMatrix* matrix = nullptr)
    {
        AssignmentReport r;
        r.status = solution.status();
        r.strategy = solution.strategy();
        r.reportedObjective = solution.objective();
        r.penalizedObjective = solution.penalizedObjective();

        for (const Slot& slot : catalog.slots())
            r.slots.push_back(SlotLoad{ slot.id, 0.0, slot.capacity, 0 });

        for (const auto& [item_id, slot_id] : solution.assignments()) {
            const Item* item = catalog.findItem(item_id);
            if (!item) {
                throw ConsistencyError("solution names unknown item '" + item_id + "'",
                                       item_id, "item");
            }

            ReportEntry entry{ item_id, slot_id, 0.0 };
            if (slot_id) {
                const Slot* slot = catalog.findSlot(*slot_id);
                if (!slot) {
                    throw ConsistencyError("item '" + item_id + "' is placed in unknown slot '"
                                           + *slot_id + "'", item_id, "slot");
                }
                const std::size_t s = catalog.slotIndex(*slot_id);
                if (matrix && !matrix->compatible(catalog.itemIndex(item_id), s)) {
                    throw ConsistencyError("item '" + item_id + "' is placed in incompatible slot '"
                                           + *slot_id + "'", item_id, names::variable(item_id, *slot_id));
                }
                entry.contribution = static_cast<double>(item->frequency) * slot->cost;
                r.objective += entry.contribution;
                r.slots[s].load += item->size;
                ++r.slots[s].items;
            } else {
                r.unassigned.push_back(item_id);
            }
            r.entries.push_back(std::move(entry));
        }

        if (r.entries.size() != catalog.numItems()) {
            for (const Item& item : catalog.items()) {
                if (!solution.assignments().count(item.id)) {
                    throw ConsistencyError("item '" + item.id + "' is missing from the solution",
                                           item.id, names::coverage(item.id));
                }
            }
        }

        if (std::abs(r.objective - r.reportedObjective) > kObjectiveTolerance) {
            std::ostringstream msg;
            msg << "recomputed objective " << r.objective
                << " differs from reported objective " << r.reportedObjective;
            throw ConsistencyError(msg.str(), "", "objective");
        }

        if (solution.hasSolution()) {
            for (const SlotLoad& s : r.slots) {
                if (s.load > s.capacity + OptimizationModel::kCapacityTolerance) {
                    std::ostringstream msg;
                    msg << "slot '" << s.slot << "' holds " << s.load
                        << " above its capacity " << s.capacity;
                    throw ConsistencyError(msg.str(), s.slot, names::capacity(s.slot));
                }
            }
        }
        return r;
    }

} // namespace assign
