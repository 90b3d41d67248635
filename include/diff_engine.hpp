/**
 * @file diff_engine.hpp
 * @brief Minimal, ordered reconciliation plans between desired and live routes
 * @author route-compose Development Team
 * @date 2026
 *
 * The DiffEngine compares resolved desired routes with live route-table
 * entries and produces the smallest plan of Add and Delete operations that
 * turns one into the other. It is a pure function of its inputs: it never
 * reads the OS and two calls with equal inputs yield equal plans.
 *
 * Managed key space:
 * - Live entries tagged with the managed protocol were applied by this tool
 *   and are reconciled, deleted when no longer desired.
 * - Live entries whose prefix appears in the desired set are claimed by the
 *   profile, which is how an explicitly listed default route is replaced.
 *   Kernel-installed connected routes are never claimed.
 * - Everything else is foreign and never appears in a plan.
 *
 * Plan order: Adds before Deletes, and within each group non-default routes
 * before the default route. A default route replacement therefore runs as
 * add-new-default then delete-old-default, so the host always has one.
 */

#pragma once

#include "route_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace routecompose {

/**
 * @struct DiffOptions
 * @brief Parameters of the managed key space
 */
struct DiffOptions {
    std::string managed_protocol = "250";  ///< Protocol tag of tool-owned routes
};

/**
 * @struct PlanRow
 * @brief One preview line; a Delete/Add modify pair collapses into one Modify row
 */
struct PlanRow {
    enum class Kind {
        Add,
        Delete,
        Modify
    };

    Kind kind = Kind::Add;
    std::optional<RouteKey> desired_key;
    std::optional<LiveRouteEntry> before;  ///< Entry removed (Delete, Modify)
    std::optional<LiveRouteEntry> after;   ///< Entry added (Add, Modify)

    std::string describe() const;
    static std::string kindToString(Kind kind);
};

/**
 * @class DiffEngine
 * @brief Computes DiffPlans
 */
class DiffEngine {
public:
    explicit DiffEngine(DiffOptions options = DiffOptions());

    /**
     * @brief Plan the changes that make the live table match the desired routes
     * @param desired Resolved routes of the profile
     * @param live Current live entries
     * @return Ordered plan carrying the fingerprint of @p live
     *
     * Routes identical in every compared field produce no operation. A route
     * whose key matches but whose metric or interface differs yields a
     * Delete of the old entry and an Add of the new one, both flagged modify.
     */
    DiffPlan computeDiff(const std::vector<ResolvedRoute>& desired,
                         const std::vector<LiveRouteEntry>& live) const;

    /**
     * @brief Plan the changes that bring the live table back to a captured state
     * @param target Entries of a snapshot, interface indices already re-resolved
     * @param live Current live entries
     *
     * The snapshot is treated as the desired state for every entry except
     * kernel-installed ones, which the kernel maintains itself. Restored
     * entries keep their original protocol tag.
     */
    DiffPlan computeRestoreDiff(const std::vector<LiveRouteEntry>& target,
                                const std::vector<LiveRouteEntry>& live) const;

    /// Collapse modify pairs for display
    static std::vector<PlanRow> summarize(const DiffPlan& plan);

    const DiffOptions& options() const { return options_; }

private:
    static DiffPlan finalize(std::vector<DiffOperation> adds,
                             std::vector<DiffOperation> deletes,
                             uint64_t fingerprint);

    DiffOptions options_;
};

} // namespace routecompose
