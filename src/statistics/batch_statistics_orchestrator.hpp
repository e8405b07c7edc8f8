// File: src/statistics/batch_statistics_orchestrator.hpp
#pragma once

#include "core/errors.hpp"
#include "storage/inventory_repository.hpp"
#include <cstdint>
#include <functional>
#include <vector>

namespace stocklens {

/// Outcome of a bulk statistics recomputation
struct BatchStatisticsResult {
    int window_days{0};

    size_t total_items{0};

    /// Items with records in the window whose statistics were computed
    size_t success{0};

    /// Items without records; stored as the no-data snapshot
    size_t no_data{0};

    size_t failed{0};

    /// Snapshots accepted by the repository in the final batch save
    size_t saved{0};

    std::vector<BatchFailure> errors;

    int64_t elapsed_ms{0};
};

/// BatchStatisticsOrchestrator: Bulk recomputation of item statistics
///
/// Each run issues one item fetch, one all-items record fetch for the
/// window, groups the records in memory and ends with a single batch save,
/// so the storage round-trips do not grow with the number of items.
/// Statistics use the five-tier volatility scheme.
class BatchStatisticsOrchestrator {
public:
    BatchStatisticsOrchestrator(
        ItemRepository& items,
        ConsumptionRepository& consumption,
        std::function<Date()> today);

    /// Recompute every item
    BatchStatisticsResult RecalculateAll(int window_days);

    /// Recompute the listed items; unknown ids are ignored
    BatchStatisticsResult RecalculateForItems(const std::vector<ItemID>& ids, int window_days);

    /// Recompute the items of one category
    /// @throws NotFoundError if the category does not exist
    BatchStatisticsResult RecalculateForCategory(CategoryID category, int window_days);

private:
    ItemRepository& items_;
    ConsumptionRepository& consumption_;
    std::function<Date()> today_;

    BatchStatisticsResult Run(const std::vector<ItemRef>& items, int window_days);
};

} // namespace stocklens
