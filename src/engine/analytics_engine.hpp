// File: src/engine/analytics_engine.hpp
#pragma once

#include "correlation/correlation_calculator.hpp"
#include "correlation/correlation_graph_manager.hpp"
#include "engine/correlation_update_worker.hpp"
#include "statistics/batch_statistics_orchestrator.hpp"
#include "statistics/item_statistics_calculator.hpp"
#include "statistics/time_series_extractor.hpp"
#include "storage/inventory_repository.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stocklens {

/// One item row of a category report
struct CategoryItemStatistics {
    ItemID item;
    std::string item_name;
    Decimal total_consumption;
    Decimal mean_consumption;
    Decimal coefficient_of_variation;
};

/// Aggregate consumption statistics of one category
struct CategoryStatisticsReport {
    CategoryID category;
    std::string category_name;
    int window_days{0};

    /// Items of the category with at least one record in the window
    size_t items_with_data{0};

    size_t total_records{0};
    Decimal total_consumption;

    /// CV across the per-item consumption totals
    Decimal category_cv;

    /// Five-tier class of category_cv
    VolatilityClass category_volatility{VolatilityClass::UNKNOWN};

    /// Per-item rows, total consumption descending
    std::vector<CategoryItemStatistics> items;

    /// First five rows of `items`
    std::vector<CategoryItemStatistics> top_items;
};

/// Consumption and receipts of every item on one date
struct DailyConsumption {
    Date date;
    Decimal consumed;
    Decimal received;
};

/// Inventory-wide overview for a window
struct DashboardStatistics {
    int window_days{0};
    DateRange window;

    size_t total_items{0};
    size_t active_items{0};
    size_t total_categories{0};

    /// Categories with at least one active item
    size_t active_categories{0};

    /// Items with positive consumption somewhere in the window
    size_t items_with_consumption{0};

    /// Items at or below their reorder level
    size_t low_stock_items{0};

    Decimal total_consumed;
    Decimal total_received;

    /// One entry per date of the window, zero-filled, ascending
    std::vector<DailyConsumption> daily;
};

/// AnalyticsEngine: Consumption analytics over an inventory store
///
/// Wires the time-series extractor, the item statistics calculator, the
/// correlation graph and the batch orchestrator to the injected
/// repositories, and owns the background worker that refreshes an item's
/// correlations after its consumption changes.
///
/// Every computation runs synchronously on the calling thread except the
/// correlation refresh, which is queued and returns immediately.
///
/// Example usage:
/// @code
///   MemoryBackend store;
///   AnalyticsEngine engine(store, store, store, AnalyticsEngine::Config{});
///   auto report = engine.ComputeItemStatistics(ItemID(1), 30);
///   if (report) {
///       std::cout << report->snapshot.mean_daily_consumption << "\n";
///   }
/// @endcode
class AnalyticsEngine {
public:
    struct Config {
        /// Default window of reports and bulk recomputation
        int statistics_window_days{30};

        /// Window of the per-item update path
        int update_window_days{30};

        /// Window of correlation computation
        int correlation_window_days{90};

        /// Minimum observations per item (and dates per pair) for correlation
        int min_data_points{TimeSeriesExtractor::kDefaultMinDataPoints};

        /// |r| at or above which a correlation is significant
        Decimal significance_threshold{CorrelationCalculator::DefaultSignificanceThreshold()};

        /// Default number of recommendations
        size_t recommendation_limit{5};

        bool Validate() const;
    };

    /// @param today Supplies "today" for every window; defaults to Date::Today
    /// @throws std::invalid_argument if config is invalid
    AnalyticsEngine(
        ConsumptionRepository& consumption,
        ItemRepository& items,
        CorrelationRepository& correlations,
        const Config& config,
        std::function<Date()> today = {});

    /// Stops the background worker after draining queued refreshes
    ~AnalyticsEngine();

    AnalyticsEngine(const AnalyticsEngine&) = delete;
    AnalyticsEngine& operator=(const AnalyticsEngine&) = delete;

    // ========================================================================
    // Statistics
    // ========================================================================

    /// Full statistics of one item over the last `window_days`
    /// @return std::nullopt when the item has no records in the window
    /// @throws NotFoundError if the item does not exist
    std::optional<ItemStatisticsReport> ComputeItemStatistics(ItemID item, int window_days);

    /// Aggregate statistics of one category over the last `window_days`
    /// @return std::nullopt when no item of the category has records
    /// @throws NotFoundError if the category does not exist
    std::optional<CategoryStatisticsReport> ComputeCategoryStatistics(CategoryID category, int window_days);

    DashboardStatistics ComputeDashboardStatistics(int window_days);

    /// Recompute and store one item's snapshot (three-tier volatility), then
    /// queue a correlation refresh for it
    /// @throws NotFoundError if the item does not exist
    /// @throws StorageError if the snapshot could not be saved
    ItemStatisticsSnapshot UpdateItemStatistics(ItemID item);

    /// Hook for the transaction-recording side: queue a correlation refresh
    void OnConsumptionRecorded(ItemID item);

    BatchStatisticsResult RecalculateAllStatistics();
    BatchStatisticsResult RecalculateStatisticsForItems(const std::vector<ItemID>& ids, int window_days);

    /// @throws NotFoundError if the category does not exist
    BatchStatisticsResult RecalculateStatisticsForCategory(CategoryID category, int window_days);

    // ========================================================================
    // Correlations
    // ========================================================================

    CorrelationSweepSummary RecalculateAllCorrelations();

    /// @throws NotFoundError if the item does not exist
    ItemCorrelationSummary RecalculateCorrelationsForItem(ItemID item);

    /// Delete the whole correlation graph and rebuild it
    CorrelationSweepSummary ForceFullRecalculation();

    std::vector<Recommendation> GetRecommendations(ItemID item, size_t limit);

    /// Recommendations with the configured default limit
    std::vector<Recommendation> GetRecommendations(ItemID item) {
        return GetRecommendations(item, config_.recommendation_limit);
    }

    CorrelationGraphStatistics GetCorrelationStatistics();

    // ========================================================================
    // Background Work
    // ========================================================================

    /// Block until every queued correlation refresh has run
    void WaitForBackgroundWork();

    const CorrelationUpdateWorker& GetWorker() const { return *worker_; }

    const Config& GetConfig() const { return config_; }

private:
    ConsumptionRepository& consumption_;
    ItemRepository& items_;
    CorrelationRepository& correlations_;
    Config config_;
    std::function<Date()> today_;

    TimeSeriesExtractor extractor_;
    CorrelationCalculator calculator_;
    CorrelationGraphManager graph_;
    BatchStatisticsOrchestrator batch_;

    // Declared last: the worker thread uses graph_ and must stop first
    std::unique_ptr<CorrelationUpdateWorker> worker_;

    DateRange WindowEndingToday(int days) const;
};

} // namespace stocklens
