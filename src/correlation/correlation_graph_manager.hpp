// File: src/correlation/correlation_graph_manager.hpp
#pragma once

#include "core/errors.hpp"
#include "correlation/correlation_calculator.hpp"
#include "correlation/correlation_edge.hpp"
#include "storage/inventory_repository.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace stocklens {

/// One computed pair, as reported by the sweeps
struct PairCorrelation {
    ItemID item1;
    std::string item1_name;
    ItemID item2;
    std::string item2_name;
    Decimal coefficient;
    CorrelationType type{CorrelationType::NO_CORRELATION};
    int data_points{0};
    bool significant{false};
};

/// Result of a full pairwise sweep
struct CorrelationSweepSummary {
    size_t total_items{0};

    /// Pairs that had enough data and were stored
    size_t total_pairs{0};

    /// Pairs skipped for insufficient data
    size_t insufficient_pairs{0};

    size_t significant_correlations{0};
    Decimal threshold;

    /// Significant pairs, |r| descending, at most 10
    std::vector<PairCorrelation> top_correlations;

    /// Pairs whose computation threw; id is "item1-item2"
    std::vector<BatchFailure> failures;

    Timestamp completed_at;

    /// Set when the sweep could not run at all
    std::optional<std::string> error;
};

/// Result of correlating one item against every other item
struct ItemCorrelationSummary {
    ItemID item;
    std::string item_name;

    /// All computed pairs, |r| descending; item1 is always the target item
    std::vector<PairCorrelation> correlations;

    /// r > 0.7
    std::vector<PairCorrelation> strong_positive;

    /// r < -0.7
    std::vector<PairCorrelation> strong_negative;

    std::vector<BatchFailure> failures;
};

/// A correlated item worth looking at when the target item is reordered
struct Recommendation {
    ItemID item;
    std::string item_name;
    Decimal coefficient;
    CorrelationType type{CorrelationType::NO_CORRELATION};
    Decimal current_stock;
    std::optional<Decimal> reorder_level;
    bool needs_reorder{false};
};

/// Aggregate view of the active correlation graph
struct CorrelationGraphStatistics {
    size_t total_correlations{0};
    Decimal average_coefficient;
    Decimal max_coefficient;
    Decimal min_coefficient;
    size_t strong_positive{0};
    size_t strong_negative{0};
    size_t significant{0};
    Decimal threshold;
    int min_data_points{0};

    /// Set when there are no active edges
    std::optional<std::string> message;
};

/// CorrelationGraphManager: Maintains the persisted item correlation graph
///
/// Computes pairwise correlations through a CorrelationCalculator and keeps
/// one edge per unordered item pair in a CorrelationRepository:
/// - Existing edges are updated in place (coefficient, type, last-calculated)
/// - New edges record the data points used, confidence 95 and item1's category
/// - Edges are only deleted by ForceRecalculate()
///
/// A failure on one pair is logged, recorded in the result and skipped.
class CorrelationGraphManager {
public:
    /// Maximum entries of CorrelationSweepSummary::top_correlations
    static constexpr size_t kTopCorrelations = 10;

    struct Config {
        /// Look-back of the correlation window, ending today
        int window_days{90};

        /// |r| at or above which a pair counts as significant
        Decimal significance_threshold{CorrelationCalculator::DefaultSignificanceThreshold()};

        bool Validate() const { return window_days > 0 && significance_threshold.Sign() >= 0; }
    };

    /// @param today Supplies the end date of every correlation window
    CorrelationGraphManager(
        ItemRepository& items,
        CorrelationRepository& edges,
        const CorrelationCalculator& calculator,
        const TimeSeriesExtractor& extractor,
        const Config& config,
        std::function<Date()> today);

    // ========================================================================
    // Sweeps
    // ========================================================================

    /// Correlate every pair of items and upsert each computed edge
    /// Fewer than two items yields a summary with `error` set.
    CorrelationSweepSummary CalculateAll();

    /// Correlate one item against all others
    /// @throws NotFoundError if the item does not exist
    ItemCorrelationSummary CalculateForItem(ItemID item);

    /// Delete every edge, then CalculateAll()
    CorrelationSweepSummary ForceRecalculate();

    // ========================================================================
    // Queries
    // ========================================================================

    /// Significant active edges of an item, |r| descending, at most `limit`
    std::vector<Recommendation> Recommendations(ItemID item, size_t limit);

    CorrelationGraphStatistics Statistics();

    const Config& GetConfig() const { return config_; }

private:
    ItemRepository& items_;
    CorrelationRepository& edges_;
    const CorrelationCalculator& calculator_;
    const TimeSeriesExtractor& extractor_;
    Config config_;
    std::function<Date()> today_;

    DateRange CurrentWindow() const;

    /// Compute one pair and upsert its edge
    /// @return std::nullopt for insufficient data
    std::optional<PairCorrelation> CorrelatePair(
        const ItemRef& item1, const ItemRef& item2, const DateRange& window);

    /// Update the existing edge of the pair, or create it
    CorrelationEdge SaveOrUpdate(
        const ItemRef& item1, const ItemRef& item2, const CorrelationResult& result);

    static std::string PairKey(ItemID a, ItemID b);
};

} // namespace stocklens
