// File: src/statistics/item_statistics_calculator.hpp
#pragma once

#include "core/records.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stocklens {

/// Which volatility thresholds a caller classifies with
enum class VolatilityScheme {
    /// VERY_LOW .. VERY_HIGH, used by reports and batch recomputation
    FIVE_TIER,
    /// LOW / MEDIUM / HIGH, used by the per-item update path
    THREE_TIER
};

/// Day-of-week consumption profile
struct SeasonalityProfile {
    /// ISO day of week (1 = Monday) -> mean consumption on that day.
    /// Only days present in the data appear.
    std::map<int, Decimal> day_of_week_means;

    /// Mean of the Monday..Friday means present (0 when none)
    Decimal weekday_average;

    /// Mean of the Saturday/Sunday means present (0 when none)
    Decimal weekend_average;
};

/// Full single-item statistics view
struct ItemStatisticsReport {
    ItemID item_id;
    std::string item_name;
    int window_days{0};
    size_t total_records{0};

    /// Mean, std, CV, classification, forecast and coverage
    ItemStatisticsSnapshot snapshot;

    Decimal median;
    Decimal min;
    Decimal max;
    Decimal range;
    Decimal total_consumption;

    /// Records with a positive consumed quantity
    int64_t days_with_activity{0};

    /// days_with_activity / window_days at 2 fractional digits
    Decimal activity_rate;

    /// Volatility is HIGH or VERY_HIGH
    bool is_highly_volatile{false};

    Decimal percentile_25;
    Decimal percentile_75;
    Decimal percentile_90;

    SeasonalityProfile seasonality;
};

/// ItemStatisticsCalculator: Descriptive and forecast statistics of one item
///
/// Every function is pure: the caller passes the series and receives a new
/// snapshot or report value. Nothing is written back to the item.
class ItemStatisticsCalculator {
public:
    // ========================================================================
    // Classification
    // ========================================================================

    /// Five-tier volatility from |CV|:
    /// > 0.75 VERY_HIGH, > 0.50 HIGH, > 0.25 MEDIUM, > 0.10 LOW, else VERY_LOW.
    /// Absent CV -> UNKNOWN.
    static VolatilityClass ClassifyVolatility(const std::optional<Decimal>& cv);

    /// Three-tier volatility from |CV|:
    /// > 0.5 HIGH, > 0.3 MEDIUM, else LOW. Absent CV -> UNKNOWN.
    static VolatilityClass ClassifyVolatilityCoarse(const std::optional<Decimal>& cv);

    /// Dispatch on scheme
    static VolatilityClass Classify(const std::optional<Decimal>& cv, VolatilityScheme scheme);

    /// Least-squares slope of value vs. index in units per day
    /// (> 0.1 INCREASING, < -0.1 DECREASING, else STABLE).
    /// Fewer than 3 values -> INSUFFICIENT_DATA.
    static TrendDirection AnalyzeTrend(const std::vector<Decimal>& values);

    /// Raw least-squares slope at 10 fractional digits (0 for fewer than 2 values)
    static Decimal Slope(const std::vector<Decimal>& values);

    /// Share of zero-consumption records:
    /// > 0.7 SPORADIC, > 0.3 IRREGULAR, else REGULAR. Empty -> NO_DATA.
    static ConsumptionPattern AnalyzePattern(const std::vector<Decimal>& values);

    static SeasonalityProfile DetectSeasonality(const std::vector<ConsumptionObservation>& records);

    // ========================================================================
    // Forecast and Coverage
    // ========================================================================

    /// Next-period consumption: last x 1.1 when increasing, last x 0.9 when
    /// decreasing, otherwise the mean. Rounded to 4 digits.
    static Decimal Forecast(const std::vector<Decimal>& values, TrendDirection trend);

    /// ceil(current_stock / mean); 0 when mean is 0 or stock <= 0
    static int64_t CoverageDays(const Decimal& current_stock, const Decimal& mean);

    // ========================================================================
    // Snapshots and Reports
    // ========================================================================

    /// Snapshot for a consumption series
    /// @param values Consumption in date order
    /// @param current_stock Stock on hand, for coverage and stockout date
    /// @param today Reference date for the stockout projection
    /// @param scheme Volatility scheme of the calling path
    /// @return NoDataSnapshot() for an empty series
    static ItemStatisticsSnapshot BuildSnapshot(
        const std::vector<Decimal>& values,
        const Decimal& current_stock,
        const Date& today,
        VolatilityScheme scheme);

    /// Full report of one item over a window (five-tier scheme)
    /// @param records Observations in date order, must not be empty
    static ItemStatisticsReport BuildReport(
        const ItemRef& item,
        const std::vector<ConsumptionObservation>& records,
        int window_days,
        const Date& today);

    /// Snapshot for an item with no observations in the window
    static ItemStatisticsSnapshot NoDataSnapshot();
};

} // namespace stocklens
