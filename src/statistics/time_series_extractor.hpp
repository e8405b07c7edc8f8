// File: src/statistics/time_series_extractor.hpp
#pragma once

#include "core/records.hpp"
#include "storage/inventory_repository.hpp"
#include <optional>
#include <unordered_map>
#include <vector>

namespace stocklens {

/// Consumption of one item over a window, in date order
struct ItemSeries {
    ItemID item;

    /// Raw observations (used for seasonality and activity counts)
    std::vector<ConsumptionObservation> records;

    /// One value per observation; absent consumed quantity becomes zero
    std::vector<Decimal> values;

    bool empty() const { return values.empty(); }
};

/// Two consumption series aligned on a common date axis
struct AlignedSeries {
    /// Sorted union of the dates either item was observed on
    std::vector<Date> dates;

    /// Values of the first item (zero where it has no observation)
    std::vector<Decimal> first;

    /// Values of the second item (zero where it has no observation)
    std::vector<Decimal> second;

    size_t size() const { return dates.size(); }
};

/// Turns stored observations into numeric series for the calculators
///
/// Insufficient data is reported as std::nullopt, never as an exception.
class TimeSeriesExtractor {
public:
    /// Minimum observations per item (and aligned dates per pair)
    static constexpr int kDefaultMinDataPoints = 5;

    explicit TimeSeriesExtractor(
        ConsumptionRepository& repository,
        int min_data_points = kDefaultMinDataPoints);

    /// Observations of one item in [window.start, window.end]
    ItemSeries ExtractItem(ItemID item, const DateRange& window) const;

    /// Aligned series for a pair of items
    ///
    /// Fails when either item has fewer than min_data_points observations,
    /// or when the union of their dates is smaller than min_data_points.
    std::optional<AlignedSeries> ExtractPair(
        ItemID item1, ItemID item2, const DateRange& window) const;

    /// Group an all-items record list by item; each group sorted by date
    static std::unordered_map<ItemID, std::vector<ConsumptionObservation>> GroupByItem(
        const std::vector<ConsumptionObservation>& records);

    /// Consumed quantities in record order (absent -> 0)
    static std::vector<Decimal> ValuesOf(const std::vector<ConsumptionObservation>& records);

    int GetMinDataPoints() const { return min_data_points_; }

private:
    ConsumptionRepository& repository_;
    int min_data_points_;
};

} // namespace stocklens
