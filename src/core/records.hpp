// File: src/core/records.hpp
#pragma once

#include "core/decimal.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>

namespace stocklens {

/// One day of stock movement for one item
///
/// Written by the transaction-recording side of the system; the analytics
/// engine only ever reads it.
struct ConsumptionObservation {
    ItemID item_id;
    Date date;

    /// Absent means nothing was recorded; treated as zero
    std::optional<Decimal> consumed_quantity;

    Decimal received_quantity;
    std::optional<Decimal> opening_stock;
    std::optional<Decimal> closing_stock;

    /// Consumed quantity with absent treated as zero
    Decimal ConsumedOrZero() const { return consumed_quantity.value_or(Decimal()); }
};

/// Read-only view of an inventory item
struct ItemRef {
    ItemID id;
    std::string name;
    CategoryID category_id;
    std::string category_name;
    Decimal current_quantity;
    std::optional<Decimal> reorder_level;
    bool active{true};

    /// Stock at or below the reorder level
    bool NeedsReorder() const {
        return reorder_level.has_value() && current_quantity <= *reorder_level;
    }
};

/// Read-only view of an item category
struct CategoryRef {
    CategoryID id;
    std::string name;
};

/// Derived statistics stored on the item record
///
/// Owned exclusively by the analytics engine. Every calculation stage
/// returns a fresh snapshot; nothing mutates a shared item in place.
struct ItemStatisticsSnapshot {
    Decimal mean_daily_consumption;
    Decimal standard_deviation;
    Decimal coefficient_of_variation;
    VolatilityClass volatility{VolatilityClass::UNKNOWN};
    TrendDirection trend{TrendDirection::INSUFFICIENT_DATA};
    ConsumptionPattern pattern{ConsumptionPattern::NO_DATA};
    Decimal forecast_next_period;

    /// Days the current stock lasts at the mean rate (0 when unknown)
    int64_t coverage_days{0};

    std::optional<Date> expected_stockout_date;
    Timestamp last_updated;
};

} // namespace stocklens
