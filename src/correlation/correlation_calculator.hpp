// File: src/correlation/correlation_calculator.hpp
#pragma once

#include "core/decimal.hpp"
#include "core/types.hpp"
#include "statistics/time_series_extractor.hpp"
#include <optional>
#include <vector>

namespace stocklens {

/// Outcome of one pairwise computation
struct CorrelationResult {
    Decimal coefficient;

    /// Size of the date union the coefficient was computed over
    int data_points{0};

    CorrelationType type{CorrelationType::NO_CORRELATION};
};

/// CorrelationCalculator: Pearson correlation of two items' daily consumption
///
/// All arithmetic stays in Decimal; the only floating point involved is the
/// seed of the square root.
class CorrelationCalculator {
public:
    /// |r| at or above which a correlation counts as significant
    static const Decimal& DefaultSignificanceThreshold();

    explicit CorrelationCalculator(const TimeSeriesExtractor& extractor);

    /// Pearson coefficient at 4 fractional digits, clamped to [-1,1]
    ///
    /// Returns 0 when the sizes differ, the input is empty, or either
    /// series has zero variance.
    static Decimal Pearson(const std::vector<Decimal>& x, const std::vector<Decimal>& y);

    /// Correlate two items over a window
    /// @return std::nullopt when the extractor reports insufficient data
    std::optional<CorrelationResult> Compute(ItemID item1, ItemID item2, const DateRange& window) const;

    static CorrelationType Classify(const Decimal& coefficient);

    /// |r| >= threshold
    static bool IsSignificant(const Decimal& coefficient, const Decimal& threshold);

    static bool IsSignificant(const Decimal& coefficient) {
        return IsSignificant(coefficient, DefaultSignificanceThreshold());
    }

    /// |r| > 0.7
    static bool IsStrong(const Decimal& coefficient);

private:
    const TimeSeriesExtractor& extractor_;
};

} // namespace stocklens
