// File: src/statistics/item_statistics_calculator.cpp
#include "statistics/item_statistics_calculator.hpp"
#include "statistics/numeric.hpp"
#include "statistics/time_series_extractor.hpp"
#include <algorithm>

namespace stocklens {

namespace {

/// Thresholds of the classifiers, parsed once
struct Thresholds {
    Decimal very_high_cv = Decimal::Parse("0.75");
    Decimal high_cv = Decimal::Parse("0.50");
    Decimal medium_cv = Decimal::Parse("0.25");
    Decimal low_cv = Decimal::Parse("0.10");
    Decimal coarse_high_cv = Decimal::Parse("0.5");
    Decimal coarse_medium_cv = Decimal::Parse("0.3");
    Decimal trend = Decimal::Parse("0.1");
    Decimal growth = Decimal::Parse("1.1");
    Decimal decline = Decimal::Parse("0.9");
};

const Thresholds& Limits() {
    static const Thresholds kThresholds;
    return kThresholds;
}

Decimal MeanOf(const std::vector<Decimal>& values, int scale) {
    if (values.empty()) {
        return Decimal();
    }
    return numeric::Sum(values).Divide(Decimal(static_cast<int64_t>(values.size())), scale);
}

} // namespace

// ============================================================================
// Classification
// ============================================================================

VolatilityClass ItemStatisticsCalculator::ClassifyVolatility(const std::optional<Decimal>& cv) {
    if (!cv) {
        return VolatilityClass::UNKNOWN;
    }

    Decimal magnitude = cv->Abs();
    if (magnitude > Limits().very_high_cv) {
        return VolatilityClass::VERY_HIGH;
    }
    if (magnitude > Limits().high_cv) {
        return VolatilityClass::HIGH;
    }
    if (magnitude > Limits().medium_cv) {
        return VolatilityClass::MEDIUM;
    }
    if (magnitude > Limits().low_cv) {
        return VolatilityClass::LOW;
    }
    return VolatilityClass::VERY_LOW;
}

VolatilityClass ItemStatisticsCalculator::ClassifyVolatilityCoarse(const std::optional<Decimal>& cv) {
    if (!cv) {
        return VolatilityClass::UNKNOWN;
    }

    Decimal magnitude = cv->Abs();
    if (magnitude > Limits().coarse_high_cv) {
        return VolatilityClass::HIGH;
    }
    if (magnitude > Limits().coarse_medium_cv) {
        return VolatilityClass::MEDIUM;
    }
    // LOW is the floor of the coarse scheme
    return VolatilityClass::LOW;
}

VolatilityClass ItemStatisticsCalculator::Classify(
    const std::optional<Decimal>& cv, VolatilityScheme scheme) {
    switch (scheme) {
        case VolatilityScheme::THREE_TIER:
            return ClassifyVolatilityCoarse(cv);
        case VolatilityScheme::FIVE_TIER:
        default:
            return ClassifyVolatility(cv);
    }
}

Decimal ItemStatisticsCalculator::Slope(const std::vector<Decimal>& values) {
    if (values.size() < 2) {
        return Decimal();
    }

    Decimal n(static_cast<int64_t>(values.size()));
    Decimal sum_x;
    Decimal sum_y;
    Decimal sum_xy;
    Decimal sum_x2;

    for (size_t i = 0; i < values.size(); ++i) {
        Decimal x(static_cast<int64_t>(i));
        sum_x += x;
        sum_y += values[i];
        sum_xy += x * values[i];
        sum_x2 += x * x;
    }

    Decimal numerator = n * sum_xy - sum_x * sum_y;
    Decimal denominator = n * sum_x2 - sum_x * sum_x;
    return numerator.Divide(denominator, numeric::kWorkingScale);
}

TrendDirection ItemStatisticsCalculator::AnalyzeTrend(const std::vector<Decimal>& values) {
    if (values.size() < 3) {
        return TrendDirection::INSUFFICIENT_DATA;
    }

    // Raw least-squares slope in units per day
    Decimal slope = Slope(values);

    if (slope > Limits().trend) {
        return TrendDirection::INCREASING;
    }
    if (slope < -Limits().trend) {
        return TrendDirection::DECREASING;
    }
    return TrendDirection::STABLE;
}

ConsumptionPattern ItemStatisticsCalculator::AnalyzePattern(const std::vector<Decimal>& values) {
    if (values.empty()) {
        return ConsumptionPattern::NO_DATA;
    }

    int64_t zero_days = std::count_if(values.begin(), values.end(),
        [](const Decimal& v) { return v.IsZero(); });
    int64_t n = static_cast<int64_t>(values.size());

    // zero_days / n compared against 0.7 and 0.3 without division
    if (zero_days * 10 > n * 7) {
        return ConsumptionPattern::SPORADIC;
    }
    if (zero_days * 10 > n * 3) {
        return ConsumptionPattern::IRREGULAR;
    }
    return ConsumptionPattern::REGULAR;
}

SeasonalityProfile ItemStatisticsCalculator::DetectSeasonality(
    const std::vector<ConsumptionObservation>& records) {

    std::map<int, std::vector<Decimal>> by_day;
    for (const auto& record : records) {
        by_day[record.date.IsoDayOfWeek()].push_back(record.ConsumedOrZero());
    }

    SeasonalityProfile profile;
    std::vector<Decimal> weekday_means;
    std::vector<Decimal> weekend_means;

    for (const auto& [day, day_values] : by_day) {
        Decimal mean = numeric::Mean(day_values);
        profile.day_of_week_means[day] = mean;
        if (day <= 5) {
            weekday_means.push_back(mean);
        } else {
            weekend_means.push_back(mean);
        }
    }

    profile.weekday_average = MeanOf(weekday_means, numeric::kResultScale);
    profile.weekend_average = MeanOf(weekend_means, numeric::kResultScale);
    return profile;
}

// ============================================================================
// Forecast and Coverage
// ============================================================================

Decimal ItemStatisticsCalculator::Forecast(const std::vector<Decimal>& values, TrendDirection trend) {
    if (values.empty()) {
        return Decimal();
    }

    const Decimal& last = values.back();
    switch (trend) {
        case TrendDirection::INCREASING:
            return (last * Limits().growth).Round(numeric::kResultScale);
        case TrendDirection::DECREASING:
            return (last * Limits().decline).Round(numeric::kResultScale);
        default:
            return numeric::Mean(values);
    }
}

int64_t ItemStatisticsCalculator::CoverageDays(const Decimal& current_stock, const Decimal& mean) {
    if (mean.Sign() <= 0 || current_stock.Sign() <= 0) {
        return 0;
    }
    return current_stock.Divide(mean, numeric::kWorkingScale).CeilToInteger();
}

// ============================================================================
// Snapshots and Reports
// ============================================================================

ItemStatisticsSnapshot ItemStatisticsCalculator::NoDataSnapshot() {
    ItemStatisticsSnapshot snapshot;
    snapshot.volatility = VolatilityClass::NO_DATA;
    snapshot.trend = TrendDirection::INSUFFICIENT_DATA;
    snapshot.pattern = ConsumptionPattern::NO_DATA;
    snapshot.coverage_days = 0;
    snapshot.last_updated = Timestamp::Now();
    return snapshot;
}

ItemStatisticsSnapshot ItemStatisticsCalculator::BuildSnapshot(
    const std::vector<Decimal>& values,
    const Decimal& current_stock,
    const Date& today,
    VolatilityScheme scheme) {

    if (values.empty()) {
        return NoDataSnapshot();
    }

    ItemStatisticsSnapshot snapshot;
    snapshot.mean_daily_consumption = numeric::Mean(values);
    snapshot.standard_deviation = numeric::StandardDeviation(values, snapshot.mean_daily_consumption);
    snapshot.coefficient_of_variation = numeric::CoefficientOfVariation(
        snapshot.mean_daily_consumption, snapshot.standard_deviation);

    snapshot.volatility = Classify(snapshot.coefficient_of_variation, scheme);
    snapshot.trend = AnalyzeTrend(values);
    snapshot.pattern = AnalyzePattern(values);
    snapshot.forecast_next_period = Forecast(values, snapshot.trend);

    snapshot.coverage_days = CoverageDays(current_stock, snapshot.mean_daily_consumption);
    if (snapshot.coverage_days > 0) {
        snapshot.expected_stockout_date = today.AddDays(snapshot.coverage_days);
    }

    snapshot.last_updated = Timestamp::Now();
    return snapshot;
}

ItemStatisticsReport ItemStatisticsCalculator::BuildReport(
    const ItemRef& item,
    const std::vector<ConsumptionObservation>& records,
    int window_days,
    const Date& today) {

    std::vector<Decimal> values = TimeSeriesExtractor::ValuesOf(records);

    ItemStatisticsReport report;
    report.item_id = item.id;
    report.item_name = item.name;
    report.window_days = window_days;
    report.total_records = records.size();
    report.snapshot = BuildSnapshot(values, item.current_quantity, today, VolatilityScheme::FIVE_TIER);

    if (!values.empty()) {
        auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
        report.min = *min_it;
        report.max = *max_it;
    }
    report.range = report.max - report.min;
    report.median = numeric::Median(values);
    report.total_consumption = numeric::Sum(values);

    report.days_with_activity = std::count_if(values.begin(), values.end(),
        [](const Decimal& v) { return v.Sign() > 0; });
    if (window_days > 0) {
        report.activity_rate = Decimal(report.days_with_activity).Divide(Decimal(window_days), 2);
    }

    report.is_highly_volatile = report.snapshot.volatility == VolatilityClass::HIGH ||
                                report.snapshot.volatility == VolatilityClass::VERY_HIGH;

    report.percentile_25 = numeric::Percentile(values, 25);
    report.percentile_75 = numeric::Percentile(values, 75);
    report.percentile_90 = numeric::Percentile(values, 90);

    report.seasonality = DetectSeasonality(records);
    return report;
}

} // namespace stocklens
