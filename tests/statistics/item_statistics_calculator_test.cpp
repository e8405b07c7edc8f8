// File: tests/statistics/item_statistics_calculator_test.cpp
#include "statistics/item_statistics_calculator.hpp"
#include "inventory_test_fixtures.hpp"
#include <gtest/gtest.h>
#include <vector>

namespace stocklens {
namespace {

using Calc = ItemStatisticsCalculator;

std::vector<Decimal> Values(std::initializer_list<int64_t> ints) {
    std::vector<Decimal> values;
    for (int64_t v : ints) {
        values.emplace_back(v);
    }
    return values;
}

std::optional<Decimal> Cv(const char* literal) {
    return Decimal::Parse(literal);
}

// ============================================================================
// Volatility
// ============================================================================

TEST(ItemStatisticsCalculatorTest, FiveTierBoundaries) {
    EXPECT_EQ(VolatilityClass::VERY_LOW, Calc::ClassifyVolatility(Cv("0")));
    EXPECT_EQ(VolatilityClass::VERY_LOW, Calc::ClassifyVolatility(Cv("0.10")));
    EXPECT_EQ(VolatilityClass::LOW, Calc::ClassifyVolatility(Cv("0.1001")));
    EXPECT_EQ(VolatilityClass::LOW, Calc::ClassifyVolatility(Cv("0.25")));
    EXPECT_EQ(VolatilityClass::MEDIUM, Calc::ClassifyVolatility(Cv("0.2501")));
    EXPECT_EQ(VolatilityClass::MEDIUM, Calc::ClassifyVolatility(Cv("0.50")));
    EXPECT_EQ(VolatilityClass::HIGH, Calc::ClassifyVolatility(Cv("0.5001")));
    EXPECT_EQ(VolatilityClass::HIGH, Calc::ClassifyVolatility(Cv("0.75")));
    EXPECT_EQ(VolatilityClass::VERY_HIGH, Calc::ClassifyVolatility(Cv("0.7501")));
    EXPECT_EQ(VolatilityClass::VERY_HIGH, Calc::ClassifyVolatility(Cv("3")));
}

TEST(ItemStatisticsCalculatorTest, ThreeTierBoundaries) {
    EXPECT_EQ(VolatilityClass::LOW, Calc::ClassifyVolatilityCoarse(Cv("0")));
    EXPECT_EQ(VolatilityClass::LOW, Calc::ClassifyVolatilityCoarse(Cv("0.3")));
    EXPECT_EQ(VolatilityClass::MEDIUM, Calc::ClassifyVolatilityCoarse(Cv("0.3001")));
    EXPECT_EQ(VolatilityClass::MEDIUM, Calc::ClassifyVolatilityCoarse(Cv("0.5")));
    EXPECT_EQ(VolatilityClass::HIGH, Calc::ClassifyVolatilityCoarse(Cv("0.5001")));
}

TEST(ItemStatisticsCalculatorTest, AbsentCvIsUnknown) {
    EXPECT_EQ(VolatilityClass::UNKNOWN, Calc::ClassifyVolatility(std::nullopt));
    EXPECT_EQ(VolatilityClass::UNKNOWN, Calc::ClassifyVolatilityCoarse(std::nullopt));
}

TEST(ItemStatisticsCalculatorTest, NegativeCvUsesMagnitude) {
    EXPECT_EQ(VolatilityClass::VERY_HIGH, Calc::ClassifyVolatility(Cv("-0.8")));
    EXPECT_EQ(VolatilityClass::MEDIUM, Calc::ClassifyVolatilityCoarse(Cv("-0.4")));
}

TEST(ItemStatisticsCalculatorTest, FiveTierIsMonotonic) {
    // Walk |CV| upward in 0.01 steps; the class never goes down
    int previous = static_cast<int>(VolatilityClass::VERY_LOW);
    for (int i = 0; i <= 150; ++i) {
        Decimal cv = Decimal(i).Divide(Decimal(100), 2);
        int current = static_cast<int>(Calc::ClassifyVolatility(cv));
        EXPECT_GE(current, previous) << "cv=" << cv;
        EXPECT_LE(current, static_cast<int>(VolatilityClass::VERY_HIGH));
        previous = current;
    }
}

TEST(ItemStatisticsCalculatorTest, SchemeDispatch) {
    EXPECT_EQ(VolatilityClass::VERY_LOW, Calc::Classify(Cv("0.05"), VolatilityScheme::FIVE_TIER));
    EXPECT_EQ(VolatilityClass::LOW, Calc::Classify(Cv("0.05"), VolatilityScheme::THREE_TIER));
}

// ============================================================================
// Trend and Pattern
// ============================================================================

TEST(ItemStatisticsCalculatorTest, Slope) {
    EXPECT_EQ(Decimal::Parse("0.5"), Calc::Slope(Values({10, 12, 11, 13, 12})));
    EXPECT_EQ(Decimal(1), Calc::Slope(Values({1, 2, 3, 4, 5})));
    EXPECT_TRUE(Calc::Slope(Values({7})).IsZero());
}

TEST(ItemStatisticsCalculatorTest, TrendDirection) {
    EXPECT_EQ(TrendDirection::INCREASING, Calc::AnalyzeTrend(Values({10, 12, 11, 13, 12})));
    EXPECT_EQ(TrendDirection::STABLE, Calc::AnalyzeTrend(Values({10, 11, 10, 11, 10})));
    EXPECT_EQ(TrendDirection::INCREASING, Calc::AnalyzeTrend(Values({1, 2, 3, 4, 5})));
    EXPECT_EQ(TrendDirection::DECREASING, Calc::AnalyzeTrend(Values({5, 4, 3, 2, 1})));
    EXPECT_EQ(TrendDirection::STABLE, Calc::AnalyzeTrend(Values({0, 0, 0})));
}

TEST(ItemStatisticsCalculatorTest, TrendComparesRawSlopeRegardlessOfMagnitude) {
    std::vector<Decimal> rising = Values({100, 101, 102, 103, 104, 105, 106, 107, 108, 109});
    EXPECT_EQ(Decimal(1), Calc::Slope(rising));
    EXPECT_EQ(TrendDirection::INCREASING, Calc::AnalyzeTrend(rising));
    EXPECT_EQ(Decimal::Parse("119.9"), Calc::Forecast(rising, Calc::AnalyzeTrend(rising)));

    std::vector<Decimal> falling = Values({200, 198, 196, 194, 192, 190, 188, 186, 184, 182});
    EXPECT_EQ(Decimal(-2), Calc::Slope(falling));
    EXPECT_EQ(TrendDirection::DECREASING, Calc::AnalyzeTrend(falling));
    EXPECT_EQ(Decimal::Parse("163.8"), Calc::Forecast(falling, Calc::AnalyzeTrend(falling)));
}

TEST(ItemStatisticsCalculatorTest, TrendThresholdIsExclusive) {
    std::vector<Decimal> edge = {Decimal(1), Decimal::Parse("1.1"), Decimal::Parse("1.2")};
    EXPECT_EQ(Decimal::Parse("0.1"), Calc::Slope(edge));
    EXPECT_EQ(TrendDirection::STABLE, Calc::AnalyzeTrend(edge));
}

TEST(ItemStatisticsCalculatorTest, TrendNeedsThreeValues) {
    EXPECT_EQ(TrendDirection::INSUFFICIENT_DATA, Calc::AnalyzeTrend(Values({1, 9})));
    EXPECT_EQ(TrendDirection::INSUFFICIENT_DATA, Calc::AnalyzeTrend({}));
}

TEST(ItemStatisticsCalculatorTest, ConsumptionPattern) {
    EXPECT_EQ(ConsumptionPattern::NO_DATA, Calc::AnalyzePattern({}));
    EXPECT_EQ(ConsumptionPattern::REGULAR, Calc::AnalyzePattern(Values({1, 2, 3, 4, 5, 6, 7, 0, 0, 0})));
    EXPECT_EQ(ConsumptionPattern::IRREGULAR, Calc::AnalyzePattern(Values({1, 2, 3, 4, 5, 6, 0, 0, 0, 0})));
    EXPECT_EQ(ConsumptionPattern::IRREGULAR, Calc::AnalyzePattern(Values({1, 2, 3, 0, 0, 0, 0, 0, 0, 0})));
    EXPECT_EQ(ConsumptionPattern::SPORADIC, Calc::AnalyzePattern(Values({1, 2, 0, 0, 0, 0, 0, 0, 0, 0})));
}

// ============================================================================
// Forecast and Coverage
// ============================================================================

TEST(ItemStatisticsCalculatorTest, Forecast) {
    EXPECT_EQ(Decimal::Parse("5.5"), Calc::Forecast(Values({1, 2, 3, 4, 5}), TrendDirection::INCREASING));
    EXPECT_EQ(Decimal::Parse("0.9"), Calc::Forecast(Values({5, 4, 3, 2, 1}), TrendDirection::DECREASING));
    EXPECT_EQ(Decimal::Parse("11.6"), Calc::Forecast(Values({10, 12, 11, 13, 12}), TrendDirection::STABLE));
    EXPECT_TRUE(Calc::Forecast({}, TrendDirection::STABLE).IsZero());
}

TEST(ItemStatisticsCalculatorTest, CoverageDays) {
    EXPECT_EQ(9, Calc::CoverageDays(Decimal(100), Decimal::Parse("11.6")));
    EXPECT_EQ(10, Calc::CoverageDays(Decimal(100), Decimal(10)));
    EXPECT_EQ(0, Calc::CoverageDays(Decimal(100), Decimal()));
    EXPECT_EQ(0, Calc::CoverageDays(Decimal(), Decimal(5)));
    EXPECT_EQ(0, Calc::CoverageDays(Decimal(-3), Decimal(5)));
}

// ============================================================================
// Snapshots and Reports
// ============================================================================

TEST(ItemStatisticsCalculatorTest, SnapshotOfSteadySeries) {
    auto snapshot = Calc::BuildSnapshot(Values({10, 12, 11, 13, 12}), Decimal(100),
                                        testing::TestToday(), VolatilityScheme::FIVE_TIER);

    EXPECT_EQ(Decimal::Parse("11.6"), snapshot.mean_daily_consumption);
    EXPECT_EQ(Decimal::Parse("1.1402"), snapshot.standard_deviation);
    EXPECT_EQ(Decimal::Parse("0.0983"), snapshot.coefficient_of_variation);
    EXPECT_EQ(VolatilityClass::VERY_LOW, snapshot.volatility);
    EXPECT_EQ(TrendDirection::INCREASING, snapshot.trend);
    EXPECT_EQ(ConsumptionPattern::REGULAR, snapshot.pattern);
    EXPECT_EQ(Decimal::Parse("13.2"), snapshot.forecast_next_period);
    EXPECT_EQ(9, snapshot.coverage_days);
    ASSERT_TRUE(snapshot.expected_stockout_date.has_value());
    EXPECT_EQ(Date::FromYMD(2024, 4, 9), *snapshot.expected_stockout_date);
}

TEST(ItemStatisticsCalculatorTest, ThreeTierSnapshotOfSteadySeriesIsLow) {
    auto snapshot = Calc::BuildSnapshot(Values({10, 12, 11, 13, 12}), Decimal(100),
                                        testing::TestToday(), VolatilityScheme::THREE_TIER);
    EXPECT_EQ(VolatilityClass::LOW, snapshot.volatility);
}

TEST(ItemStatisticsCalculatorTest, SnapshotWithoutStockHasNoStockoutDate) {
    auto snapshot = Calc::BuildSnapshot(Values({1, 2, 3}), Decimal(), testing::TestToday(),
                                        VolatilityScheme::FIVE_TIER);
    EXPECT_EQ(0, snapshot.coverage_days);
    EXPECT_FALSE(snapshot.expected_stockout_date.has_value());
}

TEST(ItemStatisticsCalculatorTest, EmptySeriesGivesNoDataSnapshot) {
    auto snapshot = Calc::BuildSnapshot({}, Decimal(100), testing::TestToday(),
                                        VolatilityScheme::FIVE_TIER);
    EXPECT_EQ(VolatilityClass::NO_DATA, snapshot.volatility);
    EXPECT_EQ(TrendDirection::INSUFFICIENT_DATA, snapshot.trend);
    EXPECT_EQ(ConsumptionPattern::NO_DATA, snapshot.pattern);
    EXPECT_TRUE(snapshot.mean_daily_consumption.IsZero());
    EXPECT_EQ(0, snapshot.coverage_days);
}

TEST(ItemStatisticsCalculatorTest, FullReport) {
    MemoryBackend store;
    testing::AddItem(store, 1, "Gloves");
    testing::SeedSeries(store, ItemID(1), {10, 12, 11, 13, 12});
    auto records = store.GetConsumptionRecords(ItemID(1), testing::TestToday().AddDays(-30),
                                               testing::TestToday());

    auto report = Calc::BuildReport(testing::MakeItem(1, "Gloves"), records, 30, testing::TestToday());

    EXPECT_EQ(ItemID(1), report.item_id);
    EXPECT_EQ("Gloves", report.item_name);
    EXPECT_EQ(30, report.window_days);
    EXPECT_EQ(5u, report.total_records);
    EXPECT_EQ(Decimal(12), report.median);
    EXPECT_EQ(Decimal(10), report.min);
    EXPECT_EQ(Decimal(13), report.max);
    EXPECT_EQ(Decimal(3), report.range);
    EXPECT_EQ(Decimal(58), report.total_consumption);
    EXPECT_EQ(5, report.days_with_activity);
    EXPECT_EQ(Decimal::Parse("0.17"), report.activity_rate);
    EXPECT_FALSE(report.is_highly_volatile);
    EXPECT_EQ(Decimal(11), report.percentile_25);
    EXPECT_EQ(Decimal(12), report.percentile_75);
    EXPECT_EQ(Decimal(13), report.percentile_90);
    EXPECT_EQ(VolatilityClass::VERY_LOW, report.snapshot.volatility);
}

TEST(ItemStatisticsCalculatorTest, SeasonalitySplitsWeekdaysAndWeekends) {
    // 2024-03-25 (Mon) .. 2024-03-31 (Sun): weekdays 2, weekend 10
    std::vector<ConsumptionObservation> records;
    Date monday = Date::FromYMD(2024, 3, 25);
    for (int i = 0; i < 7; ++i) {
        Date d = monday.AddDays(i);
        records.push_back(testing::MakeRecord(ItemID(1), d, Decimal(d.IsWeekend() ? 10 : 2)));
    }

    SeasonalityProfile profile = Calc::DetectSeasonality(records);

    EXPECT_EQ(7u, profile.day_of_week_means.size());
    EXPECT_EQ(Decimal(2), profile.day_of_week_means.at(1));
    EXPECT_EQ(Decimal(10), profile.day_of_week_means.at(7));
    EXPECT_EQ(Decimal(2), profile.weekday_average);
    EXPECT_EQ(Decimal(10), profile.weekend_average);
}

TEST(ItemStatisticsCalculatorTest, SeasonalityWithoutWeekendData) {
    std::vector<ConsumptionObservation> records = {
        testing::MakeRecord(ItemID(1), Date::FromYMD(2024, 3, 25), Decimal(4)),
        testing::MakeRecord(ItemID(1), Date::FromYMD(2024, 3, 26), Decimal(6)),
    };

    SeasonalityProfile profile = Calc::DetectSeasonality(records);
    EXPECT_EQ(2u, profile.day_of_week_means.size());
    EXPECT_EQ(Decimal(5), profile.weekday_average);
    EXPECT_TRUE(profile.weekend_average.IsZero());
}

} // namespace
} // namespace stocklens
