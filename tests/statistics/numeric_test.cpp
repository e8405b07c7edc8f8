// File: tests/statistics/numeric_test.cpp
#include "statistics/numeric.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

namespace stocklens {
namespace numeric {
namespace {

std::vector<Decimal> Values(std::initializer_list<int64_t> ints) {
    std::vector<Decimal> values;
    for (int64_t v : ints) {
        values.emplace_back(v);
    }
    return values;
}

// ============================================================================
// Central Tendency
// ============================================================================

TEST(NumericTest, MeanIsSumOverCount) {
    EXPECT_EQ(Decimal::Parse("11.6"), Mean(Values({10, 12, 11, 13, 12})));
    EXPECT_EQ(Decimal(5), Mean(Values({5})));
    EXPECT_EQ(Decimal::Parse("3.3333"), Mean(Values({3, 3, 4})));
}

TEST(NumericTest, MeanOfEmptyIsZero) {
    EXPECT_TRUE(Mean({}).IsZero());
}

TEST(NumericTest, SumIsExact) {
    std::vector<Decimal> values(10, Decimal::Parse("0.1"));
    EXPECT_EQ(Decimal(1), Sum(values));
    EXPECT_TRUE(Sum({}).IsZero());
}

TEST(NumericTest, Median) {
    EXPECT_EQ(Decimal(2), Median(Values({3, 1, 2})));
    EXPECT_EQ(Decimal::Parse("2.5"), Median(Values({4, 1, 3, 2})));
    EXPECT_TRUE(Median({}).IsZero());
}

TEST(NumericTest, PercentileNearestRank) {
    auto values = Values({10, 9, 8, 7, 6, 5, 4, 3, 2, 1});

    EXPECT_EQ(Decimal(1), Percentile(values, 0));
    EXPECT_EQ(Decimal(3), Percentile(values, 25));
    EXPECT_EQ(Decimal(5), Percentile(values, 50));
    EXPECT_EQ(Decimal(8), Percentile(values, 75));
    EXPECT_EQ(Decimal(9), Percentile(values, 90));
    EXPECT_EQ(Decimal(10), Percentile(values, 100));
    EXPECT_TRUE(Percentile({}, 50).IsZero());
}

TEST(NumericTest, FiftiethPercentileIsNearMedian) {
    for (const auto& values : {Values({1, 2, 3}), Values({1, 2, 3, 4}),
                               Values({5, 1, 9, 7, 3, 3}), Values({42})}) {
        std::vector<Decimal> sorted(values);
        std::sort(sorted.begin(), sorted.end());

        Decimal p50 = Percentile(values, 50);
        Decimal median = Median(values);
        size_t mid = sorted.size() / 2;
        Decimal lo = sorted[mid == 0 ? 0 : mid - 1];
        Decimal hi = sorted[std::min(mid + 1, sorted.size() - 1)];

        EXPECT_GE(p50, lo);
        EXPECT_LE(p50, hi);
        EXPECT_GE(median, lo);
        EXPECT_LE(median, hi);
    }
}

// ============================================================================
// Dispersion
// ============================================================================

TEST(NumericTest, SampleStandardDeviation) {
    auto values = Values({10, 12, 11, 13, 12});
    Decimal mean = Mean(values);

    // variance = 5.2 / 4 = 1.3
    EXPECT_EQ(Decimal::Parse("1.1402"), StandardDeviation(values, mean));
}

TEST(NumericTest, StandardDeviationOfOneValueIsZero) {
    auto values = Values({7});
    EXPECT_TRUE(StandardDeviation(values, Mean(values)).IsZero());
    EXPECT_TRUE(StandardDeviation({}, Decimal()).IsZero());
}

TEST(NumericTest, StandardDeviationOfConstantSeriesIsZero) {
    auto values = Values({4, 4, 4, 4});
    EXPECT_TRUE(StandardDeviation(values, Mean(values)).IsZero());
}

TEST(NumericTest, StandardDeviationOfLargeQuantities) {
    auto values = Values({0, 30000000000});
    Decimal mean = Mean(values);

    // variance = 2 * (1.5e10)^2 = 4.5e20
    EXPECT_NEAR(21213203435.5964, StandardDeviation(values, mean).ToDouble(), 0.001);
}

TEST(NumericTest, StandardDeviationBeyondRangeThrows) {
    std::vector<Decimal> values = {Decimal(), Decimal::Parse("100000000000000000000")};
    EXPECT_THROW(StandardDeviation(values, Mean(values)), ArithmeticError);
}

TEST(NumericTest, SqrtConverges) {
    EXPECT_EQ(Decimal(2), Sqrt(Decimal(4)).Round(4));
    EXPECT_EQ(Decimal::Parse("1.4142"), Sqrt(Decimal(2)).Round(4));
    EXPECT_EQ(Decimal::Parse("0.01"), Sqrt(Decimal::Parse("0.0001")).Round(4));
    EXPECT_TRUE(Sqrt(Decimal()).IsZero());
}

TEST(NumericTest, SqrtOfNegativeThrows) {
    EXPECT_THROW(Sqrt(Decimal(-1)), ArithmeticError);
}

TEST(NumericTest, CoefficientOfVariation) {
    EXPECT_EQ(Decimal::Parse("0.0983"),
              CoefficientOfVariation(Decimal::Parse("11.6"), Decimal::Parse("1.1402")));
}

TEST(NumericTest, CoefficientOfVariationWithZeroMeanIsZero) {
    EXPECT_TRUE(CoefficientOfVariation(Decimal(), Decimal(5)).IsZero());
}

} // namespace
} // namespace numeric
} // namespace stocklens
