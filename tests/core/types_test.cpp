// File: tests/core/types_test.cpp
#include "core/types.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <unordered_set>
#include <vector>

namespace stocklens {
namespace {

// ============================================================================
// EntityID
// ============================================================================

TEST(EntityIDTest, DefaultConstructorCreatesInvalid) {
    ItemID id;
    EXPECT_FALSE(id.IsValid());
    EXPECT_EQ(0, id.value());
    EXPECT_EQ("INVALID", id.ToString());
}

TEST(EntityIDTest, ExplicitValue) {
    ItemID id(42);
    EXPECT_TRUE(id.IsValid());
    EXPECT_EQ(42, id.value());
    EXPECT_EQ("42", id.ToString());
}

TEST(EntityIDTest, ComparisonOperators) {
    ItemID id1(100);
    ItemID id2(200);
    ItemID id3(100);

    EXPECT_EQ(id1, id3);
    EXPECT_NE(id1, id2);
    EXPECT_LT(id1, id2);
    EXPECT_GT(id2, id1);
    EXPECT_LE(id1, id3);
    EXPECT_GE(id2, id1);
}

TEST(EntityIDTest, HashingWorks) {
    std::unordered_set<ItemID> id_set;
    for (int i = 1; i <= 100; ++i) {
        id_set.insert(ItemID(i));
    }
    id_set.insert(ItemID(1));

    EXPECT_EQ(100u, id_set.size());
    EXPECT_EQ(1u, id_set.count(ItemID(50)));
}

// ============================================================================
// Date
// ============================================================================

TEST(DateTest, EpochIsDayZero) {
    EXPECT_EQ(0, Date::FromYMD(1970, 1, 1).DaysSinceEpoch());
    EXPECT_EQ(Date(), Date::FromYMD(1970, 1, 1));
}

TEST(DateTest, CalendarRoundTrip) {
    Date d = Date::FromYMD(2024, 3, 1);
    EXPECT_EQ(2024, d.Year());
    EXPECT_EQ(3u, d.Month());
    EXPECT_EQ(1u, d.Day());
    EXPECT_EQ("2024-03-01", d.ToString());
    EXPECT_EQ(d, Date::Parse("2024-03-01"));
}

TEST(DateTest, LeapDays) {
    EXPECT_NO_THROW(Date::FromYMD(2024, 2, 29));
    EXPECT_NO_THROW(Date::FromYMD(2000, 2, 29));
    EXPECT_THROW(Date::FromYMD(2023, 2, 29), std::invalid_argument);
    EXPECT_THROW(Date::FromYMD(1900, 2, 29), std::invalid_argument);

    EXPECT_EQ(Date::FromYMD(2024, 3, 1), Date::FromYMD(2024, 2, 28).AddDays(2));
}

TEST(DateTest, InvalidDatesThrow) {
    EXPECT_THROW(Date::FromYMD(2024, 13, 1), std::invalid_argument);
    EXPECT_THROW(Date::FromYMD(2024, 4, 31), std::invalid_argument);
    EXPECT_THROW(Date::Parse("2024/03/01"), std::invalid_argument);
    EXPECT_THROW(Date::Parse("yesterday"), std::invalid_argument);
}

TEST(DateTest, IsoDayOfWeek) {
    EXPECT_EQ(4, Date::FromYMD(1970, 1, 1).IsoDayOfWeek());   // Thursday
    EXPECT_EQ(1, Date::FromYMD(2024, 3, 4).IsoDayOfWeek());   // Monday
    EXPECT_EQ(7, Date::FromYMD(2024, 3, 10).IsoDayOfWeek());  // Sunday
    EXPECT_EQ(3, Date::FromYMD(1969, 12, 31).IsoDayOfWeek()); // Wednesday

    EXPECT_TRUE(Date::FromYMD(2024, 3, 9).IsWeekend());
    EXPECT_FALSE(Date::FromYMD(2024, 3, 8).IsWeekend());
}

TEST(DateTest, DaysUntil) {
    Date a = Date::FromYMD(2024, 1, 1);
    Date b = Date::FromYMD(2024, 12, 31);
    EXPECT_EQ(365, a.DaysUntil(b));
    EXPECT_EQ(-365, b.DaysUntil(a));
}

TEST(DateRangeTest, LastDaysIsInclusive) {
    Date end = Date::FromYMD(2024, 3, 31);
    DateRange window = DateRange::LastDays(end, 30);

    EXPECT_EQ(Date::FromYMD(2024, 3, 1), window.start);
    EXPECT_EQ(end, window.end);
    EXPECT_TRUE(window.Contains(window.start));
    EXPECT_TRUE(window.Contains(end));
    EXPECT_FALSE(window.Contains(end.AddDays(1)));
    EXPECT_FALSE(window.Contains(window.start.AddDays(-1)));
}

// ============================================================================
// Timestamp
// ============================================================================

TEST(TimestampTest, MicrosRoundTrip) {
    Timestamp ts = Timestamp::FromMicros(1234567890);
    EXPECT_EQ(1234567890, ts.ToMicros());
}

TEST(TimestampTest, ToStringIsIsoUtc) {
    EXPECT_EQ("1970-01-01T00:00:00.000000Z", Timestamp::FromMicros(0).ToString());
    EXPECT_EQ("1970-01-02T01:01:01.000005Z",
              Timestamp::FromMicros((86400LL + 3661LL) * 1000000LL + 5).ToString());
}

TEST(TimestampTest, NowIsOrdered) {
    Timestamp a = Timestamp::Now();
    Timestamp b = Timestamp::Now();
    EXPECT_LE(a, b);
    EXPECT_GE((b - a).count(), 0);
}

// ============================================================================
// Enums
// ============================================================================

TEST(EnumTest, VolatilityClassRoundTrip) {
    for (auto value : {VolatilityClass::VERY_LOW, VolatilityClass::LOW, VolatilityClass::MEDIUM,
                       VolatilityClass::HIGH, VolatilityClass::VERY_HIGH,
                       VolatilityClass::NO_DATA, VolatilityClass::UNKNOWN}) {
        EXPECT_EQ(value, ParseVolatilityClass(ToString(value)));
    }
    EXPECT_THROW(ParseVolatilityClass("EXTREME"), std::invalid_argument);
}

TEST(EnumTest, TrendAndPatternNames) {
    EXPECT_STREQ("STABLE", ToString(TrendDirection::STABLE));
    EXPECT_EQ(TrendDirection::INSUFFICIENT_DATA, ParseTrendDirection("INSUFFICIENT_DATA"));
    EXPECT_STREQ("SPORADIC", ToString(ConsumptionPattern::SPORADIC));
    EXPECT_EQ(ConsumptionPattern::NO_DATA, ParseConsumptionPattern("NO_DATA"));
    EXPECT_THROW(ParseTrendDirection("UP"), std::invalid_argument);
    EXPECT_THROW(ParseConsumptionPattern(""), std::invalid_argument);
}

TEST(EnumTest, CorrelationTypeRoundTrip) {
    std::vector<CorrelationType> all = {
        CorrelationType::STRONG_POSITIVE, CorrelationType::MODERATE_POSITIVE,
        CorrelationType::WEAK_POSITIVE, CorrelationType::NO_CORRELATION,
        CorrelationType::WEAK_NEGATIVE, CorrelationType::MODERATE_NEGATIVE,
        CorrelationType::STRONG_NEGATIVE};
    for (auto value : all) {
        EXPECT_EQ(value, ParseCorrelationType(ToString(value)));
    }
    EXPECT_THROW(ParseCorrelationType("POSITIVE"), std::invalid_argument);
}

} // namespace
} // namespace stocklens
