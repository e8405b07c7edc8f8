// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <chrono>
#include <iosfwd>

namespace stocklens {

// EntityID: Strongly typed 64-bit identifier
// Tag keeps item ids and category ids from being mixed up
template <typename Tag>
class EntityID {
public:
    // Type alias for underlying storage
    using ValueType = int64_t;

    // Default constructor creates invalid ID
    EntityID() : value_(kInvalidID) {}

    // Explicit constructor from value
    explicit EntityID(ValueType value) : value_(value) {}

    // Check if ID is valid
    bool IsValid() const { return value_ != kInvalidID; }

    // Get underlying value
    ValueType value() const { return value_; }

    // Comparison operators
    bool operator==(const EntityID& other) const { return value_ == other.value_; }
    bool operator!=(const EntityID& other) const { return value_ != other.value_; }
    bool operator<(const EntityID& other) const { return value_ < other.value_; }
    bool operator>(const EntityID& other) const { return value_ > other.value_; }
    bool operator<=(const EntityID& other) const { return value_ <= other.value_; }
    bool operator>=(const EntityID& other) const { return value_ >= other.value_; }

    // String conversion for logs and error messages
    std::string ToString() const { return IsValid() ? std::to_string(value_) : "INVALID"; }

    // Hash support for std::unordered_map
    struct Hash {
        size_t operator()(const EntityID& id) const {
            return std::hash<ValueType>()(id.value_);
        }
    };

private:
    static constexpr ValueType kInvalidID = 0;

    ValueType value_;
};

struct ItemTag {};
struct CategoryTag {};

using ItemID = EntityID<ItemTag>;
using CategoryID = EntityID<CategoryTag>;

// Date: Calendar day (proleptic Gregorian), stored as days since 1970-01-01
class Date {
public:
    // Default constructor creates 1970-01-01
    Date() : days_(0) {}

    // Create from year, month [1,12], day [1,31]
    // Throws std::invalid_argument for impossible dates
    static Date FromYMD(int year, unsigned month, unsigned day);

    // Create from days since epoch
    static Date FromDays(int64_t days) { return Date(days); }

    // Current UTC calendar day
    static Date Today();

    // Parse "YYYY-MM-DD"
    static Date Parse(const std::string& str);

    int64_t DaysSinceEpoch() const { return days_; }

    int Year() const;
    unsigned Month() const;
    unsigned Day() const;

    // ISO-8601 day of week: 1 = Monday ... 7 = Sunday
    int IsoDayOfWeek() const;

    // True for Saturday and Sunday
    bool IsWeekend() const { return IsoDayOfWeek() >= 6; }

    Date AddDays(int64_t days) const { return Date(days_ + days); }

    // Number of days from this date to other (negative if other is earlier)
    int64_t DaysUntil(const Date& other) const { return other.days_ - days_; }

    bool operator==(const Date& other) const { return days_ == other.days_; }
    bool operator!=(const Date& other) const { return days_ != other.days_; }
    bool operator<(const Date& other) const { return days_ < other.days_; }
    bool operator>(const Date& other) const { return days_ > other.days_; }
    bool operator<=(const Date& other) const { return days_ <= other.days_; }
    bool operator>=(const Date& other) const { return days_ >= other.days_; }

    // "YYYY-MM-DD"
    std::string ToString() const;

    struct Hash {
        size_t operator()(const Date& date) const {
            return std::hash<int64_t>()(date.days_);
        }
    };

private:
    explicit Date(int64_t days) : days_(days) {}
    int64_t days_;
};

// DateRange: Inclusive window of calendar days
struct DateRange {
    Date start;
    Date end;

    // Window of `days` days ending at `end` (start = end - days)
    static DateRange LastDays(const Date& end, int days) {
        return DateRange{end.AddDays(-days), end};
    }

    bool Contains(const Date& date) const { return date >= start && date <= end; }
};

// Timestamp: Microsecond-precision wall-clock time point
class Timestamp {
public:
    using ClockType = std::chrono::system_clock;
    using TimePoint = ClockType::time_point;
    using Duration = std::chrono::microseconds;

    // Create timestamp for current time
    static Timestamp Now();

    // Create timestamp from microseconds since epoch
    static Timestamp FromMicros(int64_t micros);

    // Default constructor creates zero timestamp
    Timestamp() : time_point_(TimePoint{}) {}

    // Get microseconds since epoch
    int64_t ToMicros() const;

    // Get duration since another timestamp
    Duration operator-(const Timestamp& other) const {
        return std::chrono::duration_cast<Duration>(time_point_ - other.time_point_);
    }

    // Comparison operators
    bool operator<(const Timestamp& other) const { return time_point_ < other.time_point_; }
    bool operator>(const Timestamp& other) const { return time_point_ > other.time_point_; }
    bool operator<=(const Timestamp& other) const { return time_point_ <= other.time_point_; }
    bool operator>=(const Timestamp& other) const { return time_point_ >= other.time_point_; }
    bool operator==(const Timestamp& other) const { return time_point_ == other.time_point_; }
    bool operator!=(const Timestamp& other) const { return time_point_ != other.time_point_; }

    // ISO-8601 UTC string, e.g. "2024-03-01T12:30:00.000123Z"
    std::string ToString() const;

private:
    explicit Timestamp(TimePoint tp) : time_point_(tp) {}
    TimePoint time_point_;
};

// VolatilityClass: Bucket derived from |CV|
enum class VolatilityClass : uint8_t {
    VERY_LOW = 0,
    LOW = 1,
    MEDIUM = 2,
    HIGH = 3,
    VERY_HIGH = 4,
    NO_DATA = 5,   // Item had no observations in the window
    UNKNOWN = 6,   // CV not available
};

const char* ToString(VolatilityClass value);
VolatilityClass ParseVolatilityClass(const std::string& str);

// TrendDirection: Direction of the fitted consumption slope
enum class TrendDirection : uint8_t {
    INCREASING = 0,
    DECREASING = 1,
    STABLE = 2,
    INSUFFICIENT_DATA = 3,
};

const char* ToString(TrendDirection value);
TrendDirection ParseTrendDirection(const std::string& str);

// ConsumptionPattern: Share of zero-consumption days
enum class ConsumptionPattern : uint8_t {
    REGULAR = 0,
    IRREGULAR = 1,
    SPORADIC = 2,
    NO_DATA = 3,
};

const char* ToString(ConsumptionPattern value);
ConsumptionPattern ParseConsumptionPattern(const std::string& str);

// CorrelationType: Sign and magnitude bucket of a Pearson coefficient
enum class CorrelationType : uint8_t {
    STRONG_POSITIVE = 0,
    MODERATE_POSITIVE = 1,
    WEAK_POSITIVE = 2,
    NO_CORRELATION = 3,
    WEAK_NEGATIVE = 4,
    MODERATE_NEGATIVE = 5,
    STRONG_NEGATIVE = 6,
};

const char* ToString(CorrelationType value);
CorrelationType ParseCorrelationType(const std::string& str);

std::ostream& operator<<(std::ostream& out, const Date& date);

} // namespace stocklens

// Hash specialization for std::unordered_map
namespace std {
    template<typename Tag>
    struct hash<stocklens::EntityID<Tag>> {
        size_t operator()(const stocklens::EntityID<Tag>& id) const {
            return typename stocklens::EntityID<Tag>::Hash()(id);
        }
    };

    template<>
    struct hash<stocklens::Date> {
        size_t operator()(const stocklens::Date& date) const {
            return stocklens::Date::Hash()(date);
        }
    };
}
