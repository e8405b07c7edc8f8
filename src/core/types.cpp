// File: src/core/types.cpp
#include "core/types.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace stocklens {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date
// (H. Hinnant's days_from_civil)
int64_t DaysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

struct CivilDate {
    int64_t year;
    unsigned month;
    unsigned day;
};

CivilDate CivilFromDays(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return CivilDate{y + (m <= 2), m, d};
}

bool IsLeapYear(int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned DaysInMonth(int64_t y, unsigned m) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && IsLeapYear(y)) {
        return 29;
    }
    return kDays[m - 1];
}

} // namespace

// Date implementations

Date Date::FromYMD(int year, unsigned month, unsigned day) {
    if (month < 1 || month > 12 || day < 1 || day > DaysInMonth(year, month)) {
        std::ostringstream oss;
        oss << "Invalid date: " << year << "-" << month << "-" << day;
        throw std::invalid_argument(oss.str());
    }
    return Date(DaysFromCivil(year, month, day));
}

Date Date::Today() {
    auto now = std::chrono::system_clock::now();
    auto days = std::chrono::duration_cast<std::chrono::hours>(now.time_since_epoch()).count() / 24;
    return Date(days);
}

Date Date::Parse(const std::string& str) {
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    char sep1 = 0;
    char sep2 = 0;

    std::istringstream iss(str);
    iss >> year >> sep1 >> month >> sep2 >> day;
    if (iss.fail() || sep1 != '-' || sep2 != '-') {
        throw std::invalid_argument("Invalid date string: " + str);
    }
    return FromYMD(year, month, day);
}

int Date::Year() const {
    return static_cast<int>(CivilFromDays(days_).year);
}

unsigned Date::Month() const {
    return CivilFromDays(days_).month;
}

unsigned Date::Day() const {
    return CivilFromDays(days_).day;
}

int Date::IsoDayOfWeek() const {
    // 1970-01-01 was a Thursday (ISO 4)
    int64_t weekday = (days_ + 3) % 7;
    if (weekday < 0) {
        weekday += 7;
    }
    return static_cast<int>(weekday) + 1;
}

std::string Date::ToString() const {
    CivilDate civil = CivilFromDays(days_);
    std::ostringstream oss;
    oss << std::setw(4) << std::setfill('0') << civil.year << "-"
        << std::setw(2) << std::setfill('0') << civil.month << "-"
        << std::setw(2) << std::setfill('0') << civil.day;
    return oss.str();
}

std::ostream& operator<<(std::ostream& out, const Date& date) {
    return out << date.ToString();
}

// Timestamp implementations

Timestamp Timestamp::Now() {
    return Timestamp(ClockType::now());
}

Timestamp Timestamp::FromMicros(int64_t micros) {
    TimePoint tp{std::chrono::duration_cast<TimePoint::duration>(Duration(micros))};
    return Timestamp(tp);
}

int64_t Timestamp::ToMicros() const {
    auto duration = time_point_.time_since_epoch();
    return std::chrono::duration_cast<Duration>(duration).count();
}

std::string Timestamp::ToString() const {
    int64_t micros = ToMicros();
    int64_t seconds = micros / 1000000;
    int64_t remaining_micros = micros % 1000000;
    if (remaining_micros < 0) {
        remaining_micros += 1000000;
        seconds -= 1;
    }

    int64_t days = seconds / 86400;
    int64_t second_of_day = seconds % 86400;
    if (second_of_day < 0) {
        second_of_day += 86400;
        days -= 1;
    }

    std::ostringstream oss;
    oss << Date::FromDays(days).ToString() << "T"
        << std::setw(2) << std::setfill('0') << second_of_day / 3600 << ":"
        << std::setw(2) << std::setfill('0') << (second_of_day % 3600) / 60 << ":"
        << std::setw(2) << std::setfill('0') << second_of_day % 60 << "."
        << std::setw(6) << std::setfill('0') << remaining_micros << "Z";
    return oss.str();
}

// Enum implementations

const char* ToString(VolatilityClass value) {
    switch (value) {
        case VolatilityClass::VERY_LOW: return "VERY_LOW";
        case VolatilityClass::LOW: return "LOW";
        case VolatilityClass::MEDIUM: return "MEDIUM";
        case VolatilityClass::HIGH: return "HIGH";
        case VolatilityClass::VERY_HIGH: return "VERY_HIGH";
        case VolatilityClass::NO_DATA: return "NO_DATA";
        case VolatilityClass::UNKNOWN: return "UNKNOWN";
        default: return "UNKNOWN";
    }
}

VolatilityClass ParseVolatilityClass(const std::string& str) {
    if (str == "VERY_LOW") return VolatilityClass::VERY_LOW;
    if (str == "LOW") return VolatilityClass::LOW;
    if (str == "MEDIUM") return VolatilityClass::MEDIUM;
    if (str == "HIGH") return VolatilityClass::HIGH;
    if (str == "VERY_HIGH") return VolatilityClass::VERY_HIGH;
    if (str == "NO_DATA") return VolatilityClass::NO_DATA;
    if (str == "UNKNOWN") return VolatilityClass::UNKNOWN;
    throw std::invalid_argument("Unknown VolatilityClass: " + str);
}

const char* ToString(TrendDirection value) {
    switch (value) {
        case TrendDirection::INCREASING: return "INCREASING";
        case TrendDirection::DECREASING: return "DECREASING";
        case TrendDirection::STABLE: return "STABLE";
        case TrendDirection::INSUFFICIENT_DATA: return "INSUFFICIENT_DATA";
        default: return "UNKNOWN";
    }
}

TrendDirection ParseTrendDirection(const std::string& str) {
    if (str == "INCREASING") return TrendDirection::INCREASING;
    if (str == "DECREASING") return TrendDirection::DECREASING;
    if (str == "STABLE") return TrendDirection::STABLE;
    if (str == "INSUFFICIENT_DATA") return TrendDirection::INSUFFICIENT_DATA;
    throw std::invalid_argument("Unknown TrendDirection: " + str);
}

const char* ToString(ConsumptionPattern value) {
    switch (value) {
        case ConsumptionPattern::REGULAR: return "REGULAR";
        case ConsumptionPattern::IRREGULAR: return "IRREGULAR";
        case ConsumptionPattern::SPORADIC: return "SPORADIC";
        case ConsumptionPattern::NO_DATA: return "NO_DATA";
        default: return "UNKNOWN";
    }
}

ConsumptionPattern ParseConsumptionPattern(const std::string& str) {
    if (str == "REGULAR") return ConsumptionPattern::REGULAR;
    if (str == "IRREGULAR") return ConsumptionPattern::IRREGULAR;
    if (str == "SPORADIC") return ConsumptionPattern::SPORADIC;
    if (str == "NO_DATA") return ConsumptionPattern::NO_DATA;
    throw std::invalid_argument("Unknown ConsumptionPattern: " + str);
}

const char* ToString(CorrelationType value) {
    switch (value) {
        case CorrelationType::STRONG_POSITIVE: return "STRONG_POSITIVE";
        case CorrelationType::MODERATE_POSITIVE: return "MODERATE_POSITIVE";
        case CorrelationType::WEAK_POSITIVE: return "WEAK_POSITIVE";
        case CorrelationType::NO_CORRELATION: return "NO_CORRELATION";
        case CorrelationType::WEAK_NEGATIVE: return "WEAK_NEGATIVE";
        case CorrelationType::MODERATE_NEGATIVE: return "MODERATE_NEGATIVE";
        case CorrelationType::STRONG_NEGATIVE: return "STRONG_NEGATIVE";
        default: return "UNKNOWN";
    }
}

CorrelationType ParseCorrelationType(const std::string& str) {
    if (str == "STRONG_POSITIVE") return CorrelationType::STRONG_POSITIVE;
    if (str == "MODERATE_POSITIVE") return CorrelationType::MODERATE_POSITIVE;
    if (str == "WEAK_POSITIVE") return CorrelationType::WEAK_POSITIVE;
    if (str == "NO_CORRELATION") return CorrelationType::NO_CORRELATION;
    if (str == "WEAK_NEGATIVE") return CorrelationType::WEAK_NEGATIVE;
    if (str == "MODERATE_NEGATIVE") return CorrelationType::MODERATE_NEGATIVE;
    if (str == "STRONG_NEGATIVE") return CorrelationType::STRONG_NEGATIVE;
    throw std::invalid_argument("Unknown CorrelationType: " + str);
}

} // namespace stocklens
