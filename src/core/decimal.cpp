// File: src/core/decimal.cpp
#include "core/decimal.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <ostream>
#include <stdexcept>

namespace stocklens {

namespace {

using RawType = Decimal::RawType;

RawType CheckedMultiply(RawType a, RawType b, const char* operation) {
    RawType result;
    if (__builtin_mul_overflow(a, b, &result)) {
        throw ArithmeticError(std::string("Decimal overflow in ") + operation);
    }
    return result;
}

RawType CheckedAdd(RawType a, RawType b, const char* operation) {
    RawType result;
    if (__builtin_add_overflow(a, b, &result)) {
        throw ArithmeticError(std::string("Decimal overflow in ") + operation);
    }
    return result;
}

RawType CheckedSubtract(RawType a, RawType b, const char* operation) {
    RawType result;
    if (__builtin_sub_overflow(a, b, &result)) {
        throw ArithmeticError(std::string("Decimal overflow in ") + operation);
    }
    return result;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

Decimal::Decimal(int64_t value)
    : raw_(CheckedMultiply(static_cast<RawType>(value), Pow10(kScale), "construction")) {}

Decimal Decimal::FromRaw(RawType raw) {
    Decimal d;
    d.raw_ = raw;
    return d;
}

Decimal Decimal::FromDouble(double value, int scale) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("Decimal::FromDouble: value is not finite");
    }
    scale = std::clamp(scale, 0, kScale);

    // Round in the requested scale first, then widen to the internal scale
    double scaled = std::round(value * std::pow(10.0, scale));
    if (std::fabs(scaled) >= 1e38) {
        throw ArithmeticError("Decimal::FromDouble: value out of range");
    }
    return FromRaw(CheckedMultiply(static_cast<RawType>(scaled), Pow10(kScale - scale), "FromDouble"));
}

Decimal Decimal::Parse(const std::string& str) {
    if (str.empty()) {
        throw std::invalid_argument("Decimal::Parse: empty string");
    }

    size_t pos = 0;
    bool negative = false;
    if (str[pos] == '-' || str[pos] == '+') {
        negative = (str[pos] == '-');
        ++pos;
    }

    RawType integer_part = 0;
    RawType fraction_part = 0;
    int fraction_digits = 0;
    bool seen_digit = false;
    bool seen_point = false;
    bool round_up = false;

    for (; pos < str.size(); ++pos) {
        char c = str[pos];
        if (c == '.') {
            if (seen_point) {
                throw std::invalid_argument("Decimal::Parse: malformed number: " + str);
            }
            seen_point = true;
            continue;
        }
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Decimal::Parse: malformed number: " + str);
        }
        seen_digit = true;
        int digit = c - '0';
        if (!seen_point) {
            if (__builtin_mul_overflow(integer_part, 10, &integer_part) ||
                __builtin_add_overflow(integer_part, digit, &integer_part)) {
                throw std::invalid_argument("Decimal::Parse: value out of range: " + str);
            }
        } else if (fraction_digits < kScale) {
            fraction_part = fraction_part * 10 + digit;
            ++fraction_digits;
        } else if (fraction_digits == kScale) {
            // First dropped digit decides half-up rounding
            round_up = digit >= 5;
            ++fraction_digits;
        }
    }

    if (!seen_digit) {
        throw std::invalid_argument("Decimal::Parse: malformed number: " + str);
    }

    // Integer part times 10^kScale must fit, which bounds values near 1.7e28
    int kept = std::min(fraction_digits, kScale);
    RawType raw;
    if (__builtin_mul_overflow(integer_part, Pow10(kScale), &raw) ||
        __builtin_add_overflow(raw, fraction_part * Pow10(kScale - kept) + (round_up ? 1 : 0), &raw)) {
        throw std::invalid_argument("Decimal::Parse: value out of range: " + str);
    }
    return FromRaw(negative ? -raw : raw);
}

// ============================================================================
// Arithmetic
// ============================================================================

Decimal Decimal::operator+(const Decimal& other) const {
    return FromRaw(CheckedAdd(raw_, other.raw_, "addition"));
}

Decimal Decimal::operator-(const Decimal& other) const {
    return FromRaw(CheckedSubtract(raw_, other.raw_, "subtraction"));
}

Decimal& Decimal::operator+=(const Decimal& other) {
    raw_ = CheckedAdd(raw_, other.raw_, "addition");
    return *this;
}

Decimal& Decimal::operator-=(const Decimal& other) {
    raw_ = CheckedSubtract(raw_, other.raw_, "subtraction");
    return *this;
}

Decimal Decimal::operator*(const Decimal& other) const {
    // (whole * 10^kScale + fraction) * other / 10^kScale, so the
    // intermediate never holds the full double-width product.
    // Both terms share a sign, so rounding the fraction term rounds the sum.
    RawType unit = Pow10(kScale);
    RawType whole = raw_ / unit;
    RawType fraction = raw_ % unit;

    RawType whole_term = CheckedMultiply(whole, other.raw_, "multiplication");
    RawType fraction_term = DivideHalfUp(
        CheckedMultiply(fraction, other.raw_, "multiplication"), unit);
    return FromRaw(CheckedAdd(whole_term, fraction_term, "multiplication"));
}

Decimal Decimal::Divide(const Decimal& divisor, int scale) const {
    if (divisor.raw_ == 0) {
        throw ArithmeticError("Division by zero");
    }
    scale = std::clamp(scale, 0, kScale);

    // raw_/divisor.raw_ is the true quotient; scale it to `scale` digits
    // by long division so raw_ itself is never widened
    RawType factor = Pow10(scale);
    RawType whole = raw_ / divisor.raw_;
    RawType remainder = raw_ % divisor.raw_;

    RawType quotient = CheckedAdd(
        CheckedMultiply(whole, factor, "division"),
        DivideHalfUp(CheckedMultiply(remainder, factor, "division"), divisor.raw_),
        "division");
    return FromRaw(CheckedMultiply(quotient, Pow10(kScale - scale), "division"));
}

Decimal Decimal::Round(int scale) const {
    scale = std::clamp(scale, 0, kScale);
    if (scale == kScale) {
        return *this;
    }
    RawType factor = Pow10(kScale - scale);
    return FromRaw(DivideHalfUp(raw_, factor) * factor);
}

int64_t Decimal::CeilToInteger() const {
    RawType unit = Pow10(kScale);
    RawType whole = raw_ / unit;
    if (raw_ % unit != 0 && raw_ > 0) {
        whole += 1;
    }
    if (whole > INT64_MAX || whole < INT64_MIN) {
        throw ArithmeticError("Decimal::CeilToInteger: value out of int64 range");
    }
    return static_cast<int64_t>(whole);
}

// ============================================================================
// Conversion
// ============================================================================

double Decimal::ToDouble() const {
    RawType unit = Pow10(kScale);
    double whole = static_cast<double>(raw_ / unit);
    double fraction = static_cast<double>(raw_ % unit) / static_cast<double>(unit);
    return whole + fraction;
}

std::string Decimal::ToString(int scale) const {
    scale = std::clamp(scale, 0, kScale);
    RawType rounded = Round(scale).raw_;
    bool negative = rounded < 0;
    RawType magnitude = negative ? -rounded : rounded;

    RawType unit = Pow10(kScale);
    RawType whole = magnitude / unit;
    RawType fraction = (magnitude % unit) / Pow10(kScale - scale);

    std::string digits;
    do {
        digits.push_back(static_cast<char>('0' + static_cast<int>(whole % 10)));
        whole /= 10;
    } while (whole > 0);
    std::reverse(digits.begin(), digits.end());

    std::string result = negative ? "-" + digits : digits;
    if (scale > 0) {
        std::string frac(scale, '0');
        for (int i = scale - 1; i >= 0; --i) {
            frac[i] = static_cast<char>('0' + static_cast<int>(fraction % 10));
            fraction /= 10;
        }
        result += "." + frac;
    }
    return result;
}

std::string Decimal::ToString() const {
    std::string full = ToString(kScale);
    size_t point = full.find('.');
    size_t last = full.find_last_not_of('0');
    if (last == point) {
        return full.substr(0, point);
    }
    return full.substr(0, last + 1);
}

std::ostream& operator<<(std::ostream& out, const Decimal& value) {
    return out << value.ToString();
}

// ============================================================================
// Helpers
// ============================================================================

Decimal::RawType Decimal::Pow10(int exponent) {
    RawType result = 1;
    for (int i = 0; i < exponent; ++i) {
        result *= 10;
    }
    return result;
}

Decimal::RawType Decimal::DivideHalfUp(RawType numerator, RawType denominator) {
    RawType quotient = numerator / denominator;
    RawType remainder = numerator % denominator;
    if (remainder == 0) {
        return quotient;
    }

    RawType abs_remainder = remainder < 0 ? -remainder : remainder;
    RawType abs_denominator = denominator < 0 ? -denominator : denominator;
    if (abs_remainder >= abs_denominator - abs_remainder) {
        bool negative = (numerator < 0) != (denominator < 0);
        quotient += negative ? -1 : 1;
    }
    return quotient;
}

} // namespace stocklens
