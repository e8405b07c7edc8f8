// File: src/core/decimal.hpp
#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>

namespace stocklens {

/// Decimal: Fixed-point decimal number with explicit rounding
///
/// Values are held as a signed 128-bit integer scaled by 10^kScale, so every
/// quantity carries exactly 10 fractional digits. Arithmetic never goes
/// through floating point:
/// - Addition and subtraction are exact
/// - Multiplication rounds the product back to 10 digits (half-up)
/// - Division takes the result scale explicitly, like Round()
///
/// Rounding is always HALF_UP (ties away from zero), so results are
/// identical on every target that builds this class.
///
/// Range: about +/-1.7e28. Parse() rejects larger literals with
/// std::invalid_argument; arithmetic that would leave the range throws
/// ArithmeticError instead of wrapping.
///
/// The representation relies on the __int128 extension and the
/// __builtin_*_overflow intrinsics, so it builds with GCC and Clang only.
class Decimal {
public:
    __extension__ typedef __int128 RawType;

    /// Number of fractional digits carried internally
    static constexpr int kScale = 10;

    /// Default constructor creates zero
    Decimal() : raw_(0) {}

    /// Construct from an integer value
    Decimal(int64_t value);

    /// Create from a double, rounded half-up to `scale` digits
    static Decimal FromDouble(double value, int scale = kScale);

    /// Create from the raw scaled representation
    static Decimal FromRaw(RawType raw);

    /// Parse a plain decimal literal ("12", "-0.25", "3.1415")
    /// @throws std::invalid_argument on malformed or out-of-range input
    static Decimal Parse(const std::string& str);

    // ========================================================================
    // Arithmetic
    // ========================================================================

    // Every operation that can leave the range throws ArithmeticError

    Decimal operator+(const Decimal& other) const;
    Decimal operator-(const Decimal& other) const;
    Decimal operator-() const { return FromRaw(-raw_); }

    /// Product rounded half-up to kScale digits
    Decimal operator*(const Decimal& other) const;

    Decimal& operator+=(const Decimal& other);
    Decimal& operator-=(const Decimal& other);

    /// Divide, rounding the quotient half-up to `scale` fractional digits
    /// @throws ArithmeticError if divisor is zero or the quotient overflows
    Decimal Divide(const Decimal& divisor, int scale) const;

    /// Round half-up to `scale` fractional digits (0 <= scale <= kScale)
    Decimal Round(int scale) const;

    /// Smallest integer not less than this value
    int64_t CeilToInteger() const;

    Decimal Abs() const { return raw_ < 0 ? FromRaw(-raw_) : *this; }

    /// -1, 0 or 1
    int Sign() const { return (raw_ > 0) - (raw_ < 0); }

    bool IsZero() const { return raw_ == 0; }

    // ========================================================================
    // Comparison
    // ========================================================================

    bool operator==(const Decimal& other) const { return raw_ == other.raw_; }
    bool operator!=(const Decimal& other) const { return raw_ != other.raw_; }
    bool operator<(const Decimal& other) const { return raw_ < other.raw_; }
    bool operator>(const Decimal& other) const { return raw_ > other.raw_; }
    bool operator<=(const Decimal& other) const { return raw_ <= other.raw_; }
    bool operator>=(const Decimal& other) const { return raw_ >= other.raw_; }

    // ========================================================================
    // Conversion
    // ========================================================================

    RawType raw() const { return raw_; }

    double ToDouble() const;

    /// Shortest representation without trailing zeros ("11.6", "-3", "0.0983")
    std::string ToString() const;

    /// Fixed representation with exactly `scale` fractional digits
    std::string ToString(int scale) const;

private:
    RawType raw_;

    /// 10^exponent for 0 <= exponent <= 38
    static RawType Pow10(int exponent);

    /// Integer division rounded half-up (ties away from zero)
    static RawType DivideHalfUp(RawType numerator, RawType denominator);
};

std::ostream& operator<<(std::ostream& out, const Decimal& value);

} // namespace stocklens
