// File: tests/core/decimal_test.cpp
#include "core/decimal.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace stocklens {
namespace {

// ============================================================================
// Construction and Parsing
// ============================================================================

TEST(DecimalTest, DefaultIsZero) {
    Decimal d;
    EXPECT_TRUE(d.IsZero());
    EXPECT_EQ(0, d.Sign());
    EXPECT_EQ("0", d.ToString());
}

TEST(DecimalTest, ConstructFromInteger) {
    Decimal d(42);
    EXPECT_EQ("42", d.ToString());
    EXPECT_EQ("-7", Decimal(-7).ToString());
}

TEST(DecimalTest, ParsePlainLiterals) {
    EXPECT_EQ("11.6", Decimal::Parse("11.6").ToString());
    EXPECT_EQ("-0.25", Decimal::Parse("-0.25").ToString());
    EXPECT_EQ("3.1415", Decimal::Parse("+3.1415").ToString());
    EXPECT_EQ("12", Decimal::Parse("12.000").ToString());
    EXPECT_EQ("0.5", Decimal::Parse(".5").ToString());
}

TEST(DecimalTest, ParseRoundsBeyondInternalScale) {
    // 11th fractional digit decides half-up rounding
    EXPECT_EQ("0.0000000001", Decimal::Parse("0.00000000005").ToString());
    EXPECT_EQ("0", Decimal::Parse("0.00000000004").ToString());
}

TEST(DecimalTest, ParseRejectsMalformedInput) {
    EXPECT_THROW(Decimal::Parse(""), std::invalid_argument);
    EXPECT_THROW(Decimal::Parse("-"), std::invalid_argument);
    EXPECT_THROW(Decimal::Parse("abc"), std::invalid_argument);
    EXPECT_THROW(Decimal::Parse("1.2.3"), std::invalid_argument);
    EXPECT_THROW(Decimal::Parse("1e5"), std::invalid_argument);
}

TEST(DecimalTest, ParseRejectsValuesBeyondRange) {
    EXPECT_EQ("10000000000000000000000000000",
              Decimal::Parse("10000000000000000000000000000").ToString());
    EXPECT_THROW(Decimal::Parse("99999999999999999999999999999"), std::invalid_argument);
    EXPECT_THROW(Decimal::Parse("123456789012345678901234567890123456789012"), std::invalid_argument);
    EXPECT_THROW(Decimal::Parse("-123456789012345678901234567890123456789012.5"), std::invalid_argument);
}

TEST(DecimalTest, IntegerConstructionBeyondRangeThrows) {
    EXPECT_THROW(Decimal(std::numeric_limits<int64_t>::max()), ArithmeticError);
}

TEST(DecimalTest, FromDoubleRoundsToRequestedScale) {
    EXPECT_EQ("0.1235", Decimal::FromDouble(0.1234567, 4).ToString());
    EXPECT_EQ("2", Decimal::FromDouble(1.5, 0).ToString());
    EXPECT_THROW(Decimal::FromDouble(std::numeric_limits<double>::infinity()), std::invalid_argument);
}

// ============================================================================
// Arithmetic
// ============================================================================

TEST(DecimalTest, AdditionAndSubtractionAreExact) {
    Decimal a = Decimal::Parse("0.1");
    Decimal b = Decimal::Parse("0.2");
    EXPECT_EQ(Decimal::Parse("0.3"), a + b);
    EXPECT_EQ(Decimal::Parse("-0.1"), a - b);

    Decimal sum;
    for (int i = 0; i < 10; ++i) {
        sum += a;
    }
    EXPECT_EQ(Decimal(1), sum);
}

TEST(DecimalTest, Multiplication) {
    EXPECT_EQ(Decimal::Parse("3.75"), Decimal::Parse("1.5") * Decimal::Parse("2.5"));
    EXPECT_EQ(Decimal::Parse("-6"), Decimal(-2) * Decimal(3));
}

TEST(DecimalTest, MultiplicationOfLargeOperandsIsExact) {
    EXPECT_EQ(Decimal::Parse("9000000000000000000"), Decimal(3000000000) * Decimal(3000000000));
    EXPECT_EQ(Decimal::Parse("-4500000001500000000.125"),
              Decimal::Parse("-3000000000.5") * Decimal::Parse("1500000000.25"));
}

TEST(DecimalTest, MultiplicationOverflowThrows) {
    Decimal big = Decimal::Parse("100000000000000000000");
    EXPECT_THROW(big * big, ArithmeticError);
    EXPECT_THROW(-big * big, ArithmeticError);
}

TEST(DecimalTest, AdditionOverflowThrows) {
    Decimal big = Decimal::Parse("10000000000000000000000000000");
    EXPECT_THROW(big + big, ArithmeticError);
    EXPECT_THROW(-big - big, ArithmeticError);

    Decimal sum = big;
    EXPECT_THROW(sum += big, ArithmeticError);
}

TEST(DecimalTest, DivideLargeDividend) {
    EXPECT_EQ(Decimal::Parse("250000000000000000000000000"),
              Decimal::Parse("1000000000000000000000000000").Divide(Decimal(4), 2));
}

TEST(DecimalTest, DivideOverflowThrows) {
    Decimal big = Decimal::Parse("10000000000000000000000000000");
    EXPECT_THROW(big.Divide(Decimal::Parse("0.0001"), 4), ArithmeticError);
}

TEST(DecimalTest, DivideRoundsHalfUp) {
    EXPECT_EQ("3.3333", Decimal(10).Divide(Decimal(3), 4).ToString());
    EXPECT_EQ("0.6667", Decimal(2).Divide(Decimal(3), 4).ToString());
    EXPECT_EQ("-0.6667", Decimal(-2).Divide(Decimal(3), 4).ToString());
    EXPECT_EQ("0.5", Decimal(1).Divide(Decimal(2), 10).ToString());
}

TEST(DecimalTest, DivideByZeroThrows) {
    EXPECT_THROW(Decimal(1).Divide(Decimal(), 4), ArithmeticError);
}

TEST(DecimalTest, RoundHalfAwayFromZero) {
    EXPECT_EQ(Decimal::Parse("2.35"), Decimal::Parse("2.345").Round(2));
    EXPECT_EQ(Decimal::Parse("-2.35"), Decimal::Parse("-2.345").Round(2));
    EXPECT_EQ(Decimal::Parse("2.34"), Decimal::Parse("2.344").Round(2));
}

TEST(DecimalTest, CeilToInteger) {
    EXPECT_EQ(3, Decimal::Parse("2.1").CeilToInteger());
    EXPECT_EQ(3, Decimal(3).CeilToInteger());
    EXPECT_EQ(-2, Decimal::Parse("-2.1").CeilToInteger());
    EXPECT_EQ(1, Decimal::Parse("0.0000000001").CeilToInteger());
    EXPECT_THROW(Decimal::Parse("100000000000000000000").CeilToInteger(), ArithmeticError);
}

TEST(DecimalTest, SignAndAbs) {
    Decimal neg = Decimal::Parse("-1.5");
    EXPECT_EQ(-1, neg.Sign());
    EXPECT_EQ(Decimal::Parse("1.5"), neg.Abs());
    EXPECT_EQ(1, neg.Abs().Sign());
    EXPECT_EQ(Decimal::Parse("1.5"), -neg);
}

// ============================================================================
// Comparison and Conversion
// ============================================================================

TEST(DecimalTest, ComparisonOperators) {
    Decimal a = Decimal::Parse("0.3");
    Decimal b = Decimal::Parse("0.30");
    Decimal c = Decimal::Parse("0.31");

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_LT(a, c);
    EXPECT_GT(c, a);
    EXPECT_LE(a, b);
    EXPECT_GE(c, b);
}

TEST(DecimalTest, FixedScaleToString) {
    EXPECT_EQ("11.6000", Decimal::Parse("11.6").ToString(4));
    EXPECT_EQ("3", Decimal::Parse("2.5").ToString(0));
    EXPECT_EQ("-3", Decimal::Parse("-2.5").ToString(0));
    EXPECT_EQ("0.10", Decimal::Parse("0.0983").ToString(2));
}

TEST(DecimalTest, ToDouble) {
    EXPECT_DOUBLE_EQ(11.6, Decimal::Parse("11.6").ToDouble());
    EXPECT_DOUBLE_EQ(-0.25, Decimal::Parse("-0.25").ToDouble());
}

TEST(DecimalTest, StreamOutput) {
    std::ostringstream oss;
    oss << Decimal::Parse("1.1402");
    EXPECT_EQ("1.1402", oss.str());
}

} // namespace
} // namespace stocklens
