// File: src/statistics/numeric.hpp
#pragma once

#include "core/decimal.hpp"
#include <vector>

namespace stocklens {
namespace numeric {

/// Fractional digits of every reported statistic
constexpr int kResultScale = 4;

/// Fractional digits used for intermediate accumulation
constexpr int kWorkingScale = 10;

/// Sqrt stops once successive Newton iterates differ by less than this
/// (1e-4, expressed at the working scale)
const Decimal& SqrtTolerance();

/// Maximum Newton-Raphson refinement steps in Sqrt
constexpr int kSqrtMaxIterations = 10;

/// Arithmetic mean at 4 fractional digits (half-up); 0 for empty input
Decimal Mean(const std::vector<Decimal>& values);

/// Sample standard deviation (n-1 denominator)
///
/// The variance is formed at 10 fractional digits before the square root
/// and the result is rounded to 4 digits.
/// @return 0 when fewer than two values
Decimal StandardDeviation(const std::vector<Decimal>& values, const Decimal& mean);

/// Square root by Newton-Raphson, seeded from the double-precision root
/// @throws ArithmeticError if value is negative
Decimal Sqrt(const Decimal& value);

/// std / mean at 4 fractional digits; 0 when mean is zero
Decimal CoefficientOfVariation(const Decimal& mean, const Decimal& std_dev);

/// Nearest-rank percentile: sorted[ceil(p/100 * n) - 1], index clamped
/// @return 0 for empty input
Decimal Percentile(const std::vector<Decimal>& values, int percentile);

/// Middle value, or mean of the two middle values (4 digits) for even n
Decimal Median(const std::vector<Decimal>& values);

/// Sum of all values (exact)
Decimal Sum(const std::vector<Decimal>& values);

} // namespace numeric
} // namespace stocklens
