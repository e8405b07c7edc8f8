// File: src/statistics/numeric.cpp
#include "statistics/numeric.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>

namespace stocklens {
namespace numeric {

const Decimal& SqrtTolerance() {
    static const Decimal kTolerance = Decimal::Parse("0.0001");
    return kTolerance;
}

// ============================================================================
// Central Tendency
// ============================================================================

Decimal Sum(const std::vector<Decimal>& values) {
    Decimal total;
    for (const auto& v : values) {
        total += v;
    }
    return total;
}

Decimal Mean(const std::vector<Decimal>& values) {
    if (values.empty()) {
        return Decimal();
    }
    return Sum(values).Divide(Decimal(static_cast<int64_t>(values.size())), kResultScale);
}

Decimal Median(const std::vector<Decimal>& values) {
    if (values.empty()) {
        return Decimal();
    }

    std::vector<Decimal> sorted(values);
    std::sort(sorted.begin(), sorted.end());

    size_t n = sorted.size();
    if (n % 2 == 0) {
        return (sorted[n / 2 - 1] + sorted[n / 2]).Divide(Decimal(2), kResultScale);
    }
    return sorted[n / 2];
}

Decimal Percentile(const std::vector<Decimal>& values, int percentile) {
    if (values.empty()) {
        return Decimal();
    }

    std::vector<Decimal> sorted(values);
    std::sort(sorted.begin(), sorted.end());

    // ceil(p * n / 100) in integer arithmetic
    int64_t n = static_cast<int64_t>(sorted.size());
    int64_t rank = (static_cast<int64_t>(percentile) * n + 99) / 100;
    if (percentile <= 0) {
        rank = 0;
    }
    int64_t index = std::clamp<int64_t>(rank - 1, 0, n - 1);
    return sorted[static_cast<size_t>(index)];
}

// ============================================================================
// Dispersion
// ============================================================================

Decimal StandardDeviation(const std::vector<Decimal>& values, const Decimal& mean) {
    if (values.size() <= 1) {
        return Decimal();
    }

    Decimal sum_squares;
    for (const auto& v : values) {
        Decimal diff = v - mean;
        sum_squares += diff * diff;
    }

    Decimal variance = sum_squares.Divide(
        Decimal(static_cast<int64_t>(values.size() - 1)), kWorkingScale);

    return Sqrt(variance).Round(kResultScale);
}

Decimal Sqrt(const Decimal& value) {
    if (value.Sign() < 0) {
        throw ArithmeticError("Square root of negative number: " + value.ToString());
    }
    if (value.IsZero()) {
        return Decimal();
    }

    const Decimal two(2);
    Decimal x = Decimal::FromDouble(std::sqrt(value.ToDouble()), kWorkingScale);
    if (x.IsZero()) {
        // Seed underflowed at the working scale; start from the value itself
        x = value;
    }

    for (int i = 0; i < kSqrtMaxIterations; ++i) {
        Decimal next = (x + value.Divide(x, kWorkingScale)).Divide(two, kWorkingScale);
        if ((next - x).Abs() < SqrtTolerance()) {
            x = next;
            break;
        }
        x = next;
    }

    return x;
}

Decimal CoefficientOfVariation(const Decimal& mean, const Decimal& std_dev) {
    if (mean.IsZero()) {
        return Decimal();
    }
    return std_dev.Divide(mean, kResultScale);
}

} // namespace numeric
} // namespace stocklens
