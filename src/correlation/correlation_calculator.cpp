// File: src/correlation/correlation_calculator.cpp
#include "correlation/correlation_calculator.hpp"
#include "correlation/correlation_edge.hpp"
#include "statistics/numeric.hpp"
#include <algorithm>

namespace stocklens {

const Decimal& CorrelationCalculator::DefaultSignificanceThreshold() {
    static const Decimal kThreshold = Decimal::Parse("0.3");
    return kThreshold;
}

CorrelationCalculator::CorrelationCalculator(const TimeSeriesExtractor& extractor)
    : extractor_(extractor) {
}

Decimal CorrelationCalculator::Pearson(const std::vector<Decimal>& x, const std::vector<Decimal>& y) {
    if (x.size() != y.size() || x.empty()) {
        return Decimal();
    }

    Decimal n(static_cast<int64_t>(x.size()));
    Decimal mean_x = numeric::Sum(x).Divide(n, numeric::kWorkingScale);
    Decimal mean_y = numeric::Sum(y).Divide(n, numeric::kWorkingScale);

    Decimal sum_xy;
    Decimal sum_x2;
    Decimal sum_y2;

    for (size_t i = 0; i < x.size(); ++i) {
        Decimal dx = x[i] - mean_x;
        Decimal dy = y[i] - mean_y;
        sum_xy += dx * dy;
        sum_x2 += dx * dx;
        sum_y2 += dy * dy;
    }

    if (sum_x2.IsZero() || sum_y2.IsZero()) {
        return Decimal();
    }

    Decimal denominator = numeric::Sqrt(sum_x2) * numeric::Sqrt(sum_y2);
    if (denominator.IsZero()) {
        return Decimal();
    }

    Decimal r = sum_xy.Divide(denominator, numeric::kResultScale);
    return std::clamp(r, Decimal(-1), Decimal(1));
}

std::optional<CorrelationResult> CorrelationCalculator::Compute(
    ItemID item1, ItemID item2, const DateRange& window) const {

    auto aligned = extractor_.ExtractPair(item1, item2, window);
    if (!aligned) {
        return std::nullopt;
    }

    CorrelationResult result;
    result.coefficient = Pearson(aligned->first, aligned->second);
    result.data_points = static_cast<int>(aligned->size());
    result.type = Classify(result.coefficient);
    return result;
}

CorrelationType CorrelationCalculator::Classify(const Decimal& coefficient) {
    return ClassifyCorrelation(coefficient);
}

bool CorrelationCalculator::IsSignificant(const Decimal& coefficient, const Decimal& threshold) {
    return coefficient.Abs() >= threshold;
}

bool CorrelationCalculator::IsStrong(const Decimal& coefficient) {
    static const Decimal kStrong = Decimal::Parse("0.7");
    return coefficient.Abs() > kStrong;
}

} // namespace stocklens
