// File: src/correlation/correlation_edge.cpp
#include "correlation/correlation_edge.hpp"
#include <algorithm>
#include <sstream>

namespace stocklens {

namespace {

const Decimal& StrongThreshold() {
    static const Decimal kValue = Decimal::Parse("0.7");
    return kValue;
}

const Decimal& ModerateThreshold() {
    static const Decimal kValue = Decimal::Parse("0.4");
    return kValue;
}

const Decimal& WeakThreshold() {
    static const Decimal kValue = Decimal::Parse("0.2");
    return kValue;
}

} // namespace

CorrelationType ClassifyCorrelation(const Decimal& coefficient) {
    Decimal magnitude = coefficient.Abs();
    bool positive = coefficient.Sign() > 0;

    if (magnitude >= StrongThreshold()) {
        return positive ? CorrelationType::STRONG_POSITIVE : CorrelationType::STRONG_NEGATIVE;
    }
    if (magnitude >= ModerateThreshold()) {
        return positive ? CorrelationType::MODERATE_POSITIVE : CorrelationType::MODERATE_NEGATIVE;
    }
    if (magnitude >= WeakThreshold()) {
        return positive ? CorrelationType::WEAK_POSITIVE : CorrelationType::WEAK_NEGATIVE;
    }
    return CorrelationType::NO_CORRELATION;
}

// ============================================================================
// Constructor
// ============================================================================

CorrelationEdge::CorrelationEdge(
    ItemID item1,
    ItemID item2,
    const Decimal& coefficient,
    int data_points
) : item1_(item1),
    item2_(item2),
    data_points_(data_points),
    created_at_(Timestamp::Now())
{
    SetCoefficient(coefficient);
    last_calculated_ = created_at_;
}

// ============================================================================
// Coefficient
// ============================================================================

void CorrelationEdge::SetCoefficient(const Decimal& coefficient) {
    coefficient_ = std::clamp(coefficient.Round(4), Decimal(-1), Decimal(1));
    type_ = ClassifyCorrelation(coefficient_);
}

void CorrelationEdge::Recalculated(const Decimal& coefficient) {
    SetCoefficient(coefficient);
    last_calculated_ = Timestamp::Now();
}

bool CorrelationEdge::IsSignificant(const Decimal& threshold) const {
    return coefficient_.Abs() >= threshold;
}

bool CorrelationEdge::IsStrong() const {
    return coefficient_.Abs() > StrongThreshold();
}

// ============================================================================
// Utility
// ============================================================================

std::string CorrelationEdge::ToString() const {
    std::ostringstream oss;
    oss << "CorrelationEdge(" << item1_.ToString() << " <-> " << item2_.ToString()
        << ", r=" << coefficient_.ToString(4)
        << ", type=" << stocklens::ToString(type_)
        << ", points=" << data_points_
        << ", active=" << (active_ ? "true" : "false") << ")";
    return oss.str();
}

} // namespace stocklens
