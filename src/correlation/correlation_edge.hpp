// File: src/correlation/correlation_edge.hpp
#pragma once

#include "core/decimal.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <string>

namespace stocklens {

/// Map a Pearson coefficient to its sign/magnitude bucket
/// |r| >= 0.7 strong, >= 0.4 moderate, >= 0.2 weak, else none
CorrelationType ClassifyCorrelation(const Decimal& coefficient);

/// CorrelationEdge: Undirected association between two items' consumption
///
/// Represents one persisted Pearson correlation with:
/// - An unordered item pair (item1/item2 order is insertion order only)
/// - Coefficient clamped to [-1,1] at 4 fractional digits
/// - Correlation type kept in sync with the coefficient
/// - Creation and last-calculated timestamps
///
/// At most one active edge exists per unordered pair; recomputation updates
/// the coefficient in place rather than creating a second edge.
class CorrelationEdge {
public:
    /// Confidence level recorded on newly created edges (percent)
    static constexpr int64_t kDefaultConfidenceLevel = 95;

    /// Default constructor
    CorrelationEdge() = default;

    /// Construct a new edge, stamped with the current time
    /// @param item1 First item (insertion order)
    /// @param item2 Second item
    /// @param coefficient Pearson coefficient (clamped to [-1,1])
    /// @param data_points Number of aligned dates the coefficient used
    CorrelationEdge(ItemID item1, ItemID item2, const Decimal& coefficient, int data_points);

    // ========================================================================
    // Core Identity
    // ========================================================================

    /// Storage id (0 until persisted)
    int64_t GetID() const { return id_; }
    void SetID(int64_t id) { id_ = id; }

    ItemID GetItem1() const { return item1_; }
    ItemID GetItem2() const { return item2_; }

    /// True if this edge connects a and b in either order
    bool MatchesPair(ItemID a, ItemID b) const {
        return (item1_ == a && item2_ == b) || (item1_ == b && item2_ == a);
    }

    /// True if the item is either endpoint
    bool Involves(ItemID item) const { return item1_ == item || item2_ == item; }

    /// The endpoint that is not `item`
    ItemID OtherItem(ItemID item) const { return item1_ == item ? item2_ : item1_; }

    // ========================================================================
    // Coefficient
    // ========================================================================

    const Decimal& GetCoefficient() const { return coefficient_; }

    /// Set the coefficient (clamped to [-1,1], 4 digits) and reclassify
    void SetCoefficient(const Decimal& coefficient);

    CorrelationType GetType() const { return type_; }

    /// |r| at or above threshold
    bool IsSignificant(const Decimal& threshold) const;

    /// |r| above 0.7
    bool IsStrong() const;

    // ========================================================================
    // Metadata
    // ========================================================================

    int GetDataPoints() const { return data_points_; }
    void SetDataPoints(int data_points) { data_points_ = data_points; }

    const Decimal& GetConfidenceLevel() const { return confidence_level_; }
    void SetConfidenceLevel(const Decimal& level) { confidence_level_ = level; }

    /// Category of item1 at creation time (may be invalid)
    CategoryID GetCategory() const { return category_; }
    void SetCategory(CategoryID category) { category_ = category; }

    bool IsActive() const { return active_; }
    void SetActive(bool active) { active_ = active; }

    Timestamp GetCreatedAt() const { return created_at_; }
    void SetCreatedAt(Timestamp ts) { created_at_ = ts; }

    Timestamp GetLastCalculated() const { return last_calculated_; }
    void SetLastCalculated(Timestamp ts) { last_calculated_ = ts; }

    /// Record a fresh calculation: new coefficient and last-calculated = now
    void Recalculated(const Decimal& coefficient);

    // ========================================================================
    // Utility
    // ========================================================================

    /// Get string representation
    std::string ToString() const;

private:
    int64_t id_{0};
    ItemID item1_;
    ItemID item2_;

    Decimal coefficient_;
    CorrelationType type_{CorrelationType::NO_CORRELATION};

    int data_points_{0};
    Decimal confidence_level_{kDefaultConfidenceLevel};
    CategoryID category_;
    bool active_{true};

    Timestamp created_at_;
    Timestamp last_calculated_;
};

} // namespace stocklens
