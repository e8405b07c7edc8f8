// File: src/correlation/correlation_graph_manager.cpp
#include "correlation/correlation_graph_manager.hpp"
#include "core/logging.hpp"
#include "statistics/numeric.hpp"
#include <algorithm>

namespace stocklens {

namespace {

constexpr const char* kComponent = "CorrelationGraphManager";

bool ByMagnitudeDesc(const PairCorrelation& a, const PairCorrelation& b) {
    return a.coefficient.Abs() > b.coefficient.Abs();
}

const Decimal& StrongBound() {
    static const Decimal kBound = Decimal::Parse("0.7");
    return kBound;
}

} // namespace

CorrelationGraphManager::CorrelationGraphManager(
    ItemRepository& items,
    CorrelationRepository& edges,
    const CorrelationCalculator& calculator,
    const TimeSeriesExtractor& extractor,
    const Config& config,
    std::function<Date()> today)
    : items_(items),
      edges_(edges),
      calculator_(calculator),
      extractor_(extractor),
      config_(config),
      today_(std::move(today)) {

    if (!config_.Validate()) {
        throw std::invalid_argument("Invalid CorrelationGraphManager configuration");
    }
    if (!today_) {
        today_ = &Date::Today;
    }
}

DateRange CorrelationGraphManager::CurrentWindow() const {
    return DateRange::LastDays(today_(), config_.window_days);
}

std::string CorrelationGraphManager::PairKey(ItemID a, ItemID b) {
    return a.ToString() + "-" + b.ToString();
}

// ============================================================================
// Edge Maintenance
// ============================================================================

CorrelationEdge CorrelationGraphManager::SaveOrUpdate(
    const ItemRef& item1, const ItemRef& item2, const CorrelationResult& result) {

    CorrelationEdge edge;
    auto existing = edges_.FindEdge(item1.id, item2.id);
    if (existing) {
        edge = *existing;
        edge.Recalculated(result.coefficient);
    } else {
        edge = CorrelationEdge(item1.id, item2.id, result.coefficient, result.data_points);
        edge.SetCategory(item1.category_id);
        edge.SetConfidenceLevel(Decimal(CorrelationEdge::kDefaultConfidenceLevel));
        edge.SetActive(true);
    }

    if (!edges_.SaveEdge(edge)) {
        throw StorageError("Failed to save correlation " + PairKey(item1.id, item2.id));
    }
    return edge;
}

std::optional<PairCorrelation> CorrelationGraphManager::CorrelatePair(
    const ItemRef& item1, const ItemRef& item2, const DateRange& window) {

    auto result = calculator_.Compute(item1.id, item2.id, window);
    if (!result) {
        LogDebug(kComponent, "Insufficient data for " + item1.name + " and " + item2.name);
        return std::nullopt;
    }

    CorrelationEdge edge = SaveOrUpdate(item1, item2, *result);

    PairCorrelation pair;
    pair.item1 = item1.id;
    pair.item1_name = item1.name;
    pair.item2 = item2.id;
    pair.item2_name = item2.name;
    pair.coefficient = edge.GetCoefficient();
    pair.type = edge.GetType();
    pair.data_points = result->data_points;
    pair.significant = edge.IsSignificant(config_.significance_threshold);

    LogDebug(kComponent, "Correlation between " + item1.name + " and " + item2.name +
                         ": " + pair.coefficient.ToString(4));
    return pair;
}

// ============================================================================
// Sweeps
// ============================================================================

CorrelationSweepSummary CorrelationGraphManager::CalculateAll() {
    CorrelationSweepSummary summary;
    summary.threshold = config_.significance_threshold;

    std::vector<ItemRef> all_items = items_.GetAllItems();
    summary.total_items = all_items.size();

    LogInfo(kComponent, "Starting correlation calculation for " +
                        std::to_string(all_items.size()) + " items");

    if (all_items.size() < 2) {
        summary.error = "Need at least 2 items to calculate correlations";
        summary.completed_at = Timestamp::Now();
        return summary;
    }

    DateRange window = CurrentWindow();
    std::vector<PairCorrelation> significant;

    for (size_t i = 0; i < all_items.size(); ++i) {
        for (size_t j = i + 1; j < all_items.size(); ++j) {
            const ItemRef& item1 = all_items[i];
            const ItemRef& item2 = all_items[j];
            try {
                auto pair = CorrelatePair(item1, item2, window);
                if (!pair) {
                    summary.insufficient_pairs++;
                    continue;
                }
                summary.total_pairs++;
                if (pair->significant) {
                    significant.push_back(*pair);
                }
            } catch (const std::exception& e) {
                LogError(kComponent, "Error calculating correlation between " + item1.name +
                                     " and " + item2.name + ": " + e.what());
                summary.failures.push_back({PairKey(item1.id, item2.id), e.what()});
            }
        }
    }

    summary.significant_correlations = significant.size();
    std::stable_sort(significant.begin(), significant.end(), ByMagnitudeDesc);
    if (significant.size() > kTopCorrelations) {
        significant.resize(kTopCorrelations);
    }
    summary.top_correlations = std::move(significant);
    summary.completed_at = Timestamp::Now();

    LogInfo(kComponent, "Calculated " + std::to_string(summary.total_pairs) + " correlations, " +
                        std::to_string(summary.significant_correlations) + " significant");
    return summary;
}

ItemCorrelationSummary CorrelationGraphManager::CalculateForItem(ItemID item) {
    auto target = items_.FindItem(item);
    if (!target) {
        throw NotFoundError("Item not found: " + item.ToString());
    }

    ItemCorrelationSummary summary;
    summary.item = target->id;
    summary.item_name = target->name;

    LogInfo(kComponent, "Calculating correlations for item: " + target->name);

    DateRange window = CurrentWindow();
    for (const auto& other : items_.GetAllItems()) {
        if (other.id == item) {
            continue;
        }
        try {
            auto pair = CorrelatePair(*target, other, window);
            if (pair) {
                summary.correlations.push_back(*pair);
            }
        } catch (const std::exception& e) {
            LogError(kComponent, "Error calculating correlation between " + target->name +
                                 " and " + other.name + ": " + e.what());
            summary.failures.push_back({PairKey(item, other.id), e.what()});
        }
    }

    std::stable_sort(summary.correlations.begin(), summary.correlations.end(), ByMagnitudeDesc);

    for (const auto& pair : summary.correlations) {
        if (pair.coefficient > StrongBound()) {
            summary.strong_positive.push_back(pair);
        } else if (pair.coefficient < -StrongBound()) {
            summary.strong_negative.push_back(pair);
        }
    }

    return summary;
}

CorrelationSweepSummary CorrelationGraphManager::ForceRecalculate() {
    LogInfo(kComponent, "Force recalculating all correlations");
    size_t removed = edges_.DeleteAllEdges();
    LogInfo(kComponent, "Deleted " + std::to_string(removed) + " correlation edges");
    return CalculateAll();
}

// ============================================================================
// Queries
// ============================================================================

std::vector<Recommendation> CorrelationGraphManager::Recommendations(ItemID item, size_t limit) {
    std::vector<CorrelationEdge> item_edges = edges_.GetEdgesForItem(item);

    item_edges.erase(
        std::remove_if(item_edges.begin(), item_edges.end(),
            [this](const CorrelationEdge& edge) {
                return !edge.IsActive() || !edge.IsSignificant(config_.significance_threshold);
            }),
        item_edges.end());

    std::stable_sort(item_edges.begin(), item_edges.end(),
        [](const CorrelationEdge& a, const CorrelationEdge& b) {
            return a.GetCoefficient().Abs() > b.GetCoefficient().Abs();
        });

    std::vector<Recommendation> recommendations;
    for (const auto& edge : item_edges) {
        if (recommendations.size() >= limit) {
            break;
        }

        auto related = items_.FindItem(edge.OtherItem(item));
        if (!related) {
            LogWarn(kComponent, "Correlated item " + edge.OtherItem(item).ToString() + " no longer exists");
            continue;
        }

        Recommendation rec;
        rec.item = related->id;
        rec.item_name = related->name;
        rec.coefficient = edge.GetCoefficient();
        rec.type = edge.GetType();
        rec.current_stock = related->current_quantity;
        rec.reorder_level = related->reorder_level;
        rec.needs_reorder = related->NeedsReorder();
        recommendations.push_back(rec);
    }

    return recommendations;
}

CorrelationGraphStatistics CorrelationGraphManager::Statistics() {
    CorrelationGraphStatistics stats;
    stats.threshold = config_.significance_threshold;
    stats.min_data_points = extractor_.GetMinDataPoints();

    std::vector<CorrelationEdge> active = edges_.GetActiveEdges();
    if (active.empty()) {
        stats.message = "No correlations calculated yet";
        return stats;
    }

    stats.total_correlations = active.size();
    stats.max_coefficient = active.front().GetCoefficient();
    stats.min_coefficient = active.front().GetCoefficient();

    Decimal sum;
    for (const auto& edge : active) {
        const Decimal& r = edge.GetCoefficient();
        sum += r;
        stats.max_coefficient = std::max(stats.max_coefficient, r);
        stats.min_coefficient = std::min(stats.min_coefficient, r);

        if (edge.GetType() == CorrelationType::STRONG_POSITIVE) {
            stats.strong_positive++;
        } else if (edge.GetType() == CorrelationType::STRONG_NEGATIVE) {
            stats.strong_negative++;
        }
        if (edge.IsSignificant(config_.significance_threshold)) {
            stats.significant++;
        }
    }

    stats.average_coefficient = sum.Divide(
        Decimal(static_cast<int64_t>(active.size())), numeric::kResultScale);
    return stats;
}

} // namespace stocklens
