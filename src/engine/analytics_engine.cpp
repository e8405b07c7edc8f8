// File: src/engine/analytics_engine.cpp
#include "engine/analytics_engine.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "statistics/numeric.hpp"
#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>

namespace stocklens {

namespace {

constexpr const char* kComponent = "AnalyticsEngine";

/// Rows shown in CategoryStatisticsReport::top_items
constexpr size_t kTopCategoryItems = 5;

const AnalyticsEngine::Config& Checked(const AnalyticsEngine::Config& config) {
    if (!config.Validate()) {
        throw std::invalid_argument("Invalid AnalyticsEngine configuration");
    }
    return config;
}

std::function<Date()> OrSystemClock(std::function<Date()> today) {
    if (!today) {
        return &Date::Today;
    }
    return today;
}

CorrelationGraphManager::Config GraphConfig(const AnalyticsEngine::Config& config) {
    CorrelationGraphManager::Config graph_config;
    graph_config.window_days = config.correlation_window_days;
    graph_config.significance_threshold = config.significance_threshold;
    return graph_config;
}

} // namespace

bool AnalyticsEngine::Config::Validate() const {
    return statistics_window_days > 0 &&
           update_window_days > 0 &&
           correlation_window_days > 0 &&
           min_data_points >= 2 &&
           significance_threshold.Sign() >= 0 &&
           significance_threshold <= Decimal(1) &&
           recommendation_limit > 0;
}

// ============================================================================
// Constructor and Destructor
// ============================================================================

AnalyticsEngine::AnalyticsEngine(
    ConsumptionRepository& consumption,
    ItemRepository& items,
    CorrelationRepository& correlations,
    const Config& config,
    std::function<Date()> today)
    : consumption_(consumption),
      items_(items),
      correlations_(correlations),
      config_(Checked(config)),
      today_(OrSystemClock(std::move(today))),
      extractor_(consumption_, config_.min_data_points),
      calculator_(extractor_),
      graph_(items_, correlations_, calculator_, extractor_, GraphConfig(config_), today_),
      batch_(items_, consumption_, today_),
      worker_(std::make_unique<CorrelationUpdateWorker>(
          [this](ItemID item) { graph_.CalculateForItem(item); })) {
}

AnalyticsEngine::~AnalyticsEngine() {
    worker_->Stop();
}

DateRange AnalyticsEngine::WindowEndingToday(int days) const {
    return DateRange::LastDays(today_(), days);
}

// ============================================================================
// Statistics
// ============================================================================

std::optional<ItemStatisticsReport> AnalyticsEngine::ComputeItemStatistics(ItemID item, int window_days) {
    auto item_ref = items_.FindItem(item);
    if (!item_ref) {
        throw NotFoundError("Item not found: " + item.ToString());
    }

    Date today = today_();
    ItemSeries series = extractor_.ExtractItem(item, DateRange::LastDays(today, window_days));
    if (series.empty()) {
        LogDebug(kComponent, "No consumption data for item " + item_ref->name);
        return std::nullopt;
    }

    return ItemStatisticsCalculator::BuildReport(*item_ref, series.records, window_days, today);
}

std::optional<CategoryStatisticsReport> AnalyticsEngine::ComputeCategoryStatistics(
    CategoryID category, int window_days) {

    auto category_ref = items_.FindCategory(category);
    if (!category_ref) {
        throw NotFoundError("Category not found: " + category.ToString());
    }

    std::vector<ItemRef> category_items = items_.GetItemsByCategory(category);
    DateRange window = WindowEndingToday(window_days);
    auto grouped = TimeSeriesExtractor::GroupByItem(
        consumption_.GetConsumptionRecords(window.start, window.end));

    CategoryStatisticsReport report;
    report.category = category_ref->id;
    report.category_name = category_ref->name;
    report.window_days = window_days;

    std::vector<Decimal> item_totals;
    for (const auto& item : category_items) {
        auto it = grouped.find(item.id);
        if (it == grouped.end() || it->second.empty()) {
            continue;
        }

        std::vector<Decimal> values = TimeSeriesExtractor::ValuesOf(it->second);
        Decimal mean = numeric::Mean(values);

        CategoryItemStatistics row;
        row.item = item.id;
        row.item_name = item.name;
        row.total_consumption = numeric::Sum(values);
        row.mean_consumption = mean;
        row.coefficient_of_variation = numeric::CoefficientOfVariation(
            mean, numeric::StandardDeviation(values, mean));

        report.total_records += it->second.size();
        report.total_consumption += row.total_consumption;
        item_totals.push_back(row.total_consumption);
        report.items.push_back(row);
    }

    if (report.items.empty()) {
        return std::nullopt;
    }

    report.items_with_data = report.items.size();

    Decimal totals_mean = numeric::Mean(item_totals);
    report.category_cv = numeric::CoefficientOfVariation(
        totals_mean, numeric::StandardDeviation(item_totals, totals_mean));
    report.category_volatility = ItemStatisticsCalculator::ClassifyVolatility(report.category_cv);

    std::stable_sort(report.items.begin(), report.items.end(),
        [](const CategoryItemStatistics& a, const CategoryItemStatistics& b) {
            return a.total_consumption > b.total_consumption;
        });

    size_t top = std::min(kTopCategoryItems, report.items.size());
    report.top_items.assign(report.items.begin(), report.items.begin() + top);

    return report;
}

DashboardStatistics AnalyticsEngine::ComputeDashboardStatistics(int window_days) {
    DashboardStatistics stats;
    stats.window_days = window_days;
    stats.window = WindowEndingToday(window_days);

    std::vector<ItemRef> all_items = items_.GetAllItems();
    stats.total_items = all_items.size();
    stats.total_categories = items_.GetAllCategories().size();

    std::set<CategoryID> active_categories;
    for (const auto& item : all_items) {
        if (item.active) {
            stats.active_items++;
            if (item.category_id.IsValid()) {
                active_categories.insert(item.category_id);
            }
        }
        if (item.NeedsReorder()) {
            stats.low_stock_items++;
        }
    }
    stats.active_categories = active_categories.size();

    // Zero-filled daily series over the whole window
    std::map<Date, DailyConsumption> by_date;
    for (Date d = stats.window.start; d <= stats.window.end; d = d.AddDays(1)) {
        by_date[d] = DailyConsumption{d, Decimal(), Decimal()};
    }

    std::set<ItemID> consuming_items;
    for (const auto& record : consumption_.GetConsumptionRecords(stats.window.start, stats.window.end)) {
        Decimal consumed = record.ConsumedOrZero();
        DailyConsumption& day = by_date[record.date];
        day.date = record.date;
        day.consumed += consumed;
        day.received += record.received_quantity;

        stats.total_consumed += consumed;
        stats.total_received += record.received_quantity;
        if (consumed.Sign() > 0) {
            consuming_items.insert(record.item_id);
        }
    }
    stats.items_with_consumption = consuming_items.size();

    stats.daily.reserve(by_date.size());
    for (const auto& [date, day] : by_date) {
        stats.daily.push_back(day);
    }

    return stats;
}

ItemStatisticsSnapshot AnalyticsEngine::UpdateItemStatistics(ItemID item) {
    auto item_ref = items_.FindItem(item);
    if (!item_ref) {
        throw NotFoundError("Item not found: " + item.ToString());
    }

    Date today = today_();
    ItemSeries series = extractor_.ExtractItem(item, DateRange::LastDays(today, config_.update_window_days));

    ItemStatisticsSnapshot snapshot = ItemStatisticsCalculator::BuildSnapshot(
        series.values, item_ref->current_quantity, today, VolatilityScheme::THREE_TIER);

    if (!items_.SaveItemStatistics(item, snapshot)) {
        throw StorageError("Failed to save statistics for item " + item.ToString());
    }

    LogInfo(kComponent, "Updated statistics for item " + item_ref->name +
                        ": mean=" + snapshot.mean_daily_consumption.ToString() +
                        ", std=" + snapshot.standard_deviation.ToString() +
                        ", cv=" + snapshot.coefficient_of_variation.ToString() +
                        ", volatility=" + ToString(snapshot.volatility));

    worker_->Submit(item);
    return snapshot;
}

void AnalyticsEngine::OnConsumptionRecorded(ItemID item) {
    worker_->Submit(item);
}

BatchStatisticsResult AnalyticsEngine::RecalculateAllStatistics() {
    return batch_.RecalculateAll(config_.statistics_window_days);
}

BatchStatisticsResult AnalyticsEngine::RecalculateStatisticsForItems(
    const std::vector<ItemID>& ids, int window_days) {
    return batch_.RecalculateForItems(ids, window_days);
}

BatchStatisticsResult AnalyticsEngine::RecalculateStatisticsForCategory(
    CategoryID category, int window_days) {
    return batch_.RecalculateForCategory(category, window_days);
}

// ============================================================================
// Correlations
// ============================================================================

CorrelationSweepSummary AnalyticsEngine::RecalculateAllCorrelations() {
    return graph_.CalculateAll();
}

ItemCorrelationSummary AnalyticsEngine::RecalculateCorrelationsForItem(ItemID item) {
    return graph_.CalculateForItem(item);
}

CorrelationSweepSummary AnalyticsEngine::ForceFullRecalculation() {
    return graph_.ForceRecalculate();
}

std::vector<Recommendation> AnalyticsEngine::GetRecommendations(ItemID item, size_t limit) {
    return graph_.Recommendations(item, limit);
}

CorrelationGraphStatistics AnalyticsEngine::GetCorrelationStatistics() {
    return graph_.Statistics();
}

// ============================================================================
// Background Work
// ============================================================================

void AnalyticsEngine::WaitForBackgroundWork() {
    worker_->WaitIdle();
}

} // namespace stocklens
