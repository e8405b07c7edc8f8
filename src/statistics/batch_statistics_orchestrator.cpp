// File: src/statistics/batch_statistics_orchestrator.cpp
#include "statistics/batch_statistics_orchestrator.hpp"
#include "core/logging.hpp"
#include "statistics/item_statistics_calculator.hpp"
#include "statistics/time_series_extractor.hpp"
#include <chrono>

namespace stocklens {

namespace {
constexpr const char* kComponent = "BatchStatisticsOrchestrator";
}

BatchStatisticsOrchestrator::BatchStatisticsOrchestrator(
    ItemRepository& items,
    ConsumptionRepository& consumption,
    std::function<Date()> today)
    : items_(items),
      consumption_(consumption),
      today_(std::move(today)) {
    if (!today_) {
        today_ = &Date::Today;
    }
}

BatchStatisticsResult BatchStatisticsOrchestrator::RecalculateAll(int window_days) {
    return Run(items_.GetAllItems(), window_days);
}

BatchStatisticsResult BatchStatisticsOrchestrator::RecalculateForItems(
    const std::vector<ItemID>& ids, int window_days) {
    return Run(items_.GetItemsByIds(ids), window_days);
}

BatchStatisticsResult BatchStatisticsOrchestrator::RecalculateForCategory(
    CategoryID category, int window_days) {
    if (!items_.FindCategory(category)) {
        throw NotFoundError("Category not found: " + category.ToString());
    }
    return Run(items_.GetItemsByCategory(category), window_days);
}

BatchStatisticsResult BatchStatisticsOrchestrator::Run(
    const std::vector<ItemRef>& items, int window_days) {

    auto start_time = std::chrono::steady_clock::now();

    BatchStatisticsResult result;
    result.window_days = window_days;
    result.total_items = items.size();

    LogInfo(kComponent, "Recalculating statistics for " + std::to_string(items.size()) +
                        " items over " + std::to_string(window_days) + " days");

    if (!items.empty()) {
        Date today = today_();
        DateRange window = DateRange::LastDays(today, window_days);

        auto grouped = TimeSeriesExtractor::GroupByItem(
            consumption_.GetConsumptionRecords(window.start, window.end));

        std::vector<ItemStatisticsUpdate> batch;
        batch.reserve(items.size());

        for (const auto& item : items) {
            try {
                auto it = grouped.find(item.id);
                if (it == grouped.end() || it->second.empty()) {
                    batch.emplace_back(item.id, ItemStatisticsCalculator::NoDataSnapshot());
                    result.no_data++;
                    continue;
                }

                std::vector<Decimal> values = TimeSeriesExtractor::ValuesOf(it->second);
                batch.emplace_back(item.id, ItemStatisticsCalculator::BuildSnapshot(
                    values, item.current_quantity, today, VolatilityScheme::FIVE_TIER));
                result.success++;
            } catch (const std::exception& e) {
                LogError(kComponent, "Failed to update statistics for item " + item.name + ": " + e.what());
                result.failed++;
                result.errors.push_back({item.id.ToString(), e.what()});
            }
        }

        result.saved = items_.SaveItemsStatistics(batch);
        if (result.saved != batch.size()) {
            LogWarn(kComponent, "Saved " + std::to_string(result.saved) + " of " +
                                std::to_string(batch.size()) + " statistics snapshots");
        }
    }

    result.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();

    LogInfo(kComponent, "Statistics recalculated: " + std::to_string(result.success) + " computed, " +
                        std::to_string(result.no_data) + " without data, " +
                        std::to_string(result.failed) + " failed in " +
                        std::to_string(result.elapsed_ms) + " ms");
    return result;
}

} // namespace stocklens
