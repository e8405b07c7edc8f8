// File: src/statistics/time_series_extractor.cpp
#include "statistics/time_series_extractor.hpp"
#include <algorithm>
#include <map>

namespace stocklens {

namespace {

void SortByDate(std::vector<ConsumptionObservation>& records) {
    std::stable_sort(records.begin(), records.end(),
        [](const ConsumptionObservation& a, const ConsumptionObservation& b) {
            return a.date < b.date;
        });
}

std::map<Date, Decimal> ByDate(const std::vector<ConsumptionObservation>& records) {
    std::map<Date, Decimal> result;
    for (const auto& record : records) {
        result[record.date] += record.ConsumedOrZero();
    }
    return result;
}

} // namespace

TimeSeriesExtractor::TimeSeriesExtractor(ConsumptionRepository& repository, int min_data_points)
    : repository_(repository),
      min_data_points_(min_data_points) {
}

ItemSeries TimeSeriesExtractor::ExtractItem(ItemID item, const DateRange& window) const {
    ItemSeries series;
    series.item = item;
    series.records = repository_.GetConsumptionRecords(item, window.start, window.end);
    SortByDate(series.records);
    series.values = ValuesOf(series.records);
    return series;
}

std::optional<AlignedSeries> TimeSeriesExtractor::ExtractPair(
    ItemID item1, ItemID item2, const DateRange& window) const {

    auto records1 = repository_.GetConsumptionRecords(item1, window.start, window.end);
    auto records2 = repository_.GetConsumptionRecords(item2, window.start, window.end);

    size_t min_points = static_cast<size_t>(std::max(min_data_points_, 0));
    if (records1.size() < min_points || records2.size() < min_points) {
        return std::nullopt;
    }

    std::map<Date, Decimal> map1 = ByDate(records1);
    std::map<Date, Decimal> map2 = ByDate(records2);

    // Union of dates; std::map keeps both key sets sorted
    std::vector<Date> dates;
    dates.reserve(map1.size() + map2.size());
    for (const auto& [date, value] : map1) {
        dates.push_back(date);
    }
    for (const auto& [date, value] : map2) {
        if (map1.find(date) == map1.end()) {
            dates.push_back(date);
        }
    }
    std::sort(dates.begin(), dates.end());

    if (dates.size() < min_points) {
        return std::nullopt;
    }

    AlignedSeries aligned;
    aligned.dates = std::move(dates);
    aligned.first.reserve(aligned.dates.size());
    aligned.second.reserve(aligned.dates.size());

    for (const auto& date : aligned.dates) {
        auto it1 = map1.find(date);
        auto it2 = map2.find(date);
        aligned.first.push_back(it1 != map1.end() ? it1->second : Decimal());
        aligned.second.push_back(it2 != map2.end() ? it2->second : Decimal());
    }

    return aligned;
}

std::unordered_map<ItemID, std::vector<ConsumptionObservation>> TimeSeriesExtractor::GroupByItem(
    const std::vector<ConsumptionObservation>& records) {

    std::unordered_map<ItemID, std::vector<ConsumptionObservation>> grouped;
    for (const auto& record : records) {
        grouped[record.item_id].push_back(record);
    }
    for (auto& [item, item_records] : grouped) {
        SortByDate(item_records);
    }
    return grouped;
}

std::vector<Decimal> TimeSeriesExtractor::ValuesOf(const std::vector<ConsumptionObservation>& records) {
    std::vector<Decimal> values;
    values.reserve(records.size());
    for (const auto& record : records) {
        values.push_back(record.ConsumedOrZero());
    }
    return values;
}

} // namespace stocklens
