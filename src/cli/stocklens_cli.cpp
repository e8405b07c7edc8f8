// File: src/cli/stocklens_cli.cpp
//
// StockLens command-line driver

#include "cli/stocklens_cli.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "storage/memory_backend.hpp"
#include "storage/persistent_backend.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

namespace stocklens {

namespace {

std::optional<int64_t> ParseInteger(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        int64_t value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::vector<std::string> SplitCsv(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        // Trim surrounding blanks
        size_t first = field.find_first_not_of(" \t\r");
        size_t last = field.find_last_not_of(" \t\r");
        fields.push_back(first == std::string::npos ? "" : field.substr(first, last - first + 1));
    }
    return fields;
}

std::string OrDash(const std::optional<Decimal>& value) {
    return value ? value->ToString() : "-";
}

} // namespace

std::unique_ptr<InventoryStore> OpenStore(const CliConfig& config) {
    if (config.storage.backend == "sqlite") {
        PersistentBackend::Config db_config;
        db_config.db_path = config.storage.db_path;
        db_config.enable_wal = config.storage.enable_wal;
        db_config.synchronous = config.storage.synchronous;
        return std::make_unique<PersistentBackend>(db_config);
    }
    return std::make_unique<MemoryBackend>();
}

StockLensCli::StockLensCli(const CliConfig& config, std::ostream& out,
                           std::function<Date()> today)
    : out_(out),
      config_(config),
      store_(OpenStore(config)),
      engine_(std::make_unique<AnalyticsEngine>(
          *store_, *store_, *store_, config.ToEngineConfig(), std::move(today))) {
}

StockLensCli::~StockLensCli() = default;

void StockLensCli::Run(std::istream& in) {
    std::string line;
    while (true) {
        out_ << "stocklens> " << std::flush;
        if (!std::getline(in, line)) {
            break;
        }
        if (line == "quit" || line == "exit") {
            break;
        }

        try {
            ProcessCommand(line);
        } catch (const NotFoundError& e) {
            out_ << "Error: " << e.what() << "\n";
        }
    }
}

bool StockLensCli::ProcessCommand(const std::string& input) {
    std::istringstream iss(input);
    std::string command;
    iss >> command;
    if (command.empty()) {
        return true;
    }

    std::vector<std::string> args;
    std::string arg;
    while (iss >> arg) {
        args.push_back(arg);
    }

    // Optional integer argument with a default
    auto arg_or = [&args](size_t index, int64_t fallback) -> std::optional<int64_t> {
        if (index >= args.size()) {
            return fallback;
        }
        return ParseInteger(args[index]);
    };

    const auto& analytics = config_.analytics;

    if (command == "help") {
        ShowHelp();
        return true;
    }
    if (command == "dashboard") {
        auto days = arg_or(0, analytics.statistics_window_days);
        if (!days || *days <= 0) return false;
        ShowDashboard(static_cast<int>(*days));
        return true;
    }
    if (command == "recalc-stats") {
        RecalculateStatistics();
        return true;
    }
    if (command == "recalc-correlations") {
        RecalculateCorrelations(false);
        return true;
    }
    if (command == "force-recalc") {
        RecalculateCorrelations(true);
        return true;
    }
    if (command == "correlation-stats") {
        ShowCorrelationStatistics();
        return true;
    }
    if (command == "import") {
        if (args.size() != 1) return false;
        auto imported = ImportFile(args[0]);
        if (!imported) return false;
        out_ << "Imported " << *imported << " rows from " << args[0] << "\n";
        return true;
    }

    // Everything below takes an id first
    if (args.empty()) {
        out_ << "Missing id for '" << command << "'\n";
        return false;
    }
    auto id = ParseInteger(args[0]);
    if (!id) {
        out_ << "Invalid id: " << args[0] << "\n";
        return false;
    }

    if (command == "item-stats") {
        auto days = arg_or(1, analytics.statistics_window_days);
        if (!days || *days <= 0) return false;
        ShowItemStatistics(ItemID(*id), static_cast<int>(*days));
    } else if (command == "category-stats") {
        auto days = arg_or(1, analytics.statistics_window_days);
        if (!days || *days <= 0) return false;
        ShowCategoryStatistics(CategoryID(*id), static_cast<int>(*days));
    } else if (command == "update-stats") {
        UpdateItem(ItemID(*id));
    } else if (command == "item-correlations") {
        ShowItemCorrelations(ItemID(*id));
    } else if (command == "recommend") {
        auto limit = arg_or(1, static_cast<int64_t>(analytics.recommendation_limit));
        if (!limit || *limit <= 0) return false;
        ShowRecommendations(ItemID(*id), static_cast<size_t>(*limit));
    } else {
        out_ << "Unknown command: " << command << " (try 'help')\n";
        return false;
    }
    return true;
}

std::optional<size_t> StockLensCli::ImportFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open import file: " << filepath << std::endl;
        return std::nullopt;
    }

    size_t stored = 0;
    size_t line_number = 0;
    std::vector<ConsumptionObservation> records;
    std::string line;

    while (std::getline(file, line)) {
        line_number++;
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::vector<std::string> fields = SplitCsv(line);
        const std::string& kind = fields[0];
        try {
            if (kind == "category" && fields.size() >= 3) {
                if (store_->AddCategory(CategoryRef{CategoryID(std::stoll(fields[1])), fields[2]})) {
                    stored++;
                }
            } else if (kind == "item" && fields.size() >= 5) {
                ItemRef item;
                item.id = ItemID(std::stoll(fields[1]));
                item.name = fields[2];
                item.category_id = CategoryID(std::stoll(fields[3]));
                item.current_quantity = Decimal::Parse(fields[4]);
                if (fields.size() >= 6 && !fields[5].empty()) {
                    item.reorder_level = Decimal::Parse(fields[5]);
                }
                if (store_->AddItem(item)) {
                    stored++;
                }
            } else if (kind == "record" && fields.size() >= 4) {
                ConsumptionObservation record;
                record.item_id = ItemID(std::stoll(fields[1]));
                record.date = Date::Parse(fields[2]);
                if (!fields[3].empty()) {
                    record.consumed_quantity = Decimal::Parse(fields[3]);
                }
                if (fields.size() >= 5 && !fields[4].empty()) {
                    record.received_quantity = Decimal::Parse(fields[4]);
                }
                records.push_back(record);
            } else {
                LogWarn("StockLensCli", "Skipping line " + std::to_string(line_number) +
                                        " of " + filepath + ": unrecognized row");
            }
        } catch (const std::logic_error& e) {
            LogWarn("StockLensCli", "Skipping line " + std::to_string(line_number) +
                                    " of " + filepath + ": " + e.what());
        }
    }

    // Records last, so rows may reference items defined further down
    stored += store_->AddConsumptionRecords(records);
    return stored;
}

// ============================================================================
// Commands
// ============================================================================

void StockLensCli::ShowHelp() {
    out_ << "Commands:\n"
         << "  item-stats <item> [days]        Statistics of one item\n"
         << "  category-stats <cat> [days]     Aggregate statistics of a category\n"
         << "  dashboard [days]                Inventory-wide overview\n"
         << "  update-stats <item>             Recompute and store one item's statistics\n"
         << "  recalc-stats                    Recompute statistics of every item\n"
         << "  recalc-correlations             Correlate every pair of items\n"
         << "  item-correlations <item>        Correlate one item against all others\n"
         << "  force-recalc                    Delete and rebuild the correlation graph\n"
         << "  recommend <item> [limit]        Correlated items worth reordering together\n"
         << "  correlation-stats               Summary of the correlation graph\n"
         << "  import <file>                   Load categories, items and records from CSV\n"
         << "  help                            Show this help\n";
}

void StockLensCli::ShowItemStatistics(ItemID item, int window_days) {
    auto report = engine_->ComputeItemStatistics(item, window_days);
    if (!report) {
        out_ << "No consumption data for item " << item.ToString()
             << " in the last " << window_days << " days\n";
        return;
    }

    const ItemStatisticsSnapshot& s = report->snapshot;
    out_ << "Item " << report->item_id.ToString() << " (" << report->item_name << "), "
         << report->window_days << " days, " << report->total_records << " records\n"
         << "  Mean:        " << s.mean_daily_consumption << "\n"
         << "  Std dev:     " << s.standard_deviation << "\n"
         << "  CV:          " << s.coefficient_of_variation << "\n"
         << "  Volatility:  " << ToString(s.volatility)
         << (report->is_highly_volatile ? " (highly volatile)" : "") << "\n"
         << "  Trend:       " << ToString(s.trend) << "\n"
         << "  Pattern:     " << ToString(s.pattern) << "\n"
         << "  Median:      " << report->median << "\n"
         << "  Min / Max:   " << report->min << " / " << report->max << "\n"
         << "  P25/P75/P90: " << report->percentile_25 << " / " << report->percentile_75
         << " / " << report->percentile_90 << "\n"
         << "  Total:       " << report->total_consumption << "\n"
         << "  Activity:    " << report->days_with_activity << " days ("
         << report->activity_rate << ")\n"
         << "  Forecast:    " << s.forecast_next_period << "\n"
         << "  Coverage:    " << s.coverage_days << " days";
    if (s.expected_stockout_date) {
        out_ << ", stockout " << s.expected_stockout_date->ToString();
    }
    out_ << "\n";

    if (!report->seasonality.day_of_week_means.empty()) {
        out_ << "  Weekday avg: " << report->seasonality.weekday_average
             << ", weekend avg: " << report->seasonality.weekend_average << "\n";
    }
}

void StockLensCli::ShowCategoryStatistics(CategoryID category, int window_days) {
    auto report = engine_->ComputeCategoryStatistics(category, window_days);
    if (!report) {
        out_ << "No consumption data for category " << category.ToString()
             << " in the last " << window_days << " days\n";
        return;
    }

    out_ << "Category " << report->category.ToString() << " (" << report->category_name << "), "
         << report->window_days << " days\n"
         << "  Items with data: " << report->items_with_data << "\n"
         << "  Records:         " << report->total_records << "\n"
         << "  Consumption:     " << report->total_consumption << "\n"
         << "  CV:              " << report->category_cv
         << " (" << ToString(report->category_volatility) << ")\n"
         << "  Top items:\n";
    for (const auto& row : report->top_items) {
        out_ << "    " << row.item.ToString() << " " << row.item_name
             << ": total " << row.total_consumption
             << ", mean " << row.mean_consumption
             << ", cv " << row.coefficient_of_variation << "\n";
    }
}

void StockLensCli::ShowDashboard(int window_days) {
    DashboardStatistics stats = engine_->ComputeDashboardStatistics(window_days);

    out_ << "Dashboard " << stats.window.start.ToString() << " .. "
         << stats.window.end.ToString() << "\n"
         << "  Items:            " << stats.active_items << " active / "
         << stats.total_items << " total\n"
         << "  Categories:       " << stats.active_categories << " active / "
         << stats.total_categories << " total\n"
         << "  Consuming items:  " << stats.items_with_consumption << "\n"
         << "  Low stock:        " << stats.low_stock_items << "\n"
         << "  Consumed:         " << stats.total_consumed << "\n"
         << "  Received:         " << stats.total_received << "\n";
}

void StockLensCli::RecalculateStatistics() {
    PrintBatch(engine_->RecalculateAllStatistics());
}

void StockLensCli::UpdateItem(ItemID item) {
    ItemStatisticsSnapshot s = engine_->UpdateItemStatistics(item);
    out_ << "Item " << item.ToString() << ": mean " << s.mean_daily_consumption
         << ", cv " << s.coefficient_of_variation
         << ", volatility " << ToString(s.volatility) << "\n";
    engine_->WaitForBackgroundWork();
}

void StockLensCli::RecalculateCorrelations(bool force) {
    PrintSweep(force ? engine_->ForceFullRecalculation() : engine_->RecalculateAllCorrelations());
}

void StockLensCli::ShowItemCorrelations(ItemID item) {
    ItemCorrelationSummary summary = engine_->RecalculateCorrelationsForItem(item);

    out_ << "Correlations of item " << summary.item.ToString() << " (" << summary.item_name << "): "
         << summary.correlations.size() << " computed, "
         << summary.strong_positive.size() << " strong positive, "
         << summary.strong_negative.size() << " strong negative\n";
    for (const auto& pair : summary.correlations) {
        PrintPair(pair);
    }
    for (const auto& failure : summary.failures) {
        out_ << "  failed " << failure.id << ": " << failure.message << "\n";
    }
}

void StockLensCli::ShowRecommendations(ItemID item, size_t limit) {
    std::vector<Recommendation> recommendations = engine_->GetRecommendations(item, limit);
    if (recommendations.empty()) {
        out_ << "No correlated items for item " << item.ToString() << "\n";
        return;
    }

    for (const auto& r : recommendations) {
        out_ << "  " << r.item.ToString() << " " << r.item_name
             << "  r=" << r.coefficient << " " << ToString(r.type)
             << "  stock " << r.current_stock << " (reorder " << OrDash(r.reorder_level) << ")"
             << (r.needs_reorder ? "  NEEDS REORDER" : "") << "\n";
    }
}

void StockLensCli::ShowCorrelationStatistics() {
    CorrelationGraphStatistics stats = engine_->GetCorrelationStatistics();
    if (stats.message) {
        out_ << *stats.message << "\n";
        return;
    }

    out_ << "Correlation graph\n"
         << "  Edges:           " << stats.total_correlations << "\n"
         << "  Average r:       " << stats.average_coefficient << "\n"
         << "  Range:           " << stats.min_coefficient << " .. " << stats.max_coefficient << "\n"
         << "  Strong +/-:      " << stats.strong_positive << " / " << stats.strong_negative << "\n"
         << "  Significant:     " << stats.significant << " (|r| >= " << stats.threshold << ")\n"
         << "  Min data points: " << stats.min_data_points << "\n";
}

// ============================================================================
// Output Helpers
// ============================================================================

void StockLensCli::PrintSweep(const CorrelationSweepSummary& summary) {
    if (summary.error) {
        out_ << *summary.error << "\n";
        return;
    }

    out_ << "Correlated " << summary.total_pairs << " pairs of " << summary.total_items << " items ("
         << summary.insufficient_pairs << " skipped for insufficient data, "
         << summary.failures.size() << " failed)\n"
         << "Significant (|r| >= " << summary.threshold << "): "
         << summary.significant_correlations << "\n";
    for (const auto& pair : summary.top_correlations) {
        PrintPair(pair);
    }
}

void StockLensCli::PrintBatch(const BatchStatisticsResult& result) {
    out_ << "Recomputed statistics of " << result.total_items << " items over "
         << result.window_days << " days: "
         << result.success << " computed, " << result.no_data << " without data, "
         << result.failed << " failed, " << result.saved << " saved ("
         << result.elapsed_ms << " ms)\n";
    for (const auto& error : result.errors) {
        out_ << "  failed " << error.id << ": " << error.message << "\n";
    }
}

void StockLensCli::PrintPair(const PairCorrelation& pair) {
    out_ << "  " << pair.item1_name << " <-> " << pair.item2_name
         << "  r=" << pair.coefficient << " " << ToString(pair.type)
         << " (" << pair.data_points << " days)"
         << (pair.significant ? " *" : "") << "\n";
}

} // namespace stocklens
