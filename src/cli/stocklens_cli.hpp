// File: src/cli/stocklens_cli.hpp
//
// StockLens CLI class definition
// Extracted for testability

#ifndef STOCKLENS_CLI_HPP
#define STOCKLENS_CLI_HPP

#include "cli/cli_config.hpp"
#include "engine/analytics_engine.hpp"
#include "storage/inventory_repository.hpp"
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>

namespace stocklens {

/// Command-line front end of the analytics engine
///
/// Opens the store named by the configuration (in-memory or SQLite), wires an
/// AnalyticsEngine to it and runs text commands against it. Commands can be
/// given one at a time (ProcessCommand) or read line by line (Run).
class StockLensCli {
public:
    /// @param today Reference date for every window; defaults to Date::Today
    /// @throws StorageError if the configured database cannot be opened
    StockLensCli(const CliConfig& config, std::ostream& out,
                 std::function<Date()> today = {});
    ~StockLensCli();

    StockLensCli(const StockLensCli&) = delete;
    StockLensCli& operator=(const StockLensCli&) = delete;

    /// Interactive mode: read commands from `in` until "quit" or EOF
    void Run(std::istream& in);

    /// Execute one command line, e.g. "item-stats 3 30"
    /// @return false for an unknown command or malformed arguments
    /// @throws NotFoundError if the command names an unknown item or category
    bool ProcessCommand(const std::string& input);

    /// Load categories, items and daily records from a CSV file
    ///
    /// One row per line, first field selects the row kind:
    ///   category,<id>,<name>
    ///   item,<id>,<name>,<category_id>,<current_quantity>[,<reorder_level>]
    ///   record,<item_id>,<YYYY-MM-DD>,<consumed>[,<received>]
    /// Blank lines and lines starting with '#' are skipped.
    /// @return Number of rows stored, std::nullopt if the file cannot be read
    std::optional<size_t> ImportFile(const std::string& filepath);

    InventoryStore& GetStore() { return *store_; }
    AnalyticsEngine& GetEngine() { return *engine_; }

private:
    std::ostream& out_;
    CliConfig config_;

    std::unique_ptr<InventoryStore> store_;

    // Declared after store_: the engine holds references into it
    std::unique_ptr<AnalyticsEngine> engine_;

    // Commands
    void ShowHelp();
    void ShowItemStatistics(ItemID item, int window_days);
    void ShowCategoryStatistics(CategoryID category, int window_days);
    void ShowDashboard(int window_days);
    void RecalculateStatistics();
    void UpdateItem(ItemID item);
    void RecalculateCorrelations(bool force);
    void ShowItemCorrelations(ItemID item);
    void ShowRecommendations(ItemID item, size_t limit);
    void ShowCorrelationStatistics();

    // Output helpers
    void PrintSweep(const CorrelationSweepSummary& summary);
    void PrintBatch(const BatchStatisticsResult& result);
    void PrintPair(const PairCorrelation& pair);
};

/// Open the store selected by `config.storage`
/// @throws StorageError if the SQLite database cannot be opened
std::unique_ptr<InventoryStore> OpenStore(const CliConfig& config);

} // namespace stocklens

#endif // STOCKLENS_CLI_HPP
