// File: src/storage/persistent_backend.hpp
#pragma once

#include "storage/inventory_repository.hpp"
#include <mutex>
#include <string>
#include <sqlite3.h>

namespace stocklens {

/// Persistent inventory store using SQLite
///
/// Tables:
/// - categories, items: reference data seeded by the import path
/// - consumption_records: one row per (item, date)
/// - item_statistics: the derived snapshot of each item
/// - item_correlations: correlation edges, unique per unordered item pair
///
/// Quantities are stored as decimal TEXT so no precision is lost to REAL
/// columns; dates are stored as days since the epoch and timestamps as
/// microseconds. Batch writes run inside a single transaction.
class PersistentBackend : public InventoryStore {
public:
    /// Configuration for PersistentBackend
    struct Config {
        /// Path to the SQLite database file (":memory:" for a private in-memory db)
        std::string db_path;

        /// Enable Write-Ahead Logging for better concurrency
        bool enable_wal{true};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};
    };

    /// Construct PersistentBackend with configuration
    /// @throws StorageError if the database cannot be opened or initialized
    explicit PersistentBackend(const Config& config);

    /// Destructor - closes database connection
    ~PersistentBackend() override;

    PersistentBackend(const PersistentBackend&) = delete;
    PersistentBackend& operator=(const PersistentBackend&) = delete;

    // ========================================================================
    // ConsumptionRepository
    // ========================================================================

    std::vector<ConsumptionObservation> GetConsumptionRecords(
        ItemID item, const Date& start, const Date& end) override;
    std::vector<ConsumptionObservation> GetConsumptionRecords(
        const Date& start, const Date& end) override;

    // ========================================================================
    // ItemRepository
    // ========================================================================

    std::vector<ItemRef> GetAllItems() override;
    std::vector<ItemRef> GetItemsByIds(const std::vector<ItemID>& ids) override;
    std::vector<ItemRef> GetItemsByCategory(CategoryID category) override;
    std::optional<ItemRef> FindItem(ItemID id) override;
    std::optional<CategoryRef> FindCategory(CategoryID id) override;
    std::vector<CategoryRef> GetAllCategories() override;

    bool SaveItemStatistics(ItemID id, const ItemStatisticsSnapshot& snapshot) override;
    size_t SaveItemsStatistics(const std::vector<ItemStatisticsUpdate>& batch) override;
    std::optional<ItemStatisticsSnapshot> GetItemStatistics(ItemID id) override;

    // ========================================================================
    // CorrelationRepository
    // ========================================================================

    std::optional<CorrelationEdge> FindEdge(ItemID a, ItemID b) override;
    bool SaveEdge(const CorrelationEdge& edge) override;
    size_t DeleteAllEdges() override;
    std::vector<CorrelationEdge> GetEdgesForItem(ItemID id) override;
    std::vector<CorrelationEdge> GetActiveEdges() override;

    // ========================================================================
    // Seeding
    // ========================================================================

    bool AddCategory(const CategoryRef& category) override;
    bool AddItem(const ItemRef& item) override;
    bool AddConsumptionRecord(const ConsumptionObservation& record) override;
    size_t AddConsumptionRecords(const std::vector<ConsumptionObservation>& records) override;
    bool UpdateItemQuantity(ItemID id, const Decimal& quantity) override;

    /// Number of rows in item_correlations (active or not)
    size_t EdgeCount() const;

private:
    Config config_;

    // SQLite database handle
    sqlite3* db_{nullptr};

    // Serializes every use of the connection
    mutable std::mutex mutex_;

    // ========================================================================
    // Helper Methods
    // ========================================================================

    /// Initialize pragmas, schema and indices
    void InitializeDatabase();

    /// Create tables
    void CreateTables();

    /// Create indices for efficient queries
    void CreateIndices();

    /// Execute a SQL statement
    /// @return true if successful, false otherwise
    bool ExecuteSQL(const std::string& sql);

    /// Run a single-row SELECT of items (filtered by `where`) and collect all rows
    std::vector<ItemRef> QueryItems(const std::string& where, int64_t param, bool bind_param);

    /// Insert or replace one observation with a prepared statement
    bool InsertRecord(sqlite3_stmt* stmt, const ConsumptionObservation& record);

    /// Upsert one snapshot with a prepared statement
    bool WriteStatistics(sqlite3_stmt* stmt, ItemID id, const ItemStatisticsSnapshot& snapshot);

    /// Caller must hold mutex_
    bool ItemExistsLocked(ItemID id) const;

    /// Begin a transaction
    void BeginTransaction();

    /// Commit a transaction
    void CommitTransaction();

    /// Rollback a transaction
    void RollbackTransaction();
};

} // namespace stocklens
